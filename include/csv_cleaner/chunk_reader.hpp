#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace cc {

// Reads a file in fixed-size chunks and yields physical lines (no '\n').
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes    = 256 * 1024;        // 256 KiB
    std::size_t max_line_bytes = 64 * 1024 * 1024;  // guard per physical line
    bool        strip_cr       = true;              // CRLF input
  };

  explicit ChunkReader(std::string path);
  ChunkReader(std::string path, Config cfg);
  ~ChunkReader();
  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  using LineCallback = std::function<void(std::string_view)>;

  // False on open/read error (see last_error()) or an oversize line.
  bool for_each_line(const LineCallback& cb);

  // Whole file as '\n'-joined lines.
  bool read_all(std::string& out);

  int  last_error() const noexcept;
  const std::string& error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
