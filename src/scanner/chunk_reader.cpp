#include "csv_cleaner/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <utility>
#include <vector>

namespace cc {

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  int last_errno{0};
  std::string err;
  std::uint64_t bytes{0};
  std::uint64_t lines{0};

  void emit(std::string_view line, const LineCallback& cb) {
    if (cfg.strip_cr && !line.empty() && line.back() == '\r') line.remove_suffix(1);
    ++lines;
    cb(line);
  }

  bool fail_errno(const char* what) {
    last_errno = errno;
    err = std::string(what) + " " + path + ": " + std::strerror(last_errno);
    return false;
  }

  bool for_each_line(const LineCallback& cb) {
    bytes = lines = 0;
    last_errno = 0;
    err.clear();

    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) return fail_errno("open");

    std::vector<char> buf(cfg.chunk_bytes);
    std::string carry;

    while (true) {
      const std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
      if (n == 0) {
        if (std::ferror(f)) { std::fclose(f); return fail_errno("read"); }
        break;
      }
      bytes += n;

      std::string_view block(buf.data(), n);
      std::size_t start = 0;
      while (start < block.size()) {
        const std::size_t pos = block.find('\n', start);
        if (pos == std::string_view::npos) {
          carry.append(block.substr(start));
          break;
        }
        if (carry.empty()) {
          emit(block.substr(start, pos - start), cb);
        } else {
          carry.append(block.substr(start, pos - start));
          emit(carry, cb);
          carry.clear();
        }
        start = pos + 1;
      }

      if (carry.size() > cfg.max_line_bytes) {
        std::fclose(f);
        err = "line " + std::to_string(lines + 1) + " exceeds " +
              std::to_string(cfg.max_line_bytes) + " bytes: " + path;
        return false;
      }
    }

    if (!carry.empty()) emit(carry, cb);
    std::fclose(f);
    return true;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::for_each_line(const LineCallback& cb) { return p_->for_each_line(cb); }

bool ChunkReader::read_all(std::string& out) {
  out.clear();
  bool first = true;
  return p_->for_each_line([&](std::string_view s) {
    if (!first) out.push_back('\n');
    first = false;
    out.append(s);
  });
}

int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
const std::string& ChunkReader::error() const noexcept { return p_->err; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::lines_read() const noexcept { return p_->lines; }

}
