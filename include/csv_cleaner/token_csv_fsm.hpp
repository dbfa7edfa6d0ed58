#pragma once
#include "csv_cleaner/row.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cc {

struct CsvConfig {
  char delimiter = ',';
  char quote     = '"';
};

// Two-state scanner (Unquoted / Quoted) fed one physical line at a time.
// A quoted field may continue onto the next line; the line break is kept
// in the field. Rows whose fields are all empty are never emitted.
class CsvFsm {
public:
  using RowCallback = std::function<void(Row&&)>;

  explicit CsvFsm(const CsvConfig& cfg = {});
  ~CsvFsm();
  CsvFsm(const CsvFsm&) = delete;
  CsvFsm& operator=(const CsvFsm&) = delete;

  // `line` must not contain the terminating '\n'.
  void feed(std::string_view line, const RowCallback& on_row);

  // Flush whatever is pending. An unterminated quote is closed silently.
  void finish(const RowCallback& on_row);

  bool in_quotes() const noexcept;
  std::uint64_t rows() const noexcept { return rows_; }
  std::uint64_t lines() const noexcept { return lines_; }

private:
  struct Impl; Impl* p_;
  std::uint64_t rows_{0};
  std::uint64_t lines_{0};
};

// Split `text` on '\n' and run it through a fresh CsvFsm.
std::vector<Row> tokenize_csv(std::string_view text, const CsvConfig& cfg = {});

}
