#include "csv_cleaner/token_csv_fsm.hpp"
#include "csv_cleaner/text_utils.hpp"
#include <string>
#include <utility>

namespace cc {

struct CsvFsm::Impl {
  CsvConfig cfg;
  enum class Mode { Unquoted, Quoted } mode = Mode::Unquoted;
  std::string field;
  Row row;

  void close_field() {
    row.emplace_back(trim(field));
    field.clear();
  }

  // Returns true when a row was handed to the callback.
  bool close_row(const RowCallback& on_row) {
    if (!field.empty() || !row.empty()) close_field();
    bool any = false;
    for (const auto& f : row) if (!f.empty()) { any = true; break; }
    if (any) on_row(std::move(row));
    row.clear();
    field.clear();
    return any;
  }

  void scan(std::string_view line) {
    for (std::size_t j = 0; j < line.size(); ++j) {
      const char c = line[j];
      if (c == cfg.quote) {
        if (mode == Mode::Quoted && j + 1 < line.size() && line[j + 1] == cfg.quote) {
          field.push_back(cfg.quote); // escaped quote
          ++j;
        } else {
          mode = (mode == Mode::Quoted) ? Mode::Unquoted : Mode::Quoted;
        }
      } else if (c == cfg.delimiter && mode == Mode::Unquoted) {
        close_field();
      } else {
        field.push_back(c);
      }
    }
  }
};

CsvFsm::CsvFsm(const CsvConfig& cfg) : p_(new Impl{cfg}) {}
CsvFsm::~CsvFsm() { delete p_; }

bool CsvFsm::in_quotes() const noexcept { return p_->mode == Impl::Mode::Quoted; }

void CsvFsm::feed(std::string_view line, const RowCallback& on_row) {
  ++lines_;
  p_->scan(line);
  if (p_->mode == Impl::Mode::Quoted) {
    p_->field.push_back('\n'); // field continues on the next physical line
    return;
  }
  if (p_->close_row(on_row)) ++rows_;
}

void CsvFsm::finish(const RowCallback& on_row) {
  if (p_->close_row(on_row)) ++rows_;
  p_->mode = Impl::Mode::Unquoted;
}

std::vector<Row> tokenize_csv(std::string_view text, const CsvConfig& cfg) {
  std::vector<Row> out;
  CsvFsm fsm(cfg);
  auto sink = [&](Row&& r) { out.push_back(std::move(r)); };

  std::size_t start = 0;
  while (true) {
    const std::size_t pos = text.find('\n', start);
    if (pos == std::string_view::npos) {
      fsm.feed(text.substr(start), sink);
      break;
    }
    fsm.feed(text.substr(start, pos - start), sink);
    start = pos + 1;
  }
  fsm.finish(sink);
  return out;
}

}
