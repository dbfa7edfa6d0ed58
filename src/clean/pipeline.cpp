#include "csv_cleaner/pipeline.hpp"
#include "csv_cleaner/field_cleaner.hpp"
#include "csv_cleaner/metrics.hpp"
#include "csv_cleaner/text_utils.hpp"
#include <algorithm>
#include <exception>
#include <optional>
#include <thread>
#include <utility>

namespace cc {

StructureError StructureError::no_columns() {
  return StructureError(Kind::NoColumns, "Please add at least one column name");
}

StructureError StructureError::empty_input() {
  return StructureError(Kind::EmptyInput, "CSV input is empty");
}

StructureError StructureError::column_count(std::size_t expected, std::size_t actual) {
  StructureError e(Kind::ColumnCount,
                   "Column count mismatch: expected " + std::to_string(expected) +
                   ", found " + std::to_string(actual));
  e.expected_count_ = expected;
  e.actual_count_ = actual;
  return e;
}

StructureError StructureError::column_name(std::size_t position, std::string expected, std::string actual) {
  StructureError e(Kind::ColumnName,
                   "Column name mismatch at position " + std::to_string(position) +
                   ": expected \"" + expected + "\", found \"" + actual + "\"");
  e.position_ = position;
  e.expected_name_ = std::move(expected);
  e.actual_name_ = std::move(actual);
  return e;
}

std::vector<std::string> normalize_columns(const std::vector<std::string>& raw) {
  std::vector<std::string> out;
  out.reserve(raw.size());
  for (const auto& c : raw) {
    std::string name(trim(c));
    if (name.empty()) continue;
    if (std::find(out.begin(), out.end(), name) != out.end()) continue;
    out.push_back(std::move(name));
  }
  return out;
}

std::vector<std::string> split_column_list(std::string_view list) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (start <= list.size()) {
    const std::size_t pos = list.find(',', start);
    const std::size_t end = (pos == std::string_view::npos) ? list.size() : pos;
    parts.emplace_back(list.substr(start, end - start));
    if (pos == std::string_view::npos) break;
    start = pos + 1;
  }
  return normalize_columns(parts);
}

// Keys are tried in table order; for each key the first column by position
// wins. `taken` is never returned.
static std::optional<std::size_t> first_match(const std::vector<std::string>& columns,
                                              const std::vector<std::string>& keys,
                                              std::optional<std::size_t> taken = std::nullopt) {
  for (const auto& k : keys) {
    for (std::size_t i = 0; i < columns.size(); ++i) {
      if (taken && *taken == i) continue;
      if (icontains(columns[i], k)) return i;
    }
  }
  return std::nullopt;
}

ColumnRoles resolve_column_roles(const std::vector<std::string>& columns,
                                 const ColumnRolePolicy& policy) {
  ColumnRoles roles;
  roles.email = first_match(columns, policy.email_keys);
  roles.phone = first_match(columns, policy.phone_keys, roles.email);
  return roles;
}

void check_header(const Row& header, const std::vector<std::string>& expected) {
  if (header.size() != expected.size())
    throw StructureError::column_count(expected.size(), header.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    if (!ieq(trim(header[i]), trim(expected[i])))
      throw StructureError::column_name(i + 1, expected[i], header[i]);
  }
}

static bool has_content(std::string_view text) {
  std::size_t start = 0;
  while (start <= text.size()) {
    const std::size_t pos = text.find('\n', start);
    const std::size_t end = (pos == std::string_view::npos) ? text.size() : pos;
    if (!trim(text.substr(start, end - start)).empty()) return true;
    if (pos == std::string_view::npos) break;
    start = pos + 1;
  }
  return false;
}

Pipeline::Pipeline(PipelineConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<RowVerdict> Pipeline::validate_all(const std::vector<Row>& rows,
                                               std::size_t width,
                                               const ColumnRoles& roles) const {
  // rows[0] is the header; verdicts[i] belongs to rows[i + 1]
  const std::size_t n = rows.empty() ? 0 : rows.size() - 1;
  std::vector<RowVerdict> verdicts(n);
  auto work = [&](std::size_t b, std::size_t e) {
    for (std::size_t i = b; i < e; ++i) verdicts[i] = validate_row(rows[i + 1], width, roles, cfg_.row);
  };

  const auto workers = static_cast<unsigned>(std::min<std::size_t>(cfg_.workers, n));
  if (workers <= 1 || n < cfg_.parallel_min_rows) {
    work(0, n);
    return verdicts;
  }

  const std::size_t chunk = (n + workers - 1) / workers;
  std::vector<std::thread> pool;
  std::vector<std::exception_ptr> errors(workers);
  pool.reserve(workers);
  for (unsigned w = 0; w < workers; ++w) {
    const std::size_t b = w * chunk;
    const std::size_t e = std::min(n, b + chunk);
    if (b >= e) break;
    pool.emplace_back([&, w, b, e] {
      try { work(b, e); } catch (...) { errors[w] = std::current_exception(); }
    });
  }
  for (auto& t : pool) t.join();
  for (auto& ep : errors) if (ep) std::rethrow_exception(ep);
  return verdicts;
}

ParseResult Pipeline::run(std::string_view text,
                          const std::vector<std::string>& expected_columns,
                          MetricsRegistry* metrics) const {
  if (expected_columns.empty()) throw StructureError::no_columns();
  if (!has_content(text)) throw StructureError::empty_input();
  if (metrics) metrics->add_bytes(text.size());

  std::vector<Row> rows;
  {
    StageTimer t(metrics, "tokenize");
    rows = tokenize_csv(text, cfg_.csv);
  }
  if (rows.empty()) throw StructureError::empty_input();
  check_header(rows[0], expected_columns);

  ParseResult res;
  res.roles = resolve_column_roles(expected_columns, cfg_.roles);

  Row header;
  header.reserve(rows[0].size());
  for (const auto& f : rows[0]) header.push_back(clean_field(f));
  res.valid_rows.reserve(rows.size());
  res.valid_rows.push_back(std::move(header));

  std::vector<RowVerdict> verdicts;
  {
    StageTimer t(metrics, "validate");
    verdicts = validate_all(rows, expected_columns.size(), res.roles);
  }

  for (auto& v : verdicts) {
    if (metrics) metrics->add_row(v.accepted());
    if (!v.accepted()) {
      ++res.invalid_row_count;
      const std::string reason(reject_reason_name(v.reason));
      ++res.rejects_by_reason[reason];
      if (metrics) metrics->add_reject(reason);
      continue;
    }
    if (v.email_corrected) {
      ++res.emails_corrected;
      if (metrics) metrics->add_email_corrected();
    }
    if (v.phone_cleared) {
      ++res.phones_cleared;
      if (metrics) metrics->add_phone_cleared();
    }
    res.valid_rows.push_back(std::move(v.row));
  }
  return res;
}

}
