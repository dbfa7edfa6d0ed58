#pragma once
#include "csv_cleaner/contact_policy.hpp"
#include "csv_cleaner/row.hpp"
#include "csv_cleaner/row_validator.hpp"
#include "csv_cleaner/token_csv_fsm.hpp"
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cc {

class MetricsRegistry;

// Fatal to the run: the header does not match the expected columns, or
// there is nothing to check it against.
class StructureError : public std::runtime_error {
public:
  enum class Kind { NoColumns, EmptyInput, ColumnCount, ColumnName };

  static StructureError no_columns();
  static StructureError empty_input();
  static StructureError column_count(std::size_t expected, std::size_t actual);
  // `position` is 1-based.
  static StructureError column_name(std::size_t position, std::string expected, std::string actual);

  Kind kind() const noexcept { return kind_; }
  std::size_t expected_count() const noexcept { return expected_count_; }
  std::size_t actual_count() const noexcept { return actual_count_; }
  std::size_t position() const noexcept { return position_; }
  const std::string& expected_name() const noexcept { return expected_name_; }
  const std::string& actual_name() const noexcept { return actual_name_; }

private:
  StructureError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

  Kind kind_;
  std::size_t expected_count_{0};
  std::size_t actual_count_{0};
  std::size_t position_{0};
  std::string expected_name_;
  std::string actual_name_;
};

struct ParseResult {
  std::vector<Row> valid_rows;  // [0] is the cleaned header
  std::size_t invalid_row_count = 0;
  std::size_t emails_corrected = 0;
  std::size_t phones_cleared = 0;
  std::map<std::string, std::size_t> rejects_by_reason;
  ColumnRoles roles;
};

struct PipelineConfig {
  CsvConfig csv;
  RowPolicy row;
  ColumnRolePolicy roles;
  unsigned workers = 1;                  // > 1 enables threaded row validation
  std::size_t parallel_min_rows = 4096;  // below this, stay sequential
};

// Trim names, drop empty ones and exact duplicates (first occurrence wins).
std::vector<std::string> normalize_columns(const std::vector<std::string>& raw);

// "name, email,phone" -> {"name","email","phone"}, normalised.
std::vector<std::string> split_column_list(std::string_view list);

// Email: first column containing an email key. Phone: phone keys in table
// order, first column per key, never the email column.
ColumnRoles resolve_column_roles(const std::vector<std::string>& columns,
                                 const ColumnRolePolicy& policy = {});

// Throws StructureError on a count or (case-insensitive) name mismatch.
void check_header(const Row& header, const std::vector<std::string>& expected);

class Pipeline {
public:
  explicit Pipeline(PipelineConfig cfg = {});

  // Throws StructureError; rejected rows are counted, never thrown.
  ParseResult run(std::string_view text,
                  const std::vector<std::string>& expected_columns,
                  MetricsRegistry* metrics = nullptr) const;

private:
  std::vector<RowVerdict> validate_all(const std::vector<Row>& rows,
                                       std::size_t width,
                                       const ColumnRoles& roles) const;

  PipelineConfig cfg_;
};

}
