#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cc {

struct RunJsonPayload {
  // Row accounting
  std::uint64_t rows_total = 0;
  std::uint64_t rows_valid = 0;
  std::uint64_t invalid_row_count = 0;
  std::uint64_t emails_corrected = 0;
  std::uint64_t phones_cleared = 0;

  // Timing
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double rows_per_sec = 0.0;
  std::vector<std::pair<std::string, double>> stage_times;

  std::map<std::string, std::uint64_t> rejects_by_reason;

  // Input / output metadata
  std::string filename;
  std::string output_name;
  std::vector<std::string> columns;
  long long email_column = -1;
  long long phone_column = -1;
  std::string message;
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON object.
  static std::string to_json(const RunJsonPayload& p);
};

// JSON string literal (quotes included) for `s`.
std::string json_quote(const std::string& s);

}
