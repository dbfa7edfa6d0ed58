#include "csv_cleaner/csv_writer.hpp"

namespace cc {

bool needs_quoting(std::string_view field) noexcept {
  return field.find_first_of(",\"\n") != std::string_view::npos;
}

void append_field(std::string& out, std::string_view field) {
  if (!needs_quoting(field)) { out.append(field); return; }
  out.push_back('"');
  for (char c : field) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
}

std::string serialize_csv(const std::vector<Row>& rows) {
  std::size_t guess = 0;
  for (const auto& r : rows) for (const auto& f : r) guess += f.size() + 1;

  std::string out;
  out.reserve(guess + 16);
  for (std::size_t i = 0; i < rows.size(); ++i) {
    if (i) out.push_back('\n');
    const Row& r = rows[i];
    for (std::size_t j = 0; j < r.size(); ++j) {
      if (j) out.push_back(',');
      append_field(out, r[j]);
    }
  }
  return out;
}

}
