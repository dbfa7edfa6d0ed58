#pragma once
#include "csv_cleaner/row.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace cc {

// True when the field holds ',', '"' or '\n' and must be quoted on output.
bool needs_quoting(std::string_view field) noexcept;

// Append one field, quoted with inner quotes doubled when needed.
void append_field(std::string& out, std::string_view field);

// Fields joined by ',', rows by '\n', no trailing newline.
std::string serialize_csv(const std::vector<Row>& rows);

}
