#include "csv_cleaner/row_validator.hpp"
#include "csv_cleaner/field_cleaner.hpp"
#include "csv_cleaner/text_utils.hpp"

namespace cc {

std::string_view reject_reason_name(RejectReason r) noexcept {
  switch (r) {
    case RejectReason::None:             return "none";
    case RejectReason::WidthMismatch:    return "width_mismatch";
    case RejectReason::InvalidEmail:     return "invalid_email";
    case RejectReason::UnbalancedQuotes: return "unbalanced_quotes";
    case RejectReason::MalformedPattern: return "malformed_pattern";
  }
  return "unknown";
}

RejectReason sweep_field(std::string_view field) noexcept {
  const std::string_view v = trim(field);

  std::size_t quotes = 0;
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (v[i] != '"') continue;
    if (i + 1 < v.size() && v[i + 1] == '"') { ++i; continue; } // "" pair
    ++quotes;
  }
  if (quotes % 2 != 0) return RejectReason::UnbalancedQuotes;

  // leading comma with a quote later on the same line
  if (starts_with(v, ',')) {
    const auto q = v.find_first_of("\"\n", 1);
    if (q != std::string_view::npos && v[q] == '"') return RejectReason::MalformedPattern;
  }
  // a quote with a comma later on the same line
  for (auto q = v.find('"'); q != std::string_view::npos; q = v.find('"', q + 1)) {
    const auto c = v.find_first_of(",\n", q + 1);
    if (c != std::string_view::npos && v[c] == ',') return RejectReason::MalformedPattern;
  }

  return RejectReason::None;
}

RowVerdict validate_row(const Row& row, std::size_t expected_width,
                        const ColumnRoles& roles, const RowPolicy& policy) {
  RowVerdict v;
  if (row.size() != expected_width) { v.reason = RejectReason::WidthMismatch; return v; }

  Row cleaned;
  cleaned.reserve(row.size());
  for (const auto& f : row) cleaned.push_back(clean_field(f));

  if (roles.email && *roles.email < cleaned.size()) {
    Field& email = cleaned[*roles.email];
    std::string fixed = normalize_email(email, policy.email);
    if (fixed != email) { v.email_corrected = true; email = std::move(fixed); }
    if (!is_valid_email(email)) { v.reason = RejectReason::InvalidEmail; return v; }
  }

  if (roles.phone && *roles.phone < cleaned.size() && roles.phone != roles.email) {
    Field& phone = cleaned[*roles.phone];
    if (!trim(phone).empty() && !is_valid_phone(phone, policy.phone)) {
      phone.clear();
      v.phone_cleared = true;
    }
  }

  for (const auto& f : cleaned) {
    const RejectReason r = sweep_field(f);
    if (r != RejectReason::None) { v.reason = r; return v; }
  }

  v.row = std::move(cleaned);
  return v;
}

}
