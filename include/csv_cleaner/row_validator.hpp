#pragma once
#include "csv_cleaner/contact_policy.hpp"
#include "csv_cleaner/row.hpp"
#include <cstddef>
#include <optional>
#include <string_view>

namespace cc {

enum class RejectReason {
  None,
  WidthMismatch,     // field count differs from the expected column count
  InvalidEmail,      // email column fails validation after normalisation
  UnbalancedQuotes,  // odd number of unescaped '"' left in a cleaned field
  MalformedPattern,  // ",...\"" or "\"...," survived cleaning
};

// Stable snake_case name used in reports.
std::string_view reject_reason_name(RejectReason r) noexcept;

// Zero-based indices of the email / phone columns, if any.
struct ColumnRoles {
  std::optional<std::size_t> email;
  std::optional<std::size_t> phone;
};

struct RowVerdict {
  RejectReason reason = RejectReason::None;
  Row row;                       // cleaned row; empty when rejected
  bool email_corrected = false;  // normalize_email changed the value
  bool phone_cleared = false;    // invalid phone was blanked

  bool accepted() const noexcept { return reason == RejectReason::None; }
};

struct RowPolicy {
  EmailPolicy email;
  PhonePolicy phone;
};

// Clean every field of `row`, then apply the email / phone rules and the
// malformed-quote sweep. Phone failures degrade the row, they never reject it.
RowVerdict validate_row(const Row& row, std::size_t expected_width,
                        const ColumnRoles& roles, const RowPolicy& policy = {});

// Unescaped quote count is odd, or a residual ",...\"" / "\"...," shape remains.
RejectReason sweep_field(std::string_view field) noexcept;

}
