#include "csv_cleaner/row_validator.hpp"
#include <iostream>
#include <string>

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (ok) { std::cout << "[PASS] " << what << "\n"; return; }
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

static std::string show(const cc::Row& r) {
  std::string s = "[";
  for (std::size_t i = 0; i < r.size(); ++i) { if (i) s += "|"; s += r[i]; }
  return s + "]";
}

int main(){
  cc::ColumnRoles roles;
  roles.email = 1;
  roles.phone = 2;

  {
    auto v = cc::validate_row({"Bob", "bob@x.com", "123"}, 3, roles);
    check(v.accepted() && v.row == cc::Row{"Bob", "bob@x.com", ""} && v.phone_cleared,
          "short phone is cleared, row kept " + show(v.row));
  }
  {
    auto v = cc::validate_row({"Ada", "ada@x.con", "+1 (415) 555-2671"}, 3, roles);
    check(v.accepted() && v.row[1] == "ada@x.com" && v.email_corrected && !v.phone_cleared,
          "email TLD repaired, valid phone kept " + show(v.row));
  }
  {
    auto v = cc::validate_row({"\"Ada\"", " ada@x.com ", "4155552671"}, 3, roles);
    check(v.accepted() && v.row == cc::Row{"Ada", "ada@x.com", "4155552671"},
          "fields cleaned before validation " + show(v.row));
  }
  {
    auto v = cc::validate_row({"Ada", "ada@x.com", "  "}, 3, roles);
    check(v.accepted() && !v.phone_cleared, "blank phone is not a failure");
  }
  {
    auto v = cc::validate_row({"Ada", "not-an-email", ""}, 3, roles);
    check(v.reason == cc::RejectReason::InvalidEmail && v.row.empty(), "bad email rejects");
  }
  {
    auto v = cc::validate_row({"Ada", "ada@x.com"}, 3, roles);
    check(v.reason == cc::RejectReason::WidthMismatch, "short row rejects");
    v = cc::validate_row({"Ada", "ada@x.com", "", "x"}, 3, roles);
    check(v.reason == cc::RejectReason::WidthMismatch, "long row rejects");
  }
  {
    auto v = cc::validate_row({"Ada \"x", "ada@x.com", ""}, 3, roles);
    check(v.reason == cc::RejectReason::UnbalancedQuotes, "odd quote count rejects");
  }
  {
    auto v = cc::validate_row({"x \"y\", z", "ada@x.com", ""}, 3, roles);
    check(v.reason == cc::RejectReason::MalformedPattern, "quote followed by comma rejects");
  }
  {
    auto v = cc::validate_row({"a\"\"b", "ada@x.com", ""}, 3, roles);
    check(v.accepted(), "escaped quote pair is balanced");
  }
  {
    cc::ColumnRoles none;
    auto v = cc::validate_row({"anything", "", "x"}, 3, none);
    check(v.accepted() && v.row[2] == "x", "no roles: no email or phone rules");
  }
  {
    cc::RowPolicy p;
    p.phone.min_digits = 3;
    auto v = cc::validate_row({"Bob", "bob@x.com", "123"}, 3, roles, p);
    check(v.accepted() && v.row[2] == "123", "phone policy is configurable");
  }

  check(cc::sweep_field(",x\"") == cc::RejectReason::UnbalancedQuotes, "sweep: ,x\"");
  check(cc::sweep_field(",x\"\"") == cc::RejectReason::MalformedPattern, "sweep: ,x\"\"");
  check(cc::sweep_field("plain, text") == cc::RejectReason::None, "sweep: comma without quote");
  check(cc::sweep_field("say \"hi\"") == cc::RejectReason::None, "sweep: balanced quotes");
  check(cc::sweep_field("say \"hi\"\nthen, later") == cc::RejectReason::None,
        "sweep: comma on a later line than the quote");
  check(cc::sweep_field(",lead\n\"q\"") == cc::RejectReason::None,
        "sweep: quote on a later line than the leading comma");
  check(cc::sweep_field("a\nsay \"x\", y") == cc::RejectReason::MalformedPattern,
        "sweep: quote then comma on the second line");

  {
    cc::ColumnRoles shared;
    shared.email = 1;
    shared.phone = 1;
    auto v = cc::validate_row({"Ada", "ada@x.com"}, 2, shared);
    check(v.accepted() && v.row[1] == "ada@x.com" && !v.phone_cleared,
          "email column never cleared by the phone rule");
  }

  check(cc::reject_reason_name(cc::RejectReason::InvalidEmail) == "invalid_email", "reason name");
  check(cc::reject_reason_name(cc::RejectReason::WidthMismatch) == "width_mismatch", "reason name");

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] row validator\n";
  return 0;
}
