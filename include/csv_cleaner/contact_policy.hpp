#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cc {

// TLD tables used by normalize_email. Suffixes include the leading '.'.
struct EmailPolicy {
  // Suffixes that are never rewritten.
  std::vector<std::string> allowed_tlds = {
    ".co", ".io", ".org", ".net", ".edu", ".gov", ".mil", ".int",
    ".uk", ".us", ".ca", ".au", ".in", ".de", ".fr", ".jp", ".cn"};

  // typo -> correction
  std::vector<std::pair<std::string, std::string>> tld_typos = {
    {".con", ".com"}, {".cmo", ".com"}, {".comn", ".com"}, {".comm", ".com"},
    {".coom", ".com"}, {".com,", ".com"},
    {".or", ".org"}, {".ogr", ".org"},
    {".ne", ".net"}, {".net,", ".net"}};
};

struct PhonePolicy {
  std::string format_chars = " -().+";
  std::size_t min_digits = 10;
  std::size_t max_digits = 15;
};

// Column-name keys that mark the email / phone roles (case-insensitive substring).
struct ColumnRolePolicy {
  std::vector<std::string> email_keys = {"email"};
  std::vector<std::string> phone_keys = {"phone", "mobile", "contact"};
};

// Repair a mistyped top-level domain ("a@b.con" -> "a@b.com").
// Anything that is not a single local@domain pair is returned as-is.
std::string normalize_email(std::string_view email, const EmailPolicy& policy = {});

bool is_valid_email(std::string_view email);
bool is_valid_phone(std::string_view phone, const PhonePolicy& policy = {});

}
