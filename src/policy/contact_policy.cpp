#include "csv_cleaner/contact_policy.hpp"
#include "csv_cleaner/text_utils.hpp"
#include <algorithm>
#include <cctype>

namespace cc {

static bool in_table(const std::vector<std::string>& table, std::string_view s) {
  for (const auto& t : table) if (ieq(t, s)) return true;
  return false;
}

static const std::string* find_typo(const EmailPolicy& policy, std::string_view suffix) {
  for (const auto& kv : policy.tld_typos) if (ieq(kv.first, suffix)) return &kv.second;
  return nullptr;
}

std::string normalize_email(std::string_view email, const EmailPolicy& policy) {
  const auto at = email.find('@');
  if (at == std::string_view::npos) return std::string(email);
  if (email.find('@', at + 1) != std::string_view::npos) return std::string(email);

  const std::string_view local  = email.substr(0, at);
  const std::string_view domain = email.substr(at + 1);
  if (domain.empty()) return std::string(email);

  const auto dot = domain.rfind('.');
  if (dot == std::string_view::npos) return std::string(email);
  const std::string_view suffix = domain.substr(dot);

  if (in_table(policy.allowed_tlds, suffix)) return std::string(email);

  const std::string* fix = find_typo(policy, suffix);
  if (!fix && ends_with(suffix, ',')) fix = find_typo(policy, suffix.substr(0, suffix.size() - 1));
  if (!fix) return std::string(email);

  std::string out;
  out.reserve(email.size() + 1);
  out.append(local);
  out.push_back('@');
  out.append(domain.substr(0, dot));
  out.append(*fix);
  return out;
}

// local@host.tld with no '@' or whitespace inside any part
static bool email_shape(std::string_view s) {
  const auto at = s.find('@');
  const std::string_view local = s.substr(0, at);
  const std::string_view domain = s.substr(at + 1);
  const auto dot = domain.find('.');
  return !local.empty() && dot != std::string_view::npos && dot > 0 && dot + 1 < domain.size();
}

bool is_valid_email(std::string_view email) {
  if (trim(email).empty()) return false;
  if (std::any_of(email.begin(), email.end(), is_space)) return false;
  if (std::count(email.begin(), email.end(), '@') != 1) return false;

  const auto at = email.find('@');
  const std::string_view local  = email.substr(0, at);
  const std::string_view domain = email.substr(at + 1);
  if (local.empty() || domain.empty()) return false;
  if (domain.find('.') == std::string_view::npos) return false;
  if (domain.front() == '.' || domain.back() == '.') return false;
  return email_shape(email);
}

bool is_valid_phone(std::string_view phone, const PhonePolicy& policy) {
  const std::string_view v = trim(phone);
  if (v.empty()) return false;

  std::size_t digits = 0;
  for (char c : v) {
    if (policy.format_chars.find(c) != std::string::npos) continue;
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    ++digits;
  }
  return digits >= policy.min_digits && digits <= policy.max_digits;
}

}
