#include "csv_cleaner/path_utils.hpp"
#include "csv_cleaner/text_utils.hpp"
#include <functional>
#include <iomanip>
#include <sstream>
#if defined(CC_USE_OPENSSL)
  #include <openssl/sha.h>
#endif

namespace cc {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

bool is_csv_path(std::string_view path) {
  return ieq(std::filesystem::path(std::string(path)).extension().string(), ".csv");
}

std::string cleaned_file_name(std::string_view path) {
  const auto base = std::filesystem::path(std::string(path)).filename().string();
  if (base.empty()) return "cleaned_csv.csv";
  return "cleaned_" + base;
}

std::string hex_hash_prefix(std::string_view data, int len) {
#ifdef CC_USE_OPENSSL
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
  std::ostringstream o;
  for (int i = 0; i < (len + 1) / 2 && i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
  auto s = o.str();
  if (static_cast<int>(s.size()) > len) s.resize(len);
  return s;
#else
  // Fallback (non-crypto)
  const std::size_t h = std::hash<std::string_view>{}(data);
  std::ostringstream o; o << std::hex << std::setw(16) << std::setfill('0') << h;
  auto s = o.str(); if (static_cast<int>(s.size()) > len) s.resize(len); return s;
#endif
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (mode == "basename") {
    auto base = std::filesystem::path(std::string(key)).stem().string();
    for (auto& c : base) if (c == ' ' || c == '/' || c == '\\') c = '-';
    if (static_cast<int>(base.size()) > len) base.resize(len);
    return base.empty() ? hex_hash_prefix(key, len) : base;
  }
  return hex_hash_prefix(key, len);
}

}
