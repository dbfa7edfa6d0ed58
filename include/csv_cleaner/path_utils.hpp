#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace cc {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Only ".csv" (any case) is accepted as input.
bool is_csv_path(std::string_view path);

// "data/in.csv" -> "cleaned_in.csv"; empty name -> "cleaned_csv.csv".
std::string cleaned_file_name(std::string_view path);

// Slug per mode: "hashprefix" (default) or "basename".
std::string make_slug(std::string_view key, std::string_view mode, int len);

// Hash helper (stable) used by slug.
std::string hex_hash_prefix(std::string_view data, int len);

}
