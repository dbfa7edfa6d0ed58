#pragma once
#include <string>
#include <string_view>

namespace cc {

// ASCII whitespace: ' ', \t, \n, \v, \f, \r
bool is_space(char c) noexcept;

std::string_view trim(std::string_view s) noexcept;

// Case-insensitive (ASCII) equality / substring test.
bool ieq(std::string_view a, std::string_view b) noexcept;
bool icontains(std::string_view haystack, std::string_view needle) noexcept;

std::string to_lower(std::string_view s);

bool starts_with(std::string_view s, char c) noexcept;
bool ends_with(std::string_view s, char c) noexcept;

}
