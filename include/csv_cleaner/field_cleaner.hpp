#pragma once
#include <string>
#include <string_view>

namespace cc {

// Normalise one raw field: trim, drop a stray leading/trailing separator,
// and unwrap a surrounding pair of quotes. Never fails.
std::string clean_field(std::string_view field);

}
