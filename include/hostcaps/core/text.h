#pragma once

#include <string>
#include <string_view>

namespace hostcaps::text {

// ASCII lowercase copy; bytes outside A-Z pass through.
std::string lower_ascii(std::string_view s);

// ASCII case-insensitive comparisons.
bool iequals(std::string_view a, std::string_view b);
bool istarts_with(std::string_view s, std::string_view prefix);

} // namespace hostcaps::text
