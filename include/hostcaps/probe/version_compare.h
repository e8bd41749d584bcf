#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace hostcaps::probe {

// Split a version string into comparable segments.
// Every character other than a letter or digit separates segments, and
// digit/non-digit boundaries start a new one:
// "1.0rc1" -> {"1", "0", "rc", "1"}, "1.0~rc1" -> the same. Empty segments
// are dropped.
std::vector<std::string> canonical_version_segments(std::string_view version);

// Dotted version comparison. Returns <0, 0 or >0.
//
// Numeric segments compare by value. Words rank as
//   unknown < dev < alpha|a < beta|b < RC|rc < (number) < pl|p
// and two unknown words compare lexicographically, ignoring case.
// When one side runs out, a trailing number makes the longer version newer
// while a trailing word is ranked against "number": 1.0rc1 < 1.0 < 1.0pl1.
int compare_versions(std::string_view a, std::string_view b);

inline bool version_at_least(std::string_view actual, std::string_view floor)
{
    return compare_versions(actual, floor) >= 0;
}

} // namespace hostcaps::probe
