#include "hostcaps/core/text.h"

#include <cctype>
#include <cstddef>

namespace hostcaps::text {

static char lower_char(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string lower_ascii(std::string_view s)
{
    std::string out(s);
    for (auto& ch : out) ch = lower_char(ch);
    return out;
}

bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (lower_char(a[i]) != lower_char(b[i])) {
            return false;
        }
    }
    return true;
}

bool istarts_with(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}

} // namespace hostcaps::text
