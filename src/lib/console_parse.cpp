#include "hostcaps/console/console_parse.h"

#include <cctype>

namespace hostcaps::console {

static bool is_ws(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim_ws(std::string_view s)
{
    while (!s.empty() && is_ws(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_ws(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string_view> split_ws(std::string_view s)
{
    std::vector<std::string_view> out;
    s = trim_ws(s);
    while (!s.empty()) {
        if (s.front() == '"') {
            s.remove_prefix(1);
            const std::size_t close = s.find('"');
            if (close == std::string_view::npos) {
                out.push_back(s);
                break;
            }
            out.push_back(s.substr(0, close));
            s.remove_prefix(close + 1);
        } else {
            std::size_t i = 0;
            while (i < s.size() && !is_ws(s[i])) {
                ++i;
            }
            out.push_back(s.substr(0, i));
            s.remove_prefix(i);
        }
        s = trim_ws(s);
    }
    return out;
}

bool is_comment_or_blank(std::string_view line)
{
    line = trim_ws(line);
    return line.empty() || line.front() == '#';
}

} // namespace hostcaps::console
