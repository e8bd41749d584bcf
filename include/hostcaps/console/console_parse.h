#pragma once

#include <string_view>
#include <vector>

namespace hostcaps::console {

std::string_view trim_ws(std::string_view s);

// Split a command line on ASCII whitespace, after trimming ends.
// A token may be wrapped in double quotes to keep embedded spaces; the quotes
// are not part of the token. An unterminated quote runs to end of line.
std::vector<std::string_view> split_ws(std::string_view s);

// True for lines that carry no command: blank, or starting with '#'.
bool is_comment_or_blank(std::string_view line);

} // namespace hostcaps::console
