#include <string_view>

namespace hostcaps {

std::string_view version()
{
    static constexpr std::string_view v = "0.1.0";
    return v;
}

} // namespace hostcaps
