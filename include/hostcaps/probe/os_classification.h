#pragma once

#include <string>
#include <string_view>

namespace hostcaps::probe {

enum class OsFamily {
    Windows,
    Mac,
    Linux,
    FreeBSD,
    Other,
};

struct OsClassification {
    OsFamily    family{OsFamily::Other};
    std::string name;   // raw host OS name, as reported by the platform

    bool operator==(const OsClassification& o) const
    {
        return family == o.family && name == o.name;
    }
};

// Normalize a host OS name (uname sysname, "Windows NT", ...).
// Matching is case-insensitive; unrecognized names are kept verbatim as Other.
OsClassification classify_os_name(std::string_view osName);

// True for the families whose executables are searched with ':' separators.
// Other counts when its name is a generic Unix/Darwin spelling.
bool is_unix_like(const OsClassification& os);

std::string_view to_string(OsFamily family);

// Family name, or the raw OS name for Other.
std::string display_name(const OsClassification& os);

} // namespace hostcaps::probe
