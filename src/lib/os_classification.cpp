#include "hostcaps/probe/os_classification.h"

#include "hostcaps/core/text.h"

namespace hostcaps::probe {

using text::iequals;
using text::istarts_with;

OsClassification classify_os_name(std::string_view osName)
{
    OsClassification os;
    os.name = std::string(osName);

    if (istarts_with(osName, "windows")) {
        os.family = OsFamily::Windows;
    } else if (istarts_with(osName, "mac") || iequals(osName, "darwin")) {
        os.family = OsFamily::Mac;
    } else if (iequals(osName, "linux")) {
        os.family = OsFamily::Linux;
    } else if (istarts_with(osName, "freebsd")) {
        os.family = OsFamily::FreeBSD;
    } else {
        os.family = OsFamily::Other;
    }
    return os;
}

bool is_unix_like(const OsClassification& os)
{
    switch (os.family) {
    case OsFamily::Mac:
    case OsFamily::Linux:
    case OsFamily::FreeBSD:
        return true;
    case OsFamily::Windows:
        return false;
    case OsFamily::Other:
        return iequals(os.name, "unix")
            || iequals(os.name, "darwin")
            || iequals(os.name, "macos");
    }
    return false;
}

std::string_view to_string(OsFamily family)
{
    switch (family) {
    case OsFamily::Windows: return "Windows";
    case OsFamily::Mac:     return "Mac";
    case OsFamily::Linux:   return "Linux";
    case OsFamily::FreeBSD: return "FreeBSD";
    case OsFamily::Other:   return "Other";
    }
    return "Other";
}

std::string display_name(const OsClassification& os)
{
    if (os.family == OsFamily::Other) {
        return os.name;
    }
    return std::string(to_string(os.family));
}

} // namespace hostcaps::probe
