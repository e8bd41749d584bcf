#include "doctest.h"

#include "hostcaps/probe/os_classification.h"

using hostcaps::probe::OsFamily;
using hostcaps::probe::classify_os_name;
using hostcaps::probe::display_name;
using hostcaps::probe::is_unix_like;

TEST_CASE("OS names map onto families")
{
    CHECK(classify_os_name("Windows NT").family == OsFamily::Windows);
    CHECK(classify_os_name("WINDOWS").family == OsFamily::Windows);
    CHECK(classify_os_name("Mac OS X").family == OsFamily::Mac);
    CHECK(classify_os_name("Darwin").family == OsFamily::Mac);
    CHECK(classify_os_name("Linux").family == OsFamily::Linux);
    CHECK(classify_os_name("LINUX").family == OsFamily::Linux);
    CHECK(classify_os_name("FreeBSD").family == OsFamily::FreeBSD);
    CHECK(classify_os_name("freebsd-13").family == OsFamily::FreeBSD);
}

TEST_CASE("Linux must match exactly")
{
    CHECK(classify_os_name("Linux-gnu").family == OsFamily::Other);
    CHECK(classify_os_name("GNU/Linux").family == OsFamily::Other);
}

TEST_CASE("Unrecognized names are kept verbatim")
{
    const auto os = classify_os_name("SunOS");
    CHECK(os.family == OsFamily::Other);
    CHECK(os.name == "SunOS");
    CHECK(display_name(os) == "SunOS");

    const auto empty = classify_os_name("");
    CHECK(empty.family == OsFamily::Other);
    CHECK(empty.name.empty());
}

TEST_CASE("Display name uses the family unless Other")
{
    CHECK(display_name(classify_os_name("Darwin")) == "Mac");
    CHECK(display_name(classify_os_name("Windows NT")) == "Windows");
}

TEST_CASE("Unix-like families")
{
    CHECK(is_unix_like(classify_os_name("Linux")));
    CHECK(is_unix_like(classify_os_name("Darwin")));
    CHECK(is_unix_like(classify_os_name("FreeBSD")));
    CHECK(is_unix_like(classify_os_name("Unix")));
    CHECK_FALSE(is_unix_like(classify_os_name("Windows NT")));
    CHECK_FALSE(is_unix_like(classify_os_name("SunOS")));
}
