#include "doctest.h"

#include "hostcaps/core/text.h"

using hostcaps::text::iequals;
using hostcaps::text::istarts_with;
using hostcaps::text::lower_ascii;

TEST_CASE("lower_ascii folds A-Z only")
{
    CHECK(lower_ascii("LibZ-1.2") == "libz-1.2");
    CHECK(lower_ascii("") == "");
    CHECK(lower_ascii("\xC3\x89t\xC3\xA9") == "\xC3\x89t\xC3\xA9");
}

TEST_CASE("iequals and istarts_with ignore ASCII case")
{
    CHECK(iequals("Darwin", "DARWIN"));
    CHECK_FALSE(iequals("Darwin", "Darwi"));
    CHECK(istarts_with("Windows_NT", "windows"));
    CHECK(istarts_with("mac", "MAC"));
    CHECK_FALSE(istarts_with("ma", "mac"));
}
