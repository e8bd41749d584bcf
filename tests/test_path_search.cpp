#include "doctest.h"

#include "fake_host.h"

#include "hostcaps/probe/os_classification.h"
#include "hostcaps/probe/path_search.h"

#include <string>
#include <vector>

using hostcaps::probe::classify_os_name;
using hostcaps::probe::is_blank;
using hostcaps::probe::resolve_executable;
using hostcaps::probe::split_search_path;
using hostcaps::tests::MemoryFileSystem;

TEST_CASE("Search lists keep empty entries")
{
    const auto parts = split_search_path("/usr/bin::/bin:", ':');
    REQUIRE(parts.size() == 4);
    CHECK(parts[0] == "/usr/bin");
    CHECK(parts[1] == "");
    CHECK(parts[2] == "/bin");
    CHECK(parts[3] == "");

    CHECK(split_search_path("C:\\tools;C:\\bin", ';').size() == 2);
}

TEST_CASE("Blank means empty or whitespace only")
{
    CHECK(is_blank(""));
    CHECK(is_blank("  \t\n"));
    CHECK_FALSE(is_blank(" /usr/bin "));
}

TEST_CASE("Unix search returns the first directory holding the file")
{
    MemoryFileSystem fs;
    fs.add_file("/usr/local/bin/convert");
    fs.add_file("/opt/bin/convert");

    const auto os = classify_os_name("Linux");
    const auto found = resolve_executable(os, "/usr/bin:/usr/local/bin:/opt/bin", "convert", fs);
    REQUIRE(found.has_value());
    CHECK(*found == "/usr/local/bin/convert");

    // Nothing past the winning directory is probed.
    CHECK(fs.checked == std::vector<std::string>{"/usr/bin/convert", "/usr/local/bin/convert"});
}

TEST_CASE("Unix search skips directories named like the executable")
{
    MemoryFileSystem fs;
    fs.add_dir("/usr/bin/convert");
    fs.add_file("/bin/convert");

    const auto found = resolve_executable(classify_os_name("FreeBSD"), "/usr/bin:/bin", "convert", fs);
    REQUIRE(found.has_value());
    CHECK(*found == "/bin/convert");
}

TEST_CASE("Unix search without a PATH falls back to the current directory")
{
    MemoryFileSystem fs;
    const auto os = classify_os_name("Darwin");

    CHECK_FALSE(resolve_executable(os, "", "identify", fs).has_value());
    CHECK_FALSE(resolve_executable(os, "   ", "identify", fs).has_value());

    fs.add_file("./identify");
    const auto found = resolve_executable(os, " ", "identify", fs);
    REQUIRE(found.has_value());
    CHECK(*found == "identify");
}

TEST_CASE("Unix search with a PATH ignores the current directory")
{
    MemoryFileSystem fs;
    fs.add_file("./convert");

    CHECK_FALSE(resolve_executable(classify_os_name("Linux"), "/usr/bin", "convert", fs).has_value());
}

TEST_CASE("Windows search appends .exe but returns the bare path")
{
    MemoryFileSystem fs;
    fs.add_file("C:\\bin\\convert.exe");

    const auto os = classify_os_name("Windows NT");
    const auto found = resolve_executable(os, "C:\\tools;C:\\bin", "convert", fs);
    REQUIRE(found.has_value());
    CHECK(*found == "C:\\bin\\convert");
    CHECK(fs.checked == std::vector<std::string>{"C:\\tools\\convert.exe", "C:\\bin\\convert.exe"});
}

TEST_CASE("Windows search without a PATH checks the current directory")
{
    MemoryFileSystem fs;
    const auto os = classify_os_name("Windows NT");

    CHECK_FALSE(resolve_executable(os, "", "identify", fs).has_value());

    fs.add_file("identify.exe");
    const auto found = resolve_executable(os, "", "identify", fs);
    REQUIRE(found.has_value());
    CHECK(*found == "identify");
}

TEST_CASE("Windows search does not split on colons")
{
    MemoryFileSystem fs;
    fs.add_file("/usr/bin/convert");

    CHECK_FALSE(resolve_executable(classify_os_name("Windows NT"), "/usr/bin:/bin", "convert", fs).has_value());
}

TEST_CASE("Unclassified hosts never resolve")
{
    MemoryFileSystem fs;
    fs.add_file("/usr/bin/convert");
    fs.add_file("./convert");

    CHECK_FALSE(resolve_executable(classify_os_name("SunOS"), "/usr/bin", "convert", fs).has_value());
    CHECK_FALSE(resolve_executable(classify_os_name("SunOS"), "", "convert", fs).has_value());
    CHECK(fs.exists_calls == 0);
}

TEST_CASE("Generic Unix spelling searches like Linux")
{
    MemoryFileSystem fs;
    fs.add_file("/usr/bin/convert");

    const auto found = resolve_executable(classify_os_name("Unix"), "/usr/bin", "convert", fs);
    REQUIRE(found.has_value());
    CHECK(*found == "/usr/bin/convert");
}
