#include "doctest.h"

#include "hostcaps/platform/host_runtime.h"

#include <cstdlib>
#include <string>

using hostcaps::probe::OsFamily;

TEST_CASE("POSIX host runtime resolves libc symbols")
{
    auto host = hostcaps::platform::create_host_runtime();
    REQUIRE(host);

    CHECK(host->hasSymbol("malloc"));
    CHECK(host->hasSymbol("symlink"));
    CHECK_FALSE(host->hasSymbol("hostcaps_no_such_symbol_4f1e"));
}

TEST_CASE("POSIX host runtime reports the OS and environment")
{
    auto host = hostcaps::platform::create_host_runtime();
    REQUIRE(host);

    CHECK_FALSE(host->osName().empty());

    const char* path = std::getenv("PATH");
    const auto env = host->environment("PATH");
    CHECK(env.has_value() == (path != nullptr));
    if (path && env) {
        CHECK(*env == path);
    }
    CHECK_FALSE(host->environment("HOSTCAPS_UNSET_VARIABLE_4f1e").has_value());
}

#if defined(__linux__)
TEST_CASE("POSIX host runtime sees the C library as a loaded module")
{
    auto host = hostcaps::platform::create_host_runtime();
    REQUIRE(host);

    bool sawLibc = false;
    for (const auto& m : host->loadedModules()) {
        CHECK_FALSE(m.name.empty());
        if (m.name == "c") sawLibc = true;
    }
    CHECK(sawLibc);
}
#endif

TEST_CASE("Host filesystem passes paths through")
{
    auto fs = hostcaps::platform::create_host_filesystem();
    REQUIRE(fs);

    CHECK(fs->exists("/"));
    CHECK(fs->isDirectory("/"));
    CHECK(fs->exists("."));
    CHECK_FALSE(fs->exists("/hostcaps/no/such/path"));
}

TEST_CASE("Default probe is one shared instance over the real host")
{
    auto& a = hostcaps::platform::default_feature_probe();
    auto& b = hostcaps::platform::default_feature_probe();
    CHECK(&a == &b);

    auto host = hostcaps::platform::create_host_runtime();
    CHECK(a.osClassification().name == host->osName());
    CHECK(a.supportsSymLink());
    CHECK(a.getImageConvertExecutable() == b.getImageConvertExecutable());
#if defined(__linux__)
    CHECK(a.osClassification().family == OsFamily::Linux);
    CHECK(a.hasExtensionSupport("c"));
#endif
}
