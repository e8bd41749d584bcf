#include "hostcaps/platform/host_runtime.h"

#include "hostcaps/core/logging.h"
#include "hostcaps/platform/posix/fs_factory.h"

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <dlfcn.h>
#include <sys/utsname.h>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#else
#include <link.h>
#endif

namespace hostcaps::platform {

static constexpr const char* TAG = "host";

namespace {

using hostcaps::probe::LoadedModule;

#if !defined(__APPLE__)
int collect_object_name(struct dl_phdr_info* info, size_t, void* data)
{
    auto* names = static_cast<std::vector<std::string>*>(data);
    if (info->dlpi_name && info->dlpi_name[0] != '\0') {
        names->emplace_back(info->dlpi_name);
    }
    return 0;
}
#endif

std::vector<std::string> mapped_object_paths()
{
    std::vector<std::string> names;
#if defined(__APPLE__)
    const uint32_t count = _dyld_image_count();
    for (uint32_t i = 0; i < count; ++i) {
        const char* n = _dyld_get_image_name(i);
        if (n && n[0] != '\0') {
            names.emplace_back(n);
        }
    }
#else
    ::dl_iterate_phdr(&collect_object_name, &names);
#endif
    return names;
}

// Loader names are often short symlinks (libz.so.1); the target may carry
// the full version (libz.so.1.3.1).
std::string resolve_link(const std::string& path)
{
    std::unique_ptr<char, decltype(&std::free)> real(::realpath(path.c_str(), nullptr), &std::free);
    if (!real) {
        return path;
    }
    return std::string(real.get());
}

class PosixHostRuntime final : public probe::IHostRuntime {
public:
    bool hasSymbol(std::string_view name) override
    {
        const std::string sym(name);
        void* addr = ::dlsym(RTLD_DEFAULT, sym.c_str());
        return addr != nullptr;
    }

    std::vector<LoadedModule> loadedModules() override
    {
        std::vector<LoadedModule> out;
        for (const auto& path : mapped_object_paths()) {
            auto m = probe::module_from_paths(path, resolve_link(path));
            if (m) {
                out.push_back(std::move(*m));
            } else {
                HC_LOGV(TAG, "skipping mapped object '%s'", path.c_str());
            }
        }
        return out;
    }

    std::string osName() override
    {
        struct utsname u{};
        if (::uname(&u) != 0) {
            HC_LOGW(TAG, "uname() failed; OS name unknown");
            return {};
        }
        return std::string(u.sysname);
    }

    std::optional<std::string> environment(std::string_view name) override
    {
        const std::string key(name);
        const char* value = std::getenv(key.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    }
};

} // namespace

std::unique_ptr<probe::IHostRuntime> create_host_runtime()
{
    return std::make_unique<PosixHostRuntime>();
}

std::unique_ptr<fs::IFileSystem> create_host_filesystem()
{
    return posix::create_host_filesystem("", "host");
}

probe::FeatureProbe& default_feature_probe()
{
    static const std::unique_ptr<probe::IHostRuntime> host = create_host_runtime();
    static const std::unique_ptr<fs::IFileSystem> hostFs = create_host_filesystem();
    static probe::FeatureProbe probe(*host, *hostFs);
    return probe;
}

} // namespace hostcaps::platform
