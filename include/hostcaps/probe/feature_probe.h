#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hostcaps/config/probe_config.h"
#include "hostcaps/fs/filesystem.h"
#include "hostcaps/probe/host_runtime.h"
#include "hostcaps/probe/loaded_module.h"
#include "hostcaps/probe/os_classification.h"

namespace hostcaps::probe {

// Capability queries against one host.
//
// Every query answers with false / nullopt when the capability is missing;
// nothing here throws. The two executable paths and the OS classification are
// resolved on first use and then kept for the lifetime of the probe, "not
// found" included. The host runtime and filesystem must outlive the probe.
class FeatureProbe {
public:
    FeatureProbe(IHostRuntime& host, fs::IFileSystem& fs, config::ProbeConfig cfg = {});

    FeatureProbe(const FeatureProbe&) = delete;
    FeatureProbe& operator=(const FeatureProbe&) = delete;

    bool supportsHardLink();
    bool supportsSymLink();
    bool supportsUserId();

    // Is the module loaded, and (when given) is its version >= minVersion?
    bool hasExtensionSupport(std::string_view name,
                             std::optional<std::string_view> minVersion = std::nullopt);

    // Version of a loaded module ("" if it has none); nullopt if not loaded.
    std::optional<std::string> loadedModuleVersion(std::string_view name);

    // Sorted, de-duplicated names of all loaded modules.
    std::vector<std::string> loadedModuleNames();

    bool hasFunction(std::string_view name);

    bool hasImageConvert();
    std::optional<std::string> getImageConvertExecutable();

    bool hasImageIdentify();
    std::optional<std::string> getImageIdentifyExecutable();

    OsClassification osClassification();

    // Uncached PATH search for an arbitrary executable name.
    std::optional<std::string> resolveExecutablePath(std::string_view fileName);

    const config::ProbeConfig& config() const { return _cfg; }

private:
    struct CachedPath {
        bool                       resolved{false};
        std::optional<std::string> path;
    };

    std::optional<std::string> cachedExecutable(CachedPath& slot, const std::string& fileName);
    std::optional<std::string> resolveLocked(std::string_view fileName);
    OsClassification osClassificationLocked();
    std::string canonicalModuleName(std::string_view name) const;

    IHostRuntime&       _host;
    fs::IFileSystem&    _fs;
    config::ProbeConfig _cfg;

    std::mutex                      _mutex;
    CachedPath                      _imageConvert;
    CachedPath                      _imageIdentify;
    std::optional<OsClassification> _os;
};

} // namespace hostcaps::probe
