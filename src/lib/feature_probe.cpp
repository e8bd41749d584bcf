#include "hostcaps/probe/feature_probe.h"

#include "hostcaps/core/logging.h"
#include "hostcaps/core/text.h"
#include "hostcaps/probe/loaded_module.h"
#include "hostcaps/probe/path_search.h"
#include "hostcaps/probe/version_compare.h"

#include <algorithm>

namespace hostcaps::probe {

static constexpr const char* TAG = "probe";

using text::lower_ascii;

FeatureProbe::FeatureProbe(IHostRuntime& host, fs::IFileSystem& fs, config::ProbeConfig cfg)
    : _host(host)
    , _fs(fs)
    , _cfg(std::move(cfg))
{
}

bool FeatureProbe::supportsHardLink()
{
    return _host.hasSymbol("link");
}

bool FeatureProbe::supportsSymLink()
{
    return _host.hasSymbol("symlink");
}

bool FeatureProbe::supportsUserId()
{
    return _host.hasSymbol("getpwuid");
}

bool FeatureProbe::hasFunction(std::string_view name)
{
    if (name.empty()) {
        return false;
    }
    return _host.hasSymbol(name);
}

std::string FeatureProbe::canonicalModuleName(std::string_view name) const
{
    auto it = _cfg.moduleAliases.find(std::string(name));
    if (it == _cfg.moduleAliases.end()) {
        it = _cfg.moduleAliases.find(lower_ascii(name));
    }
    const std::string_view target = it != _cfg.moduleAliases.end()
        ? std::string_view(it->second)
        : name;
    return lower_ascii(strip_lib_prefix(target));
}

std::optional<std::string> FeatureProbe::loadedModuleVersion(std::string_view name)
{
    if (name.empty()) {
        return std::nullopt;
    }

    const std::string wanted = canonicalModuleName(name);

    // The same module can be mapped more than once; report the newest.
    std::optional<std::string> best;
    for (const auto& m : _host.loadedModules()) {
        if (lower_ascii(m.name) != wanted) {
            continue;
        }
        if (!best || compare_versions(m.version, *best) > 0) {
            best = m.version;
        }
    }
    return best;
}

std::vector<std::string> FeatureProbe::loadedModuleNames()
{
    std::vector<std::string> names;
    for (const auto& m : _host.loadedModules()) {
        names.push_back(lower_ascii(m.name));
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

bool FeatureProbe::hasExtensionSupport(std::string_view name,
                                       std::optional<std::string_view> minVersion)
{
    const auto version = loadedModuleVersion(name);
    if (!version) {
        return false;
    }
    if (!minVersion) {
        return true;
    }
    return version_at_least(*version, *minVersion);
}

bool FeatureProbe::hasImageConvert()
{
    return getImageConvertExecutable().has_value();
}

std::optional<std::string> FeatureProbe::getImageConvertExecutable()
{
    std::lock_guard<std::mutex> lock(_mutex);
    return cachedExecutable(_imageConvert, _cfg.imageConvertName);
}

bool FeatureProbe::hasImageIdentify()
{
    return getImageIdentifyExecutable().has_value();
}

std::optional<std::string> FeatureProbe::getImageIdentifyExecutable()
{
    std::lock_guard<std::mutex> lock(_mutex);
    return cachedExecutable(_imageIdentify, _cfg.imageIdentifyName);
}

OsClassification FeatureProbe::osClassification()
{
    std::lock_guard<std::mutex> lock(_mutex);
    return osClassificationLocked();
}

std::optional<std::string> FeatureProbe::resolveExecutablePath(std::string_view fileName)
{
    std::lock_guard<std::mutex> lock(_mutex);
    return resolveLocked(fileName);
}

std::optional<std::string> FeatureProbe::cachedExecutable(CachedPath& slot, const std::string& fileName)
{
    if (!slot.resolved) {
        slot.path = resolveLocked(fileName);
        slot.resolved = true;

        if (slot.path) {
            HC_LOGD(TAG, "'%s' resolved to '%s'", fileName.c_str(), slot.path->c_str());
        } else {
            HC_LOGD(TAG, "'%s' not found", fileName.c_str());
        }
    }
    return slot.path;
}

std::optional<std::string> FeatureProbe::resolveLocked(std::string_view fileName)
{
    const OsClassification os = osClassificationLocked();
    const std::optional<std::string> pathVar = _host.environment(_cfg.pathVariable);

    return resolve_executable(os, pathVar ? std::string_view(*pathVar) : std::string_view{},
                              fileName, _fs);
}

OsClassification FeatureProbe::osClassificationLocked()
{
    if (!_os) {
        _os = classify_os_name(_host.osName());
        HC_LOGD(TAG, "host OS '%s' classified as %s",
                _os->name.c_str(), std::string(to_string(_os->family)).c_str());
    }
    return *_os;
}

} // namespace hostcaps::probe
