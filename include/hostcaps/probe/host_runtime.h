#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hostcaps/probe/loaded_module.h"

namespace hostcaps::probe {

// Read-only introspection of the running process and its host.
// The platform layer provides the real implementation; tests inject answers.
class IHostRuntime {
public:
    virtual ~IHostRuntime() = default;

    // Is a callable symbol of this name resolvable in the process?
    virtual bool hasSymbol(std::string_view name) = 0;

    // Shared libraries currently mapped into the process.
    virtual std::vector<LoadedModule> loadedModules() = 0;

    // Host OS name, e.g. "Linux", "Darwin", "FreeBSD". Empty if unknown.
    virtual std::string osName() = 0;

    // Value of an environment variable; nullopt when unset.
    virtual std::optional<std::string> environment(std::string_view name) = 0;
};

} // namespace hostcaps::probe
