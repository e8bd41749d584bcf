#pragma once

#include <memory>
#include <string>

#include "hostcaps/fs/filesystem.h"

namespace hostcaps::platform::posix {

// Create a POSIX-backed filesystem rooted at `rootDir` (host path),
// exposed under logical name `name`. An empty root leaves paths untouched.
std::unique_ptr<fs::IFileSystem>
create_host_filesystem(const std::string& rootDir, const std::string& name);

} // namespace hostcaps::platform::posix
