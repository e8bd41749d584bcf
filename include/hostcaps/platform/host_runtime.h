#pragma once

#include <memory>

#include "hostcaps/fs/filesystem.h"
#include "hostcaps/probe/feature_probe.h"
#include "hostcaps/probe/host_runtime.h"

namespace hostcaps::platform {

// Introspection of the current process and host OS.
std::unique_ptr<probe::IHostRuntime> create_host_runtime();

// Filesystem seeing host paths exactly as given (absolute or cwd-relative).
std::unique_ptr<fs::IFileSystem> create_host_filesystem();

// Process-wide probe over the real host with default settings.
// Created on first use and kept until exit.
probe::FeatureProbe& default_feature_probe();

} // namespace hostcaps::platform
