#pragma once

#include <string>

#include "hostcaps/config/probe_config.h"
#include "hostcaps/fs/filesystem.h"

namespace hostcaps::config {

// YAML-backed ProbeConfigStore reading and writing through an IFileSystem.
//
// load() never fails: a missing, empty or malformed file yields defaults
// (with a log line); keys absent from the document keep their defaults.
class YamlProbeConfigStoreFs : public ProbeConfigStore {
public:
    YamlProbeConfigStoreFs(fs::IFileSystem& fs, std::string path);

    ProbeConfig load() override;
    void        save(const ProbeConfig& cfg) override;

private:
    ProbeConfig loadFromFs();

    fs::IFileSystem& _fs;
    std::string      _path;
};

// Render the YAML document for `cfg`.
std::string to_yaml_string(const ProbeConfig& cfg);

// Parse a YAML document; throws YAML::Exception on malformed input.
ProbeConfig probe_config_from_yaml(const std::string& text);

} // namespace hostcaps::config
