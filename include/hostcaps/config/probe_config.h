#pragma once

#include <map>
#include <string>

namespace hostcaps::config {

struct ProbeConfig {
    std::string pathVariable{"PATH"};      // environment variable holding the search list
    std::string imageConvertName{"convert"};
    std::string imageIdentifyName{"identify"};

    // Requested extension name -> loaded module name ("zlib" -> "z").
    std::map<std::string, std::string> moduleAliases{{"zlib", "z"}};
};

// Abstract storage interface.
class ProbeConfigStore {
public:
    virtual ~ProbeConfigStore() = default;

    virtual ProbeConfig load() = 0;
    virtual void        save(const ProbeConfig& cfg) = 0;
};

} // namespace hostcaps::config
