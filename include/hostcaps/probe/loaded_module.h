#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace hostcaps::probe {

// A shared library mapped into the process.
struct LoadedModule {
    std::string name;     // "z" for libz.so.1.3.1
    std::string version;  // "1.3.1"; empty when the file carries no version

    bool operator==(const LoadedModule& o) const
    {
        return name == o.name && version == o.version;
    }
};

// Derive module name and version from a library file name or path.
//   /usr/lib/libz.so.1.3.1  -> {"z", "1.3.1"}
//   libssl.3.dylib          -> {"ssl", "3"}
//   ld-linux-x86-64.so.2    -> {"ld-linux-x86-64", "2"}
// Returns nullopt for anything that is not a .so / .dylib.
std::optional<LoadedModule> parse_library_file_name(std::string_view fileOrPath);

// Combine the name the loader reports with the file it resolves to.
// The loader path names the module; the resolved file only refines the
// version, and only when it is the same module:
//   libz.so.1  -> libz.so.1.3.1   gives {"z", "1.3.1"}
//   libc.so.6  -> libc-2.31.so    gives {"c", "2.31"}
//   libz.1.dylib (no file on disk) gives {"z", "1"}
// Falls back to the resolved file when the loader path is not a library.
std::optional<LoadedModule> module_from_paths(std::string_view loaderPath,
                                              std::string_view resolvedPath);

// "libz" -> "z"; a bare "lib" is left alone.
std::string_view strip_lib_prefix(std::string_view name);

} // namespace hostcaps::probe
