#include "hostcaps/probe/loaded_module.h"

#include <utility>

namespace hostcaps::probe {

namespace {

std::string_view base_name(std::string_view path)
{
    const std::size_t slash = path.find_last_of('/');
    if (slash == std::string_view::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

} // namespace

std::string_view strip_lib_prefix(std::string_view name)
{
    if (name.size() > 3 && name.substr(0, 3) == "lib") {
        name.remove_prefix(3);
    }
    return name;
}

std::optional<LoadedModule> parse_library_file_name(std::string_view fileOrPath)
{
    const std::string_view file = base_name(fileOrPath);
    if (file.empty()) {
        return std::nullopt;
    }

    // ELF: name.so[.version]
    for (std::size_t so = file.find(".so", 1); so != std::string_view::npos;
         so = file.find(".so", so + 1)) {
        const std::string_view rest = file.substr(so + 3);
        if (rest.empty() || rest.front() == '.') {
            LoadedModule m;
            m.name = std::string(strip_lib_prefix(file.substr(0, so)));
            if (!rest.empty()) {
                m.version = std::string(rest.substr(1));
            }
            return m;
        }
    }

    // Mach-O: name[.version].dylib
    constexpr std::string_view dylib = ".dylib";
    if (file.size() > dylib.size() &&
        file.substr(file.size() - dylib.size()) == dylib) {
        const std::string_view stem = file.substr(0, file.size() - dylib.size());
        const std::size_t dot = stem.find('.');

        LoadedModule m;
        if (dot == std::string_view::npos) {
            m.name = std::string(strip_lib_prefix(stem));
        } else {
            m.name = std::string(strip_lib_prefix(stem.substr(0, dot)));
            m.version = std::string(stem.substr(dot + 1));
        }
        if (m.name.empty()) {
            return std::nullopt;
        }
        return m;
    }

    return std::nullopt;
}

std::optional<LoadedModule> module_from_paths(std::string_view loaderPath,
                                              std::string_view resolvedPath)
{
    auto fromLoader = parse_library_file_name(loaderPath);
    auto fromFile = parse_library_file_name(resolvedPath);
    if (!fromLoader) {
        return fromFile;
    }
    if (!fromFile) {
        return fromLoader;
    }

    if (fromFile->name == fromLoader->name) {
        if (!fromFile->version.empty()) {
            fromLoader->version = std::move(fromFile->version);
        }
        return fromLoader;
    }

    // glibc before 2.34 names its files libc-2.31.so, libpthread-2.31.so.
    const std::string& stem = fromFile->name;
    const std::string& name = fromLoader->name;
    if (fromFile->version.empty() && stem.size() > name.size() + 1 &&
        stem.compare(0, name.size(), name) == 0 && stem[name.size()] == '-' &&
        is_digit(stem[name.size() + 1])) {
        fromLoader->version = stem.substr(name.size() + 1);
    }
    return fromLoader;
}

} // namespace hostcaps::probe
