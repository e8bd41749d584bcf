#include "hostcaps/probe/path_search.h"

#include <cctype>

namespace hostcaps::probe {

namespace {

bool is_file(fs::IFileSystem& fs, const std::string& path)
{
    return fs.exists(path) && !fs.isDirectory(path);
}

std::optional<std::string> search_unix(std::string_view pathVar,
                                       std::string_view fileName,
                                       fs::IFileSystem& fs)
{
    const std::string file(fileName);

    if (is_blank(pathVar)) {
        // No search list: leave resolution to whoever runs it from here.
        if (is_file(fs, "./" + file)) {
            return file;
        }
        return std::nullopt;
    }

    for (auto dir : split_search_path(pathVar, ':')) {
        std::string candidate(dir);
        candidate += '/';
        candidate += file;
        if (is_file(fs, candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::string> search_windows(std::string_view pathVar,
                                          std::string_view fileName,
                                          fs::IFileSystem& fs)
{
    const std::string file(fileName);

    if (is_blank(pathVar)) {
        if (is_file(fs, file + ".exe")) {
            return file;
        }
        return std::nullopt;
    }

    for (auto dir : split_search_path(pathVar, ';')) {
        std::string candidate(dir);
        candidate += '\\';
        candidate += file;
        if (is_file(fs, candidate + ".exe")) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace

bool is_blank(std::string_view s)
{
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::vector<std::string_view> split_search_path(std::string_view pathVar, char sep)
{
    std::vector<std::string_view> out;
    for (;;) {
        const std::size_t pos = pathVar.find(sep);
        if (pos == std::string_view::npos) {
            out.push_back(pathVar);
            break;
        }
        out.push_back(pathVar.substr(0, pos));
        pathVar.remove_prefix(pos + 1);
    }
    return out;
}

std::optional<std::string> resolve_executable(const OsClassification& os,
                                              std::string_view pathVar,
                                              std::string_view fileName,
                                              fs::IFileSystem& fs)
{
    if (fileName.empty()) {
        return std::nullopt;
    }
    if (os.family == OsFamily::Windows) {
        return search_windows(pathVar, fileName, fs);
    }
    if (is_unix_like(os)) {
        return search_unix(pathVar, fileName, fs);
    }
    return std::nullopt;
}

} // namespace hostcaps::probe
