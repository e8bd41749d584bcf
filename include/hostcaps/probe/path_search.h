#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hostcaps/fs/filesystem.h"
#include "hostcaps/probe/os_classification.h"

namespace hostcaps::probe {

// True if the value is empty or only ASCII whitespace.
bool is_blank(std::string_view s);

// Split a PATH-like list on `sep`, keeping empty entries.
std::vector<std::string_view> split_search_path(std::string_view pathVar, char sep);

// Locate `fileName` along the PATH-like list `pathVar`.
//
// Unix-like hosts: ':' separated, first "{dir}/{file}" that exists as a
// non-directory wins. With a blank list, "./{file}" is checked and the bare
// file name returned.
//
// Windows: ';' separated, "{dir}\{file}.exe" is checked and "{dir}\{file}"
// returned. With a blank list, "{file}.exe" is checked and the bare name
// returned.
//
// Any other host: nullopt.
std::optional<std::string> resolve_executable(const OsClassification& os,
                                              std::string_view pathVar,
                                              std::string_view fileName,
                                              fs::IFileSystem& fs);

} // namespace hostcaps::probe
