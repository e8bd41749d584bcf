#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "hostcaps/fs/filesystem.h"
#include "hostcaps/probe/host_runtime.h"

namespace hostcaps::tests {

// Host runtime answering from configured tables, counting the calls it sees.
class FakeHostRuntime final : public hostcaps::probe::IHostRuntime {
public:
    bool hasSymbol(std::string_view name) override
    {
        ++symbol_calls;
        return symbols.count(std::string(name)) > 0;
    }

    std::vector<hostcaps::probe::LoadedModule> loadedModules() override
    {
        ++module_calls;
        return modules;
    }

    std::string osName() override
    {
        ++os_calls;
        return os_name;
    }

    std::optional<std::string> environment(std::string_view name) override
    {
        ++env_calls;
        auto it = env.find(std::string(name));
        if (it == env.end()) return std::nullopt;
        return it->second;
    }

    void add_module(std::string name, std::string version)
    {
        modules.push_back(hostcaps::probe::LoadedModule{std::move(name), std::move(version)});
    }

    std::set<std::string> symbols;
    std::vector<hostcaps::probe::LoadedModule> modules;
    std::string os_name{"Linux"};
    std::map<std::string, std::string> env;

    int symbol_calls{0};
    int module_calls{0};
    int os_calls{0};
    int env_calls{0};
};

class MemoryFile final : public hostcaps::fs::IFile {
public:
    MemoryFile(std::vector<std::uint8_t>& bytes, bool readOnly)
        : _bytes(bytes), _readOnly(readOnly) {}

    std::size_t read(void* dst, std::size_t maxBytes) override
    {
        if (!dst) return 0;
        if (_pos >= _bytes.size()) return 0;
        const std::size_t n = std::min<std::size_t>(maxBytes, _bytes.size() - _pos);
        std::memcpy(dst, _bytes.data() + _pos, n);
        _pos += n;
        return n;
    }

    std::size_t write(const void* src, std::size_t bytes) override
    {
        if (_readOnly || !src) return 0;
        if (_pos + bytes > _bytes.size()) {
            _bytes.resize(_pos + bytes);
        }
        std::memcpy(_bytes.data() + _pos, src, bytes);
        _pos += bytes;
        return bytes;
    }

    bool flush() override { return true; }

private:
    std::vector<std::uint8_t>& _bytes;
    bool _readOnly{true};
    std::size_t _pos{0};
};

// Paths are used verbatim as keys, so Windows-style "C:\bin\convert.exe"
// and relative "./identify" work alongside POSIX paths.
class MemoryFileSystem final : public hostcaps::fs::IFileSystem {
public:
    explicit MemoryFileSystem(std::string name = "mem")
        : _name(std::move(name))
    {}

    std::string name() const override { return _name; }

    bool exists(const std::string& path) override
    {
        ++exists_calls;
        checked.push_back(path);
        return _files.count(path) > 0 || _dirs.count(path) > 0;
    }

    bool isDirectory(const std::string& path) override { return _dirs.count(path) > 0; }

    std::unique_ptr<hostcaps::fs::IFile> open(const std::string& path, const char* mode) override
    {
        const std::string m = mode ? std::string(mode) : std::string();
        const bool wantWrite = m.find('w') != std::string::npos || m.find('a') != std::string::npos;

        if (_dirs.count(path) > 0) return nullptr;
        if (read_only && wantWrite) return nullptr;

        auto it = _files.find(path);
        if (it == _files.end()) {
            if (!wantWrite) return nullptr;
            it = _files.emplace(path, std::vector<std::uint8_t>{}).first;
        } else if (m.find('w') != std::string::npos) {
            it->second.clear();
        }
        return std::make_unique<MemoryFile>(it->second, !wantWrite);
    }

    void add_file(const std::string& path, const std::string& content = {})
    {
        _files[path] = std::vector<std::uint8_t>(content.begin(), content.end());
    }

    void add_dir(const std::string& path) { _dirs.insert(path); }

    std::string file_text(const std::string& path) const
    {
        auto it = _files.find(path);
        if (it == _files.end()) return {};
        return std::string(it->second.begin(), it->second.end());
    }

    bool read_only{false};
    int exists_calls{0};
    std::vector<std::string> checked;

private:
    std::string _name;
    std::unordered_map<std::string, std::vector<std::uint8_t>> _files;
    std::set<std::string> _dirs;
};

} // namespace hostcaps::tests
