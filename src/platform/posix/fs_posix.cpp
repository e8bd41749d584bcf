#include "hostcaps/fs/filesystem.h"
#include "hostcaps/platform/posix/fs_factory.h"

#include <cstdio>
#include <memory>
#include <string>

#include <sys/stat.h>

namespace hostcaps::platform::posix {

namespace {

using hostcaps::fs::IFile;
using hostcaps::fs::IFileSystem;

// ----------------------
// PosixFile
// ----------------------

class PosixFile : public IFile {
public:
    explicit PosixFile(std::FILE* fp)
        : _fp(fp)
    {}

    ~PosixFile() override {
        if (_fp) {
            std::fclose(_fp);
        }
    }

    PosixFile(const PosixFile&) = delete;
    PosixFile& operator=(const PosixFile&) = delete;

    std::size_t read(void* dst, std::size_t maxBytes) override
    {
        if (!_fp || maxBytes == 0) {
            return 0;
        }
        return std::fread(dst, 1, maxBytes, _fp);
    }

    std::size_t write(const void* src, std::size_t bytes) override
    {
        if (!_fp || bytes == 0) {
            return 0;
        }
        return std::fwrite(src, 1, bytes, _fp);
    }

    bool flush() override
    {
        if (!_fp) {
            return false;
        }
        return std::fflush(_fp) == 0;
    }

private:
    std::FILE* _fp{nullptr};
};

// ----------------------
// PosixFileSystem
// ----------------------

class PosixFileSystem : public IFileSystem {
public:
    PosixFileSystem(std::string root, std::string name)
        : _root(std::move(root))
        , _name(std::move(name))
    {
        // Normalize root: remove trailing slash if present.
        if (_root.size() > 1 && _root.back() == '/') {
            _root.pop_back();
        }
    }

    std::string name() const override {
        return _name;
    }

    bool exists(const std::string& path) override
    {
        struct stat st{};
        return ::stat(toFullPath(path).c_str(), &st) == 0;
    }

    bool isDirectory(const std::string& path) override
    {
        struct stat st{};
        if (::stat(toFullPath(path).c_str(), &st) != 0) {
            return false;
        }
        return S_ISDIR(st.st_mode);
    }

    std::unique_ptr<IFile> open(const std::string& path, const char* mode) override
    {
        if (!mode) {
            return nullptr;
        }
        auto full = toFullPath(path);
        std::FILE* fp = std::fopen(full.c_str(), mode);
        if (!fp) {
            return nullptr;
        }
        return std::make_unique<PosixFile>(fp);
    }

private:
    std::string toFullPath(const std::string& path) const
    {
        if (_root.empty()) {
            return path;
        }

        // Normalize: empty or "." -> root
        if (path.empty() || path == ".") {
            return _root;
        }

        if (path.front() == '/') {
            return _root + path;
        }
        return _root + "/" + path;
    }

    std::string _root;  // host directory for this volume, empty for pass-through
    std::string _name;  // logical name, e.g. "host"
};

} // namespace

std::unique_ptr<hostcaps::fs::IFileSystem>
create_host_filesystem(const std::string& rootDir, const std::string& name)
{
    return std::make_unique<PosixFileSystem>(rootDir, name);
}

} // namespace hostcaps::platform::posix
