#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace hostcaps::fs {

// Simple file abstraction; streaming open file handle.
class IFile {
public:
    virtual ~IFile() = default;

    // Read up to maxBytes into dst, returns number of bytes actually read (0 on EOF or error).
    virtual std::size_t read(void* dst, std::size_t maxBytes) = 0;

    // Write up to bytes from src, returns number of bytes actually written.
    virtual std::size_t write(const void* src, std::size_t bytes) = 0;

    // Flush buffered data to underlying storage if applicable.
    virtual bool flush() = 0;
};

// Abstract filesystem. Paths are passed through to the backing store;
// a host filesystem with an empty root sees exactly what the OS sees,
// including relative paths such as "./convert".
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    // Logical name, e.g. "host".
    virtual std::string name() const = 0;

    virtual bool exists(const std::string& path) = 0;
    virtual bool isDirectory(const std::string& path) = 0;

    // Open a file using C stdio-style mode strings ("rb", "wb", ...).
    // Returns nullptr on failure.
    virtual std::unique_ptr<IFile> open(const std::string& path, const char* mode) = 0;
};

} // namespace hostcaps::fs
