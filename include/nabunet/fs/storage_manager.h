#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "nabunet/fs/filesystem.h"

namespace nabunet::fs {

// Simple name-based registry for filesystems ("paks", "raw", "config").
class StorageManager {
public:
    StorageManager() = default;
    ~StorageManager() = default;

    StorageManager(const StorageManager&) = delete;
    StorageManager& operator=(const StorageManager&) = delete;

    // Registers a filesystem under its own name().
    // Returns false if that name already exists or fs is null.
    bool registerFileSystem(std::unique_ptr<IFileSystem> fs);

    // Lookup by name.
    IFileSystem*       get(const std::string& name);
    const IFileSystem* get(const std::string& name) const;

private:
    std::unordered_map<std::string, std::unique_ptr<IFileSystem>> _fileSystems;
};

} // namespace nabunet::fs
