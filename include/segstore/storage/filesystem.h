#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "segstore/core/result.h"

namespace segstore {
namespace storage {

/**
 * @brief Interface for the filesystem operations the store performs
 *
 * Segments, controllers and tables all share one instance, which lets tests
 * inject failures without touching the real disk.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    /**
     * @brief Create a directory and its parents; succeeds if it already exists
     */
    virtual core::Result<void> mkdir_if_not_exist(const std::string& path) = 0;

    /**
     * @brief Write a whole file atomically (temp file, then rename)
     * @return Number of bytes written
     */
    virtual core::Result<size_t> write(const std::string& path, const std::string& data) = 0;

    /**
     * @brief Read a whole file
     */
    virtual core::Result<std::string> read(const std::string& path) = 0;

    /**
     * @brief Remove a file or directory tree; missing paths are not an error
     */
    virtual core::Result<void> remove_all(const std::string& path) = 0;

    /**
     * @brief Names (not paths) of the direct subdirectories of path
     */
    virtual core::Result<std::vector<std::string>> list_dirs(const std::string& path) = 0;

    virtual bool exists(const std::string& path) = 0;

    /**
     * @brief Used space of the volume holding path, 0..100
     */
    virtual core::Result<int> disk_usage_percent(const std::string& path) = 0;
};

/**
 * @brief FileSystem backed by std::filesystem
 */
class LocalFileSystem : public FileSystem {
public:
    core::Result<void> mkdir_if_not_exist(const std::string& path) override;
    core::Result<size_t> write(const std::string& path, const std::string& data) override;
    core::Result<std::string> read(const std::string& path) override;
    core::Result<void> remove_all(const std::string& path) override;
    core::Result<std::vector<std::string>> list_dirs(const std::string& path) override;
    bool exists(const std::string& path) override;
    core::Result<int> disk_usage_percent(const std::string& path) override;
};

} // namespace storage
} // namespace segstore
