#pragma once

#include <cstdint>
#include <string>

#include "segstore/core/types.h"
#include "segstore/storage/filesystem.h"

namespace segstore {
namespace storage {

/**
 * @brief Summary of one flushed or merged part inside a table
 *
 * Persisted as metadata.json in the part directory. A part whose metadata
 * cannot be read back, or whose timestamps are inverted, is corrupt: both
 * must_* calls log at critical level and throw core::CorruptionError.
 */
struct PartMetadata {
    uint64_t compressed_size_bytes = 0;
    uint64_t uncompressed_size_bytes = 0;
    uint64_t total_count = 0;
    uint64_t blocks_count = 0;
    core::Timestamp min_timestamp = 0;
    core::Timestamp max_timestamp = 0;
    uint64_t id = 0;

    void reset();

    void must_read(FileSystem& fs, const std::string& part_path);
    void must_write(FileSystem& fs, const std::string& part_path) const;

    std::string to_json() const;

    static constexpr const char* kFilename = "metadata.json";
};

} // namespace storage
} // namespace segstore
