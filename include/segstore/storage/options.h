#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "segstore/core/interval_rule.h"
#include "segstore/core/result.h"
#include "segstore/storage/table.h"

namespace segstore {
namespace storage {

/**
 * @brief Options for one time-partitioned database (one group)
 */
struct TSDBOptions {
    std::string location;                   // Root directory holding seg-* directories
    std::string group;                      // Used in positions and log lines
    std::string module = "measure";
    core::IntervalRule segment_interval = core::IntervalRule::Days(1);
    core::IntervalRule ttl = core::IntervalRule::Days(7);
    uint32_t shard_num = 1;
    TSTableCreator table_creator;
    TableOptions table_options;
    std::chrono::milliseconds shutdown_timeout{5000};
    int disk_usage_limit_percent = 95;      // 0 disables the check

    core::Result<void> validate() const;
};

/**
 * @brief Bounds of the service cache
 */
struct CacheConfig {
    int64_t max_cache_size = 100 * 1024 * 1024;           // bytes, 0 disables caching
    std::chrono::milliseconds cleanup_interval{30000};
    std::chrono::milliseconds idle_timeout{120000};

    core::Result<void> validate() const;
};

/**
 * @brief Configuration of an entity service (stream or measure)
 */
struct ServiceConfig {
    std::string name = "measure";
    std::string root_path = "/tmp";
    std::string data_path;                  // Defaults to <root>/<name>/data
    int max_disk_usage_percent = 95;
    int max_file_snapshot_num = 10;
    CacheConfig cache;

    static ServiceConfig Default(const std::string& name);

    core::Result<void> validate() const;

    std::string resolved_data_path() const;
    std::string snapshot_dir() const;
};

} // namespace storage
} // namespace segstore
