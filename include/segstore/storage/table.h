#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "segstore/core/result.h"
#include "segstore/core/types.h"
#include "segstore/storage/filesystem.h"

namespace segstore {
namespace storage {

/**
 * @brief Receives gauge values from the store and its tables
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void record(const std::string& name, const core::Position& position, double value) = 0;
};

/**
 * @brief Per-shard payload of a segment, supplied by the entity service
 *
 * The segment owns the table for its whole lifetime and closes it exactly
 * once, either on physical deletion or when the store is closed.
 */
class TSTable {
public:
    virtual ~TSTable() = default;

    virtual core::Result<void> close() = 0;

    virtual void collect(MetricsSink& sink) = 0;

    /**
     * @brief Hard-link or copy the table's files into dest_dir
     */
    virtual core::Result<void> take_file_snapshot(const std::string& dest_dir) = 0;
};

/**
 * @brief Opaque options forwarded untouched to the table creator
 */
using TableOptions = std::map<std::string, std::string>;

using TSTableCreator = std::function<core::Result<std::unique_ptr<TSTable>>(
    FileSystem& fs,
    const std::string& path,
    const core::Position& position,
    std::shared_ptr<spdlog::logger> logger,
    const core::TimeRange& time_range,
    const TableOptions& options)>;

} // namespace storage
} // namespace segstore
