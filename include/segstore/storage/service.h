#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "segstore/core/clock.h"
#include "segstore/core/result.h"
#include "segstore/core/types.h"
#include "segstore/storage/filesystem.h"
#include "segstore/storage/options.h"
#include "segstore/storage/service_cache.h"
#include "segstore/storage/table.h"
#include "segstore/storage/tsdb.h"

namespace segstore {
namespace storage {

/**
 * @brief Control-plane request to purge a group's segments ahead of its TTL
 */
struct DeleteExpiredSegmentsRequest {
    std::string group;
    core::TimeRange time_range;
};

/**
 * @brief Entity service (stream or measure) owning one Database per group
 *
 * Group databases live under <data_path>/<group>; file snapshots go to
 * <snapshot_dir>/<YYYYMMDDHHMMSS>-<seq>/<group>.
 */
class Service {
public:
    /**
     * @throws core::InvalidArgumentError if config is invalid
     */
    Service(const ServiceConfig& config,
            std::shared_ptr<core::Clock> clock,
            std::shared_ptr<FileSystem> fs = nullptr);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    /**
     * @brief Open the database of a group
     *
     * options.location, module and group are derived from the service.
     * @return ALREADY_EXISTS if the group is open
     */
    core::Result<Database*> open_group(const std::string& group, TSDBOptions options);

    /**
     * @return NOT_FOUND if the group was never opened
     */
    core::Result<Database*> load_group(const std::string& group) const;

    void tick(core::Timestamp now);

    /**
     * @brief Purge segments of one group; unknown groups delete nothing
     */
    int64_t delete_expired_segments(const DeleteExpiredSegmentsRequest& request);

    /**
     * @brief Snapshot every group and keep at most max_file_snapshot_num snapshots
     * @return Directory of the new snapshot
     */
    core::Result<std::string> take_snapshot();

    void collect_cache_metrics(MetricsSink& sink) const;

    ServiceCache& cache() { return cache_; }
    const ServiceConfig& config() const { return config_; }

    /**
     * @brief Close every group, then the cache; safe to call twice
     */
    void close();

private:
    void prune_snapshots();

    ServiceConfig config_;
    std::shared_ptr<core::Clock> clock_;
    std::shared_ptr<FileSystem> fs_;
    ServiceCache cache_;

    mutable std::shared_mutex groups_mutex_;
    std::map<std::string, std::unique_ptr<Database>> groups_;

    std::mutex snapshot_mutex_;
    uint64_t snapshot_seq_ = 0;

    std::atomic<bool> closed_{false};
};

} // namespace storage
} // namespace segstore
