#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "segstore/core/clock.h"
#include "segstore/core/result.h"
#include "segstore/core/types.h"
#include "segstore/storage/filesystem.h"
#include "segstore/storage/options.h"
#include "segstore/storage/segment.h"
#include "segstore/storage/segment_controller.h"
#include "segstore/storage/table.h"

namespace segstore {
namespace storage {

/**
 * @brief Time-partitioned database of one group
 *
 * Owns exactly one SegmentController. The clock is injected at open time and
 * never replaced. Every segment returned by the acquire/create/select calls
 * carries a reference the caller must release (wrap it in a SegmentRef).
 *
 * Usage:
 * ```
 * auto db = Database::open(options, std::make_shared<core::SystemClock>());
 * if (!db.ok()) { ... }
 * auto segment = db.value()->create_segment_for_write(ts);
 * SegmentRef ref(segment.take_value());
 * ref->table_as<MyTable>(shard)->append(...);
 * ```
 */
class Database {
public:
    /**
     * @brief Validate options, reload existing segments and create the current one
     * @param fs Filesystem shared with segments and tables; LocalFileSystem if null
     * @throws core::CorruptionError if persisted segment metadata is inconsistent
     */
    static core::Result<std::unique_ptr<Database>> open(const TSDBOptions& options,
                                                        std::shared_ptr<core::Clock> clock,
                                                        std::shared_ptr<FileSystem> fs = nullptr);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    core::Result<std::shared_ptr<Segment>> create_segment_if_not_exist(core::Timestamp ts);

    /**
     * @brief Like create_segment_if_not_exist, but refuses writes on a full disk
     * @return RESOURCE_EXHAUSTED when disk usage is above the configured limit
     */
    core::Result<std::shared_ptr<Segment>> create_segment_for_write(core::Timestamp ts);

    core::Result<std::shared_ptr<Segment>> acquire_segment(core::Timestamp ts);

    /**
     * @brief Acquired live segments overlapping time_range, ordered by start
     *
     * Segments that expire while being selected are skipped.
     */
    std::vector<std::shared_ptr<Segment>> select_segments(const core::TimeRange& time_range);

    std::vector<std::shared_ptr<Segment>> segments(bool include_closed = false) const;

    /**
     * @brief Rotate and apply retention; never fails
     */
    void tick(core::Timestamp now);

    int64_t delete_expired_segments(const core::TimeRange& time_range);

    /**
     * @brief Snapshot every live segment into <dest_dir>/<segment>/shard-<n>
     */
    core::Result<void> take_file_snapshot(const std::string& dest_dir);

    void collect(MetricsSink& sink);

    /**
     * @brief Drain references and close every segment; safe to call twice
     */
    void close();

    bool is_closed() const { return closed_.load(std::memory_order_acquire); }

    const TSDBOptions& options() const { return options_; }
    std::shared_ptr<core::Clock> clock() const { return clock_; }
    SegmentController& controller() { return *controller_; }

private:
    Database(const TSDBOptions& options,
             std::shared_ptr<core::Clock> clock,
             std::shared_ptr<FileSystem> fs,
             std::unique_ptr<SegmentController> controller);

    TSDBOptions options_;
    std::shared_ptr<core::Clock> clock_;
    std::shared_ptr<FileSystem> fs_;
    std::unique_ptr<SegmentController> controller_;
    std::atomic<bool> closed_{false};
};

} // namespace storage
} // namespace segstore
