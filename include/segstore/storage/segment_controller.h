#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "segstore/core/clock.h"
#include "segstore/core/result.h"
#include "segstore/core/types.h"
#include "segstore/storage/filesystem.h"
#include "segstore/storage/options.h"
#include "segstore/storage/segment.h"

namespace segstore {
namespace storage {

/**
 * @brief Owns the time-ordered list of live segments of one database
 *
 * Locking:
 * - mutex_ guards segments_ and pending_deletion_ and is only held while the
 *   lists are copied or mutated, never during I/O.
 * - create_mutex_ serializes segment creation so concurrent requests for the
 *   same bucket converge on one directory.
 * - rotation_in_flight_ is a single-slot try-lock: a tick that finds it held
 *   skips rotation instead of waiting.
 */
class SegmentController {
public:
    SegmentController(const TSDBOptions& options,
                      std::shared_ptr<FileSystem> fs,
                      std::shared_ptr<core::Clock> clock);
    ~SegmentController();

    SegmentController(const SegmentController&) = delete;
    SegmentController& operator=(const SegmentController&) = delete;

    /**
     * @brief Reload segments found under the root directory
     * @throws core::CorruptionError if a segment's metadata cannot be trusted
     */
    core::Result<void> open();

    /**
     * @brief Return the segment covering ts, creating it if needed
     *
     * The returned segment carries one reference owned by the caller. Missing
     * buckets between ts and the existing segments are created as well, so the
     * list stays contiguous.
     */
    core::Result<std::shared_ptr<Segment>> create_segment_if_not_exist(core::Timestamp ts);

    /**
     * @brief Live segment covering ts, acquired; retries if it expires concurrently
     */
    core::Result<std::shared_ptr<Segment>> acquire_segment(core::Timestamp ts);

    /**
     * @brief Snapshot of the segments, ordered by start time
     *
     * No references are taken. include_closed adds retired segments that
     * still wait for their last reference to be released.
     */
    std::vector<std::shared_ptr<Segment>> segments(bool include_closed) const;

    /**
     * @brief Rotation, then retention, then retry of failed deletions
     */
    void tick(core::Timestamp now);

    /**
     * @brief Remove the live segments overlapping time_range
     * @return Number of segments removed
     */
    int64_t delete_expired_segments(const core::TimeRange& time_range);

    /**
     * @brief Retire every segment and wait for references to drain
     *
     * Tables still referenced when the timeout elapses are force-closed.
     */
    void close(std::chrono::milliseconds timeout);

    bool rotation_in_flight() const { return rotation_in_flight_.load(std::memory_order_acquire); }
    size_t pending_deletion_count() const;
    bool is_closed() const { return closed_.load(std::memory_order_acquire); }

    const std::string& location() const { return options_.location; }

    std::string segment_name(core::Timestamp start) const;

    static constexpr const char* kSegmentPrefix = "seg-";
    static constexpr const char* kMetadataFilename = "metadata";

private:
    struct BucketPlan {
        std::vector<core::TimeRange> ranges;  // In creation order, adjacent to existing segments
    };

    core::Result<BucketPlan> plan_buckets(core::Timestamp ts, core::Timestamp horizon) const;
    core::Result<std::shared_ptr<Segment>> create_segment(const core::TimeRange& range);
    core::Result<std::shared_ptr<Segment>> load_segment(const std::string& name);
    core::Result<std::vector<std::unique_ptr<TSTable>>> open_tables(const std::string& segment_name,
                                                                    const std::string& path,
                                                                    const core::TimeRange& range);
    std::shared_ptr<Segment> find_live(core::Timestamp ts) const;
    core::Result<void> insert_segment(std::shared_ptr<Segment> segment);

    void rotate(core::Timestamp now);
    void apply_retention(core::Timestamp now);
    void sweep_pending_deletions();

    TSDBOptions options_;
    std::shared_ptr<FileSystem> fs_;
    std::shared_ptr<core::Clock> clock_;
    std::shared_ptr<spdlog::logger> table_logger_;

    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<Segment>> segments_;
    std::vector<std::shared_ptr<Segment>> pending_deletion_;

    std::mutex create_mutex_;
    std::atomic<bool> rotation_in_flight_{false};
    std::atomic<bool> closed_{false};
};

} // namespace storage
} // namespace segstore
