#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "segstore/core/result.h"
#include "segstore/core/types.h"
#include "segstore/storage/filesystem.h"
#include "segstore/storage/table.h"

namespace segstore {
namespace storage {

/**
 * @brief One time bucket of the store, backed by a directory on disk
 *
 * Reference counting:
 * - A segment starts with one reference owned by its controller.
 * - acquire() adds a reference unless the owner reference was already
 *   dropped; release() removes one.
 * - The controller drops the owner reference exactly once, either through
 *   mark_expired() (files are deleted) or retire() (files are kept).
 * - When the count reaches zero the tables are closed, and for expired
 *   segments the directory is removed. This cleanup runs exactly once, in the
 *   thread that released the last reference.
 *
 * Memory is held through std::shared_ptr; the reference count only governs
 * whether the segment's files and tables may be used.
 */
class Segment {
public:
    Segment(uint64_t id,
            std::string name,
            std::string path,
            const core::TimeRange& time_range,
            std::vector<std::unique_ptr<TSTable>> tables,
            std::shared_ptr<FileSystem> fs);
    ~Segment();

    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    /**
     * @brief Try to take a reference; never blocks
     * @return false if the segment was retired, the caller must re-resolve
     *         the segment from its controller
     */
    bool acquire();

    /**
     * @brief Drop a reference; the last one on a retired segment cleans up
     */
    void release();

    /**
     * @brief Half-open membership test start <= ts < end
     */
    bool contains(core::Timestamp ts) const;

    /**
     * @brief Flag for deletion and drop the owner reference
     * @return true for the call that performed the transition
     */
    bool mark_expired();

    /**
     * @brief Drop the owner reference, keeping files on disk
     * @return true for the call that performed the transition
     */
    bool retire();

    /**
     * @brief Close tables now regardless of outstanding references
     */
    void force_close();

    /**
     * @brief Retry a directory removal that failed during cleanup
     */
    core::Result<void> retry_deletion();

    int32_t ref_count() const { return ref_count_.load(std::memory_order_acquire); }
    bool is_expired() const { return retired_.load(std::memory_order_acquire) && delete_files_.load(std::memory_order_acquire); }
    bool is_closed() const { return retired_.load(std::memory_order_acquire); }
    bool is_destroyed() const { return destroyed_.load(std::memory_order_acquire); }
    bool is_cleanup_done() const { return cleanup_done_.load(std::memory_order_acquire); }
    bool deletion_failed() const { return deletion_failed_.load(std::memory_order_acquire); }

    uint64_t id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& path() const { return path_; }
    const core::TimeRange& time_range() const { return time_range_; }

    size_t shard_num() const { return tables_.size(); }

    /**
     * @brief Table of a shard; valid while the caller holds a reference
     */
    TSTable* table(size_t shard_id) const;

    template<typename T>
    T* table_as(size_t shard_id) const {
        return dynamic_cast<T*>(table(shard_id));
    }

    void collect(MetricsSink& sink, const core::Position& position);

    /**
     * @brief Snapshot every shard table into <dest_dir>/shard-<n>
     */
    core::Result<void> take_file_snapshot(const std::string& dest_dir);

    std::string to_string() const;

    static std::string ShardDirName(size_t shard_id);

private:
    void destroy();
    void close_tables();
    core::Result<void> remove_files();

    const uint64_t id_;
    const std::string name_;
    const std::string path_;
    const core::TimeRange time_range_;
    std::vector<std::unique_ptr<TSTable>> tables_;
    std::shared_ptr<FileSystem> fs_;

    std::atomic<int32_t> ref_count_{1};
    std::atomic<bool> retired_{false};
    std::atomic<bool> delete_files_{false};
    std::atomic<bool> destroyed_{false};
    std::atomic<bool> cleanup_done_{false};
    std::atomic<bool> deletion_failed_{false};
};

/**
 * @brief Releases a held segment reference when it goes out of scope
 */
class SegmentRef {
public:
    SegmentRef() = default;
    explicit SegmentRef(std::shared_ptr<Segment> segment) : segment_(std::move(segment)) {}
    ~SegmentRef() { reset(); }

    SegmentRef(SegmentRef&& other) noexcept : segment_(std::move(other.segment_)) {}
    SegmentRef& operator=(SegmentRef&& other) noexcept {
        if (this != &other) {
            reset();
            segment_ = std::move(other.segment_);
        }
        return *this;
    }

    SegmentRef(const SegmentRef&) = delete;
    SegmentRef& operator=(const SegmentRef&) = delete;

    void reset() {
        if (segment_) {
            segment_->release();
            segment_.reset();
        }
    }

    Segment* get() const { return segment_.get(); }
    Segment* operator->() const { return segment_.get(); }
    explicit operator bool() const { return segment_ != nullptr; }

private:
    std::shared_ptr<Segment> segment_;
};

} // namespace storage
} // namespace segstore
