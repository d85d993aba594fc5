#include "segstore/storage/segment.h"
#include "segstore/common/logger.h"

#include <filesystem>
#include <sstream>

namespace segstore {
namespace storage {

Segment::Segment(uint64_t id,
                 std::string name,
                 std::string path,
                 const core::TimeRange& time_range,
                 std::vector<std::unique_ptr<TSTable>> tables,
                 std::shared_ptr<FileSystem> fs)
    : id_(id)
    , name_(std::move(name))
    , path_(std::move(path))
    , time_range_(time_range)
    , tables_(std::move(tables))
    , fs_(std::move(fs)) {
}

Segment::~Segment() {
    // A segment dropped without going through the controller still owns open tables.
    bool expected = false;
    if (destroyed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        close_tables();
    }
}

bool Segment::acquire() {
    int32_t current = ref_count_.load(std::memory_order_acquire);
    while (current > 0) {
        if (retired_.load(std::memory_order_acquire)) {
            return false;
        }
        if (ref_count_.compare_exchange_weak(current, current + 1,
                                             std::memory_order_acq_rel,
                                             std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

void Segment::release() {
    int32_t current = ref_count_.load(std::memory_order_acquire);
    while (true) {
        if (current <= 0) {
            SEGSTORE_ERROR("segment {} released more times than acquired", name_);
            return;
        }
        if (ref_count_.compare_exchange_weak(current, current - 1,
                                             std::memory_order_acq_rel,
                                             std::memory_order_acquire)) {
            break;
        }
    }
    if (current == 1) {
        destroy();
    }
}

bool Segment::contains(core::Timestamp ts) const {
    return ts >= time_range_.start && ts < time_range_.end;
}

bool Segment::mark_expired() {
    bool expected = false;
    if (!retired_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return false;
    }
    delete_files_.store(true, std::memory_order_release);
    release();
    return true;
}

bool Segment::retire() {
    bool expected = false;
    if (!retired_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return false;
    }
    release();
    return true;
}

void Segment::force_close() {
    destroy();
}

void Segment::destroy() {
    bool expected = false;
    if (!destroyed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }

    close_tables();
    if (delete_files_.load(std::memory_order_acquire)) {
        auto result = remove_files();
        if (!result.ok()) {
            deletion_failed_.store(true, std::memory_order_release);
            SEGSTORE_ERROR("failed to remove expired segment {}: {}", name_, result.error());
        } else {
            SEGSTORE_INFO("removed expired segment {} {}", name_, time_range_.to_string());
        }
    }
    cleanup_done_.store(true, std::memory_order_release);
}

void Segment::close_tables() {
    for (size_t i = 0; i < tables_.size(); ++i) {
        if (!tables_[i]) {
            continue;
        }
        auto result = tables_[i]->close();
        if (!result.ok()) {
            SEGSTORE_ERROR("failed to close table of segment {} shard {}: {}", name_, i, result.error());
        }
    }
}

core::Result<void> Segment::remove_files() {
    if (!fs_) {
        return core::Result<void>::error("segment has no filesystem", core::Error::Code::INTERNAL);
    }
    return fs_->remove_all(path_);
}

core::Result<void> Segment::retry_deletion() {
    if (!cleanup_done_.load(std::memory_order_acquire) || !deletion_failed_.load(std::memory_order_acquire)) {
        return core::Result<void>();
    }
    auto result = remove_files();
    if (result.ok()) {
        deletion_failed_.store(false, std::memory_order_release);
        SEGSTORE_INFO("removed expired segment {} on retry", name_);
    }
    return result;
}

TSTable* Segment::table(size_t shard_id) const {
    if (shard_id >= tables_.size()) {
        return nullptr;
    }
    return tables_[shard_id].get();
}

void Segment::collect(MetricsSink& sink, const core::Position& position) {
    core::Position segment_position = position;
    segment_position.segment = name_;
    sink.record("segment_ref_count", segment_position, static_cast<double>(ref_count()));
    for (const auto& table : tables_) {
        if (table) {
            table->collect(sink);
        }
    }
}

core::Result<void> Segment::take_file_snapshot(const std::string& dest_dir) {
    for (size_t i = 0; i < tables_.size(); ++i) {
        std::string shard_dir = (std::filesystem::path(dest_dir) / ShardDirName(i)).string();
        auto mkdir_result = fs_->mkdir_if_not_exist(shard_dir);
        if (!mkdir_result.ok()) {
            return mkdir_result;
        }
        auto result = tables_[i]->take_file_snapshot(shard_dir);
        if (!result.ok()) {
            return core::Result<void>::error("snapshot of " + name_ + "/" + ShardDirName(i) +
                                             " failed: " + result.error(), result.error_code());
        }
    }
    return core::Result<void>();
}

std::string Segment::to_string() const {
    std::ostringstream oss;
    oss << "SegID: " << id_ << ", " << name_ << " " << time_range_.to_string()
        << ", refs: " << ref_count();
    return oss.str();
}

std::string Segment::ShardDirName(size_t shard_id) {
    return "shard-" + std::to_string(shard_id);
}

} // namespace storage
} // namespace segstore
