#include "segstore/storage/segment_controller.h"
#include "segstore/common/logger.h"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <iterator>
#include <string>
#include <thread>

namespace segstore {
namespace storage {

namespace {

constexpr const char* kSegmentVersion = "1.0";
constexpr int kAcquireAttempts = 3;

std::string join_path(const std::string& dir, const std::string& name) {
    return (std::filesystem::path(dir) / name).string();
}

std::string encode_segment_metadata(const core::TimeRange& range, const core::IntervalRule& interval) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    std::string interval_str = interval.to_string();

    writer.StartObject();
    writer.Key("version");
    writer.String(kSegmentVersion);
    writer.Key("start");
    writer.Int64(range.start);
    writer.Key("end");
    writer.Int64(range.end);
    writer.Key("interval");
    writer.String(interval_str.c_str());
    writer.EndObject();
    return buffer.GetString();
}

[[noreturn]] void corrupted(const std::string& message) {
    SEGSTORE_CRITICAL("{}", message);
    throw core::CorruptionError(message);
}

core::TimeRange decode_segment_metadata(const std::string& path, const std::string& data) {
    rapidjson::Document doc;
    doc.Parse(data.c_str());
    if (doc.HasParseError() || !doc.IsObject()) {
        corrupted("cannot parse segment metadata " + path);
    }
    if (!doc.HasMember("start") || !doc["start"].IsInt64() ||
        !doc.HasMember("end") || !doc["end"].IsInt64()) {
        corrupted("segment metadata " + path + " misses its time range");
    }
    core::TimeRange range(doc["start"].GetInt64(), doc["end"].GetInt64());
    if (range.start >= range.end) {
        corrupted("segment metadata " + path + " has an empty time range " + range.to_string());
    }
    return range;
}

bool has_prefix(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

// seg-20240501 -> 20240501
bool parse_segment_id(const std::string& name, size_t prefix_len, uint64_t& id) {
    std::string digits = name.substr(prefix_len);
    if (digits.empty() || digits.size() > 12 ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    id = std::stoull(digits);
    return true;
}

} // namespace

SegmentController::SegmentController(const TSDBOptions& options,
                                     std::shared_ptr<FileSystem> fs,
                                     std::shared_ptr<core::Clock> clock)
    : options_(options)
    , fs_(std::move(fs))
    , clock_(std::move(clock))
    , table_logger_(common::Logger::Get(options.module)) {
}

SegmentController::~SegmentController() {
    close(options_.shutdown_timeout);
}

std::string SegmentController::segment_name(core::Timestamp start) const {
    core::CivilTime ct = core::ToCivil(start);
    char buf[32];
    if (options_.segment_interval.unit == core::IntervalRule::Unit::HOUR) {
        std::snprintf(buf, sizeof(buf), "%04lld%02d%02d%02d",
                      static_cast<long long>(ct.year), ct.month, ct.day, ct.hour);
    } else {
        std::snprintf(buf, sizeof(buf), "%04lld%02d%02d",
                      static_cast<long long>(ct.year), ct.month, ct.day);
    }
    return std::string(kSegmentPrefix) + buf;
}

core::Result<void> SegmentController::open() {
    auto mkdir_result = fs_->mkdir_if_not_exist(options_.location);
    if (!mkdir_result.ok()) {
        return mkdir_result;
    }

    auto dirs = fs_->list_dirs(options_.location);
    if (!dirs.ok()) {
        return core::Result<void>::error(dirs.error(), dirs.error_code());
    }

    std::vector<std::shared_ptr<Segment>> loaded;
    for (const auto& name : dirs.value()) {
        if (!has_prefix(name, kSegmentPrefix)) {
            continue;
        }
        auto result = load_segment(name);
        if (!result.ok()) {
            if (result.error_code() == core::Error::Code::NOT_FOUND) {
                continue;
            }
            return core::Result<void>::error(result.error(), result.error_code());
        }
        loaded.push_back(result.take_value());
    }

    std::sort(loaded.begin(), loaded.end(), [](const auto& a, const auto& b) {
        return a->time_range().start < b->time_range().start;
    });
    for (size_t i = 1; i < loaded.size(); ++i) {
        if (loaded[i - 1]->time_range().end > loaded[i]->time_range().start) {
            corrupted("segments " + loaded[i - 1]->name() + " and " + loaded[i]->name() + " overlap");
        }
    }

    size_t count = loaded.size();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        segments_ = std::move(loaded);
    }
    SEGSTORE_INFO("opened {} with {} existing segments", options_.location, count);
    return core::Result<void>();
}

core::Result<std::shared_ptr<Segment>> SegmentController::load_segment(const std::string& name) {
    std::string path = join_path(options_.location, name);
    std::string metadata_path = join_path(path, kMetadataFilename);

    uint64_t id = 0;
    if (!parse_segment_id(name, std::string(kSegmentPrefix).size(), id)) {
        SEGSTORE_WARN("ignoring {}: not a segment directory name", path);
        return core::Result<std::shared_ptr<Segment>>::error("not a segment: " + path,
                                                              core::Error::Code::NOT_FOUND);
    }
    if (!fs_->exists(metadata_path)) {
        SEGSTORE_WARN("segment directory {} has no metadata, removing the partial segment", path);
        auto remove_result = fs_->remove_all(path);
        if (!remove_result.ok()) {
            SEGSTORE_ERROR("failed to remove partial segment {}: {}", path, remove_result.error());
        }
        return core::Result<std::shared_ptr<Segment>>::error("no metadata in " + path,
                                                              core::Error::Code::NOT_FOUND);
    }

    auto data = fs_->read(metadata_path);
    if (!data.ok()) {
        return core::Result<std::shared_ptr<Segment>>::error(data.error(), core::Error::Code::IO_ERROR);
    }
    core::TimeRange range = decode_segment_metadata(metadata_path, data.value());

    auto tables = open_tables(name, path, range);
    if (!tables.ok()) {
        return core::Result<std::shared_ptr<Segment>>::error(tables.error(), tables.error_code());
    }

    return core::Result<std::shared_ptr<Segment>>(
        std::make_shared<Segment>(id, name, path, range, tables.take_value(), fs_));
}

core::Result<std::vector<std::unique_ptr<TSTable>>> SegmentController::open_tables(
    const std::string& segment_name, const std::string& path, const core::TimeRange& range) {
    using TablesResult = core::Result<std::vector<std::unique_ptr<TSTable>>>;

    std::vector<std::unique_ptr<TSTable>> tables;
    tables.reserve(options_.shard_num);
    for (uint32_t shard = 0; shard < options_.shard_num; ++shard) {
        std::string shard_path = join_path(path, Segment::ShardDirName(shard));
        auto mkdir_result = fs_->mkdir_if_not_exist(shard_path);
        core::Result<std::unique_ptr<TSTable>> table_result =
            core::Result<std::unique_ptr<TSTable>>::error("not created");
        if (mkdir_result.ok()) {
            core::Position position{options_.module, options_.group, Segment::ShardDirName(shard), segment_name};
            table_result = options_.table_creator(*fs_, shard_path, position, table_logger_,
                                                  range, options_.table_options);
        } else {
            table_result = core::Result<std::unique_ptr<TSTable>>::error(mkdir_result.error(),
                                                                         mkdir_result.error_code());
        }

        if (!table_result.ok() || !table_result.value()) {
            for (auto& table : tables) {
                auto close_result = table->close();
                if (!close_result.ok()) {
                    SEGSTORE_ERROR("failed to close table of {}: {}", segment_name, close_result.error());
                }
            }
            if (table_result.ok()) {
                return TablesResult::error("table creator returned no table for " + shard_path,
                                           core::Error::Code::INTERNAL);
            }
            return TablesResult::error("failed to open table " + shard_path + ": " + table_result.error(),
                                       table_result.error_code());
        }
        tables.push_back(table_result.take_value());
    }
    return TablesResult(std::move(tables));
}

std::shared_ptr<Segment> SegmentController::find_live(core::Timestamp ts) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = std::upper_bound(segments_.begin(), segments_.end(), ts,
                               [](core::Timestamp value, const std::shared_ptr<Segment>& segment) {
                                   return value < segment->time_range().start;
                               });
    if (it == segments_.begin()) {
        return nullptr;
    }
    --it;
    if ((*it)->contains(ts)) {
        return *it;
    }
    return nullptr;
}

core::Result<SegmentController::BucketPlan> SegmentController::plan_buckets(core::Timestamp ts,
                                                                             core::Timestamp horizon) const {
    using PlanResult = core::Result<BucketPlan>;
    const auto& interval = options_.segment_interval;
    BucketPlan plan;
    auto beyond_retention = [&]() {
        return PlanResult::error("timestamp " + core::FormatRFC3339(ts) + " is beyond the retention of " +
                                 options_.ttl.to_string(), core::Error::Code::INVALID_ARGUMENT);
    };

    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (segments_.empty()) {
        core::Timestamp start = interval.floor(ts);
        plan.ranges.emplace_back(start, interval.next(start));
        return PlanResult(std::move(plan));
    }

    auto succ = std::upper_bound(segments_.begin(), segments_.end(), ts,
                                 [](core::Timestamp value, const std::shared_ptr<Segment>& segment) {
                                     return value < segment->time_range().start;
                                 });
    if (succ != segments_.begin()) {
        // Walk forward from the predecessor, clamping to the successor if any.
        // Buckets wholly behind the horizon are skipped; retention drops the stale head.
        core::Timestamp start = (*std::prev(succ))->time_range().end;
        core::Timestamp first_retained = interval.floor(horizon);
        if (start < first_retained) {
            start = first_retained;
        }
        if (ts < start || (succ != segments_.end() && start >= (*succ)->time_range().start)) {
            return beyond_retention();
        }
        while (true) {
            core::Timestamp end = interval.next(start);
            if (succ != segments_.end() && end > (*succ)->time_range().start) {
                end = (*succ)->time_range().start;
            }
            plan.ranges.emplace_back(start, end);
            if (ts < end) {
                break;
            }
            start = end;
        }
    } else {
        // ts precedes every segment: walk backward from the head, never past the horizon.
        core::Timestamp end = (*succ)->time_range().start;
        while (true) {
            if (end <= horizon) {
                return beyond_retention();
            }
            core::Timestamp start = interval.prev(end);
            plan.ranges.emplace_back(start, end);
            if (start <= ts) {
                break;
            }
            end = start;
        }
    }
    return PlanResult(std::move(plan));
}

core::Result<std::shared_ptr<Segment>> SegmentController::create_segment(const core::TimeRange& range) {
    using SegmentResult = core::Result<std::shared_ptr<Segment>>;

    std::string name = segment_name(range.start);
    std::string path = join_path(options_.location, name);
    uint64_t id = 0;
    if (!parse_segment_id(name, std::string(kSegmentPrefix).size(), id)) {
        return SegmentResult::error("invalid segment name " + name, core::Error::Code::INTERNAL);
    }

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& pending : pending_deletion_) {
            // A failed removal is retried on tick against this path, so reuse must wait for it.
            if (pending->name() == name && (!pending->is_cleanup_done() || pending->deletion_failed())) {
                return SegmentResult::error("segment " + name + " is still being deleted",
                                            core::Error::Code::UNAVAILABLE);
            }
        }
    }

    auto mkdir_result = fs_->mkdir_if_not_exist(path);
    if (!mkdir_result.ok()) {
        return SegmentResult::error("failed to create segment " + name + ": " + mkdir_result.error(),
                                    mkdir_result.error_code());
    }

    auto tables = open_tables(name, path, range);
    if (!tables.ok()) {
        auto remove_result = fs_->remove_all(path);
        if (!remove_result.ok()) {
            SEGSTORE_ERROR("failed to clean up partial segment {}: {}", path, remove_result.error());
        }
        return SegmentResult::error(tables.error(), tables.error_code());
    }

    // The metadata file is written last: a directory without it is a partial segment.
    auto written = fs_->write(join_path(path, kMetadataFilename),
                              encode_segment_metadata(range, options_.segment_interval));
    if (!written.ok()) {
        auto opened = tables.take_value();
        for (auto& table : opened) {
            auto close_result = table->close();
            if (!close_result.ok()) {
                SEGSTORE_ERROR("failed to close table of {}: {}", name, close_result.error());
            }
        }
        auto remove_result = fs_->remove_all(path);
        if (!remove_result.ok()) {
            SEGSTORE_ERROR("failed to clean up partial segment {}: {}", path, remove_result.error());
        }
        return SegmentResult::error("failed to write metadata of " + name + ": " + written.error(),
                                    written.error_code());
    }

    SEGSTORE_INFO("created segment {} {} in {}", name, range.to_string(), options_.location);
    return SegmentResult(std::make_shared<Segment>(id, name, path, range, tables.take_value(), fs_));
}

core::Result<void> SegmentController::insert_segment(std::shared_ptr<Segment> segment) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!closed_.load(std::memory_order_acquire)) {
            auto pos = std::upper_bound(segments_.begin(), segments_.end(), segment,
                                        [](const std::shared_ptr<Segment>& a, const std::shared_ptr<Segment>& b) {
                                            return a->time_range().start < b->time_range().start;
                                        });
            segments_.insert(pos, std::move(segment));
            return core::Result<void>();
        }
    }
    segment->retire();
    return core::Result<void>::error("segment controller of " + options_.location + " is closed",
                                     core::Error::Code::UNAVAILABLE);
}

core::Result<std::shared_ptr<Segment>> SegmentController::create_segment_if_not_exist(core::Timestamp ts) {
    using SegmentResult = core::Result<std::shared_ptr<Segment>>;

    if (closed_.load(std::memory_order_acquire)) {
        return SegmentResult::error("segment controller of " + options_.location + " is closed",
                                    core::Error::Code::UNAVAILABLE);
    }
    if (auto segment = find_live(ts)) {
        if (segment->acquire()) {
            return SegmentResult(segment);
        }
    }

    std::lock_guard<std::mutex> create_lock(create_mutex_);
    if (closed_.load(std::memory_order_acquire)) {
        return SegmentResult::error("segment controller of " + options_.location + " is closed",
                                    core::Error::Code::UNAVAILABLE);
    }
    // Another caller may have created the bucket while we waited.
    if (auto segment = find_live(ts)) {
        if (segment->acquire()) {
            return SegmentResult(segment);
        }
    }

    core::Timestamp horizon = options_.ttl.prev(clock_->now());
    auto plan = plan_buckets(ts, horizon);
    if (!plan.ok()) {
        return SegmentResult::error(plan.error(), plan.error_code());
    }

    std::shared_ptr<Segment> target;
    for (const auto& range : plan.value().ranges) {
        if (range.contains(ts) && range.end <= horizon) {
            return SegmentResult::error("timestamp " + core::FormatRFC3339(ts) + " is beyond the retention of " +
                                        options_.ttl.to_string(), core::Error::Code::INVALID_ARGUMENT);
        }
    }
    for (const auto& range : plan.value().ranges) {
        auto created = create_segment(range);
        if (!created.ok()) {
            return SegmentResult::error(created.error(), created.error_code());
        }
        auto segment = created.take_value();
        bool covers = segment->contains(ts);
        auto inserted = insert_segment(segment);
        if (!inserted.ok()) {
            return SegmentResult::error(inserted.error(), inserted.error_code());
        }
        if (covers) {
            target = segment;
        }
    }

    if (!target || !target->acquire()) {
        return SegmentResult::error("no segment covers " + core::FormatRFC3339(ts) + " after creation",
                                    core::Error::Code::INTERNAL);
    }
    return SegmentResult(target);
}

core::Result<std::shared_ptr<Segment>> SegmentController::acquire_segment(core::Timestamp ts) {
    using SegmentResult = core::Result<std::shared_ptr<Segment>>;

    for (int attempt = 0; attempt < kAcquireAttempts; ++attempt) {
        auto segment = find_live(ts);
        if (!segment) {
            return SegmentResult::error("no segment covers " + core::FormatRFC3339(ts),
                                        core::Error::Code::NOT_FOUND);
        }
        if (segment->acquire()) {
            return SegmentResult(segment);
        }
    }
    return SegmentResult::error("segment covering " + core::FormatRFC3339(ts) + " is being removed",
                                core::Error::Code::UNAVAILABLE);
}

std::vector<std::shared_ptr<Segment>> SegmentController::segments(bool include_closed) const {
    std::vector<std::shared_ptr<Segment>> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        result = segments_;
        if (include_closed) {
            for (const auto& segment : pending_deletion_) {
                if (!segment->is_destroyed()) {
                    result.push_back(segment);
                }
            }
        }
    }
    if (include_closed) {
        std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            return a->time_range().start < b->time_range().start;
        });
    }
    return result;
}

size_t SegmentController::pending_deletion_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return pending_deletion_.size();
}

void SegmentController::tick(core::Timestamp now) {
    if (closed_.load(std::memory_order_acquire)) {
        return;
    }
    rotate(now);
    apply_retention(now);
    sweep_pending_deletions();
}

void SegmentController::rotate(core::Timestamp now) {
    bool expected = false;
    if (!rotation_in_flight_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        SEGSTORE_DEBUG("rotation of {} already in flight, skipping tick", options_.location);
        return;
    }
    struct FlagGuard {
        std::atomic<bool>& flag;
        ~FlagGuard() { flag.store(false, std::memory_order_release); }
    } guard{rotation_in_flight_};

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (!segments_.empty() && now < segments_.back()->time_range().end) {
            return;
        }
    }

    auto result = create_segment_if_not_exist(now);
    if (!result.ok()) {
        SEGSTORE_ERROR("failed to rotate {} at {}, retrying on next tick: {}",
                       options_.location, core::FormatRFC3339(now), result.error());
        return;
    }
    result.value()->release();
}

void SegmentController::apply_retention(core::Timestamp now) {
    core::Timestamp horizon = options_.ttl.prev(now);
    std::vector<std::shared_ptr<Segment>> expired;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        // Oldest first; the list is time-ordered so the first survivor ends the scan.
        while (segments_.size() > 1) {
            const auto& oldest = segments_.front();
            if (oldest->time_range().end > horizon || oldest->contains(now)) {
                break;
            }
            expired.push_back(oldest);
            pending_deletion_.push_back(oldest);
            segments_.erase(segments_.begin());
        }
    }

    for (const auto& segment : expired) {
        if (segment->mark_expired()) {
            SEGSTORE_INFO("segment {} {} expired, ttl {}", segment->name(),
                          segment->time_range().to_string(), options_.ttl.to_string());
        }
    }
}

int64_t SegmentController::delete_expired_segments(const core::TimeRange& time_range) {
    if (closed_.load(std::memory_order_acquire)) {
        return 0;
    }
    core::Timestamp now = clock_->now();
    std::vector<std::shared_ptr<Segment>> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = segments_.begin();
        while (it != segments_.end()) {
            const auto& segment = *it;
            bool eligible = segment->time_range().overlaps(time_range) && !segment->contains(now);
            if (!eligible || segments_.size() <= 1) {
                ++it;
                continue;
            }
            removed.push_back(segment);
            pending_deletion_.push_back(segment);
            it = segments_.erase(it);
        }
    }

    int64_t count = 0;
    for (const auto& segment : removed) {
        if (segment->mark_expired()) {
            ++count;
            SEGSTORE_INFO("segment {} {} deleted on request for {}", segment->name(),
                          segment->time_range().to_string(), time_range.to_string());
        }
    }
    return count;
}

void SegmentController::sweep_pending_deletions() {
    std::vector<std::shared_ptr<Segment>> pending;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        pending = pending_deletion_;
    }
    if (pending.empty()) {
        return;
    }

    std::vector<std::shared_ptr<Segment>> done;
    for (const auto& segment : pending) {
        if (!segment->is_cleanup_done()) {
            continue;
        }
        if (segment->deletion_failed()) {
            auto result = segment->retry_deletion();
            if (!result.ok()) {
                SEGSTORE_ERROR("retry of segment {} deletion failed: {}", segment->name(), result.error());
                continue;
            }
        }
        done.push_back(segment);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    pending_deletion_.erase(
        std::remove_if(pending_deletion_.begin(), pending_deletion_.end(),
                       [&done](const std::shared_ptr<Segment>& segment) {
                           return std::find(done.begin(), done.end(), segment) != done.end();
                       }),
        pending_deletion_.end());
}

void SegmentController::close(std::chrono::milliseconds timeout) {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    // Wait for an in-progress creation to finish inserting or backing out.
    std::lock_guard<std::mutex> create_lock(create_mutex_);

    std::vector<std::shared_ptr<Segment>> all;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        all = segments_;
        all.insert(all.end(), pending_deletion_.begin(), pending_deletion_.end());
        segments_.clear();
        pending_deletion_.clear();
    }

    for (const auto& segment : all) {
        segment->retire();
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto drained = [&all]() {
        return std::all_of(all.begin(), all.end(), [](const std::shared_ptr<Segment>& segment) {
            return segment->is_cleanup_done();
        });
    };
    while (!drained() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    for (const auto& segment : all) {
        if (!segment->is_destroyed()) {
            SEGSTORE_WARN("segment {} still has {} references after {}ms, force closing",
                          segment->name(), segment->ref_count(), timeout.count());
            segment->force_close();
        }
        if (segment->deletion_failed()) {
            auto result = segment->retry_deletion();
            if (!result.ok()) {
                SEGSTORE_ERROR("failed to remove expired segment {} on close: {}", segment->name(), result.error());
            }
        }
    }
    SEGSTORE_INFO("closed segment controller of {}", options_.location);
}

} // namespace storage
} // namespace segstore
