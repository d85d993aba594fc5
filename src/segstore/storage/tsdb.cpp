#include "segstore/storage/tsdb.h"
#include "segstore/common/logger.h"

#include <filesystem>

namespace segstore {
namespace storage {

core::Result<std::unique_ptr<Database>> Database::open(const TSDBOptions& options,
                                                       std::shared_ptr<core::Clock> clock,
                                                       std::shared_ptr<FileSystem> fs) {
    using DatabaseResult = core::Result<std::unique_ptr<Database>>;

    auto valid = options.validate();
    if (!valid.ok()) {
        return DatabaseResult::error("invalid options for " + options.location + ": " + valid.error(),
                                     valid.error_code());
    }
    if (!clock) {
        return DatabaseResult::error("clock is not set", core::Error::Code::INVALID_ARGUMENT);
    }
    if (!fs) {
        fs = std::make_shared<LocalFileSystem>();
    }

    auto controller = std::make_unique<SegmentController>(options, fs, clock);
    auto opened = controller->open();
    if (!opened.ok()) {
        return DatabaseResult::error(opened.error(), opened.error_code());
    }

    core::Timestamp now = clock->now();
    auto current = controller->create_segment_if_not_exist(now);
    if (!current.ok()) {
        controller->close(options.shutdown_timeout);
        return DatabaseResult::error("failed to create the current segment: " + current.error(),
                                     current.error_code());
    }
    current.value()->release();
    controller->tick(now);

    SEGSTORE_INFO("opened {} database {} at {} (interval {}, ttl {})", options.module, options.group,
                  options.location, options.segment_interval.to_string(), options.ttl.to_string());
    return DatabaseResult(std::unique_ptr<Database>(
        new Database(options, std::move(clock), std::move(fs), std::move(controller))));
}

Database::Database(const TSDBOptions& options,
                   std::shared_ptr<core::Clock> clock,
                   std::shared_ptr<FileSystem> fs,
                   std::unique_ptr<SegmentController> controller)
    : options_(options)
    , clock_(std::move(clock))
    , fs_(std::move(fs))
    , controller_(std::move(controller)) {
}

Database::~Database() {
    close();
}

core::Result<std::shared_ptr<Segment>> Database::create_segment_if_not_exist(core::Timestamp ts) {
    return controller_->create_segment_if_not_exist(ts);
}

core::Result<std::shared_ptr<Segment>> Database::create_segment_for_write(core::Timestamp ts) {
    if (options_.disk_usage_limit_percent > 0) {
        auto usage = fs_->disk_usage_percent(options_.location);
        if (!usage.ok()) {
            SEGSTORE_WARN("cannot read disk usage of {}: {}", options_.location, usage.error());
        } else if (usage.value() > options_.disk_usage_limit_percent) {
            return core::Result<std::shared_ptr<Segment>>::error(
                "disk usage " + std::to_string(usage.value()) + "% of " + options_.location +
                " exceeds the limit of " + std::to_string(options_.disk_usage_limit_percent) + "%",
                core::Error::Code::RESOURCE_EXHAUSTED);
        }
    }
    return controller_->create_segment_if_not_exist(ts);
}

core::Result<std::shared_ptr<Segment>> Database::acquire_segment(core::Timestamp ts) {
    return controller_->acquire_segment(ts);
}

std::vector<std::shared_ptr<Segment>> Database::select_segments(const core::TimeRange& time_range) {
    std::vector<std::shared_ptr<Segment>> selected;
    for (auto& segment : controller_->segments(false)) {
        if (!segment->time_range().overlaps(time_range)) {
            continue;
        }
        if (segment->acquire()) {
            selected.push_back(std::move(segment));
        }
    }
    return selected;
}

std::vector<std::shared_ptr<Segment>> Database::segments(bool include_closed) const {
    return controller_->segments(include_closed);
}

void Database::tick(core::Timestamp now) {
    if (is_closed()) {
        return;
    }
    controller_->tick(now);
}

int64_t Database::delete_expired_segments(const core::TimeRange& time_range) {
    return controller_->delete_expired_segments(time_range);
}

core::Result<void> Database::take_file_snapshot(const std::string& dest_dir) {
    auto mkdir_result = fs_->mkdir_if_not_exist(dest_dir);
    if (!mkdir_result.ok()) {
        return mkdir_result;
    }
    for (auto& segment : controller_->segments(false)) {
        if (!segment->acquire()) {
            continue;
        }
        SegmentRef ref(std::move(segment));
        auto result = ref->take_file_snapshot((std::filesystem::path(dest_dir) / ref->name()).string());
        if (!result.ok()) {
            return result;
        }
    }
    return core::Result<void>();
}

void Database::collect(MetricsSink& sink) {
    core::Position position{options_.module, options_.group, "", ""};
    auto live = controller_->segments(false);
    sink.record("segment_count", position, static_cast<double>(live.size()));
    sink.record("pending_deletion_count", position, static_cast<double>(controller_->pending_deletion_count()));
    for (auto& segment : live) {
        if (!segment->acquire()) {
            continue;
        }
        SegmentRef ref(std::move(segment));
        ref->collect(sink, position);
    }
}

void Database::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    controller_->close(options_.shutdown_timeout);
    SEGSTORE_INFO("closed {} database {}", options_.module, options_.group);
}

} // namespace storage
} // namespace segstore
