#include "segstore/storage/service.h"
#include "segstore/common/logger.h"
#include "segstore/core/error.h"

#include <cstdio>
#include <filesystem>

namespace segstore {
namespace storage {

namespace {

std::shared_ptr<FileSystem> or_local(std::shared_ptr<FileSystem> fs) {
    if (fs) {
        return fs;
    }
    return std::make_shared<LocalFileSystem>();
}

const ServiceConfig& validated(const ServiceConfig& config) {
    auto valid = config.validate();
    if (!valid.ok()) {
        throw core::InvalidArgumentError(valid.error());
    }
    return config;
}

std::string snapshot_name(core::Timestamp ts, uint64_t seq) {
    core::CivilTime ct = core::ToCivil(ts);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04lld%02d%02d%02d%02d%02d-%08llu",
                  static_cast<long long>(ct.year), ct.month, ct.day, ct.hour, ct.minute, ct.second,
                  static_cast<unsigned long long>(seq));
    return buf;
}

} // namespace

Service::Service(const ServiceConfig& config,
                 std::shared_ptr<core::Clock> clock,
                 std::shared_ptr<FileSystem> fs)
    : config_(validated(config))
    , clock_(std::move(clock))
    , fs_(or_local(std::move(fs)))
    , cache_(config_.cache, clock_) {
    SEGSTORE_INFO("{} service data at {}", config_.name, config_.resolved_data_path());
}

Service::~Service() {
    close();
}

core::Result<Database*> Service::open_group(const std::string& group, TSDBOptions options) {
    if (closed_.load(std::memory_order_acquire)) {
        return core::Result<Database*>::error(config_.name + " service is closed", core::Error::Code::UNAVAILABLE);
    }
    {
        std::shared_lock<std::shared_mutex> lock(groups_mutex_);
        if (groups_.count(group) > 0) {
            return core::Result<Database*>::error("group " + group + " is already open",
                                                  core::Error::Code::ALREADY_EXISTS);
        }
    }

    options.location = (std::filesystem::path(config_.resolved_data_path()) / group).string();
    options.module = config_.name;
    options.group = group;
    options.disk_usage_limit_percent = config_.max_disk_usage_percent;

    auto opened = Database::open(options, clock_, fs_);
    if (!opened.ok()) {
        return core::Result<Database*>::error("failed to open group " + group + ": " + opened.error(),
                                              opened.error_code());
    }
    auto db = opened.take_value();

    std::unique_lock<std::shared_mutex> lock(groups_mutex_);
    auto inserted = groups_.emplace(group, nullptr);
    if (!inserted.second) {
        lock.unlock();
        db->close();
        return core::Result<Database*>::error("group " + group + " is already open",
                                              core::Error::Code::ALREADY_EXISTS);
    }
    inserted.first->second = std::move(db);
    return core::Result<Database*>(inserted.first->second.get());
}

core::Result<Database*> Service::load_group(const std::string& group) const {
    std::shared_lock<std::shared_mutex> lock(groups_mutex_);
    auto it = groups_.find(group);
    if (it == groups_.end()) {
        return core::Result<Database*>::error("group " + group + " is not open", core::Error::Code::NOT_FOUND);
    }
    return core::Result<Database*>(it->second.get());
}

void Service::tick(core::Timestamp now) {
    std::shared_lock<std::shared_mutex> lock(groups_mutex_);
    for (auto& entry : groups_) {
        entry.second->tick(now);
    }
}

int64_t Service::delete_expired_segments(const DeleteExpiredSegmentsRequest& request) {
    auto db = load_group(request.group);
    if (!db.ok()) {
        SEGSTORE_ERROR("failed to delete expired segments of {}: {}", request.group, db.error());
        return 0;
    }
    return db.value()->delete_expired_segments(request.time_range);
}

core::Result<std::string> Service::take_snapshot() {
    std::lock_guard<std::mutex> snapshot_lock(snapshot_mutex_);

    std::string dir = (std::filesystem::path(config_.snapshot_dir()) /
                       snapshot_name(clock_->now(), snapshot_seq_++)).string();
    auto mkdir_result = fs_->mkdir_if_not_exist(dir);
    if (!mkdir_result.ok()) {
        return core::Result<std::string>::error(mkdir_result.error(), mkdir_result.error_code());
    }

    {
        std::shared_lock<std::shared_mutex> lock(groups_mutex_);
        for (auto& entry : groups_) {
            auto result = entry.second->take_file_snapshot((std::filesystem::path(dir) / entry.first).string());
            if (!result.ok()) {
                SEGSTORE_ERROR("snapshot of group {} failed: {}", entry.first, result.error());
                auto remove_result = fs_->remove_all(dir);
                if (!remove_result.ok()) {
                    SEGSTORE_ERROR("failed to remove partial snapshot {}: {}", dir, remove_result.error());
                }
                return core::Result<std::string>::error(result.error(), result.error_code());
            }
        }
    }

    prune_snapshots();
    SEGSTORE_INFO("took {} snapshot {}", config_.name, dir);
    return core::Result<std::string>(dir);
}

void Service::prune_snapshots() {
    auto dirs = fs_->list_dirs(config_.snapshot_dir());
    if (!dirs.ok()) {
        SEGSTORE_ERROR("failed to list snapshots in {}: {}", config_.snapshot_dir(), dirs.error());
        return;
    }
    const auto& names = dirs.value();
    if (names.size() <= static_cast<size_t>(config_.max_file_snapshot_num)) {
        return;
    }
    size_t excess = names.size() - static_cast<size_t>(config_.max_file_snapshot_num);
    for (size_t i = 0; i < excess; ++i) {
        std::string path = (std::filesystem::path(config_.snapshot_dir()) / names[i]).string();
        auto result = fs_->remove_all(path);
        if (!result.ok()) {
            SEGSTORE_ERROR("failed to remove old snapshot {}: {}", path, result.error());
        }
    }
}

void Service::collect_cache_metrics(MetricsSink& sink) const {
    core::Position position{config_.name, "", "", ""};
    auto requests = cache_.requests();
    auto misses = cache_.misses();
    double hit_ratio = 0.0;
    if (requests > 0) {
        hit_ratio = static_cast<double>(requests - misses) / static_cast<double>(requests);
    }
    sink.record("service_cache_requests", position, static_cast<double>(requests));
    sink.record("service_cache_misses", position, static_cast<double>(misses));
    sink.record("service_cache_hit_ratio", position, hit_ratio);
    sink.record("service_cache_entries", position, static_cast<double>(cache_.entries()));
    sink.record("service_cache_size", position, static_cast<double>(cache_.size()));
}

void Service::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::unique_lock<std::shared_mutex> lock(groups_mutex_);
        for (auto& entry : groups_) {
            entry.second->close();
        }
        groups_.clear();
    }
    cache_.close();
    SEGSTORE_INFO("closed {} service", config_.name);
}

} // namespace storage
} // namespace segstore
