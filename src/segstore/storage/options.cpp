#include "segstore/storage/options.h"

#include <filesystem>

namespace segstore {
namespace storage {

namespace {

core::Result<void> invalid(const std::string& message) {
    return core::Result<void>::error(message, core::Error::Code::INVALID_ARGUMENT);
}

} // namespace

core::Result<void> TSDBOptions::validate() const {
    if (location.empty()) {
        return invalid("root path is empty");
    }
    auto interval_result = segment_interval.validate();
    if (!interval_result.ok()) {
        return invalid("invalid segment interval: " + interval_result.error());
    }
    auto ttl_result = ttl.validate();
    if (!ttl_result.ok()) {
        return invalid("invalid ttl: " + ttl_result.error());
    }
    if (shard_num == 0) {
        return invalid("shard_num must be greater than 0");
    }
    if (!table_creator) {
        return invalid("table creator is not set");
    }
    if (shutdown_timeout.count() < 0) {
        return invalid("shutdown_timeout must not be negative");
    }
    if (disk_usage_limit_percent < 0 || disk_usage_limit_percent > 100) {
        return invalid("disk_usage_limit_percent must be within [0, 100]");
    }
    return core::Result<void>();
}

core::Result<void> CacheConfig::validate() const {
    if (max_cache_size < 0) {
        return invalid("service-cache-max-size must be greater than or equal to 0");
    }
    if (cleanup_interval.count() <= 0) {
        return invalid("service-cache-cleanup-interval must be greater than 0");
    }
    if (idle_timeout.count() <= 0) {
        return invalid("service-cache-idle-timeout must be greater than 0");
    }
    return core::Result<void>();
}

ServiceConfig ServiceConfig::Default(const std::string& name) {
    ServiceConfig config;
    config.name = name;
    config.root_path = "/tmp";
    config.max_disk_usage_percent = 95;
    config.max_file_snapshot_num = 10;
    config.cache = CacheConfig{};
    return config;
}

core::Result<void> ServiceConfig::validate() const {
    if (root_path.empty()) {
        return invalid("root path is empty");
    }
    if (name.empty()) {
        return invalid("service name is empty");
    }
    if (max_disk_usage_percent < 0) {
        return invalid(name + "-max-disk-usage-percent must be greater than or equal to 0");
    }
    if (max_disk_usage_percent > 100) {
        return invalid(name + "-max-disk-usage-percent must be less than or equal to 100");
    }
    if (max_file_snapshot_num <= 0) {
        return invalid(name + "-max-file-snapshot-num must be greater than 0");
    }
    return cache.validate();
}

std::string ServiceConfig::resolved_data_path() const {
    if (!data_path.empty()) {
        return data_path;
    }
    return (std::filesystem::path(root_path) / name / "data").string();
}

std::string ServiceConfig::snapshot_dir() const {
    return (std::filesystem::path(root_path) / name / "snapshots").string();
}

} // namespace storage
} // namespace segstore
