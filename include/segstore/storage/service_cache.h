#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "segstore/core/clock.h"
#include "segstore/storage/options.h"

namespace segstore {
namespace storage {

/**
 * @brief Size- and idle-bounded LRU cache shared by an entity service
 *
 * Keys are strings and values are opaque; callers recover the concrete type
 * with get_as<T>(). Entries are evicted least-recently-used first when the
 * byte budget would be exceeded, and a background thread removes entries
 * idle for longer than idle_timeout every cleanup_interval.
 */
class ServiceCache {
public:
    /**
     * @brief Construct and start the background sweep
     * @throws core::InvalidArgumentError if config is invalid
     */
    ServiceCache(const CacheConfig& config, std::shared_ptr<core::Clock> clock);

    ~ServiceCache();

    ServiceCache(const ServiceCache&) = delete;
    ServiceCache& operator=(const ServiceCache&) = delete;

    /**
     * @brief Look up a value and refresh its recency
     * @return nullptr on miss
     */
    std::shared_ptr<void> get(const std::string& key);

    template<typename T>
    std::shared_ptr<T> get_as(const std::string& key) {
        return std::static_pointer_cast<T>(get(key));
    }

    /**
     * @brief Insert or replace a value accounted as size_bytes
     *
     * Ignored when caching is disabled, the cache is closed, or the entry
     * alone is larger than the whole budget.
     */
    void put(const std::string& key, std::shared_ptr<void> value, int64_t size_bytes);

    bool remove(const std::string& key);

    /**
     * @brief Remove entries idle for longer than idle_timeout
     * @return Number of entries removed
     */
    size_t clean();

    /**
     * @brief Stop the background sweep and drop all entries; safe to call twice
     */
    void close();

    uint64_t requests() const { return requests_.load(std::memory_order_relaxed); }
    uint64_t misses() const { return misses_.load(std::memory_order_relaxed); }
    size_t entries() const;
    int64_t size() const;

    const CacheConfig& config() const { return config_; }

private:
    struct Entry {
        std::string key;
        std::shared_ptr<void> value;
        int64_t size_bytes;
        core::Timestamp last_access;
    };

    using LRUList = std::list<Entry>;
    using LRUIterator = LRUList::iterator;

    void evict_lru();
    void cleanup_loop();

    CacheConfig config_;
    std::shared_ptr<core::Clock> clock_;

    mutable std::mutex mutex_;
    LRUList lru_list_;  // Most recently used at the front
    std::unordered_map<std::string, LRUIterator> cache_map_;
    int64_t current_size_ = 0;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> misses_{0};

    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cond_;
    bool stop_requested_ = false;
    std::thread cleanup_thread_;
    std::atomic<bool> closed_{false};
};

} // namespace storage
} // namespace segstore
