/**
 * @file service_cache.cpp
 * @brief LRU cache with a byte budget and an idle sweep
 *
 * Implementation Details:
 * - std::list keeps recency order (front = most recent), std::unordered_map
 *   stores list iterators for O(1) lookups and splices
 * - A single mutex protects the list, the map and the byte counter
 * - Request and miss counters are atomics and only ever grow
 * - The sweep thread sleeps on a condition variable so close() wakes it
 *   immediately instead of waiting for the next interval
 */

#include "segstore/storage/service_cache.h"
#include "segstore/common/logger.h"
#include "segstore/core/error.h"

#include <chrono>

namespace segstore {
namespace storage {

ServiceCache::ServiceCache(const CacheConfig& config, std::shared_ptr<core::Clock> clock)
    : config_(config)
    , clock_(std::move(clock)) {
    auto valid = config_.validate();
    if (!valid.ok()) {
        throw core::InvalidArgumentError(valid.error());
    }
    if (!clock_) {
        throw core::InvalidArgumentError("service cache requires a clock");
    }
    cleanup_thread_ = std::thread(&ServiceCache::cleanup_loop, this);
}

ServiceCache::~ServiceCache() {
    close();
}

std::shared_ptr<void> ServiceCache::get(const std::string& key) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }
    it->second->last_access = clock_->now();
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return it->second->value;
}

void ServiceCache::put(const std::string& key, std::shared_ptr<void> value, int64_t size_bytes) {
    if (config_.max_cache_size == 0 || closed_.load(std::memory_order_acquire)) {
        return;
    }
    if (size_bytes < 0) {
        SEGSTORE_WARN("entry {} has a negative size of {} bytes, not cached", key, size_bytes);
        return;
    }
    if (size_bytes > config_.max_cache_size) {
        SEGSTORE_DEBUG("entry {} of {} bytes exceeds the cache budget of {} bytes",
                       key, size_bytes, config_.max_cache_size);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // close() clears under mutex_ after setting closed_.
    if (closed_.load(std::memory_order_acquire)) {
        return;
    }
    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
        current_size_ -= it->second->size_bytes;
        lru_list_.erase(it->second);
        cache_map_.erase(it);
    }
    while (!lru_list_.empty() && current_size_ + size_bytes > config_.max_cache_size) {
        evict_lru();
    }
    lru_list_.push_front(Entry{key, std::move(value), size_bytes, clock_->now()});
    cache_map_[key] = lru_list_.begin();
    current_size_ += size_bytes;
}

bool ServiceCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
        return false;
    }
    current_size_ -= it->second->size_bytes;
    lru_list_.erase(it->second);
    cache_map_.erase(it);
    return true;
}

// Caller holds mutex_
void ServiceCache::evict_lru() {
    const Entry& victim = lru_list_.back();
    current_size_ -= victim.size_bytes;
    cache_map_.erase(victim.key);
    lru_list_.pop_back();
}

size_t ServiceCache::clean() {
    core::Timestamp deadline = clock_->now() -
        std::chrono::duration_cast<std::chrono::nanoseconds>(config_.idle_timeout).count();

    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    // Idle entries cluster at the back; access order matches recency order.
    while (!lru_list_.empty() && lru_list_.back().last_access < deadline) {
        evict_lru();
        ++removed;
    }
    if (removed > 0) {
        SEGSTORE_DEBUG("service cache removed {} idle entries", removed);
    }
    return removed;
}

void ServiceCache::cleanup_loop() {
    std::unique_lock<std::mutex> lock(cleanup_mutex_);
    while (!stop_requested_) {
        if (cleanup_cond_.wait_for(lock, config_.cleanup_interval, [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        clean();
        lock.lock();
    }
}

void ServiceCache::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        stop_requested_ = true;
    }
    cleanup_cond_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    lru_list_.clear();
    cache_map_.clear();
    current_size_ = 0;
}

size_t ServiceCache::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_map_.size();
}

int64_t ServiceCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_size_;
}

} // namespace storage
} // namespace segstore
