#pragma once

#include "core/clock.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace vaultagent {

/**
 * @brief TTL- and capacity-bounded key/value cache with hit/miss accounting
 *
 * - An entry is never returned once now >= expires_at. Expired entries are
 *   dropped lazily when a lookup touches them; purge_expired() is an optional
 *   sweep and is not needed for correctness.
 * - size() <= max_entries after every mutation. When full, inserting a new
 *   key evicts the least-recently-inserted entry. Reads do not promote.
 *   Replacing an existing key counts as a fresh insertion.
 * - A TTL of zero means pass-through: with a zero default TTL every get()
 *   misses, and put() with a zero TTL stores nothing (it drops any older
 *   value for the key so it cannot outlive the write).
 *
 * One mutex per instance; no I/O happens under it. stats() reads atomics
 * only and never takes the lock.
 */
template<typename V>
class TtlCache {
public:
    struct Config {
        int64_t max_entries = 1000;
        std::chrono::seconds default_ttl{300};
    };

    struct Entry {
        std::string key;
        V value;
        TimePoint created_at;
        TimePoint expires_at;
        std::optional<int> version;
    };

    /// @throws ConfigurationError if max_entries <= 0 or default_ttl < 0
    explicit TtlCache(const Config& config,
                      std::shared_ptr<IClock> clock = SteadyClock::shared())
        : max_entries_(validated_capacity(config.max_entries)),
          clock_(std::move(clock)),
          default_ttl_seconds_(validated_ttl(config.default_ttl).count()) {}

    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;

    [[nodiscard]] std::optional<V> get(const std::string& key) {
        auto entry = get_entry(key);
        if (!entry) return std::nullopt;
        return std::move(entry->value);
    }

    /// Lookup returning the full entry (timestamps, version). Counts like get().
    [[nodiscard]] std::optional<Entry> get_entry(const std::string& key) {
        if (default_ttl().count() == 0) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        const auto now = clock_->now();
        std::lock_guard lock(mutex_);
        const auto it = index_.find(key);
        if (it == index_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        if (now >= it->second->expires_at) {
            erase_locked(it);
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        hits_.fetch_add(1, std::memory_order_relaxed);
        return *it->second;
    }

    void put(const std::string& key, V value,
             std::optional<std::chrono::seconds> ttl = std::nullopt,
             std::optional<int> version = std::nullopt) {
        const auto effective_ttl = ttl.value_or(default_ttl());
        const auto now = clock_->now();

        std::lock_guard lock(mutex_);
        if (const auto it = index_.find(key); it != index_.end()) {
            erase_locked(it);
        }

        if (effective_ttl.count() <= 0) {
            return;
        }

        while (index_.size() >= max_entries_ && !order_.empty()) {
            index_.erase(order_.front().key);
            order_.pop_front();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        order_.push_back(Entry{key, std::move(value), now, now + effective_ttl, version});
        index_[key] = std::prev(order_.end());
        size_.store(index_.size(), std::memory_order_relaxed);
    }

    bool invalidate(const std::string& key) {
        std::lock_guard lock(mutex_);
        const auto it = index_.find(key);
        if (it == index_.end()) return false;
        erase_locked(it);
        return true;
    }

    /// Remove every key starting with prefix. Returns the number removed.
    size_t invalidate_prefix(std::string_view prefix) {
        std::lock_guard lock(mutex_);
        size_t removed = 0;
        for (auto it = order_.begin(); it != order_.end(); ) {
            if (std::string_view(it->key).starts_with(prefix)) {
                index_.erase(it->key);
                it = order_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        size_.store(index_.size(), std::memory_order_relaxed);
        return removed;
    }

    /// Drop every entry. Counters survive unless reset_stats is set.
    void clear(bool reset_stats = false) {
        std::lock_guard lock(mutex_);
        order_.clear();
        index_.clear();
        size_.store(0, std::memory_order_relaxed);
        if (reset_stats) {
            hits_.store(0, std::memory_order_relaxed);
            misses_.store(0, std::memory_order_relaxed);
            evictions_.store(0, std::memory_order_relaxed);
        }
    }

    /// Sweep expired entries. Returns the number removed.
    size_t purge_expired() {
        const auto now = clock_->now();
        std::lock_guard lock(mutex_);
        size_t removed = 0;
        for (auto it = order_.begin(); it != order_.end(); ) {
            if (now >= it->expires_at) {
                index_.erase(it->key);
                it = order_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        size_.store(index_.size(), std::memory_order_relaxed);
        return removed;
    }

    /// Applies to subsequent puts; existing entries keep their expiry.
    /// @throws ConfigurationError on a negative TTL
    void set_default_ttl(std::chrono::seconds ttl) {
        default_ttl_seconds_.store(validated_ttl(ttl).count(), std::memory_order_relaxed);
    }

    [[nodiscard]] std::chrono::seconds default_ttl() const {
        return std::chrono::seconds(default_ttl_seconds_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] size_t max_entries() const { return max_entries_; }

    [[nodiscard]] size_t size() const { return size_.load(std::memory_order_relaxed); }

    [[nodiscard]] CacheStats stats() const {
        return {
            .hits = hits_.load(std::memory_order_relaxed),
            .misses = misses_.load(std::memory_order_relaxed),
            .evictions = evictions_.load(std::memory_order_relaxed),
            .size = size_.load(std::memory_order_relaxed),
            .max_entries = max_entries_,
        };
    }

private:
    using EntryList = std::list<Entry>;

    static size_t validated_capacity(int64_t max_entries) {
        if (max_entries <= 0) {
            throw ConfigurationError(
                std::format("cache max_entries must be positive, got {}", max_entries));
        }
        return static_cast<size_t>(max_entries);
    }

    static std::chrono::seconds validated_ttl(std::chrono::seconds ttl) {
        if (ttl.count() < 0) {
            throw ConfigurationError(
                std::format("cache TTL must not be negative, got {}s", ttl.count()));
        }
        return ttl;
    }

    void erase_locked(typename std::unordered_map<std::string,
                                                  typename EntryList::iterator>::iterator it) {
        order_.erase(it->second);
        index_.erase(it);
        size_.store(index_.size(), std::memory_order_relaxed);
    }

    const size_t max_entries_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    EntryList order_;  // oldest insertion at front
    std::unordered_map<std::string, typename EntryList::iterator> index_;

    std::atomic<int64_t> default_ttl_seconds_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<size_t> size_{0};
};

} // namespace vaultagent
