#pragma once

/// @file response_cache.hpp
/// @brief Thread-safe LRU response cache with TTL expiration.
///
/// Entries are keyed by a SHA-256 digest of the request payload, so
/// arbitrarily long prompts map to fixed-size keys. Lookup and eviction
/// are O(1) using a doubly-linked list plus a hash map.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "lra/foundation/agent_logger.hpp"
#include "lra/resilience/cache_key.hpp"

namespace lra::resilience {

/// Configuration for a ResponseCache.
struct ResponseCacheConfig {
    /// Maximum number of entries; values below 1 are raised to 1.
    std::size_t maxEntries = 100;

    /// Entry lifetime measured from insertion. Zero disables expiry.
    std::chrono::milliseconds ttl{std::chrono::seconds(3600)};

    bool enabled = true;
};

/// Snapshot of cache counters.
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    std::size_t size = 0;
    std::size_t maxEntries = 0;
    std::chrono::milliseconds ttl{0};

    /// Hits as a percentage of lookups.
    [[nodiscard]] double hitRate() const noexcept {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) * 100.0 : 0.0;
    }
};

[[nodiscard]] std::string toString(const CacheStats& stats);

/// TTL + LRU cache for inference responses.
///
/// Usage:
/// @code
///   ResponseCache<std::string> cache({.maxEntries = 100,
///                                     .ttl = std::chrono::hours(1)});
///   if (auto hit = cache.get(prompt)) {
///       return *hit;
///   }
///   auto reply = generate(prompt);
///   cache.set(prompt, reply);
/// @endcode
///
/// Values are returned by copy; entries never leave the cache by reference.
/// size() <= maxEntries holds after every mutating call.
template <typename T>
class ResponseCache {
public:
    explicit ResponseCache(ResponseCacheConfig config = {});

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    /// Look up a cached value.
    ///
    /// An expired entry is removed and counted as a miss. A hit promotes
    /// the entry to most recently used. Always nullopt when disabled.
    [[nodiscard]] std::optional<T> get(std::string_view content);

    /// Store a value, replacing any existing entry and restarting its TTL.
    /// Evicts the least recently used entry when full. No-op when disabled.
    void set(std::string_view content, T value);

    /// @return true if an entry was found and removed.
    bool invalidate(std::string_view content);

    /// Remove every entry. @return Number of entries removed.
    std::size_t clear();

    /// Presence check without touching recency or counters.
    [[nodiscard]] bool contains(std::string_view content) const;

    /// Hit count of a live entry (nullopt if absent or expired).
    [[nodiscard]] std::optional<uint64_t> entryHits(std::string_view content) const;

    /// Drop all expired entries. @return Number of entries removed.
    std::size_t cleanupExpired();

    [[nodiscard]] std::size_t size() const;

    void setEnabled(bool enabled);
    [[nodiscard]] bool isEnabled() const;

    [[nodiscard]] CacheStats stats() const;

    /// Zero hit/miss/eviction counters; entries are kept.
    void resetStats();

    [[nodiscard]] const ResponseCacheConfig& config() const noexcept { return config_; }

private:
    struct Entry {
        std::string key;
        T value;
        std::chrono::steady_clock::time_point createdAt;
        uint64_t hits = 0;
    };

    using EntryList = std::list<Entry>;

    // Callers hold mutex_.
    [[nodiscard]] bool isExpired(const Entry& entry,
                                 std::chrono::steady_clock::time_point now) const {
        return config_.ttl.count() > 0 && now - entry.createdAt > config_.ttl;
    }

    void touch(typename EntryList::iterator it) { lru_.splice(lru_.begin(), lru_, it); }

    void evictLru() {
        auto& back = lru_.back();
        LRA_LOG_CTX(lra::foundation::LogLevel::Debug, lra::foundation::LogCategory::Cache,
                    "cache_eviction",
                    lra::foundation::LogContext{}.add("key", back.key.substr(0, 16)));
        index_.erase(back.key);
        lru_.pop_back();
        ++evictions_;
    }

    // Callers hold mutex_; `key` is computed before locking.
    [[nodiscard]] typename EntryList::const_iterator findLive(const std::string& key) const;

    ResponseCacheConfig config_;
    mutable std::mutex mutex_;
    bool enabled_;

    // Front = most recently used, back = least recently used.
    EntryList lru_;
    std::unordered_map<std::string, typename EntryList::iterator> index_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
};

// --- Template implementation ---

template <typename T>
ResponseCache<T>::ResponseCache(ResponseCacheConfig config)
    : config_(config), enabled_(config.enabled) {
    if (config_.maxEntries < 1) {
        config_.maxEntries = 1;
    }
    if (config_.ttl.count() < 0) {
        config_.ttl = std::chrono::milliseconds::zero();
    }

    LRA_LOG_CTX(lra::foundation::LogLevel::Info, lra::foundation::LogCategory::Cache,
                "cache_initialized",
                lra::foundation::LogContext{}
                    .add("max_entries", config_.maxEntries)
                    .add("ttl_ms", config_.ttl.count())
                    .add("enabled", enabled_));
}

template <typename T>
std::optional<T> ResponseCache<T>::get(std::string_view content) {
    auto key = cacheKey(content);
    std::lock_guard lock(mutex_);
    if (!enabled_) {
        return std::nullopt;
    }

    auto it = index_.find(key);
    if (key.empty() || it == index_.end()) {
        ++misses_;
        return std::nullopt;
    }

    auto listIt = it->second;
    if (isExpired(*listIt, std::chrono::steady_clock::now())) {
        LRA_LOG_CTX(lra::foundation::LogLevel::Debug, lra::foundation::LogCategory::Cache,
                    "cache_expired",
                    lra::foundation::LogContext{}.add("key", key.substr(0, 16)));
        lru_.erase(listIt);
        index_.erase(it);
        ++misses_;
        return std::nullopt;
    }

    ++hits_;
    ++listIt->hits;
    touch(listIt);
    LRA_LOG_CTX(lra::foundation::LogLevel::Debug, lra::foundation::LogCategory::Cache,
                "cache_hit",
                lra::foundation::LogContext{}
                    .add("key", key.substr(0, 16))
                    .add("entry_hits", listIt->hits));
    return listIt->value;
}

template <typename T>
void ResponseCache<T>::set(std::string_view content, T value) {
    auto key = cacheKey(content);
    std::lock_guard lock(mutex_);
    if (!enabled_) {
        return;
    }

    if (key.empty()) {
        LRA_LOG_WARN(lra::foundation::LogCategory::Cache, "cache_key_digest_failed");
        return;
    }

    auto now = std::chrono::steady_clock::now();
    auto it = index_.find(key);
    if (it != index_.end()) {
        auto listIt = it->second;
        listIt->value = std::move(value);
        listIt->createdAt = now;
        listIt->hits = 0;
        touch(listIt);
        return;
    }

    while (lru_.size() >= config_.maxEntries) {
        evictLru();
    }

    lru_.push_front(Entry{key, std::move(value), now, 0});
    index_.emplace(std::move(key), lru_.begin());

    LRA_LOG_CTX(lra::foundation::LogLevel::Debug, lra::foundation::LogCategory::Cache,
                "cache_set", lra::foundation::LogContext{}.add("size", lru_.size()));
}

template <typename T>
bool ResponseCache<T>::invalidate(std::string_view content) {
    auto key = cacheKey(content);
    std::lock_guard lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    lru_.erase(it->second);
    index_.erase(it);
    return true;
}

template <typename T>
std::size_t ResponseCache<T>::clear() {
    std::lock_guard lock(mutex_);
    auto count = lru_.size();
    lru_.clear();
    index_.clear();
    LRA_LOG_CTX(lra::foundation::LogLevel::Info, lra::foundation::LogCategory::Cache,
                "cache_cleared", lra::foundation::LogContext{}.add("entries_cleared", count));
    return count;
}

template <typename T>
typename ResponseCache<T>::EntryList::const_iterator ResponseCache<T>::findLive(
    const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end() || isExpired(*it->second, std::chrono::steady_clock::now())) {
        return lru_.cend();
    }
    return it->second;
}

template <typename T>
bool ResponseCache<T>::contains(std::string_view content) const {
    auto key = cacheKey(content);
    std::lock_guard lock(mutex_);
    return findLive(key) != lru_.cend();
}

template <typename T>
std::optional<uint64_t> ResponseCache<T>::entryHits(std::string_view content) const {
    auto key = cacheKey(content);
    std::lock_guard lock(mutex_);
    auto it = findLive(key);
    if (it == lru_.cend()) {
        return std::nullopt;
    }
    return it->hits;
}

template <typename T>
std::size_t ResponseCache<T>::cleanupExpired() {
    std::lock_guard lock(mutex_);
    if (config_.ttl.count() == 0) {
        return 0;
    }

    auto now = std::chrono::steady_clock::now();
    std::size_t removed = 0;
    for (auto it = lru_.begin(); it != lru_.end();) {
        if (isExpired(*it, now)) {
            index_.erase(it->key);
            it = lru_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LRA_LOG_CTX(lra::foundation::LogLevel::Info, lra::foundation::LogCategory::Cache,
                    "cache_cleanup",
                    lra::foundation::LogContext{}.add("entries_removed", removed));
    }
    return removed;
}

template <typename T>
std::size_t ResponseCache<T>::size() const {
    std::lock_guard lock(mutex_);
    return lru_.size();
}

template <typename T>
void ResponseCache<T>::setEnabled(bool enabled) {
    {
        std::lock_guard lock(mutex_);
        enabled_ = enabled;
    }
    LRA_LOG_CTX(lra::foundation::LogLevel::Info, lra::foundation::LogCategory::Cache,
                "cache_enabled_changed", lra::foundation::LogContext{}.add("enabled", enabled));
}

template <typename T>
bool ResponseCache<T>::isEnabled() const {
    std::lock_guard lock(mutex_);
    return enabled_;
}

template <typename T>
CacheStats ResponseCache<T>::stats() const {
    std::lock_guard lock(mutex_);
    CacheStats s;
    s.hits = hits_;
    s.misses = misses_;
    s.evictions = evictions_;
    s.size = lru_.size();
    s.maxEntries = config_.maxEntries;
    s.ttl = config_.ttl;
    return s;
}

template <typename T>
void ResponseCache<T>::resetStats() {
    std::lock_guard lock(mutex_);
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
}

}  // namespace lra::resilience
