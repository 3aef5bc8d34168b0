/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_CACHE_HPP
#define PATH_CACHE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "utils/GridPoint.hpp"

namespace GridRoute {

/**
 * Statistics for monitoring PathCache effectiveness.
 */
struct PathCacheStats {
    size_t totalPaths = 0;
    size_t capacity = 0;
    size_t totalQueries = 0;
    size_t totalHits = 0;
    size_t totalMisses = 0;
    size_t totalInserts = 0;
    size_t rejectedAtCapacity = 0;
    float hitRate = 0.0f;

    void updateHitRate() {
        hitRate = (totalQueries > 0) ? (static_cast<float>(totalHits) / static_cast<float>(totalQueries)) : 0.0f;
    }
};

/**
 * PathCache - memoized shortest paths shared by every planning call of an engine.
 *
 * Entries are keyed by (grid fingerprint, start, goal). A key always maps to the
 * same path, so an entry never becomes stale and nothing is ever evicted.
 *
 * Capacity policy:
 * - Insert-only. Once size() reaches capacity(), further inserts are refused and
 *   the caller keeps its freshly computed path without storing it.
 * - Entries already stored stay readable until clear().
 *
 * Thread Safety:
 * - find/insert/clear/size are serialized by one mutex, so the capacity check
 *   and the insertion happen atomically.
 * - Two callers racing on the same key both compute; the second insert is a no-op.
 * - Statistics counters are lock-free atomics.
 */
class PathCache {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1000;

    explicit PathCache(size_t capacity = DEFAULT_CAPACITY);
    ~PathCache() = default;

    /**
     * Look up a previously stored path.
     * @return a copy of the stored path, or nullopt on miss
     */
    std::optional<std::vector<Point>> find(uint64_t gridFingerprint, const Point& start,
                                           const Point& goal) const;

    /**
     * Store a computed path.
     * @return true if stored; false when the cache is full, the key is already
     *         present, or the path is empty
     */
    bool insert(uint64_t gridFingerprint, const Point& start, const Point& goal,
                std::vector<Point> path);

    /**
     * Drop all entries and reset statistics. Administrative/testing use.
     */
    void clear();

    size_t size() const;
    size_t capacity() const { return m_capacity; }
    bool isFull() const;

    PathCacheStats getStats() const;

private:
    struct CacheKey {
        uint64_t fingerprint;
        Point start;
        Point goal;

        bool operator==(const CacheKey& o) const {
            return fingerprint == o.fingerprint && start == o.start && goal == o.goal;
        }
    };

    struct CacheKeyHash {
        size_t operator()(const CacheKey& k) const noexcept;
    };

    std::unordered_map<CacheKey, std::vector<Point>, CacheKeyHash> m_paths;
    const size_t m_capacity;
    mutable std::mutex m_cacheMutex;

    // Performance statistics (atomic for lock-free access)
    mutable std::atomic<size_t> m_totalQueries{0};
    mutable std::atomic<size_t> m_totalHits{0};
    mutable std::atomic<size_t> m_totalMisses{0};
    std::atomic<size_t> m_totalInserts{0};
    std::atomic<size_t> m_rejectedAtCapacity{0};

    // Prevent copying
    PathCache(const PathCache&) = delete;
    PathCache& operator=(const PathCache&) = delete;
};

} // namespace GridRoute

#endif // PATH_CACHE_HPP
