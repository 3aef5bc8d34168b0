/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/PathCache.hpp"
#include "core/Logger.hpp"
#include <string>

namespace GridRoute {

PathCache::PathCache(size_t capacity)
    : m_capacity(capacity)
{
    // Reserve to reduce rehashing at runtime
    m_paths.reserve(capacity);
    CACHE_DEBUG("PathCache initialized with capacity " + std::to_string(capacity));
}

std::optional<std::vector<Point>> PathCache::find(uint64_t gridFingerprint, const Point& start,
                                                  const Point& goal) const
{
    m_totalQueries.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(m_cacheMutex);

    if (auto it = m_paths.find(CacheKey{gridFingerprint, start, goal}); it != m_paths.end()) {
        m_totalHits.fetch_add(1, std::memory_order_relaxed);
        return it->second;
    }

    m_totalMisses.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

bool PathCache::insert(uint64_t gridFingerprint, const Point& start, const Point& goal,
                       std::vector<Point> path)
{
    if (path.empty()) {
        return false; // only successful searches are memoized
    }

    std::lock_guard<std::mutex> lock(m_cacheMutex);

    if (m_paths.size() >= m_capacity) {
        // Log only the first refusal, saturation is otherwise silent
        if (m_rejectedAtCapacity.fetch_add(1, std::memory_order_relaxed) == 0) {
            CACHE_WARN("PathCache reached capacity (" + std::to_string(m_capacity) +
                       " paths), new results are no longer stored");
        }
        return false;
    }

    const bool inserted =
        m_paths.try_emplace(CacheKey{gridFingerprint, start, goal}, std::move(path)).second;
    if (inserted) {
        m_totalInserts.fetch_add(1, std::memory_order_relaxed);
    }
    return inserted;
}

void PathCache::clear()
{
    std::lock_guard<std::mutex> lock(m_cacheMutex);

    m_paths.clear();

    // Reset statistics
    m_totalQueries.store(0, std::memory_order_relaxed);
    m_totalHits.store(0, std::memory_order_relaxed);
    m_totalMisses.store(0, std::memory_order_relaxed);
    m_totalInserts.store(0, std::memory_order_relaxed);
    m_rejectedAtCapacity.store(0, std::memory_order_relaxed);

    CACHE_INFO("PathCache: Cleared all cached paths and reset statistics");
}

size_t PathCache::size() const
{
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    return m_paths.size();
}

bool PathCache::isFull() const
{
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    return m_paths.size() >= m_capacity;
}

PathCacheStats PathCache::getStats() const
{
    PathCacheStats stats;

    stats.capacity = m_capacity;
    stats.totalQueries = m_totalQueries.load(std::memory_order_relaxed);
    stats.totalHits = m_totalHits.load(std::memory_order_relaxed);
    stats.totalMisses = m_totalMisses.load(std::memory_order_relaxed);
    stats.totalInserts = m_totalInserts.load(std::memory_order_relaxed);
    stats.rejectedAtCapacity = m_rejectedAtCapacity.load(std::memory_order_relaxed);

    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        stats.totalPaths = m_paths.size();
    }

    stats.updateHitRate();
    return stats;
}

size_t PathCache::CacheKeyHash::operator()(const CacheKey& k) const noexcept
{
    // FNV-1a mixing of fingerprint and both endpoints
    uint64_t hash = 14695981039346656037ULL;
    auto mix = [&hash](uint64_t value) {
        hash ^= value;
        hash *= 1099511628211ULL;
    };
    mix(k.fingerprint);
    mix(static_cast<uint32_t>(k.start.x));
    mix(static_cast<uint32_t>(k.start.y));
    mix(static_cast<uint32_t>(k.goal.x));
    mix(static_cast<uint32_t>(k.goal.y));
    return static_cast<size_t>(hash);
}

} // namespace GridRoute
