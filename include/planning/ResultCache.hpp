/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESULT_CACHE_HPP
#define RESULT_CACHE_HPP

#include "planning/PlanningTypes.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace Amortize {

/**
 * @brief Identity of a planning problem for caching
 */
struct CacheKey {
    std::string functionId;
    size_t datasetSize{0};
    uint32_t schemaVersion{1};

    std::string toString() const;

    bool operator==(const CacheKey&) const = default;
};

/**
 * @brief Storage seam for earlier decisions
 *
 * Implementations may throw; the planner treats any error as a miss.
 */
class ResultCache {
public:
    virtual ~ResultCache() = default;

    virtual std::optional<DecisionRecord> get(const CacheKey& key) = 0;
    virtual void put(const CacheKey& key, const DecisionRecord& record) = 0;
};

/**
 * @brief Bounded-lifetime in-process cache
 *
 * Entries expire after the TTL. When full, expired entries are purged
 * first, then the oldest entry is evicted.
 */
class InMemoryResultCache : public ResultCache {
public:
    explicit InMemoryResultCache(std::chrono::duration<double> ttl = std::chrono::hours(1),
                                 size_t maxEntries = 1024);

    std::optional<DecisionRecord> get(const CacheKey& key) override;
    void put(const CacheKey& key, const DecisionRecord& record) override;

    size_t size() const;
    void clear();

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        DecisionRecord record;
        Clock::time_point storedAt;
    };

    // Caller holds m_mutex
    void evictForInsert(Clock::time_point now);

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
    std::chrono::duration<double> m_ttl;
    size_t m_maxEntries;
};

} // namespace Amortize

#endif // RESULT_CACHE_HPP
