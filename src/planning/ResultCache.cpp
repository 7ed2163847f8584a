/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "planning/ResultCache.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace Amortize {

std::string CacheKey::toString() const {
    return std::format("{}|{}|v{}", functionId, datasetSize, schemaVersion);
}

InMemoryResultCache::InMemoryResultCache(std::chrono::duration<double> ttl, size_t maxEntries)
    : m_ttl(ttl), m_maxEntries(maxEntries) {
    if (ttl.count() <= 0.0) {
        throw ConfigurationError("result cache TTL must be positive");
    }
    if (maxEntries == 0) {
        throw ConfigurationError("result cache needs room for at least one entry");
    }
}

std::optional<DecisionRecord> InMemoryResultCache::get(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(key.toString());
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    if (Clock::now() - it->second.storedAt >= m_ttl) {
        CACHE_DEBUG(std::format("Entry {} expired", key.toString()));
        m_entries.erase(it);
        return std::nullopt;
    }
    return it->second.record;
}

void InMemoryResultCache::put(const CacheKey& key, const DecisionRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto now = Clock::now();
    std::string id = key.toString();
    if (!m_entries.contains(id)) {
        evictForInsert(now);
    }
    m_entries[id] = Entry{record, now};
}

void InMemoryResultCache::evictForInsert(Clock::time_point now) {
    if (m_entries.size() < m_maxEntries) {
        return;
    }

    std::erase_if(m_entries, [&](const auto& entry) {
        return now - entry.second.storedAt >= m_ttl;
    });

    if (m_entries.size() >= m_maxEntries) {
        auto oldest = std::min_element(m_entries.begin(), m_entries.end(),
                                       [](const auto& a, const auto& b) {
                                           return a.second.storedAt < b.second.storedAt;
                                       });
        m_entries.erase(oldest);
    }
}

size_t InMemoryResultCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void InMemoryResultCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

} // namespace Amortize
