/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLANNER_HPP
#define PLANNER_HPP

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "managers/SystemProfiler.hpp"
#include "planning/Dataset.hpp"
#include "planning/DecisionAdvisor.hpp"
#include "planning/PlanningTypes.hpp"
#include "planning/ResultCache.hpp"
#include "planning/WorkloadSampler.hpp"
#include "utils/BinarySerializer.hpp"
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace Amortize {

/**
 * @brief Per-call planning constraints supplied by the caller
 */
struct PlanConstraints {
    std::optional<size_t> maxWorkers;
    std::optional<size_t> internalThreads;        // overrides detection
    std::optional<BackendKind> preferredBackend;  // overrides workload class
    std::optional<size_t> lengthHint;             // total length of a single-pass dataset
    bool adaptationRequested{true};
    std::string functionId;                       // cache key; empty disables the cache
};

/**
 * @brief Turns a sample and system capacity into a Decision
 *
 * plan() is pure: identical inputs give identical decisions. decide() adds
 * the measurements (profiler, sampler) and the optional advisor and result
 * cache around it. The planner keeps no state between calls beyond its
 * configuration and collaborators.
 */
class Planner {
public:
    explicit Planner(PlannerConfig config = {});

    void setResultCache(std::shared_ptr<ResultCache> cache) { m_cache = std::move(cache); }
    void setAdvisor(std::shared_ptr<DecisionAdvisor> advisor) { m_advisor = std::move(advisor); }

    const PlannerConfig& getConfig() const { return m_config; }

    /**
     * @brief Pure decision from measured inputs
     */
    Decision plan(const SampleResult& sample, const SystemProfile& profile, size_t totalItems,
                  const PlanConstraints& constraints = {}) const;

    /**
     * @brief Measure, then plan
     *
     * Single-pass datasets stay replayable: every item the planner pulls is
     * kept in the dataset's prefix buffer.
     */
    template <typename T, typename Fn>
    Decision decide(Fn& fn, Dataset<T>& dataset, const PlanConstraints& constraints = {});

    static Decision serialDecision(ReasonCode code, std::string message, size_t totalItems);

private:
    std::optional<Decision> consultAdvisor(size_t totalItems, size_t physicalCores,
                                           const PlanConstraints& constraints,
                                           BackendKind fallbackBackend) const;
    std::optional<Decision> consultCache(const CacheKey& key, size_t physicalCores,
                                         const PlanConstraints& constraints) const;
    void storeInCache(const CacheKey& key, const Decision& decision) const;

    PlannerConfig m_config;
    std::shared_ptr<ResultCache> m_cache;
    std::shared_ptr<DecisionAdvisor> m_advisor;
};

template <typename T, typename Fn>
Decision Planner::decide(Fn& fn, Dataset<T>& dataset, const PlanConstraints& constraints) {
    using R = std::decay_t<std::invoke_result_t<Fn&, const T&>>;
    constexpr bool codecAvailable =
        BinarySerial::IsTransferable<T> && BinarySerial::IsTransferable<R>;

    // Total length: exact, hinted, or counted by buffering the remainder
    size_t totalItems = 0;
    if (auto known = dataset.knownSize()) {
        totalItems = *known;
    } else if (constraints.lengthHint) {
        totalItems = *constraints.lengthHint;
    } else if (dataset.lengthHint()) {
        totalItems = *dataset.lengthHint();
    } else {
        totalItems = dataset.bufferAll();
        PLANNER_DEBUG(std::format("Counted {} items by buffering the dataset", totalItems));
    }

    auto& profiler = SystemProfiler::Instance();
    profiler.configure(m_config.spawnCacheTtlSeconds, m_config.memoryCacheTtlSeconds);

    const BackendKind fallbackBackend = constraints.preferredBackend.value_or(
        codecAvailable ? BackendKind::IsolatedWorker : BackendKind::SharedMemoryWorker);
    if (auto hinted = consultAdvisor(totalItems, profiler.physicalCores(), constraints,
                                     fallbackBackend)) {
        return *hinted;
    }

    const CacheKey key{constraints.functionId, totalItems, 1};
    if (!constraints.functionId.empty()) {
        if (auto cached = consultCache(key, profiler.physicalCores(), constraints)) {
            return *cached;
        }
    }

    if (totalItems == 0) {
        return serialDecision(ReasonCode::EmptyDataset, "Dataset is empty", 0);
    }

    const SystemProfile profile = profiler.profile(m_config.spawnTimeoutSeconds);

    SampleResult sample;
    try {
        sample = WorkloadSampler::sample(fn, dataset, m_config.sampleSize);
    } catch (const SamplingFailure& e) {
        PLANNER_WARN(e.what());
        Decision decision = serialDecision(ReasonCode::SamplingFailed, e.what(), totalItems);
        decision.diagnostics.failedSamples = e.failedItems();
        return decision;
    }

    Decision decision = plan(sample, profile, totalItems, constraints);
    if (!constraints.functionId.empty()) {
        storeInCache(key, decision);
    }
    return decision;
}

} // namespace Amortize

#endif // PLANNER_HPP
