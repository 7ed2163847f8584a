/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "planning/Planner.hpp"
#include "planning/CostModel.hpp"
#include <algorithm>
#include <cmath>

namespace Amortize {

namespace {

size_t ceilDiv(size_t numerator, size_t denominator) {
    return (numerator + denominator - 1) / denominator;
}

// Batch that runs for about the target duration, clipped to the share of
// one worker
size_t targetBatchSize(double perItemSeconds, double targetSeconds, size_t totalItems,
                       size_t workerCount) {
    const size_t upper = std::max<size_t>(1, ceilDiv(totalItems, workerCount));
    if (perItemSeconds <= 0.0) {
        return upper;
    }
    const double ideal = std::round(targetSeconds / perItemSeconds);
    if (ideal >= static_cast<double>(upper)) {
        return upper;
    }
    return std::clamp<size_t>(static_cast<size_t>(std::max(1.0, ideal)), 1, upper);
}

void fillDiagnostics(DiagnosticProfile& diagnostics, const SampleResult& sample,
                     const SystemProfile& profile, size_t totalItems) {
    diagnostics.physicalCores = profile.physicalCores;
    diagnostics.logicalCores = profile.logicalCores;
    diagnostics.availableMemoryBytes = profile.availableMemoryBytes;
    diagnostics.spawnCostSeconds = profile.spawnCostSeconds;
    diagnostics.spawnCostMeasured = profile.spawnCostMeasured;
    diagnostics.totalItems = totalItems;
    diagnostics.sampledItems = sample.timings.size() + sample.failures.size();
    diagnostics.failedSamples = sample.failures.size();
    diagnostics.perItemSeconds = sample.meanWallTime;
    diagnostics.coefficientOfVariation = sample.coefficientOfVariation;
    diagnostics.cpuRatio = sample.cpuRatio;
    diagnostics.workloadClass = sample.workloadClass;
    diagnostics.internalThreads = sample.internalThreads;
    diagnostics.transferSecondsPerItem = sample.transferSecondsPerItem;
    diagnostics.itemPayloadBytes = sample.itemPayloadBytes;
    diagnostics.resultPayloadBytes = sample.resultPayloadBytes;
    diagnostics.estimatedResultBytes =
        static_cast<uint64_t>(sample.resultPayloadBytes) * static_cast<uint64_t>(totalItems);
}

// Upper bound for externally supplied worker counts (advisor, cache)
size_t externalWorkerCap(size_t physicalCores, const PlanConstraints& constraints,
                         size_t totalItems) {
    size_t cap = std::max<size_t>(1, physicalCores);
    if (constraints.maxWorkers) {
        cap = std::min(cap, std::max<size_t>(1, *constraints.maxWorkers));
    }
    if (totalItems > 0) {
        cap = std::min(cap, totalItems);
    }
    return cap;
}

} // anonymous namespace

Planner::Planner(PlannerConfig config) : m_config(std::move(config)) {
    m_config.validate();
}

Decision Planner::serialDecision(ReasonCode code, std::string message, size_t totalItems) {
    Decision decision;
    decision.workerCount = 1;
    decision.batchSize = std::max<size_t>(1, totalItems);
    decision.estimatedSpeedup = 1.0;
    decision.reason = {code, std::move(message)};
    decision.diagnostics.totalItems = totalItems;
    return decision;
}

Decision Planner::plan(const SampleResult& sample, const SystemProfile& profile,
                       size_t totalItems, const PlanConstraints& constraints) const {
    if (totalItems == 0) {
        return serialDecision(ReasonCode::EmptyDataset, "Dataset is empty", 0);
    }

    const BackendKind backend = constraints.preferredBackend.value_or(
        sample.workloadClass == WorkloadClass::WaitBound ? BackendKind::SharedMemoryWorker
                                                         : BackendKind::IsolatedWorker);

    Decision decision;
    decision.backend = backend;
    fillDiagnostics(decision.diagnostics, sample, profile, totalItems);
    decision.diagnostics.backend = backend;

    auto finishSerial = [&](ReasonCode code, std::string message, size_t batchSize) {
        decision.workerCount = 1;
        decision.batchSize = std::clamp<size_t>(batchSize, 1, totalItems);
        decision.estimatedSpeedup = 1.0;
        decision.reason = {code, std::move(message)};
        decision.diagnostics.efficiency = 1.0;
        decision.diagnostics.warnings = decision.warnings;
        PLANNER_INFO(std::format("Serial execution: {} ({})", toString(code),
                                 decision.reason.message));
        return decision;
    };

    // Collected results live in the caller's memory whatever the decision
    const uint64_t resultBytes = decision.diagnostics.estimatedResultBytes;
    const double resultLimit =
        m_config.resultMemoryFraction * static_cast<double>(profile.availableMemoryBytes);
    if (profile.availableMemoryBytes > 0 && static_cast<double>(resultBytes) > resultLimit) {
        constexpr double GIB = 1024.0 * 1024.0 * 1024.0;
        decision.warnings.push_back(std::format(
            "Results will take about {:.2f} GiB of {:.2f} GiB available; consume them with "
            "imapUnordered() or submit the items in smaller batches",
            static_cast<double>(resultBytes) / GIB,
            static_cast<double>(profile.availableMemoryBytes) / GIB));
        PLANNER_WARN(decision.warnings.back());
    }

    if (sample.empty()) {
        return finishSerial(ReasonCode::SamplingFailed, "No successful sample timings",
                            totalItems);
    }

    if (!sample.transferable && backend == BackendKind::IsolatedWorker) {
        decision.warnings.push_back("Items or results cannot cross the process boundary: " +
                                    sample.transferReason);
        return finishSerial(ReasonCode::NotTransferable, sample.transferReason, totalItems);
    }

    const double perItem = sample.meanWallTime;
    const CostInputs inputs =
        CostInputs::forBackend(sample, profile, backend, m_config, totalItems);
    const double serialTime = perItem * static_cast<double>(totalItems);

    if (serialTime < m_config.workloadTooSmallFactor * inputs.spawnCostPerWorker) {
        decision.diagnostics.bottleneck = Bottleneck::WorkloadTooSmall;
        return finishSerial(ReasonCode::WorkloadTooSmall,
                            std::format("Total serial time {:.6f}s is below {:.1f}x the {:.6f}s "
                                        "worker start cost",
                                        serialTime, m_config.workloadTooSmallFactor,
                                        inputs.spawnCostPerWorker),
                            totalItems);
    }

    // Worker ceiling
    size_t maxWorkers = std::min(profile.physicalCores, totalItems);
    if (m_config.maxWorkers > 0) {
        maxWorkers = std::min(maxWorkers, m_config.maxWorkers);
    }
    if (constraints.maxWorkers) {
        maxWorkers = std::min(maxWorkers, *constraints.maxWorkers);
    }
    maxWorkers = std::max<size_t>(1, maxWorkers);

    const size_t internalThreads =
        std::max<size_t>(1, constraints.internalThreads.value_or(sample.internalThreads));
    if (internalThreads > 1) {
        const size_t nestedCap = std::max<size_t>(1, profile.physicalCores / internalThreads);
        if (nestedCap < maxWorkers) {
            decision.warnings.push_back(std::format(
                "Function uses {} threads internally; workers capped at {} to avoid "
                "oversubscription",
                internalThreads, nestedCap));
            maxWorkers = nestedCap;
        }
    }

    // Memory ceiling
    bool memoryConstrained = false;
    const uint64_t perWorkerBytes = sample.peakMemoryGrowthBytes;
    if (profile.availableMemoryBytes > 0 && perWorkerBytes > 0 && maxWorkers > 1) {
        const double budget =
            m_config.memoryFraction * static_cast<double>(profile.availableMemoryBytes);
        const size_t memoryCap =
            static_cast<size_t>(budget / static_cast<double>(perWorkerBytes));
        if (memoryCap < maxWorkers) {
            memoryConstrained = true;
            maxWorkers = std::max<size_t>(1, memoryCap);
            decision.warnings.push_back(std::format(
                "Estimated {} bytes per worker limits workers to {} within {:.0f}% of "
                "available memory",
                perWorkerBytes, maxWorkers, m_config.memoryFraction * 100.0));
        }
    }

    // Heterogeneous items get smaller batches and runtime adaptation
    const bool heterogeneous = sample.coefficientOfVariation > m_config.variabilityThreshold;
    const bool shrink = heterogeneous && constraints.adaptationRequested;
    if (heterogeneous) {
        decision.warnings.push_back(
            std::format("Item times vary (CV {:.2f}); batches shrunk for load balance",
                        sample.coefficientOfVariation));
    }

    auto batchFor = [&](size_t workers) {
        size_t batch = targetBatchSize(perItem, m_config.targetChunkDuration, totalItems, workers);
        if (shrink) {
            batch = std::max<size_t>(
                1, static_cast<size_t>(std::floor(static_cast<double>(batch) *
                                                  m_config.batchShrinkFactor)));
        }
        return batch;
    };

    CostEstimate best = CostModel::computeSpeedup(1, batchFor(1), inputs);
    size_t evaluated = 1;
    for (size_t workers = 2; workers <= maxWorkers; ++workers) {
        CostEstimate candidate = CostModel::computeSpeedup(workers, batchFor(workers), inputs);
        ++evaluated;
        if (candidate.estimatedSpeedup > best.estimatedSpeedup) {
            best = candidate;
        }
    }
    decision.diagnostics.candidatesEvaluated = evaluated;
    decision.diagnostics.bottleneck =
        CostModel::classifyBottleneck(best, inputs, sample, m_config, memoryConstrained);

    if (memoryConstrained && maxWorkers <= 1) {
        return finishSerial(ReasonCode::MemoryConstrained,
                            "Available memory does not fit more than one worker",
                            batchFor(1));
    }

    if (best.workerCount <= 1 || best.estimatedSpeedup < m_config.minBenefitThreshold) {
        return finishSerial(
            ReasonCode::SerialOptimal,
            std::format("Best estimated speedup {:.2f}x ({} workers) is below the {:.2f}x "
                        "threshold",
                        best.estimatedSpeedup, best.workerCount, m_config.minBenefitThreshold),
            batchFor(1));
    }

    decision.workerCount = best.workerCount;
    decision.batchSize = std::clamp<size_t>(best.batchSize, 1, totalItems);
    decision.estimatedSpeedup = best.estimatedSpeedup;
    decision.adaptationRecommended = shrink;
    decision.reason = {ReasonCode::Parallel,
                       std::format("{} {} workers, batch {}: estimated {:.2f}x speedup",
                                   best.workerCount, toString(backend), best.batchSize,
                                   best.estimatedSpeedup)};
    decision.diagnostics.efficiency =
        best.estimatedSpeedup / static_cast<double>(best.workerCount);
    decision.diagnostics.warnings = decision.warnings;

    PLANNER_INFO(decision.reason.message);
    return decision;
}

std::optional<Decision> Planner::consultAdvisor(size_t totalItems, size_t physicalCores,
                                                const PlanConstraints& constraints,
                                                BackendKind fallbackBackend) const {
    if (!m_advisor) {
        return std::nullopt;
    }

    std::optional<AdvisorHint> hint;
    try {
        hint = m_advisor->advise({constraints.functionId, totalItems, physicalCores});
    } catch (const std::exception& e) {
        PLANNER_WARN(std::format("Advisor failed, planning from measurements: {}", e.what()));
        return std::nullopt;
    }

    if (!hint) {
        return std::nullopt;
    }
    if (hint->confidence < m_config.advisorConfidenceThreshold) {
        PLANNER_DEBUG(std::format("Advisor hint ignored: confidence {:.2f} below {:.2f}",
                                  hint->confidence, m_config.advisorConfidenceThreshold));
        return std::nullopt;
    }

    const size_t workerCap = externalWorkerCap(physicalCores, constraints, totalItems);

    Decision decision;
    decision.workerCount = std::clamp<size_t>(hint->workerCount, 1, workerCap);
    decision.batchSize = std::clamp<size_t>(hint->batchSize, 1, std::max<size_t>(1, totalItems));
    decision.backend = fallbackBackend;
    decision.estimatedSpeedup = 1.0;
    decision.reason = {ReasonCode::AdvisorHint,
                       std::format("Advisor suggested {} workers, batch {} (confidence {:.2f})",
                                   hint->workerCount, hint->batchSize, hint->confidence)};
    decision.diagnostics.totalItems = totalItems;
    decision.diagnostics.physicalCores = physicalCores;
    decision.diagnostics.backend = fallbackBackend;
    decision.adaptationRecommended = true;

    PLANNER_INFO(decision.reason.message);
    return decision;
}

std::optional<Decision> Planner::consultCache(const CacheKey& key, size_t physicalCores,
                                              const PlanConstraints& constraints) const {
    // Empty datasets always get their own reason
    if (!m_cache || key.datasetSize == 0) {
        return std::nullopt;
    }
    try {
        if (auto record = m_cache->get(key)) {
            CACHE_DEBUG(std::format("Cache hit for {}", key.toString()));
            Decision decision = record->toDecision(ReasonCode::Cached);
            decision.workerCount = std::clamp<size_t>(
                decision.workerCount, 1,
                externalWorkerCap(physicalCores, constraints, key.datasetSize));
            decision.batchSize = std::clamp<size_t>(decision.batchSize, 1, key.datasetSize);
            decision.estimatedSpeedup = std::min(decision.estimatedSpeedup,
                                                 static_cast<double>(decision.workerCount));
            decision.diagnostics.totalItems = key.datasetSize;
            decision.diagnostics.physicalCores = physicalCores;
            if (decision.workerCount < record->workerCount) {
                decision.warnings.push_back(
                    std::format("Cached {} workers reduced to {} for this machine",
                                record->workerCount, decision.workerCount));
                decision.diagnostics.warnings = decision.warnings;
            }
            return decision;
        }
    } catch (const std::exception& e) {
        CACHE_WARN(std::format("Cache lookup for {} failed, treating as miss: {}",
                               key.toString(), e.what()));
    }
    return std::nullopt;
}

void Planner::storeInCache(const CacheKey& key, const Decision& decision) const {
    if (!m_cache) {
        return;
    }
    try {
        m_cache->put(key, DecisionRecord::fromDecision(decision));
    } catch (const std::exception& e) {
        CACHE_WARN(std::format("Cache store for {} failed: {}", key.toString(), e.what()));
    }
}

} // namespace Amortize
