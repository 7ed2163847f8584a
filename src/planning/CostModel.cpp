/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "planning/CostModel.hpp"
#include "core/Logger.hpp"
#include "managers/SystemProfiler.hpp"
#include <algorithm>
#include <format>

namespace Amortize {

// Overheads below this share of the parallel time are not worth naming
static constexpr double BOTTLENECK_SHARE = 0.1;

CostInputs CostInputs::forBackend(const SampleResult& sample, const SystemProfile& profile,
                                  BackendKind backend, const PlannerConfig& config,
                                  size_t totalItems) {
    CostInputs inputs;
    inputs.perItemSeconds = sample.meanWallTime;
    inputs.totalItems = totalItems;

    if (backend == BackendKind::IsolatedWorker) {
        inputs.spawnCostPerWorker = profile.spawnCostSeconds;
        inputs.dispatchCostPerBatch = config.isolatedDispatchCostPerBatch;
        inputs.transferCostPerItem = sample.transferSecondsPerItem;
    } else {
        inputs.spawnCostPerWorker =
            SystemProfiler::boundsFor(CreationStrategy::ThreadLaunch).estimateSeconds;
        inputs.dispatchCostPerBatch = config.sharedDispatchCostPerBatch;
        inputs.transferCostPerItem = 0.0;
    }
    return inputs;
}

namespace CostModel {

CostEstimate computeSpeedup(size_t workerCount, size_t batchSize, const CostInputs& inputs) {
    CostEstimate estimate;
    estimate.workerCount = std::max<size_t>(1, workerCount);
    estimate.batchSize = std::max<size_t>(1, batchSize);
    estimate.serialTime = inputs.perItemSeconds * static_cast<double>(inputs.totalItems);

    if (estimate.workerCount == 1) {
        estimate.parallelComputeTime = estimate.serialTime;
        estimate.estimatedSpeedup = 1.0;
        estimate.rationale = "single worker runs serially";
        return estimate;
    }

    const double workers = static_cast<double>(estimate.workerCount);
    const double batch = static_cast<double>(estimate.batchSize);
    const size_t batchCount =
        (inputs.totalItems + estimate.batchSize - 1) / estimate.batchSize;

    estimate.parallelComputeTime = estimate.serialTime / workers;
    estimate.spawnOverhead = inputs.spawnCostPerWorker * workers;
    estimate.transferOverhead =
        static_cast<double>(batchCount) * batch * inputs.transferCostPerItem;
    estimate.batchingOverhead =
        static_cast<double>(batchCount) * inputs.dispatchCostPerBatch + estimate.transferOverhead;

    const double parallelTime =
        estimate.parallelComputeTime + estimate.spawnOverhead + estimate.batchingOverhead;

    if (parallelTime <= 0.0 || estimate.serialTime <= 0.0) {
        estimate.estimatedSpeedup = 1.0;
        estimate.rationale = "no measurable work";
        return estimate;
    }

    estimate.estimatedSpeedup = std::min(estimate.serialTime / parallelTime, workers);
    estimate.rationale = std::format(
        "{} workers x batch {}: serial {:.4f}s vs parallel {:.4f}s "
        "(compute {:.4f}s, spawn {:.4f}s, batching {:.4f}s)",
        estimate.workerCount, estimate.batchSize, estimate.serialTime, parallelTime,
        estimate.parallelComputeTime, estimate.spawnOverhead, estimate.batchingOverhead);

    COSTMODEL_DEBUG(estimate.rationale);
    return estimate;
}

Bottleneck classifyBottleneck(const CostEstimate& chosen, const CostInputs& inputs,
                              const SampleResult& sample, const PlannerConfig& config,
                              bool memoryConstrained) {
    if (memoryConstrained) {
        return Bottleneck::MemoryConstraint;
    }

    const double serialTime = inputs.perItemSeconds * static_cast<double>(inputs.totalItems);
    if (serialTime < config.workloadTooSmallFactor * inputs.spawnCostPerWorker) {
        return Bottleneck::WorkloadTooSmall;
    }

    if (sample.coefficientOfVariation > config.variabilityThreshold) {
        return Bottleneck::HeterogeneousWorkload;
    }

    // Price the overheads as if every physical worker were used when the
    // chosen plan is serial, so a rejected parallel plan still names a cause
    CostEstimate reference = chosen;
    if (chosen.workerCount <= 1) {
        const size_t batch = std::max<size_t>(1, chosen.batchSize);
        reference = computeSpeedup(2, batch, inputs);
    }

    const double dispatchOverhead = reference.batchingOverhead - reference.transferOverhead;
    const double parallelTime =
        reference.parallelComputeTime + reference.spawnOverhead + reference.batchingOverhead;
    if (parallelTime <= 0.0) {
        return Bottleneck::None;
    }

    Bottleneck worst = Bottleneck::None;
    double worstShare = BOTTLENECK_SHARE;
    auto consider = [&](double overhead, Bottleneck kind) {
        double share = overhead / parallelTime;
        if (share > worstShare) {
            worstShare = share;
            worst = kind;
        }
    };
    consider(reference.spawnOverhead, Bottleneck::SpawnOverhead);
    consider(reference.transferOverhead, Bottleneck::TransferOverhead);
    consider(dispatchOverhead, Bottleneck::DispatchOverhead);
    return worst;
}

} // namespace CostModel

} // namespace Amortize
