/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COST_MODEL_HPP
#define COST_MODEL_HPP

#include "core/Config.hpp"
#include "planning/PlanningTypes.hpp"
#include <cstddef>

namespace Amortize {

/**
 * @brief Everything the cost model needs for one backend
 */
struct CostInputs {
    double perItemSeconds{0.0};
    size_t totalItems{0};
    double spawnCostPerWorker{0.0};
    double dispatchCostPerBatch{0.0};
    double transferCostPerItem{0.0};

    /**
     * Isolated workers pay the measured spawn cost, the configured dispatch
     * cost and the measured codec cost per item. Shared-memory workers pay a
     * thread launch, the shared dispatch cost and nothing for transfer.
     */
    static CostInputs forBackend(const SampleResult& sample, const SystemProfile& profile,
                                 BackendKind backend, const PlannerConfig& config,
                                 size_t totalItems);
};

/**
 * @brief Pure speedup estimate for (workerCount, batchSize) candidates
 *
 *   serial   = perItem * N
 *   parallel = serial / W + spawn * W + ceil(N / b) * (dispatch + b * transfer)
 *   speedup  = min(serial / parallel, W)
 *
 * W = 1 is always exactly 1.0.
 */
namespace CostModel {

CostEstimate computeSpeedup(size_t workerCount, size_t batchSize, const CostInputs& inputs);

/**
 * @brief Name the dominant limit on the chosen candidate
 */
Bottleneck classifyBottleneck(const CostEstimate& chosen, const CostInputs& inputs,
                              const SampleResult& sample, const PlannerConfig& config,
                              bool memoryConstrained);

} // namespace CostModel

} // namespace Amortize

#endif // COST_MODEL_HPP
