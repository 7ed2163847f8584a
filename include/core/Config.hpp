/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <limits>
#include <string>

namespace Amortize {

class JsonValue;

/**
 * @brief Runtime batch controller options
 *
 * Defaults are the documented policy constants; every field can be
 * overridden from the "controller" object of a configuration file.
 */
struct ControllerConfig {
    static constexpr size_t UNBOUNDED = std::numeric_limits<size_t>::max();

    size_t workerCount{1};
    size_t initialBatchSize{1};
    double targetChunkDuration{0.2};   // seconds
    double adaptationRate{0.3};        // 0 = frozen, 1 = jump straight to the estimate
    size_t minBatch{1};
    size_t maxBatch{UNBOUNDED};
    size_t windowCapacity{10};
    bool enabled{true};
    double deviationTolerance{0.2};    // relative deviation from target before adapting
    size_t minSamplesBeforeAdapting{3};
    size_t maxInFlightBatches{0};      // 0 = 2 x workerCount

    /**
     * @brief Throws ConfigurationError on the first invalid field
     */
    void validate() const;

    size_t effectiveInFlightLimit() const {
        return maxInFlightBatches > 0 ? maxInFlightBatches : 2 * workerCount;
    }

    static ControllerConfig fromJson(const JsonValue& json);
};

/**
 * @brief Planner policy constants
 */
struct PlannerConfig {
    size_t sampleSize{5};
    double targetChunkDuration{0.2};          // seconds per batch
    double minBenefitThreshold{1.2};          // speedup needed to go parallel
    double memoryFraction{0.8};               // share of available memory workers may use
    double resultMemoryFraction{0.5};         // collected results above this share warn
    double variabilityThreshold{0.5};         // CV above which batches shrink
    double batchShrinkFactor{0.5};
    double workloadTooSmallFactor{2.0};       // serial time below factor x spawn cost stays serial
    double isolatedDispatchCostPerBatch{0.001};
    double sharedDispatchCostPerBatch{0.00002};
    double spawnTimeoutSeconds{2.0};
    double spawnCacheTtlSeconds{300.0};
    double memoryCacheTtlSeconds{1.0};
    double advisorConfidenceThreshold{0.7};
    size_t maxWorkers{0};                     // 0 = physical core count

    void validate() const;

    static PlannerConfig fromJson(const JsonValue& json);
};

/**
 * @brief Both configuration sections of one file
 */
struct AmortizeConfig {
    PlannerConfig planner{};
    ControllerConfig controller{};
};

/**
 * @brief Load a configuration file with optional "planner" and "controller"
 * objects
 *
 * Missing keys keep their defaults, unknown keys are logged and ignored.
 * Throws ConfigurationError when the file cannot be read or parsed, or when
 * a value fails validation.
 */
AmortizeConfig loadConfigFile(const std::string& path);

} // namespace Amortize

#endif // CONFIG_HPP
