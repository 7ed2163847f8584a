/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLANNING_TYPES_HPP
#define PLANNING_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Amortize {

class JsonValue;

/**
 * @brief How a worker is created, from most to least isolated
 */
enum class CreationStrategy : uint8_t {
    Fork = 0,        // fork() of the current process
    PosixSpawn = 1,  // posix_spawn() of a fresh program image
    ThreadLaunch = 2 // std::thread in the current process
};

enum class WorkloadClass : uint8_t {
    ComputeBound = 0,
    WaitBound = 1,
    Mixed = 2
};

enum class BackendKind : uint8_t {
    IsolatedWorker = 0,
    SharedMemoryWorker = 1
};

enum class ReasonCode : uint8_t {
    Parallel = 0,
    SerialOptimal,
    EmptyDataset,
    NotTransferable,
    SamplingFailed,
    MemoryConstrained,
    WorkloadTooSmall,
    AdvisorHint,
    Cached
};

enum class Bottleneck : uint8_t {
    None = 0,
    SpawnOverhead,
    TransferOverhead,
    DispatchOverhead,
    MemoryConstraint,
    WorkloadTooSmall,
    HeterogeneousWorkload
};

const char* toString(CreationStrategy strategy);
const char* toString(WorkloadClass workloadClass);
const char* toString(BackendKind backend);
const char* toString(ReasonCode reason);
const char* toString(Bottleneck bottleneck);

std::optional<BackendKind> backendFromString(const std::string& text);

/**
 * @brief Machine capacity as seen by the planner
 */
struct SystemProfile {
    size_t physicalCores{1};
    size_t logicalCores{1};
    uint64_t availableMemoryBytes{0};
    CreationStrategy strategy{CreationStrategy::Fork};
    double spawnCostSeconds{0.005};
    bool spawnCostMeasured{false};
    std::chrono::steady_clock::time_point measuredAt{};
};

struct ItemTiming {
    size_t itemIndex{0};
    double wallTime{0.0};  // seconds
    double busyTime{0.0};  // process CPU seconds

    double cpuRatio() const { return wallTime > 0.0 ? busyTime / wallTime : 0.0; }
};

struct ItemFailure {
    size_t itemIndex{0};
    std::string message;
};

/**
 * @brief Aggregate of one sampling pass over the dataset prefix
 */
struct SampleResult {
    std::vector<ItemTiming> timings;
    std::vector<ItemFailure> failures;

    double meanWallTime{0.0};
    double coefficientOfVariation{0.0};
    double cpuRatio{0.0};
    WorkloadClass workloadClass{WorkloadClass::ComputeBound};

    bool transferable{true};
    std::string transferReason;
    double transferSecondsPerItem{0.0};  // encode + decode of item and result
    size_t itemPayloadBytes{0};
    size_t resultPayloadBytes{0};

    uint64_t peakMemoryGrowthBytes{0};
    size_t internalThreads{1};

    bool empty() const { return timings.empty(); }
};

/**
 * @brief Cost model output for one (workers, batch) candidate
 */
struct CostEstimate {
    size_t workerCount{1};
    size_t batchSize{1};
    double estimatedSpeedup{1.0};

    double serialTime{0.0};
    double parallelComputeTime{0.0};
    double spawnOverhead{0.0};
    double batchingOverhead{0.0};   // dispatch + transfer
    double transferOverhead{0.0};   // transfer share of batchingOverhead

    std::string rationale;
};

struct DecisionReason {
    ReasonCode code{ReasonCode::SerialOptimal};
    std::string message;
};

/**
 * @brief Human-readable account of how a decision was reached
 *
 * Has no output dependency; describe() renders it as text.
 */
struct DiagnosticProfile {
    size_t physicalCores{0};
    size_t logicalCores{0};
    uint64_t availableMemoryBytes{0};
    double spawnCostSeconds{0.0};
    bool spawnCostMeasured{false};

    size_t totalItems{0};
    size_t sampledItems{0};
    size_t failedSamples{0};
    double perItemSeconds{0.0};
    double coefficientOfVariation{0.0};
    double cpuRatio{0.0};
    WorkloadClass workloadClass{WorkloadClass::ComputeBound};
    size_t internalThreads{1};
    double transferSecondsPerItem{0.0};
    size_t itemPayloadBytes{0};
    size_t resultPayloadBytes{0};
    uint64_t estimatedResultBytes{0};  // result payload x total items

    size_t candidatesEvaluated{0};
    BackendKind backend{BackendKind::IsolatedWorker};
    Bottleneck bottleneck{Bottleneck::None};
    double efficiency{0.0};  // speedup / workers

    std::vector<std::string> warnings;

    std::string describe() const;
};

/**
 * @brief Final planning outcome; immutable once returned
 */
struct Decision {
    size_t workerCount{1};
    size_t batchSize{1};
    BackendKind backend{BackendKind::IsolatedWorker};
    double estimatedSpeedup{1.0};
    DecisionReason reason{};
    DiagnosticProfile diagnostics{};
    std::vector<std::string> warnings;
    bool adaptationRecommended{false};

    bool isParallel() const { return workerCount > 1; }
};

/**
 * @brief Flat persistence form of a Decision
 */
struct DecisionRecord {
    size_t workerCount{1};
    size_t batchSize{1};
    BackendKind backend{BackendKind::IsolatedWorker};
    double estimatedSpeedup{1.0};
    std::string provenance;

    static DecisionRecord fromDecision(const Decision& decision);

    /**
     * @brief Rebuild a Decision carrying the given reason code
     */
    Decision toDecision(ReasonCode code) const;

    JsonValue toJson() const;
    std::string toJsonString() const;

    /**
     * @throws AmortizeError on missing or mistyped fields
     */
    static DecisionRecord fromJson(const JsonValue& json);
    static DecisionRecord fromJsonString(const std::string& text);

    bool operator==(const DecisionRecord&) const = default;
};

} // namespace Amortize

#endif // PLANNING_TYPES_HPP
