/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "planning/PlanningTypes.hpp"
#include "core/Errors.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <format>
#include <sstream>

namespace Amortize {

const char* toString(CreationStrategy strategy) {
    switch (strategy) {
    case CreationStrategy::Fork:
        return "fork";
    case CreationStrategy::PosixSpawn:
        return "posix_spawn";
    case CreationStrategy::ThreadLaunch:
        return "thread_launch";
    }
    return "unknown";
}

const char* toString(WorkloadClass workloadClass) {
    switch (workloadClass) {
    case WorkloadClass::ComputeBound:
        return "compute_bound";
    case WorkloadClass::WaitBound:
        return "wait_bound";
    case WorkloadClass::Mixed:
        return "mixed";
    }
    return "unknown";
}

const char* toString(BackendKind backend) {
    switch (backend) {
    case BackendKind::IsolatedWorker:
        return "isolated_worker";
    case BackendKind::SharedMemoryWorker:
        return "shared_memory_worker";
    }
    return "unknown";
}

const char* toString(ReasonCode reason) {
    switch (reason) {
    case ReasonCode::Parallel:
        return "parallel";
    case ReasonCode::SerialOptimal:
        return "serial_optimal";
    case ReasonCode::EmptyDataset:
        return "empty_dataset";
    case ReasonCode::NotTransferable:
        return "not_transferable";
    case ReasonCode::SamplingFailed:
        return "sampling_failed";
    case ReasonCode::MemoryConstrained:
        return "memory_constrained";
    case ReasonCode::WorkloadTooSmall:
        return "workload_too_small";
    case ReasonCode::AdvisorHint:
        return "advisor_hint";
    case ReasonCode::Cached:
        return "cached";
    }
    return "unknown";
}

const char* toString(Bottleneck bottleneck) {
    switch (bottleneck) {
    case Bottleneck::None:
        return "none";
    case Bottleneck::SpawnOverhead:
        return "spawn_overhead";
    case Bottleneck::TransferOverhead:
        return "transfer_overhead";
    case Bottleneck::DispatchOverhead:
        return "dispatch_overhead";
    case Bottleneck::MemoryConstraint:
        return "memory_constraint";
    case Bottleneck::WorkloadTooSmall:
        return "workload_too_small";
    case Bottleneck::HeterogeneousWorkload:
        return "heterogeneous_workload";
    }
    return "unknown";
}

std::optional<BackendKind> backendFromString(const std::string& text) {
    if (text == "isolated_worker") {
        return BackendKind::IsolatedWorker;
    }
    if (text == "shared_memory_worker") {
        return BackendKind::SharedMemoryWorker;
    }
    return std::nullopt;
}

std::string DiagnosticProfile::describe() const {
    std::ostringstream out;

    out << "=== Planning diagnostics ===\n";
    out << std::format("System: {} physical / {} logical cores, {:.1f} MiB available\n",
                       physicalCores, logicalCores,
                       static_cast<double>(availableMemoryBytes) / (1024.0 * 1024.0));
    out << std::format("Spawn cost: {:.6f}s ({})\n", spawnCostSeconds,
                       spawnCostMeasured ? "measured" : "estimated");
    out << std::format("Workload: {} items, {} sampled ({} failed)\n",
                       totalItems, sampledItems, failedSamples);
    out << std::format("Per item: {:.6f}s, CV {:.3f}, CPU ratio {:.2f} ({})\n",
                       perItemSeconds, coefficientOfVariation, cpuRatio,
                       toString(workloadClass));
    if (internalThreads > 1) {
        out << std::format("Internal threads per call: {}\n", internalThreads);
    }
    if (transferSecondsPerItem > 0.0) {
        out << std::format("Transfer cost per item: {:.9f}s\n", transferSecondsPerItem);
    }
    if (itemPayloadBytes > 0 || resultPayloadBytes > 0) {
        out << std::format("Payload: {} bytes per item, {} bytes per result, "
                           "{:.1f} MiB of results in total\n",
                           itemPayloadBytes, resultPayloadBytes,
                           static_cast<double>(estimatedResultBytes) / (1024.0 * 1024.0));
    }
    out << std::format("Candidates evaluated: {}\n", candidatesEvaluated);
    out << std::format("Backend: {}, bottleneck: {}, efficiency {:.0f}%\n",
                       toString(backend), toString(bottleneck), efficiency * 100.0);

    for (const auto& warning : warnings) {
        out << "Warning: " << warning << '\n';
    }
    return out.str();
}

DecisionRecord DecisionRecord::fromDecision(const Decision& decision) {
    DecisionRecord record;
    record.workerCount = decision.workerCount;
    record.batchSize = decision.batchSize;
    record.backend = decision.backend;
    record.estimatedSpeedup = decision.estimatedSpeedup;
    record.provenance = toString(decision.reason.code);
    return record;
}

Decision DecisionRecord::toDecision(ReasonCode code) const {
    Decision decision;
    decision.workerCount = workerCount;
    decision.batchSize = batchSize;
    decision.backend = backend;
    decision.estimatedSpeedup = estimatedSpeedup;
    decision.reason.code = code;
    decision.reason.message =
        std::format("Reused decision ({} workers, batch {}) from {}", workerCount,
                    batchSize, provenance.empty() ? "an earlier run" : provenance);
    decision.diagnostics.backend = backend;
    return decision;
}

JsonValue DecisionRecord::toJson() const {
    JsonValue json;
    json.set("workerCount", JsonValue(workerCount))
        .set("batchSize", JsonValue(batchSize))
        .set("backend", JsonValue(toString(backend)))
        .set("estimatedSpeedup", JsonValue(estimatedSpeedup))
        .set("provenance", JsonValue(provenance));
    return json;
}

std::string DecisionRecord::toJsonString() const {
    return toJson().toString();
}

DecisionRecord DecisionRecord::fromJson(const JsonValue& json) {
    if (!json.isObject()) {
        throw AmortizeError("Invalid decision record: not an object");
    }

    auto readCount = [&json](const char* key) -> size_t {
        auto count = json[key].tryAsCount();
        if (!count || *count == 0) {
            throw AmortizeError(std::format("Invalid decision record: '{}' must be a positive integer", key));
        }
        return static_cast<size_t>(*count);
    };

    DecisionRecord record;
    record.workerCount = readCount("workerCount");
    record.batchSize = readCount("batchSize");

    auto backendName = json["backend"].tryAsString();
    auto backend = backendName ? backendFromString(*backendName) : std::nullopt;
    if (!backend) {
        throw AmortizeError("Invalid decision record: unknown backend");
    }
    record.backend = *backend;

    auto speedup = json["estimatedSpeedup"].tryAsNumber();
    if (!speedup || *speedup <= 0.0) {
        throw AmortizeError("Invalid decision record: 'estimatedSpeedup' must be positive");
    }
    record.estimatedSpeedup = *speedup;
    record.provenance = json["provenance"].tryAsString().value_or("");
    return record;
}

DecisionRecord DecisionRecord::fromJsonString(const std::string& text) {
    try {
        return fromJson(JsonReader::parse(text));
    } catch (const JsonParseError& e) {
        throw AmortizeError(std::string("Invalid decision record: ") + e.what());
    }
}

} // namespace Amortize
