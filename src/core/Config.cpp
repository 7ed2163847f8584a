/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <format>
#include <initializer_list>

namespace Amortize {

namespace {

void warnUnknownKeys(const JsonObject& object, const char* section,
                     std::initializer_list<const char*> known) {
    for (const auto& [key, value] : object) {
        bool found = false;
        for (const char* name : known) {
            if (key == name) {
                found = true;
                break;
            }
        }
        if (!found) {
            CONFIG_WARN(std::format("Ignoring unknown key '{}' in '{}' section", key, section));
        }
    }
}

void readDouble(const JsonValue& section, const char* key, double& out) {
    const JsonValue* value = section.find(key);
    if (value == nullptr || value->isNull()) {
        return;
    }
    auto number = value->tryAsNumber();
    if (!number) {
        throw ConfigurationError(
            std::format("'{}' must be a number, got {}", key, value->kindName()));
    }
    out = *number;
}

void readSize(const JsonValue& section, const char* key, size_t& out) {
    const JsonValue* value = section.find(key);
    if (value == nullptr || value->isNull()) {
        return;
    }
    auto count = value->tryAsCount();
    if (!count) {
        throw ConfigurationError(std::format("'{}' must be a non-negative integer, got {}",
                                             key, value->toString()));
    }
    out = static_cast<size_t>(*count);
}

void readBool(const JsonValue& section, const char* key, bool& out) {
    const JsonValue* value = section.find(key);
    if (value == nullptr || value->isNull()) {
        return;
    }
    auto flag = value->tryAsBool();
    if (!flag) {
        throw ConfigurationError(
            std::format("'{}' must be a boolean, got {}", key, value->kindName()));
    }
    out = *flag;
}

void requirePositive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw ConfigurationError(std::format("{} must be positive, got {}", name, value));
    }
}

void requireFraction(double value, const char* name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConfigurationError(std::format("{} must be in [0, 1], got {}", name, value));
    }
}

} // anonymous namespace

void ControllerConfig::validate() const {
    if (workerCount == 0) {
        throw ConfigurationError("workerCount must be at least 1");
    }
    if (initialBatchSize == 0) {
        throw ConfigurationError("initialBatchSize must be at least 1");
    }
    if (minBatch == 0) {
        throw ConfigurationError("minBatch must be at least 1");
    }
    if (minBatch > maxBatch) {
        throw ConfigurationError(
            std::format("minBatch ({}) exceeds maxBatch ({})", minBatch, maxBatch));
    }
    requirePositive(targetChunkDuration, "targetChunkDuration");
    requireFraction(adaptationRate, "adaptationRate");
    if (windowCapacity == 0) {
        throw ConfigurationError("windowCapacity must be at least 1");
    }
    if (!(deviationTolerance >= 0.0)) {
        throw ConfigurationError("deviationTolerance must be non-negative");
    }
    if (minSamplesBeforeAdapting == 0 || minSamplesBeforeAdapting > windowCapacity) {
        throw ConfigurationError(std::format(
            "minSamplesBeforeAdapting must be in [1, windowCapacity={}], got {}",
            windowCapacity, minSamplesBeforeAdapting));
    }
}

ControllerConfig ControllerConfig::fromJson(const JsonValue& json) {
    ControllerConfig config;
    const auto* object = json.tryAsObject();
    if (object == nullptr) {
        if (!json.isNull()) {
            throw ConfigurationError(
                std::format("'controller' must be an object, got {}", json.kindName()));
        }
        return config;
    }

    warnUnknownKeys(*object, "controller",
                    {"workerCount", "initialBatchSize", "targetChunkDuration",
                     "adaptationRate", "minBatch", "maxBatch", "windowCapacity",
                     "enabled", "deviationTolerance", "minSamplesBeforeAdapting",
                     "maxInFlightBatches"});

    readSize(json, "workerCount", config.workerCount);
    readSize(json, "initialBatchSize", config.initialBatchSize);
    readDouble(json, "targetChunkDuration", config.targetChunkDuration);
    readDouble(json, "adaptationRate", config.adaptationRate);
    readSize(json, "minBatch", config.minBatch);
    readSize(json, "maxBatch", config.maxBatch);
    readSize(json, "windowCapacity", config.windowCapacity);
    readBool(json, "enabled", config.enabled);
    readDouble(json, "deviationTolerance", config.deviationTolerance);
    readSize(json, "minSamplesBeforeAdapting", config.minSamplesBeforeAdapting);
    readSize(json, "maxInFlightBatches", config.maxInFlightBatches);

    // 0 in a file means "no upper bound"
    if (config.maxBatch == 0) {
        config.maxBatch = UNBOUNDED;
    }

    config.validate();
    return config;
}

void PlannerConfig::validate() const {
    if (sampleSize == 0) {
        throw ConfigurationError("sampleSize must be at least 1");
    }
    requirePositive(targetChunkDuration, "targetChunkDuration");
    if (!(minBenefitThreshold >= 1.0)) {
        throw ConfigurationError(
            std::format("minBenefitThreshold must be at least 1.0, got {}", minBenefitThreshold));
    }
    requireFraction(memoryFraction, "memoryFraction");
    requireFraction(resultMemoryFraction, "resultMemoryFraction");
    if (!(variabilityThreshold >= 0.0)) {
        throw ConfigurationError("variabilityThreshold must be non-negative");
    }
    if (!(batchShrinkFactor > 0.0 && batchShrinkFactor <= 1.0)) {
        throw ConfigurationError(
            std::format("batchShrinkFactor must be in (0, 1], got {}", batchShrinkFactor));
    }
    if (!(workloadTooSmallFactor >= 0.0)) {
        throw ConfigurationError("workloadTooSmallFactor must be non-negative");
    }
    if (!(isolatedDispatchCostPerBatch >= 0.0) || !(sharedDispatchCostPerBatch >= 0.0)) {
        throw ConfigurationError("dispatch costs must be non-negative");
    }
    requirePositive(spawnTimeoutSeconds, "spawnTimeoutSeconds");
    requirePositive(spawnCacheTtlSeconds, "spawnCacheTtlSeconds");
    requirePositive(memoryCacheTtlSeconds, "memoryCacheTtlSeconds");
    requireFraction(advisorConfidenceThreshold, "advisorConfidenceThreshold");
}

PlannerConfig PlannerConfig::fromJson(const JsonValue& json) {
    PlannerConfig config;
    const auto* object = json.tryAsObject();
    if (object == nullptr) {
        if (!json.isNull()) {
            throw ConfigurationError(
                std::format("'planner' must be an object, got {}", json.kindName()));
        }
        return config;
    }

    warnUnknownKeys(*object, "planner",
                    {"sampleSize", "targetChunkDuration", "minBenefitThreshold",
                     "memoryFraction", "resultMemoryFraction", "variabilityThreshold",
                     "batchShrinkFactor",
                     "workloadTooSmallFactor", "isolatedDispatchCostPerBatch",
                     "sharedDispatchCostPerBatch", "spawnTimeoutSeconds",
                     "spawnCacheTtlSeconds", "memoryCacheTtlSeconds",
                     "advisorConfidenceThreshold", "maxWorkers"});

    readSize(json, "sampleSize", config.sampleSize);
    readDouble(json, "targetChunkDuration", config.targetChunkDuration);
    readDouble(json, "minBenefitThreshold", config.minBenefitThreshold);
    readDouble(json, "memoryFraction", config.memoryFraction);
    readDouble(json, "resultMemoryFraction", config.resultMemoryFraction);
    readDouble(json, "variabilityThreshold", config.variabilityThreshold);
    readDouble(json, "batchShrinkFactor", config.batchShrinkFactor);
    readDouble(json, "workloadTooSmallFactor", config.workloadTooSmallFactor);
    readDouble(json, "isolatedDispatchCostPerBatch", config.isolatedDispatchCostPerBatch);
    readDouble(json, "sharedDispatchCostPerBatch", config.sharedDispatchCostPerBatch);
    readDouble(json, "spawnTimeoutSeconds", config.spawnTimeoutSeconds);
    readDouble(json, "spawnCacheTtlSeconds", config.spawnCacheTtlSeconds);
    readDouble(json, "memoryCacheTtlSeconds", config.memoryCacheTtlSeconds);
    readDouble(json, "advisorConfidenceThreshold", config.advisorConfidenceThreshold);
    readSize(json, "maxWorkers", config.maxWorkers);

    config.validate();
    return config;
}

AmortizeConfig loadConfigFile(const std::string& path) {
    JsonValue root;
    try {
        root = JsonReader::parseFile(path);
    } catch (const JsonParseError& e) {
        CONFIG_ERROR(std::format("Failed to load {}: {}", path, e.what()));
        throw ConfigurationError(std::format("cannot read '{}': {}", path, e.what()));
    }

    if (!root.isObject()) {
        throw ConfigurationError(std::format("'{}' must contain a JSON object", path));
    }

    AmortizeConfig config;
    config.planner = PlannerConfig::fromJson(root["planner"]);
    config.controller = ControllerConfig::fromJson(root["controller"]);

    CONFIG_INFO(std::format("Loaded configuration from {}", path));
    return config;
}

} // namespace Amortize
