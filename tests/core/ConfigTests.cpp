/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ConfigTests
#include <boost/test/unit_test.hpp>

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace Amortize;

struct QuietLoggingFixture {
    QuietLoggingFixture() { Logger::SetBenchmarkMode(true); }
    ~QuietLoggingFixture() { Logger::SetBenchmarkMode(false); }
};

BOOST_GLOBAL_FIXTURE(QuietLoggingFixture);

namespace {

JsonValue parseOrFail(const std::string& text) {
    try {
        return JsonReader::parse(text);
    } catch (const JsonParseError& e) {
        BOOST_FAIL(e.what());
    }
    return JsonValue();
}

// Writes a file on construction and removes it on destruction
struct TempConfigFile {
    explicit TempConfigFile(const std::string& content)
        : path("amortize_config_test.json") {
        std::ofstream file(path);
        file << content;
    }
    ~TempConfigFile() { std::remove(path.c_str()); }

    std::string path;
};

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(ConfigDefaults)

BOOST_AUTO_TEST_CASE(TestControllerDefaults) {
    ControllerConfig config;
    BOOST_CHECK_NO_THROW(config.validate());
    BOOST_CHECK_CLOSE(config.targetChunkDuration, 0.2, 0.0001);
    BOOST_CHECK_CLOSE(config.adaptationRate, 0.3, 0.0001);
    BOOST_CHECK_CLOSE(config.deviationTolerance, 0.2, 0.0001);
    BOOST_CHECK_EQUAL(config.minSamplesBeforeAdapting, 3u);
    BOOST_CHECK_EQUAL(config.maxBatch, ControllerConfig::UNBOUNDED);

    config.workerCount = 4;
    BOOST_CHECK_EQUAL(config.effectiveInFlightLimit(), 8u);
    config.maxInFlightBatches = 3;
    BOOST_CHECK_EQUAL(config.effectiveInFlightLimit(), 3u);
}

BOOST_AUTO_TEST_CASE(TestPlannerDefaults) {
    PlannerConfig config;
    BOOST_CHECK_NO_THROW(config.validate());
    BOOST_CHECK_EQUAL(config.sampleSize, 5u);
    BOOST_CHECK_CLOSE(config.minBenefitThreshold, 1.2, 0.0001);
    BOOST_CHECK_CLOSE(config.memoryFraction, 0.8, 0.0001);
    BOOST_CHECK_CLOSE(config.resultMemoryFraction, 0.5, 0.0001);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ConfigValidation)

BOOST_AUTO_TEST_CASE(TestControllerRejectsBadBounds) {
    ControllerConfig config;
    config.minBatch = 0;
    BOOST_CHECK_THROW(config.validate(), ConfigurationError);

    config = ControllerConfig{};
    config.minBatch = 10;
    config.maxBatch = 2;
    BOOST_CHECK_THROW(config.validate(), ConfigurationError);

    config = ControllerConfig{};
    config.workerCount = 0;
    BOOST_CHECK_THROW(config.validate(), ConfigurationError);

    config = ControllerConfig{};
    config.minSamplesBeforeAdapting = 11;
    BOOST_CHECK_THROW(config.validate(), ConfigurationError);

    config = ControllerConfig{};
    config.adaptationRate = -0.1;
    BOOST_CHECK_THROW(config.validate(), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(TestPlannerRejectsBadValues) {
    PlannerConfig config;
    config.sampleSize = 0;
    BOOST_CHECK_THROW(config.validate(), ConfigurationError);

    config = PlannerConfig{};
    config.minBenefitThreshold = 0.5;
    BOOST_CHECK_THROW(config.validate(), ConfigurationError);

    config = PlannerConfig{};
    config.memoryFraction = 1.5;
    BOOST_CHECK_THROW(config.validate(), ConfigurationError);
    config.memoryFraction = 0.8;
    config.resultMemoryFraction = 1.5;
    BOOST_CHECK_THROW(config.validate(), ConfigurationError);

    config = PlannerConfig{};
    config.batchShrinkFactor = 0.0;
    BOOST_CHECK_THROW(config.validate(), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(TestErrorsShareBaseClass) {
    ControllerConfig config;
    config.windowCapacity = 0;
    BOOST_CHECK_THROW(config.validate(), AmortizeError);
    BOOST_CHECK_THROW(config.validate(), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ConfigFromJson)

BOOST_AUTO_TEST_CASE(TestControllerFromJson) {
    auto json = parseOrFail(R"({
        "workerCount": 6,
        "initialBatchSize": 12,
        "targetChunkDuration": 0.5,
        "maxBatch": 0,
        "enabled": false
    })");

    ControllerConfig config = ControllerConfig::fromJson(json);
    BOOST_CHECK_EQUAL(config.workerCount, 6u);
    BOOST_CHECK_EQUAL(config.initialBatchSize, 12u);
    BOOST_CHECK_CLOSE(config.targetChunkDuration, 0.5, 0.0001);
    BOOST_CHECK_EQUAL(config.maxBatch, ControllerConfig::UNBOUNDED);
    BOOST_CHECK(!config.enabled);
    // Missing keys keep defaults
    BOOST_CHECK_EQUAL(config.windowCapacity, 10u);
}

BOOST_AUTO_TEST_CASE(TestUnknownKeysIgnored) {
    auto json = parseOrFail(R"({"sampleSize": 9, "futureSetting": "x"})");
    PlannerConfig config = PlannerConfig::fromJson(json);
    BOOST_CHECK_EQUAL(config.sampleSize, 9u);
}

BOOST_AUTO_TEST_CASE(TestWrongTypesRejected) {
    BOOST_CHECK_THROW(ControllerConfig::fromJson(parseOrFail(R"({"enabled": "yes"})")),
                      ConfigurationError);
    BOOST_CHECK_THROW(ControllerConfig::fromJson(parseOrFail(R"({"minBatch": 2.5})")),
                      ConfigurationError);
    BOOST_CHECK_THROW(PlannerConfig::fromJson(parseOrFail(R"({"sampleSize": -1})")),
                      ConfigurationError);
    BOOST_CHECK_THROW(PlannerConfig::fromJson(parseOrFail("[1, 2]")), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(TestParsedValuesValidated) {
    BOOST_CHECK_THROW(
        ControllerConfig::fromJson(parseOrFail(R"({"minBatch": 8, "maxBatch": 4})")),
        ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ConfigFile)

BOOST_AUTO_TEST_CASE(TestLoadConfigFile) {
    TempConfigFile file(R"({
        "planner": {"sampleSize": 3, "maxWorkers": 2},
        "controller": {"adaptationRate": 0.5}
    })");

    AmortizeConfig config = loadConfigFile(file.path);
    BOOST_CHECK_EQUAL(config.planner.sampleSize, 3u);
    BOOST_CHECK_EQUAL(config.planner.maxWorkers, 2u);
    BOOST_CHECK_CLOSE(config.controller.adaptationRate, 0.5, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestMissingSectionsKeepDefaults) {
    TempConfigFile file("{}");

    AmortizeConfig config = loadConfigFile(file.path);
    BOOST_CHECK_EQUAL(config.planner.sampleSize, 5u);
    BOOST_CHECK_EQUAL(config.controller.windowCapacity, 10u);
}

BOOST_AUTO_TEST_CASE(TestUnreadableFileThrows) {
    BOOST_CHECK_THROW(loadConfigFile("does_not_exist.json"), ConfigurationError);

    TempConfigFile broken("{\"planner\": ");
    BOOST_CHECK_THROW(loadConfigFile(broken.path), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()
