/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CostModelTests
#include <boost/test/unit_test.hpp>

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "managers/SystemProfiler.hpp"
#include "planning/CostModel.hpp"

using namespace Amortize;

struct QuietLoggingFixture {
    QuietLoggingFixture() { Logger::SetBenchmarkMode(true); }
    ~QuietLoggingFixture() { Logger::SetBenchmarkMode(false); }
};

BOOST_GLOBAL_FIXTURE(QuietLoggingFixture);

namespace {

// 1000 items of 50ms, cheap workers, 1ms codec per item
CostInputs expensiveItems() {
    CostInputs inputs;
    inputs.perItemSeconds = 0.05;
    inputs.totalItems = 1000;
    inputs.spawnCostPerWorker = 0.01;
    inputs.dispatchCostPerBatch = 0.001;
    inputs.transferCostPerItem = 0.001;
    return inputs;
}

// 100 million items of 1us whose codec costs as much as the work
CostInputs tinyItems() {
    CostInputs inputs;
    inputs.perItemSeconds = 1e-6;
    inputs.totalItems = 100000000;
    inputs.spawnCostPerWorker = 0.05;
    inputs.dispatchCostPerBatch = 0.001;
    inputs.transferCostPerItem = 1e-6;
    return inputs;
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(SpeedupEstimates)

BOOST_AUTO_TEST_CASE(TestExpensiveItemsParallelize) {
    CostEstimate estimate = CostModel::computeSpeedup(8, 4, expensiveItems());

    // serial 50s; parallel 6.25 + 0.08 + 250 x 0.001 + 1000 x 0.001 = 7.58s
    BOOST_CHECK_CLOSE(estimate.serialTime, 50.0, 0.0001);
    BOOST_CHECK_CLOSE(estimate.parallelComputeTime, 6.25, 0.0001);
    BOOST_CHECK_CLOSE(estimate.spawnOverhead, 0.08, 0.0001);
    BOOST_CHECK_CLOSE(estimate.transferOverhead, 1.0, 0.0001);
    BOOST_CHECK_CLOSE(estimate.batchingOverhead, 1.25, 0.0001);
    BOOST_CHECK_CLOSE(estimate.estimatedSpeedup, 50.0 / 7.58, 0.0001);
    BOOST_CHECK(!estimate.rationale.empty());
}

BOOST_AUTO_TEST_CASE(TestTinyItemsLoseToOverhead) {
    const CostInputs inputs = tinyItems();

    // Batches of about 200ms of work
    CostEstimate estimate = CostModel::computeSpeedup(8, 200000, inputs);
    BOOST_CHECK_LT(estimate.estimatedSpeedup, 1.0);

    for (size_t workers = 2; workers <= 8; ++workers) {
        BOOST_CHECK_LT(CostModel::computeSpeedup(workers, 200000, inputs).estimatedSpeedup, 1.2);
    }
}

BOOST_AUTO_TEST_CASE(TestSingleWorkerIsExactlyOne) {
    CostEstimate estimate = CostModel::computeSpeedup(1, 10, expensiveItems());
    BOOST_CHECK_EQUAL(estimate.estimatedSpeedup, 1.0);
    BOOST_CHECK_EQUAL(estimate.spawnOverhead, 0.0);
    BOOST_CHECK_EQUAL(estimate.batchingOverhead, 0.0);

    BOOST_CHECK_EQUAL(CostModel::computeSpeedup(0, 0, expensiveItems()).estimatedSpeedup, 1.0);
}

BOOST_AUTO_TEST_CASE(TestSpeedupNeverExceedsWorkers) {
    CostInputs noOverhead;
    noOverhead.perItemSeconds = 1.0;
    noOverhead.totalItems = 100;

    for (size_t workers = 2; workers <= 16; ++workers) {
        CostEstimate estimate = CostModel::computeSpeedup(workers, 5, noOverhead);
        BOOST_CHECK_LE(estimate.estimatedSpeedup, static_cast<double>(workers) + 1e-9);
        BOOST_CHECK_GT(estimate.estimatedSpeedup, 0.0);
    }
}

BOOST_AUTO_TEST_CASE(TestNoWorkGivesOne) {
    CostInputs nothing;
    nothing.totalItems = 10;
    BOOST_CHECK_EQUAL(CostModel::computeSpeedup(4, 2, nothing).estimatedSpeedup, 1.0);
}

BOOST_AUTO_TEST_CASE(TestLargerBatchesCutDispatchCost) {
    CostInputs inputs = expensiveItems();
    inputs.transferCostPerItem = 0.0;

    double fineGrained = CostModel::computeSpeedup(4, 1, inputs).estimatedSpeedup;
    double coarse = CostModel::computeSpeedup(4, 50, inputs).estimatedSpeedup;
    BOOST_CHECK_GT(coarse, fineGrained);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(BackendInputs)

BOOST_AUTO_TEST_CASE(TestIsolatedPaysMeasuredCosts) {
    SampleResult sample;
    sample.meanWallTime = 0.02;
    sample.transferSecondsPerItem = 0.0005;
    SystemProfile profile;
    profile.spawnCostSeconds = 0.007;
    PlannerConfig config;

    CostInputs inputs =
        CostInputs::forBackend(sample, profile, BackendKind::IsolatedWorker, config, 300);
    BOOST_CHECK_EQUAL(inputs.totalItems, 300u);
    BOOST_CHECK_CLOSE(inputs.perItemSeconds, 0.02, 0.0001);
    BOOST_CHECK_CLOSE(inputs.spawnCostPerWorker, 0.007, 0.0001);
    BOOST_CHECK_CLOSE(inputs.dispatchCostPerBatch, config.isolatedDispatchCostPerBatch, 0.0001);
    BOOST_CHECK_CLOSE(inputs.transferCostPerItem, 0.0005, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestSharedSkipsTransfer) {
    SampleResult sample;
    sample.meanWallTime = 0.02;
    sample.transferSecondsPerItem = 0.0005;
    SystemProfile profile;
    profile.spawnCostSeconds = 0.007;
    PlannerConfig config;

    CostInputs inputs =
        CostInputs::forBackend(sample, profile, BackendKind::SharedMemoryWorker, config, 300);
    BOOST_CHECK_EQUAL(inputs.transferCostPerItem, 0.0);
    BOOST_CHECK_CLOSE(inputs.spawnCostPerWorker,
                      SystemProfiler::boundsFor(CreationStrategy::ThreadLaunch).estimateSeconds,
                      0.0001);
    BOOST_CHECK_CLOSE(inputs.dispatchCostPerBatch, config.sharedDispatchCostPerBatch, 0.0001);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(BottleneckClassification)

BOOST_AUTO_TEST_CASE(TestTransferDominatesTinyItems) {
    const CostInputs inputs = tinyItems();
    CostEstimate serial = CostModel::computeSpeedup(1, 200000, inputs);
    SampleResult sample;
    PlannerConfig config;

    BOOST_CHECK(CostModel::classifyBottleneck(serial, inputs, sample, config, false) ==
                Bottleneck::TransferOverhead);
}

BOOST_AUTO_TEST_CASE(TestSpawnDominatesShortRuns) {
    CostInputs inputs;
    inputs.perItemSeconds = 0.001;
    inputs.totalItems = 100;
    inputs.spawnCostPerWorker = 0.04;
    CostEstimate chosen = CostModel::computeSpeedup(2, 50, inputs);
    SampleResult sample;
    PlannerConfig config;

    BOOST_CHECK(CostModel::classifyBottleneck(chosen, inputs, sample, config, false) ==
                Bottleneck::SpawnOverhead);
}

BOOST_AUTO_TEST_CASE(TestDispatchDominatesTinyBatches) {
    CostInputs inputs;
    inputs.perItemSeconds = 0.001;
    inputs.totalItems = 10000;
    inputs.dispatchCostPerBatch = 0.001;
    CostEstimate chosen = CostModel::computeSpeedup(4, 1, inputs);
    SampleResult sample;
    PlannerConfig config;

    BOOST_CHECK(CostModel::classifyBottleneck(chosen, inputs, sample, config, false) ==
                Bottleneck::DispatchOverhead);
}

BOOST_AUTO_TEST_CASE(TestPriorityOrder) {
    CostInputs inputs = expensiveItems();
    CostEstimate chosen = CostModel::computeSpeedup(8, 4, inputs);
    SampleResult sample;
    PlannerConfig config;

    BOOST_CHECK(CostModel::classifyBottleneck(chosen, inputs, sample, config, true) ==
                Bottleneck::MemoryConstraint);

    sample.coefficientOfVariation = 0.9;
    BOOST_CHECK(CostModel::classifyBottleneck(chosen, inputs, sample, config, false) ==
                Bottleneck::HeterogeneousWorkload);

    CostInputs brief = inputs;
    brief.totalItems = 1;
    brief.perItemSeconds = 0.001;
    BOOST_CHECK(CostModel::classifyBottleneck(chosen, brief, sample, config, false) ==
                Bottleneck::WorkloadTooSmall);
}

BOOST_AUTO_TEST_CASE(TestCheapOverheadsNameNothing) {
    CostInputs inputs;
    inputs.perItemSeconds = 0.1;
    inputs.totalItems = 1000;
    inputs.spawnCostPerWorker = 0.0001;
    inputs.dispatchCostPerBatch = 0.00002;
    CostEstimate chosen = CostModel::computeSpeedup(4, 10, inputs);
    SampleResult sample;
    PlannerConfig config;

    BOOST_CHECK(CostModel::classifyBottleneck(chosen, inputs, sample, config, false) ==
                Bottleneck::None);
}

BOOST_AUTO_TEST_SUITE_END()
