/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WorkloadSamplerTests
#include <boost/test/unit_test.hpp>

#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "planning/Dataset.hpp"
#include "planning/WorkloadProbe.hpp"
#include "planning/WorkloadSampler.hpp"

#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace Amortize;

struct QuietLoggingFixture {
    QuietLoggingFixture() { Logger::SetBenchmarkMode(true); }
    ~QuietLoggingFixture() { Logger::SetBenchmarkMode(false); }
};

BOOST_GLOBAL_FIXTURE(QuietLoggingFixture);

namespace {

// Keeps the optimizer from removing the busy loop
volatile double g_sink = 0.0;

double spin(std::chrono::milliseconds duration) {
    const auto end = std::chrono::steady_clock::now() + duration;
    double acc = 0.0;
    while (std::chrono::steady_clock::now() < end) {
        for (int i = 0; i < 1000; ++i) {
            acc += std::sqrt(static_cast<double>(i));
        }
    }
    g_sink = acc;
    return acc;
}

ItemTiming timing(size_t index, double wall) {
    return ItemTiming{index, wall, 0.0};
}

// No wire codec for this one
struct Handle {
    void* resource{nullptr};
};

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(SamplerStatistics)

BOOST_AUTO_TEST_CASE(TestClassifyThresholds) {
    BOOST_CHECK(WorkloadSampler::classify(0.95) == WorkloadClass::ComputeBound);
    BOOST_CHECK(WorkloadSampler::classify(0.7) == WorkloadClass::ComputeBound);
    BOOST_CHECK(WorkloadSampler::classify(0.69) == WorkloadClass::Mixed);
    BOOST_CHECK(WorkloadSampler::classify(0.3) == WorkloadClass::Mixed);
    BOOST_CHECK(WorkloadSampler::classify(0.29) == WorkloadClass::WaitBound);
    BOOST_CHECK(WorkloadSampler::classify(0.0) == WorkloadClass::WaitBound);
}

BOOST_AUTO_TEST_CASE(TestVariability) {
    // Identical times
    std::vector<ItemTiming> uniform{timing(0, 0.1), timing(1, 0.1), timing(2, 0.1)};
    BOOST_CHECK_SMALL(WorkloadSampler::computeVariability(uniform), 1e-12);

    // mean 2, population stddev 1
    std::vector<ItemTiming> spread{timing(0, 1.0), timing(1, 3.0)};
    BOOST_CHECK_CLOSE(WorkloadSampler::computeVariability(spread), 0.5, 0.0001);

    BOOST_CHECK_EQUAL(WorkloadSampler::computeVariability({timing(0, 5.0)}), 0.0);
    BOOST_CHECK_EQUAL(WorkloadSampler::computeVariability({}), 0.0);
    BOOST_CHECK_EQUAL(WorkloadSampler::computeVariability({timing(0, 0.0), timing(1, 0.0)}),
                      0.0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SamplerTransferability)

BOOST_AUTO_TEST_CASE(TestCodecTypesTransferable) {
    auto check = WorkloadSampler::checkTransferability(std::string("payload"), 42);
    BOOST_CHECK(check.transferable);
    BOOST_CHECK(check.reason.empty());
    BOOST_CHECK_GT(check.itemBytes, 0u);
    BOOST_CHECK_GT(check.resultBytes, 0u);
    BOOST_CHECK_GE(check.seconds, 0.0);
}

BOOST_AUTO_TEST_CASE(TestMissingCodecNamed) {
    auto item = WorkloadSampler::checkTransferability(Handle{}, 1);
    BOOST_CHECK(!item.transferable);
    BOOST_CHECK(item.reason.find("item") != std::string::npos);

    auto result = WorkloadSampler::checkTransferability(1, Handle{});
    BOOST_CHECK(!result.transferable);
    BOOST_CHECK(result.reason.find("result") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestSampleFlagsNonTransferableResult) {
    auto dataset = Dataset<int>::fromVector({1, 2, 3});
    auto fn = [](const int&) { return Handle{}; };

    SampleResult result = WorkloadSampler::sample(fn, dataset, 3);
    BOOST_CHECK(!result.transferable);
    BOOST_CHECK(!result.transferReason.empty());
    BOOST_CHECK_EQUAL(result.timings.size(), 3u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SamplerRuns)

BOOST_AUTO_TEST_CASE(TestComputeBoundSample) {
    auto dataset = Dataset<int>::fromVector({1, 2, 3, 4, 5, 6, 7, 8});
    auto fn = [](const int& x) {
        spin(std::chrono::milliseconds(20));
        return x * 2;
    };

    SampleResult result = WorkloadSampler::sample(fn, dataset, 4);
    BOOST_CHECK_EQUAL(result.timings.size(), 4u);
    BOOST_CHECK(result.failures.empty());
    BOOST_CHECK_GE(result.meanWallTime, 0.019);
    BOOST_CHECK(result.workloadClass == WorkloadClass::ComputeBound);
    BOOST_CHECK(result.transferable);
    BOOST_CHECK_GT(result.itemPayloadBytes, 0u);
}

BOOST_AUTO_TEST_CASE(TestWaitBoundSample) {
    auto dataset = Dataset<int>::fromVector({1, 2, 3, 4});
    auto fn = [](const int& x) {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        return x;
    };

    SampleResult result = WorkloadSampler::sample(fn, dataset, 4);
    BOOST_CHECK_GE(result.meanWallTime, 0.029);
    BOOST_CHECK_LT(result.cpuRatio, 0.3);
    BOOST_CHECK(result.workloadClass == WorkloadClass::WaitBound);
}

BOOST_AUTO_TEST_CASE(TestSampleSizeClippedToDataset) {
    auto dataset = Dataset<int>::fromVector({1, 2});
    auto fn = [](const int& x) { return x; };

    SampleResult result = WorkloadSampler::sample(fn, dataset, 5);
    BOOST_CHECK_EQUAL(result.timings.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestEmptyDatasetGivesEmptySample) {
    auto dataset = Dataset<int>::fromVector({});
    auto fn = [](const int& x) { return x; };

    SampleResult result = WorkloadSampler::sample(fn, dataset, 5);
    BOOST_CHECK(result.empty());
    BOOST_CHECK(result.failures.empty());
}

BOOST_AUTO_TEST_CASE(TestPartialFailuresCollected) {
    auto dataset = Dataset<int>::fromVector({0, 1, 2, 3, 4});
    auto fn = [](const int& x) {
        if (x % 2 == 1) {
            throw std::runtime_error("odd item");
        }
        return x;
    };

    SampleResult result = WorkloadSampler::sample(fn, dataset, 5);
    BOOST_CHECK_EQUAL(result.timings.size(), 3u);
    BOOST_REQUIRE_EQUAL(result.failures.size(), 2u);
    BOOST_CHECK_EQUAL(result.failures[0].itemIndex, 1u);
    BOOST_CHECK_EQUAL(result.failures[0].message, "odd item");
    BOOST_CHECK_EQUAL(result.timings[1].itemIndex, 2u);
}

BOOST_AUTO_TEST_CASE(TestAllFailuresRaise) {
    auto dataset = Dataset<int>::fromVector({1, 2, 3});
    auto fn = [](const int&) -> int { throw std::invalid_argument("always"); };

    try {
        WorkloadSampler::sample(fn, dataset, 3);
        BOOST_FAIL("expected SamplingFailure");
    } catch (const SamplingFailure& e) {
        BOOST_CHECK_EQUAL(e.failedItems(), 3u);
        BOOST_CHECK(std::string(e.what()).find("always") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(TestSinglePassPrefixKept) {
    int next = 0;
    auto dataset = Dataset<int>::fromGenerator([&next]() -> std::optional<int> {
        if (next >= 12) {
            return std::nullopt;
        }
        return next++;
    });
    auto fn = [](const int& x) { return x + 1; };

    SampleResult result = WorkloadSampler::sample(fn, dataset, 5);
    BOOST_CHECK_EQUAL(result.timings.size(), 5u);
    BOOST_CHECK_EQUAL(dataset.bufferedCount(), 5u);

    // Nothing sampled is lost
    std::vector<int> all = dataset.takeRemaining();
    BOOST_REQUIRE_EQUAL(all.size(), 12u);
    for (int i = 0; i < 12; ++i) {
        BOOST_CHECK_EQUAL(all[static_cast<size_t>(i)], i);
    }
}

BOOST_AUTO_TEST_CASE(TestInternalThreadsObserved) {
    auto dataset = Dataset<int>::fromVector({1, 2});
    auto fn = [](const int& x) {
        std::vector<std::thread> helpers;
        for (int i = 0; i < 3; ++i) {
            helpers.emplace_back(
                []() { std::this_thread::sleep_for(std::chrono::milliseconds(40)); });
        }
        for (auto& helper : helpers) {
            helper.join();
        }
        return x;
    };

    SampleResult result = WorkloadSampler::sample(fn, dataset, 2);
    if (auto limit = WorkloadProbe::threadLimitFromEnvironment()) {
        BOOST_CHECK_EQUAL(result.internalThreads, *limit);
    } else if (WorkloadProbe::processThreadCount() > 0) {
        BOOST_CHECK_EQUAL(result.internalThreads, 4u);
    }
}

BOOST_AUTO_TEST_CASE(TestMemoryGrowthMeasuredPerCall) {
    if (WorkloadProbe::currentResidentBytes() == 0) {
        BOOST_TEST_MESSAGE("Resident memory not readable here, skipping");
        return;
    }
    constexpr size_t MIB = 1024 * 1024;

    // An earlier, larger peak must not hide what the function allocates
    {
        std::vector<char> earlier(512 * MIB, 1);
        g_sink = static_cast<double>(earlier[earlier.size() / 2]);
    }

    auto dataset = Dataset<int>::fromVector({1, 2, 3});
    auto fn = [](const int& x) {
        std::vector<char> scratch(64 * MIB, static_cast<char>(x));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return static_cast<int>(scratch[scratch.size() - 1]);
    };

    SampleResult result = WorkloadSampler::sample(fn, dataset, 3);
    BOOST_CHECK_GE(result.peakMemoryGrowthBytes, 32 * MIB);
}

BOOST_AUTO_TEST_CASE(TestSmallFunctionsGrowLittle) {
    auto dataset = Dataset<int>::fromVector({1, 2, 3});
    auto fn = [](const int& x) { return x + 1; };

    SampleResult result = WorkloadSampler::sample(fn, dataset, 3);
    BOOST_CHECK_LT(result.peakMemoryGrowthBytes, 16u * 1024 * 1024);
}

BOOST_AUTO_TEST_CASE(TestSerialWorkHasOneThread) {
    auto dataset = Dataset<int>::fromVector({1, 2, 3});
    auto fn = [](const int& x) { return x * x; };

    SampleResult result = WorkloadSampler::sample(fn, dataset, 3);
    if (!WorkloadProbe::threadLimitFromEnvironment()) {
        BOOST_CHECK_EQUAL(result.internalThreads, 1u);
    }
}

BOOST_AUTO_TEST_SUITE_END()
