/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AdaptiveChunkControllerTests
#include <boost/test/unit_test.hpp>

#include "core/AdaptiveChunkController.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "planning/PlanningTypes.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Amortize;

struct QuietLoggingFixture {
    QuietLoggingFixture() { Logger::SetBenchmarkMode(true); }
    ~QuietLoggingFixture() { Logger::SetBenchmarkMode(false); }
};

BOOST_GLOBAL_FIXTURE(QuietLoggingFixture);

namespace {

using IntController = AdaptiveChunkController<int, int>;

std::vector<int> iota(int count) {
    std::vector<int> values(static_cast<size_t>(count));
    std::iota(values.begin(), values.end(), 0);
    return values;
}

ControllerConfig fixedBatches(size_t batchSize) {
    ControllerConfig config;
    config.initialBatchSize = batchSize;
    config.enabled = false;
    return config;
}

std::unique_ptr<IntController> sharedController(std::function<int(const int&)> fn,
                                                size_t workers, ControllerConfig config) {
    return std::make_unique<IntController>(
        std::make_unique<SharedMemoryBackend<int, int>>(std::move(fn), workers), config);
}

// Type with no wire codec
struct Opaque {
    int* pointer{nullptr};
};

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(ControllerOrdering)

BOOST_AUTO_TEST_CASE(TestMapPreservesInputOrder) {
    auto controller = sharedController([](const int& x) { return x * x; }, 4, fixedBatches(7));

    auto results = controller->map(iota(1000));

    BOOST_REQUIRE_EQUAL(results.size(), 1000u);
    for (int i = 0; i < 1000; ++i) {
        BOOST_CHECK_EQUAL(results[static_cast<size_t>(i)], i * i);
    }
    BOOST_CHECK_EQUAL(controller->getStats().totalProcessed, 1000u);
}

BOOST_AUTO_TEST_CASE(TestOrderedStreamBuffersEarlyArrivals) {
    // Early batches are slowest, so later ones finish first
    auto controller = sharedController(
        [](const int& x) {
            if (x < 10) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            return x + 1;
        },
        4, fixedBatches(5));

    auto stream = controller->imap(iota(100));
    int expected = 1;
    while (auto value = stream.next()) {
        BOOST_CHECK_EQUAL(*value, expected);
        ++expected;
    }
    BOOST_CHECK_EQUAL(expected, 101);
}

BOOST_AUTO_TEST_CASE(TestUnorderedStreamHasNoLossOrDuplication) {
    auto controller = sharedController(
        [](const int& x) {
            std::this_thread::sleep_for(std::chrono::microseconds((x * 37) % 200));
            return x;
        },
        4, fixedBatches(3));

    auto results = controller->imapUnordered(iota(500)).collect();

    std::sort(results.begin(), results.end());
    BOOST_CHECK(results == iota(500));
}

BOOST_AUTO_TEST_CASE(TestEmptySubmission) {
    auto controller = sharedController([](const int& x) { return x; }, 2, fixedBatches(4));

    BOOST_CHECK(controller->map({}).empty());
    BOOST_CHECK(!controller->imapUnordered({}).next().has_value());
}

BOOST_AUTO_TEST_CASE(TestConcurrentCallersGetTheirOwnResults) {
    auto controller = sharedController([](const int& x) { return x * 2; }, 4, fixedBatches(8));

    std::vector<std::future<std::vector<int>>> callers;
    for (int c = 0; c < 4; ++c) {
        callers.push_back(std::async(std::launch::async, [&controller, c]() {
            std::vector<int> items(200, c);
            return controller->map(items);
        }));
    }

    for (int c = 0; c < 4; ++c) {
        auto results = callers[static_cast<size_t>(c)].get();
        BOOST_REQUIRE_EQUAL(results.size(), 200u);
        BOOST_CHECK(std::all_of(results.begin(), results.end(),
                                [c](int r) { return r == c * 2; }));
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ControllerAdaptation)

BOOST_AUTO_TEST_CASE(TestSmallInputBypassesTracking) {
    auto controller = sharedController([](const int& x) { return x; }, 2, fixedBatches(5));

    // 10 <= 2 x 5
    auto results = controller->map(iota(10));
    BOOST_CHECK_EQUAL(results.size(), 10u);

    auto stats = controller->getStats();
    BOOST_CHECK_EQUAL(stats.windowDepth, 0u);
    BOOST_CHECK_EQUAL(stats.totalProcessed, 10u);
    BOOST_CHECK_EQUAL(stats.adaptationCount, 0u);
}

BOOST_AUTO_TEST_CASE(TestLargeInputIsTracked) {
    auto controller = sharedController([](const int& x) { return x; }, 2, fixedBatches(5));

    controller->map(iota(11));

    BOOST_CHECK_EQUAL(controller->getStats().windowDepth, 3u);
}

BOOST_AUTO_TEST_CASE(TestSlowBatchesShrinkLive) {
    ControllerConfig config;
    config.initialBatchSize = 40;
    config.targetChunkDuration = 0.02;
    config.adaptationRate = 0.5;

    auto controller = sharedController(
        [](const int& x) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            return x;
        },
        2, config);

    auto results = controller->map(iota(600));
    BOOST_CHECK_EQUAL(results.size(), 600u);

    auto stats = controller->getStats();
    BOOST_CHECK_GT(stats.adaptationCount, 0u);
    BOOST_CHECK_LT(stats.currentBatchSize, 40u);
    BOOST_CHECK_GE(stats.currentBatchSize, config.minBatch);
    BOOST_CHECK_EQUAL(stats.totalProcessed, 600u);
}

BOOST_AUTO_TEST_CASE(TestInFlightLimitBoundsConcurrency) {
    ControllerConfig config = fixedBatches(4);
    config.maxInFlightBatches = 1;

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    auto controller = sharedController(
        [&](const int& x) {
            int now = active.fetch_add(1) + 1;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            active.fetch_sub(1);
            return x;
        },
        4, config);

    controller->map(iota(80));
    BOOST_CHECK_EQUAL(peak.load(), 1);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ControllerErrors)

BOOST_AUTO_TEST_CASE(TestBatchExceptionReachesConsumer) {
    auto controller = sharedController(
        [](const int& x) {
            if (x == 13) {
                throw std::runtime_error("bad item 13");
            }
            return x;
        },
        3, fixedBatches(10));

    BOOST_CHECK_THROW(controller->map(iota(100)), std::runtime_error);

    // The stream continues after the failed batch
    auto stream = controller->imap(iota(100));
    std::vector<int> results;
    int failures = 0;
    while (true) {
        try {
            auto value = stream.next();
            if (!value) {
                break;
            }
            results.push_back(*value);
        } catch (const std::runtime_error&) {
            ++failures;
        }
    }
    BOOST_CHECK_EQUAL(failures, 1);
    BOOST_CHECK_EQUAL(results.size(), 90u);
    BOOST_CHECK(std::find(results.begin(), results.end(), 13) == results.end());
}

BOOST_AUTO_TEST_CASE(TestSubmitAfterCloseRaises) {
    auto controller = sharedController([](const int& x) { return x; }, 2, fixedBatches(5));
    controller->map(iota(50));
    controller->close();

    BOOST_CHECK(controller->isClosed());
    BOOST_CHECK_THROW(controller->map(iota(5)), ClosedControllerError);
    BOOST_CHECK_THROW(controller->imapUnordered(iota(5)), ClosedControllerError);

    controller->join();
    const BatchTunerStats joined = controller->getStats();
    BOOST_CHECK_EQUAL(joined.totalProcessed, 50u);

    // Still closed after the workers are gone; stats keep the last snapshot
    BOOST_CHECK_THROW(controller->submit(iota(5), Ordering::Ordered), ClosedControllerError);
    BOOST_CHECK_THROW(controller->map(iota(5)), ClosedControllerError);
    BOOST_CHECK_THROW(controller->imap(iota(5)), ClosedControllerError);

    const BatchTunerStats after = controller->getStats();
    BOOST_CHECK_EQUAL(after.totalProcessed, joined.totalProcessed);
    BOOST_CHECK_EQUAL(after.currentBatchSize, joined.currentBatchSize);
    BOOST_CHECK_EQUAL(after.adaptationCount, joined.adaptationCount);

    // A second join is a no-op
    BOOST_CHECK_NO_THROW(controller->join());
}

BOOST_AUTO_TEST_CASE(TestSubmitAfterTerminateRaises) {
    auto controller = sharedController([](const int& x) { return x * 2; }, 2, fixedBatches(5));
    BOOST_CHECK_EQUAL(controller->map(iota(20)).size(), 20u);
    controller->terminate();

    BOOST_CHECK(controller->isClosed());
    BOOST_CHECK_THROW(controller->submit(iota(5), Ordering::Unordered), ClosedControllerError);
    BOOST_CHECK_THROW(controller->map(iota(5)), ClosedControllerError);
    BOOST_CHECK_THROW(controller->imapUnordered(iota(5)), ClosedControllerError);
    BOOST_CHECK_EQUAL(controller->getStats().totalProcessed, 20u);

    // The destructor joins a terminated controller without blocking
    auto destroyed = std::async(std::launch::async, [c = std::move(controller)]() mutable {
        c.reset();
    });
    BOOST_REQUIRE(destroyed.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    BOOST_CHECK_NO_THROW(destroyed.get());
}

BOOST_AUTO_TEST_CASE(TestJoinWaitsForDispatchedBatches) {
    std::atomic<int> done{0};
    auto controller = sharedController(
        [&done](const int& x) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            done.fetch_add(1);
            return x;
        },
        2, fixedBatches(5));

    auto stream = controller->imapUnordered(iota(60));
    controller->close();
    controller->join();

    BOOST_CHECK_EQUAL(done.load(), 60);
    BOOST_CHECK_EQUAL(stream.collect().size(), 60u);
}

BOOST_AUTO_TEST_CASE(TestTerminateFailsPendingStream) {
    ControllerConfig config = fixedBatches(5);
    config.maxInFlightBatches = 100;

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    auto controller = sharedController(
        [gate](const int& x) {
            gate.wait();
            return x;
        },
        1, config);

    auto stream = controller->imap(iota(100));

    std::thread opener([&release]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        release.set_value();
    });
    controller->terminate();
    opener.join();

    BOOST_CHECK(controller->isClosed());
    BOOST_CHECK_THROW(stream.collect(), ClosedControllerError);
    BOOST_CHECK_THROW(controller->map(iota(3)), ClosedControllerError);
}

BOOST_AUTO_TEST_CASE(TestInvalidConfigRejected) {
    ControllerConfig config;
    config.minBatch = 5;
    config.maxBatch = 1;
    BOOST_CHECK_THROW(sharedController([](const int& x) { return x; }, 1, config),
                      ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ControllerFromDecision)

BOOST_AUTO_TEST_CASE(TestSerialDecisionRunsOnOneThread) {
    Decision decision;
    decision.workerCount = 1;
    decision.batchSize = 50;
    decision.backend = BackendKind::IsolatedWorker;

    auto controller = IntController::fromDecision(decision, [](const int& x) { return -x; });

    BOOST_CHECK(controller->backendKind() == BackendKind::SharedMemoryWorker);
    BOOST_CHECK_EQUAL(controller->workerCount(), 1u);
    BOOST_CHECK_EQUAL(controller->getStats().currentBatchSize, 50u);

    auto results = controller->map(iota(20));
    BOOST_CHECK_EQUAL(results[19], -19);
}

BOOST_AUTO_TEST_CASE(TestSharedDecisionUsesWorkerCount) {
    Decision decision;
    decision.workerCount = 3;
    decision.batchSize = 4;
    decision.backend = BackendKind::SharedMemoryWorker;

    auto controller = IntController::fromDecision(decision, [](const int& x) { return x; });
    BOOST_CHECK_EQUAL(controller->workerCount(), 3u);
    BOOST_CHECK_EQUAL(controller->getStats().currentBatchSize, 4u);
}

BOOST_AUTO_TEST_CASE(TestIsolatedBackendNeedsCodec) {
    Decision decision;
    decision.workerCount = 2;
    decision.batchSize = 4;
    decision.backend = BackendKind::IsolatedWorker;

    using OpaqueController = AdaptiveChunkController<Opaque, int>;
    BOOST_CHECK_THROW(
        OpaqueController::fromDecision(decision, [](const Opaque&) { return 0; }),
        TransferabilityError);
}

BOOST_AUTO_TEST_SUITE_END()
