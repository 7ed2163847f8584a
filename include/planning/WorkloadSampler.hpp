/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORKLOAD_SAMPLER_HPP
#define WORKLOAD_SAMPLER_HPP

#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "planning/Dataset.hpp"
#include "planning/PlanningTypes.hpp"
#include "planning/WorkloadProbe.hpp"
#include "utils/BinarySerializer.hpp"
#include <algorithm>
#include <chrono>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace Amortize {

/**
 * @brief Dry run of the unit of work on a dataset prefix
 *
 * Runs the function serially on the first few items, timing each call in
 * wall and process CPU time, and checks that items and results can cross
 * the worker process boundary. Per-item exceptions are collected; only a
 * sample in which every item failed raises SamplingFailure.
 */
class WorkloadSampler {
public:
    static constexpr double COMPUTE_BOUND_RATIO = 0.7;
    static constexpr double WAIT_BOUND_RATIO = 0.3;

    static WorkloadClass classify(double cpuRatio) {
        if (cpuRatio >= COMPUTE_BOUND_RATIO) {
            return WorkloadClass::ComputeBound;
        }
        if (cpuRatio < WAIT_BOUND_RATIO) {
            return WorkloadClass::WaitBound;
        }
        return WorkloadClass::Mixed;
    }

    /**
     * @brief Population standard deviation over mean of the wall times
     *
     * 0 for fewer than two timings or a zero mean.
     */
    static double computeVariability(const std::vector<ItemTiming>& timings);

    /**
     * @brief Result of the transfer round trip for one item and result
     */
    struct TransferCheck {
        bool transferable{false};
        std::string reason;
        double seconds{0.0};
        size_t itemBytes{0};
        size_t resultBytes{0};
    };

    template <typename T, typename R>
    static TransferCheck checkTransferability(const T& item, const R& result) {
        TransferCheck check;
        if constexpr (!BinarySerial::IsTransferable<T>) {
            check.reason = "item type has no wire codec";
            return check;
        } else if constexpr (!BinarySerial::IsTransferable<R>) {
            check.reason = "result type has no wire codec";
            return check;
        } else {
            const auto start = std::chrono::steady_clock::now();
            bool itemOk = BinarySerial::roundTrip(item, check.itemBytes);
            bool resultOk = itemOk && BinarySerial::roundTrip(result, check.resultBytes);
            check.seconds =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

            if (!itemOk) {
                check.reason = "item failed to round-trip through the codec";
            } else if (!resultOk) {
                check.reason = "result failed to round-trip through the codec";
            } else {
                check.transferable = true;
            }
            return check;
        }
    }

    /**
     * @brief Sample the first sampleSize items of the dataset
     *
     * Single-pass datasets keep the consumed prefix in their replay buffer.
     *
     * @throws SamplingFailure if every sampled item threw
     */
    template <typename T, typename Fn>
    static SampleResult sample(Fn& fn, Dataset<T>& dataset, size_t sampleSize) {
        using R = std::decay_t<std::invoke_result_t<Fn&, const T&>>;
        static_assert(!std::is_void_v<R>, "unit of work must return a value");

        SampleResult result;
        const size_t available = dataset.buffer(sampleSize);
        if (available == 0) {
            return result;
        }

        double transferSeconds = 0.0;
        size_t itemBytes = 0;
        size_t resultBytes = 0;
        size_t transferChecks = 0;
        bool threadsObserved = false;
        size_t threadDelta = 0;
        uint64_t memoryGrowth = 0;

        for (size_t i = 0; i < available; ++i) {
            const T& item = dataset.at(i);

            // Resident memory is watched per call, thread activity on the
            // first item only; both watchers are inside the thread baseline
            WorkloadProbe::ResidentMemoryMonitor memoryMonitor;
            memoryMonitor.start();
            WorkloadProbe::ThreadActivityMonitor monitor;
            if (i == 0) {
                monitor.start();
            }

            const double cpuStart = WorkloadProbe::processCpuSeconds();
            const auto wallStart = std::chrono::steady_clock::now();

            std::optional<R> output;
            try {
                output.emplace(std::invoke(fn, item));
            } catch (const std::exception& e) {
                result.failures.push_back({i, e.what()});
            } catch (...) {
                result.failures.push_back({i, "non-standard exception"});
            }

            const double wall =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - wallStart).count();
            const double busy = WorkloadProbe::processCpuSeconds() - cpuStart;

            if (i == 0) {
                threadDelta = static_cast<size_t>(monitor.stop());
                threadsObserved = true;
            }
            memoryGrowth = std::max(memoryGrowth, memoryMonitor.stop());

            if (!output) {
                SAMPLER_WARN(std::format("Sample item {} failed: {}", i,
                                         result.failures.back().message));
                continue;
            }

            result.timings.push_back({i, wall, busy});

            if (result.transferable) {
                TransferCheck check = checkTransferability(item, *output);
                if (!check.transferable) {
                    result.transferable = false;
                    result.transferReason = check.reason;
                } else {
                    transferSeconds += check.seconds;
                    itemBytes += check.itemBytes;
                    resultBytes += check.resultBytes;
                    ++transferChecks;
                }
            }
        }

        if (result.timings.empty()) {
            throw SamplingFailure(
                std::format("all {} sampled items raised, first error: {}", available,
                            result.failures.front().message),
                result.failures.size());
        }

        result.peakMemoryGrowthBytes = memoryGrowth;

        if (transferChecks > 0) {
            result.transferSecondsPerItem = transferSeconds / static_cast<double>(transferChecks);
            result.itemPayloadBytes = itemBytes / transferChecks;
            result.resultPayloadBytes = resultBytes / transferChecks;
        }

        summarize(result);

        if (auto limit = WorkloadProbe::threadLimitFromEnvironment()) {
            result.internalThreads = *limit;
        } else if (threadsObserved && threadDelta > 0) {
            result.internalThreads = threadDelta + 1;
        } else {
            result.internalThreads = 1;
        }

        SAMPLER_DEBUG(std::format(
            "Sampled {} items ({} failed): mean {:.6f}s, CV {:.3f}, CPU ratio {:.2f} ({})",
            result.timings.size(), result.failures.size(), result.meanWallTime,
            result.coefficientOfVariation, result.cpuRatio, toString(result.workloadClass)));
        return result;
    }

private:
    // Fill mean, CV, CPU ratio and class from the timings
    static void summarize(SampleResult& result);
};

} // namespace Amortize

#endif // WORKLOAD_SAMPLER_HPP
