/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "planning/WorkloadSampler.hpp"
#include <algorithm>
#include <cmath>

namespace Amortize {

double WorkloadSampler::computeVariability(const std::vector<ItemTiming>& timings) {
    if (timings.size() < 2) {
        return 0.0;
    }

    // Welford's single pass mean/variance
    double mean = 0.0;
    double m2 = 0.0;
    size_t count = 0;
    for (const auto& timing : timings) {
        ++count;
        double delta = timing.wallTime - mean;
        mean += delta / static_cast<double>(count);
        m2 += delta * (timing.wallTime - mean);
    }

    if (mean <= 0.0) {
        return 0.0;
    }
    return std::sqrt(m2 / static_cast<double>(count)) / mean;
}

void WorkloadSampler::summarize(SampleResult& result) {
    double wallSum = 0.0;
    double busySum = 0.0;
    for (const auto& timing : result.timings) {
        wallSum += timing.wallTime;
        busySum += timing.busyTime;
    }

    result.meanWallTime = wallSum / static_cast<double>(result.timings.size());
    result.coefficientOfVariation = computeVariability(result.timings);
    // Process CPU time can exceed wall time when other threads run
    result.cpuRatio = wallSum > 0.0 ? std::min(1.0, busySum / wallSum) : 0.0;
    result.workloadClass = classify(result.cpuRatio);
}

} // namespace Amortize
