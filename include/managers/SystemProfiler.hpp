/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SYSTEM_PROFILER_HPP
#define SYSTEM_PROFILER_HPP

#include "planning/PlanningTypes.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace Amortize {

/**
 * @brief Plausibility window and fallback for one creation strategy
 */
struct SpawnCostBounds {
    double lowerSeconds;
    double upperSeconds;
    double estimateSeconds;
};

/**
 * @brief Process-wide cache of machine capacity
 *
 * Spawn cost, memory and core counts are measured lazily and cached with
 * independent lifetimes. Concurrent callers arriving while the spawn cost
 * is being measured wait for that one measurement instead of starting
 * their own.
 *
 * Usage:
 *   auto& profiler = SystemProfiler::Instance();
 *   SystemProfile profile = profiler.profile();
 */
class SystemProfiler {
public:
    /**
     * @brief Replaces the real spawn measurement (tests)
     *
     * Returns measured seconds for the given strategy; may throw.
     */
    using SpawnProbe = std::function<double(CreationStrategy)>;

    static SystemProfiler& Instance() {
        static SystemProfiler instance;
        return instance;
    }

    /**
     * @brief Set cache lifetimes in seconds
     */
    void configure(double spawnCacheTtlSeconds, double memoryCacheTtlSeconds);

    void setStrategy(CreationStrategy strategy);
    CreationStrategy getStrategy() const;

    static SpawnCostBounds boundsFor(CreationStrategy strategy);

    /**
     * @brief Check a measurement against the strategy bounds
     * @throws MeasurementImplausible when outside [lower, upper]
     */
    static double validateSpawnCost(CreationStrategy strategy, double measuredSeconds);

    /**
     * @brief Cost of creating and tearing down one worker
     *
     * Never throws: timeouts, failures and implausible results fall back to
     * the static estimate of the active strategy.
     */
    double measureSpawnCost(double timeoutSeconds = 2.0);

    // Whether the cached spawn cost came from a successful measurement
    bool isSpawnCostMeasured() const;

    /**
     * @brief Available memory in bytes, capped by the container limit
     */
    uint64_t detectMemory();

    size_t physicalCores();
    size_t logicalCores();

    /**
     * @brief Snapshot of everything above
     */
    SystemProfile profile(double spawnTimeoutSeconds = 2.0);

    /**
     * @brief Drop every cached value
     */
    void reset();

    void setSpawnProbe(SpawnProbe probe);

    // Number of real or probed spawn measurements since the last reset()
    size_t getMeasurementCount() const {
        return m_measurementCount.load(std::memory_order_relaxed);
    }

private:
    SystemProfiler() = default;
    ~SystemProfiler() = default;

    // Non-copyable
    SystemProfiler(const SystemProfiler&) = delete;
    SystemProfiler& operator=(const SystemProfiler&) = delete;

    double runSpawnMeasurement(CreationStrategy strategy, double timeoutSeconds);
    static double timeFork(double timeoutSeconds);
    static double timePosixSpawn(double timeoutSeconds);
    static double timeThreadLaunch();

    static uint64_t readHostAvailableMemory();
    static uint64_t readContainerMemoryLimit();
    void detectCores();

    using Clock = std::chrono::steady_clock;

    // Spawn cost cache
    mutable std::mutex m_spawnMutex;
    std::condition_variable m_spawnReady;
    bool m_spawnValid{false};
    bool m_spawnInFlight{false};
    bool m_spawnMeasured{false};
    double m_spawnCost{0.0};
    Clock::time_point m_spawnMeasuredAt{};
    CreationStrategy m_strategy{CreationStrategy::Fork};
    SpawnProbe m_probe;
    std::chrono::duration<double> m_spawnTtl{300.0};
    std::atomic<size_t> m_measurementCount{0};

    // Memory cache
    std::mutex m_memoryMutex;
    bool m_memoryValid{false};
    uint64_t m_availableMemory{0};
    Clock::time_point m_memoryMeasuredAt{};
    std::chrono::duration<double> m_memoryTtl{1.0};

    // Core counts (double-checked, computed once per reset)
    std::atomic<bool> m_coresValid{false};
    std::mutex m_coresMutex;
    size_t m_physicalCores{1};
    size_t m_logicalCores{1};
};

} // namespace Amortize

#endif // SYSTEM_PROFILER_HPP
