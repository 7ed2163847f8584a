/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORKLOAD_PROBE_HPP
#define WORKLOAD_PROBE_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <thread>

namespace Amortize {

/**
 * @brief Process-level measurements taken around a sampled call
 */
namespace WorkloadProbe {

// CPU seconds consumed by the whole process so far
double processCpuSeconds();

// Current number of threads in this process (0 if unknown)
size_t processThreadCount();

// Resident set size right now, in bytes (0 if unknown)
uint64_t currentResidentBytes();

/**
 * @brief Explicit thread limit from OMP_NUM_THREADS, MKL_NUM_THREADS,
 * OPENBLAS_NUM_THREADS, NUMEXPR_NUM_THREADS, VECLIB_MAXIMUM_THREADS or
 * NUMBA_NUM_THREADS, first positive value wins
 */
std::optional<size_t> threadLimitFromEnvironment();

/**
 * @brief Polls a process-wide reading while a call runs and keeps its peak
 *
 * The baseline is taken after the watcher thread itself started, so the
 * reported growth only counts what the observed call added.
 */
class PeakActivityMonitor {
public:
    using Reading = uint64_t (*)();

    PeakActivityMonitor(Reading reading, std::chrono::microseconds interval)
        : m_reading(reading), m_interval(interval) {}
    ~PeakActivityMonitor();

    PeakActivityMonitor(const PeakActivityMonitor&) = delete;
    PeakActivityMonitor& operator=(const PeakActivityMonitor&) = delete;

    void start();

    // Growth of the reading at its peak since start(); 0 if unreadable
    uint64_t stop();

private:
    void record(uint64_t current);

    Reading m_reading;
    std::chrono::microseconds m_interval;
    std::thread m_watcher;
    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_peak{0};
    uint64_t m_baseline{0};
};

// Extra threads started by the observed call
class ThreadActivityMonitor : public PeakActivityMonitor {
public:
    ThreadActivityMonitor();
};

// Resident memory the observed call touched on top of what was already mapped
class ResidentMemoryMonitor : public PeakActivityMonitor {
public:
    ResidentMemoryMonitor();
};

} // namespace WorkloadProbe

} // namespace Amortize

#endif // WORKLOAD_PROBE_HPP
