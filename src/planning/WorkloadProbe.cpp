/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "planning/WorkloadProbe.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <format>
#include <fstream>
#include <string>

#if defined(__linux__) || defined(__APPLE__)
#include <unistd.h>
#endif

namespace Amortize::WorkloadProbe {

double processCpuSeconds() {
#if defined(CLOCK_PROCESS_CPUTIME_ID)
    timespec ts{};
    if (clock_gettime(CLOCK_PROCESS_CPUTIME_ID, &ts) == 0) {
        return static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) * 1e-9;
    }
#endif
    return static_cast<double>(std::clock()) / CLOCKS_PER_SEC;
}

size_t processThreadCount() {
    std::ifstream status("/proc/self/status");
    std::string line;
    while (status.is_open() && std::getline(status, line)) {
        if (line.starts_with("Threads:")) {
            try {
                return static_cast<size_t>(std::stoul(line.substr(8)));
            } catch (const std::exception&) {
                return 0;
            }
        }
    }
    return 0;
}

uint64_t currentResidentBytes() {
#if defined(__linux__)
    // statm: size resident shared text lib data dt, in pages
    std::ifstream statm("/proc/self/statm");
    uint64_t sizePages = 0;
    uint64_t residentPages = 0;
    if (statm >> sizePages >> residentPages) {
        const long pageSize = sysconf(_SC_PAGESIZE);
        if (pageSize > 0) {
            return residentPages * static_cast<uint64_t>(pageSize);
        }
    }
#endif
    return 0;
}

std::optional<size_t> threadLimitFromEnvironment() {
    static constexpr const char* VARIABLES[] = {
        "OMP_NUM_THREADS",     "MKL_NUM_THREADS",        "OPENBLAS_NUM_THREADS",
        "NUMEXPR_NUM_THREADS", "VECLIB_MAXIMUM_THREADS", "NUMBA_NUM_THREADS"};

    for (const char* name : VARIABLES) {
        const char* value = std::getenv(name);
        if (value == nullptr) {
            continue;
        }
        char* end = nullptr;
        long threads = std::strtol(value, &end, 10);
        if (end != value && *end == '\0' && threads > 0) {
            SAMPLER_DEBUG(std::format("{}={} limits internal threads", name, threads));
            return static_cast<size_t>(threads);
        }
    }
    return std::nullopt;
}

PeakActivityMonitor::~PeakActivityMonitor() {
    if (m_watcher.joinable()) {
        m_running.store(false, std::memory_order_release);
        m_watcher.join();
    }
}

void PeakActivityMonitor::record(uint64_t current) {
    uint64_t peak = m_peak.load(std::memory_order_relaxed);
    while (current > peak &&
           !m_peak.compare_exchange_weak(peak, current, std::memory_order_relaxed)) {
    }
}

void PeakActivityMonitor::start() {
    if (m_running.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    m_peak.store(0, std::memory_order_relaxed);

    m_watcher = std::thread([this] {
        while (m_running.load(std::memory_order_acquire)) {
            record(m_reading());
            std::this_thread::sleep_for(m_interval);
        }
    });

    // Baseline includes the watcher
    m_baseline = m_reading();
}

uint64_t PeakActivityMonitor::stop() {
    if (!m_running.exchange(false, std::memory_order_acq_rel)) {
        return 0;
    }
    // What the call left behind counts even between polls
    record(m_reading());
    if (m_watcher.joinable()) {
        m_watcher.join();
    }
    const uint64_t peak = m_peak.load(std::memory_order_relaxed);
    if (m_baseline == 0 || peak <= m_baseline) {
        return 0;
    }
    return peak - m_baseline;
}

ThreadActivityMonitor::ThreadActivityMonitor()
    : PeakActivityMonitor([]() -> uint64_t { return processThreadCount(); },
                          std::chrono::milliseconds(1)) {}

ResidentMemoryMonitor::ResidentMemoryMonitor()
    : PeakActivityMonitor(&currentResidentBytes, std::chrono::microseconds(500)) {}

} // namespace Amortize::WorkloadProbe
