/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SystemProfiler.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#if defined(__linux__) || defined(__APPLE__)
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#endif

#if defined(__linux__)
#include <sched.h>
#endif

namespace Amortize {

namespace {

// cgroup v1 reports "no limit" as a page-aligned value near INT64_MAX
constexpr uint64_t CGROUP_UNLIMITED_THRESHOLD = uint64_t{1} << 60;

std::chrono::duration<double> toDuration(double seconds) {
    return std::chrono::duration<double>(seconds);
}

#if defined(__linux__) || defined(__APPLE__)
// Reap a child within the timeout; kills it on expiry
double waitForChild(pid_t pid, std::chrono::steady_clock::time_point start,
                    double timeoutSeconds) {
    int status = 0;
    while (true) {
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        }
        if (result < 0 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }

        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        if (elapsed > timeoutSeconds) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            throw MeasurementImplausible("worker launch timed out", elapsed);
        }
        std::this_thread::sleep_for(std::chrono::microseconds(20));
    }
}
#endif

std::optional<uint64_t> readUnsigned(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string token;
    file >> token;
    if (token.empty() || token == "max") {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(token));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// cgroup v2 cpu.max: "<quota> <period>" or "max <period>"
std::optional<size_t> readCpuQuota() {
    std::ifstream file("/sys/fs/cgroup/cpu.max");
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string quota;
    double period = 0.0;
    file >> quota >> period;
    if (quota.empty() || quota == "max" || period <= 0.0) {
        return std::nullopt;
    }
    try {
        double cores = std::ceil(std::stod(quota) / period);
        return static_cast<size_t>(std::max(1.0, cores));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

size_t countPhysicalCores() {
    std::ifstream cpuinfo("/proc/cpuinfo");
    if (!cpuinfo.is_open()) {
        return 0;
    }

    std::set<std::pair<int, int>> cores;
    int physicalId = 0;
    int coreId = -1;
    std::string line;
    auto valueOf = [](const std::string& text) {
        auto colon = text.find(':');
        return colon == std::string::npos ? std::string() : text.substr(colon + 1);
    };

    while (std::getline(cpuinfo, line)) {
        try {
            if (line.starts_with("physical id")) {
                physicalId = std::stoi(valueOf(line));
            } else if (line.starts_with("core id")) {
                coreId = std::stoi(valueOf(line));
            } else if (line.empty()) {
                if (coreId >= 0) {
                    cores.emplace(physicalId, coreId);
                }
                physicalId = 0;
                coreId = -1;
            }
        } catch (const std::exception&) {
            // Malformed field; treat this processor block as unknown
            coreId = -1;
        }
    }
    if (coreId >= 0) {
        cores.emplace(physicalId, coreId);
    }
    return cores.size();
}

} // anonymous namespace

void SystemProfiler::configure(double spawnCacheTtlSeconds, double memoryCacheTtlSeconds) {
    {
        std::lock_guard<std::mutex> lock(m_spawnMutex);
        m_spawnTtl = toDuration(spawnCacheTtlSeconds);
    }
    std::lock_guard<std::mutex> lock(m_memoryMutex);
    m_memoryTtl = toDuration(memoryCacheTtlSeconds);
}

void SystemProfiler::setStrategy(CreationStrategy strategy) {
    std::lock_guard<std::mutex> lock(m_spawnMutex);
    if (strategy != m_strategy) {
        m_strategy = strategy;
        m_spawnValid = false;
    }
}

CreationStrategy SystemProfiler::getStrategy() const {
    std::lock_guard<std::mutex> lock(m_spawnMutex);
    return m_strategy;
}

SpawnCostBounds SystemProfiler::boundsFor(CreationStrategy strategy) {
    switch (strategy) {
    case CreationStrategy::Fork:
        return {0.00005, 0.1, 0.005};
    case CreationStrategy::PosixSpawn:
        return {0.0005, 1.0, 0.05};
    case CreationStrategy::ThreadLaunch:
        return {0.000001, 0.01, 0.0001};
    }
    return {0.00005, 0.1, 0.005};
}

double SystemProfiler::validateSpawnCost(CreationStrategy strategy, double measuredSeconds) {
    const SpawnCostBounds bounds = boundsFor(strategy);
    if (!std::isfinite(measuredSeconds) || measuredSeconds < bounds.lowerSeconds ||
        measuredSeconds > bounds.upperSeconds) {
        throw MeasurementImplausible(
            std::format("{} spawn cost {:.6f}s outside [{}, {}]", toString(strategy),
                        measuredSeconds, bounds.lowerSeconds, bounds.upperSeconds),
            measuredSeconds);
    }
    return measuredSeconds;
}

double SystemProfiler::measureSpawnCost(double timeoutSeconds) {
    std::unique_lock<std::mutex> lock(m_spawnMutex);

    // Someone else is measuring: share their result
    m_spawnReady.wait(lock, [this] { return !m_spawnInFlight; });

    const auto now = Clock::now();
    if (m_spawnValid && now - m_spawnMeasuredAt < m_spawnTtl) {
        return m_spawnCost;
    }

    m_spawnInFlight = true;
    const CreationStrategy strategy = m_strategy;
    lock.unlock();

    bool measured = false;
    double cost = boundsFor(strategy).estimateSeconds;
    try {
        cost = validateSpawnCost(strategy, runSpawnMeasurement(strategy, timeoutSeconds));
        measured = true;
        PROFILER_DEBUG(std::format("Measured {} spawn cost: {:.6f}s", toString(strategy), cost));
    } catch (const MeasurementImplausible& e) {
        PROFILER_WARN(std::format("{}; using estimate {:.6f}s", e.what(), cost));
    } catch (const std::exception& e) {
        PROFILER_WARN(std::format("Spawn cost measurement failed ({}); using estimate {:.6f}s",
                                  e.what(), cost));
    } catch (...) {
        // Waiting callers must still be released
        PROFILER_WARN(std::format("Spawn cost measurement raised a non-standard exception; "
                                  "using estimate {:.6f}s", cost));
    }

    lock.lock();
    m_spawnCost = cost;
    m_spawnMeasured = measured;
    m_spawnMeasuredAt = Clock::now();
    m_spawnValid = true;
    m_spawnInFlight = false;
    lock.unlock();
    m_spawnReady.notify_all();
    return cost;
}

bool SystemProfiler::isSpawnCostMeasured() const {
    std::lock_guard<std::mutex> lock(m_spawnMutex);
    return m_spawnValid && m_spawnMeasured;
}

double SystemProfiler::runSpawnMeasurement(CreationStrategy strategy, double timeoutSeconds) {
    m_measurementCount.fetch_add(1, std::memory_order_relaxed);

    SpawnProbe probe;
    {
        std::lock_guard<std::mutex> lock(m_spawnMutex);
        probe = m_probe;
    }
    if (probe) {
        return probe(strategy);
    }

    switch (strategy) {
    case CreationStrategy::Fork:
        return timeFork(timeoutSeconds);
    case CreationStrategy::PosixSpawn:
        return timePosixSpawn(timeoutSeconds);
    case CreationStrategy::ThreadLaunch:
        return timeThreadLaunch();
    }
    return timeThreadLaunch();
}

double SystemProfiler::timeFork(double timeoutSeconds) {
#if defined(__linux__) || defined(__APPLE__)
    const auto start = Clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0) {
        _exit(0);
    }
    return waitForChild(pid, start, timeoutSeconds);
#else
    (void)timeoutSeconds;
    throw std::runtime_error("fork is not available on this platform");
#endif
}

double SystemProfiler::timePosixSpawn(double timeoutSeconds) {
#if defined(__linux__) || defined(__APPLE__)
    char program[] = "true";
    char* argv[] = {program, nullptr};

    const auto start = Clock::now();
    pid_t pid = 0;
    int rc = posix_spawnp(&pid, program, nullptr, nullptr, argv, environ);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "posix_spawnp");
    }
    return waitForChild(pid, start, timeoutSeconds);
#else
    (void)timeoutSeconds;
    throw std::runtime_error("posix_spawn is not available on this platform");
#endif
}

double SystemProfiler::timeThreadLaunch() {
    const auto start = Clock::now();
    std::thread worker([] {});
    worker.join();
    return std::chrono::duration<double>(Clock::now() - start).count();
}

uint64_t SystemProfiler::readHostAvailableMemory() {
    std::ifstream meminfo("/proc/meminfo");
    std::string line;
    while (meminfo.is_open() && std::getline(meminfo, line)) {
        if (line.starts_with("MemAvailable:")) {
            std::istringstream fields(line.substr(13));
            uint64_t kilobytes = 0;
            if (fields >> kilobytes) {
                return kilobytes * 1024;
            }
        }
    }

    // SDL reports total RAM in MiB
    int systemRamMiB = SDL_GetSystemRAM();
    if (systemRamMiB > 0) {
        return static_cast<uint64_t>(systemRamMiB) * 1024 * 1024;
    }
    return 0;
}

uint64_t SystemProfiler::readContainerMemoryLimit() {
    uint64_t limit = std::numeric_limits<uint64_t>::max();

    if (auto v2 = readUnsigned("/sys/fs/cgroup/memory.max")) {
        limit = std::min(limit, *v2);
    }
    if (auto v1 = readUnsigned("/sys/fs/cgroup/memory/memory.limit_in_bytes")) {
        if (*v1 < CGROUP_UNLIMITED_THRESHOLD) {
            limit = std::min(limit, *v1);
        }
    }
    return limit;
}

uint64_t SystemProfiler::detectMemory() {
    std::lock_guard<std::mutex> lock(m_memoryMutex);

    const auto now = Clock::now();
    if (m_memoryValid && now - m_memoryMeasuredAt < m_memoryTtl) {
        return m_availableMemory;
    }

    uint64_t host = readHostAvailableMemory();
    uint64_t container = readContainerMemoryLimit();
    uint64_t available = host == 0 ? container : std::min(host, container);
    if (available == std::numeric_limits<uint64_t>::max()) {
        available = 0;
    }

    if (available == 0) {
        PROFILER_WARN("Could not determine available memory; memory constraints disabled");
    } else if (container < host) {
        PROFILER_DEBUG(std::format("Container memory limit {} bytes below host available {}",
                                   container, host));
    }

    m_availableMemory = available;
    m_memoryMeasuredAt = now;
    m_memoryValid = true;
    return available;
}

void SystemProfiler::detectCores() {
    // Fast path
    if (m_coresValid.load(std::memory_order_acquire)) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_coresMutex);
    if (m_coresValid.load(std::memory_order_relaxed)) {
        return;
    }

    int sdlLogical = SDL_GetNumLogicalCPUCores();
    size_t logical = sdlLogical > 0 ? static_cast<size_t>(sdlLogical)
                                    : static_cast<size_t>(std::thread::hardware_concurrency());
    logical = std::max<size_t>(1, logical);

#if defined(__linux__)
    cpu_set_t affinity;
    CPU_ZERO(&affinity);
    if (sched_getaffinity(0, sizeof(affinity), &affinity) == 0) {
        int allowed = CPU_COUNT(&affinity);
        if (allowed > 0) {
            logical = std::min(logical, static_cast<size_t>(allowed));
        }
    }
#endif

    if (auto quota = readCpuQuota()) {
        logical = std::min(logical, *quota);
    }

    size_t physical = countPhysicalCores();
    if (physical == 0) {
        physical = logical;
    }
    physical = std::clamp<size_t>(physical, 1, logical);

    m_logicalCores = logical;
    m_physicalCores = physical;
    m_coresValid.store(true, std::memory_order_release);

    PROFILER_INFO(std::format("Detected {} physical / {} logical cores", physical, logical));
}

size_t SystemProfiler::physicalCores() {
    detectCores();
    return m_physicalCores;
}

size_t SystemProfiler::logicalCores() {
    detectCores();
    return m_logicalCores;
}

SystemProfile SystemProfiler::profile(double spawnTimeoutSeconds) {
    SystemProfile result;
    result.physicalCores = physicalCores();
    result.logicalCores = logicalCores();
    result.availableMemoryBytes = detectMemory();
    result.spawnCostSeconds = measureSpawnCost(spawnTimeoutSeconds);

    std::lock_guard<std::mutex> lock(m_spawnMutex);
    result.strategy = m_strategy;
    result.spawnCostMeasured = m_spawnMeasured;
    result.measuredAt = m_spawnMeasuredAt;
    return result;
}

void SystemProfiler::reset() {
    {
        std::unique_lock<std::mutex> lock(m_spawnMutex);
        m_spawnReady.wait(lock, [this] { return !m_spawnInFlight; });
        m_spawnValid = false;
        m_spawnMeasured = false;
        m_spawnCost = 0.0;
        m_measurementCount.store(0, std::memory_order_relaxed);
    }
    {
        std::lock_guard<std::mutex> lock(m_memoryMutex);
        m_memoryValid = false;
        m_availableMemory = 0;
    }
    std::lock_guard<std::mutex> lock(m_coresMutex);
    m_coresValid.store(false, std::memory_order_release);
}

void SystemProfiler::setSpawnProbe(SpawnProbe probe) {
    std::lock_guard<std::mutex> lock(m_spawnMutex);
    m_probe = std::move(probe);
    m_spawnValid = false;
}

} // namespace Amortize
