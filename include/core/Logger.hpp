/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Amortize {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Amortize - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define AMORTIZE_CRITICAL(system, msg)                                         \
  Amortize::Logger::Log(Amortize::LogLevel::CRITICAL, system, msg)
#define AMORTIZE_ERROR(system, msg)                                            \
  Amortize::Logger::Log(Amortize::LogLevel::ERROR_LEVEL, system, msg)
#define AMORTIZE_WARN(system, msg)                                             \
  Amortize::Logger::Log(Amortize::LogLevel::WARNING, system, msg)
#define AMORTIZE_INFO(system, msg)                                             \
  Amortize::Logger::Log(Amortize::LogLevel::INFO, system, msg)
#define AMORTIZE_DEBUG(system, msg)                                            \
  Amortize::Logger::Log(Amortize::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL/ERROR go to a log file (see Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define AMORTIZE_CRITICAL(system, msg)                                         \
  Amortize::Logger::Log("CRITICAL", system, msg)

#define AMORTIZE_ERROR(system, msg)                                            \
  Amortize::Logger::Log("ERROR", system, msg)

#define AMORTIZE_WARN(system, msg) ((void)0)  // Zero overhead
#define AMORTIZE_INFO(system, msg) ((void)0)  // Zero overhead
#define AMORTIZE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

// Planning
#define PROFILER_CRITICAL(msg) AMORTIZE_CRITICAL("SystemProfiler", msg)
#define PROFILER_ERROR(msg) AMORTIZE_ERROR("SystemProfiler", msg)
#define PROFILER_WARN(msg) AMORTIZE_WARN("SystemProfiler", msg)
#define PROFILER_INFO(msg) AMORTIZE_INFO("SystemProfiler", msg)
#define PROFILER_DEBUG(msg) AMORTIZE_DEBUG("SystemProfiler", msg)

#define SAMPLER_CRITICAL(msg) AMORTIZE_CRITICAL("WorkloadSampler", msg)
#define SAMPLER_ERROR(msg) AMORTIZE_ERROR("WorkloadSampler", msg)
#define SAMPLER_WARN(msg) AMORTIZE_WARN("WorkloadSampler", msg)
#define SAMPLER_INFO(msg) AMORTIZE_INFO("WorkloadSampler", msg)
#define SAMPLER_DEBUG(msg) AMORTIZE_DEBUG("WorkloadSampler", msg)

#define COSTMODEL_ERROR(msg) AMORTIZE_ERROR("CostModel", msg)
#define COSTMODEL_WARN(msg) AMORTIZE_WARN("CostModel", msg)
#define COSTMODEL_DEBUG(msg) AMORTIZE_DEBUG("CostModel", msg)

#define PLANNER_CRITICAL(msg) AMORTIZE_CRITICAL("Planner", msg)
#define PLANNER_ERROR(msg) AMORTIZE_ERROR("Planner", msg)
#define PLANNER_WARN(msg) AMORTIZE_WARN("Planner", msg)
#define PLANNER_INFO(msg) AMORTIZE_INFO("Planner", msg)
#define PLANNER_DEBUG(msg) AMORTIZE_DEBUG("Planner", msg)

// Execution
#define CONTROLLER_CRITICAL(msg) AMORTIZE_CRITICAL("ChunkController", msg)
#define CONTROLLER_ERROR(msg) AMORTIZE_ERROR("ChunkController", msg)
#define CONTROLLER_WARN(msg) AMORTIZE_WARN("ChunkController", msg)
#define CONTROLLER_INFO(msg) AMORTIZE_INFO("ChunkController", msg)
#define CONTROLLER_DEBUG(msg) AMORTIZE_DEBUG("ChunkController", msg)

#define THREADPOOL_CRITICAL(msg) AMORTIZE_CRITICAL("ThreadPool", msg)
#define THREADPOOL_ERROR(msg) AMORTIZE_ERROR("ThreadPool", msg)
#define THREADPOOL_WARN(msg) AMORTIZE_WARN("ThreadPool", msg)
#define THREADPOOL_INFO(msg) AMORTIZE_INFO("ThreadPool", msg)
#define THREADPOOL_DEBUG(msg) AMORTIZE_DEBUG("ThreadPool", msg)

#define WORKER_CRITICAL(msg) AMORTIZE_CRITICAL("WorkerProcess", msg)
#define WORKER_ERROR(msg) AMORTIZE_ERROR("WorkerProcess", msg)
#define WORKER_WARN(msg) AMORTIZE_WARN("WorkerProcess", msg)
#define WORKER_INFO(msg) AMORTIZE_INFO("WorkerProcess", msg)
#define WORKER_DEBUG(msg) AMORTIZE_DEBUG("WorkerProcess", msg)

// Support
#define CONFIG_ERROR(msg) AMORTIZE_ERROR("Config", msg)
#define CONFIG_WARN(msg) AMORTIZE_WARN("Config", msg)
#define CONFIG_INFO(msg) AMORTIZE_INFO("Config", msg)

#define CACHE_ERROR(msg) AMORTIZE_ERROR("ResultCache", msg)
#define CACHE_WARN(msg) AMORTIZE_WARN("ResultCache", msg)
#define CACHE_DEBUG(msg) AMORTIZE_DEBUG("ResultCache", msg)

#define SERIAL_ERROR(msg) AMORTIZE_ERROR("BinarySerializer", msg)
#define SERIAL_DEBUG(msg) AMORTIZE_DEBUG("BinarySerializer", msg)

// Benchmark mode convenience macros
#define AMORTIZE_ENABLE_BENCHMARK_MODE()                                       \
  Amortize::Logger::SetBenchmarkMode(true)
#define AMORTIZE_DISABLE_BENCHMARK_MODE()                                      \
  Amortize::Logger::SetBenchmarkMode(false)

} // namespace Amortize

#endif // LOGGER_HPP
