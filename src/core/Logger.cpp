/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds use inline definitions
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <format>
#include <mutex>
#include <string>
#include <vector>

namespace Amortize {
namespace {

namespace fs = std::filesystem;

constexpr size_t LOG_FILES_KEPT = 5;
constexpr const char* LOG_PREFIX = "amortize_";

std::string localTime(std::chrono::system_clock::time_point when, const char* pattern) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm parts{};
    localtime_r(&seconds, &parts);
    char buffer[32];
    size_t length = std::strftime(buffer, sizeof(buffer), pattern, &parts);
    return std::string(buffer, length);
}

/**
 * Release-build sink for CRITICAL and ERROR lines.
 *
 * Each process that logs gets its own file, named after its start time and
 * pid. Isolated workers are fork()ed from a process that may already own a
 * sink: a child never touches the inherited FILE* or mutex and writes to
 * stderr instead.
 */
class ProcessLogSink {
public:
    static ProcessLogSink& Instance() {
        static ProcessLogSink instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        const pid_t self = ::getpid();
        if (self != m_ownerPid) {
            std::fprintf(stderr, "Amortize[%d] - [%s] %s: %s\n", static_cast<int>(self), system,
                         level, message);
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()).count() % 1000;
        std::string line = std::format("{}.{:03} [{}] [{}] {}\n",
                                       localTime(now, "%Y-%m-%d %H:%M:%S"), millis,
                                       level, system, message);

        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_openAttempted) {
            open(now);
        }
        std::FILE* target = m_file != nullptr ? m_file : stderr;
        std::fputs(line.c_str(), target);
        // Flush every line
        std::fflush(target);
    }

private:
    ProcessLogSink() : m_ownerPid(::getpid()) {}

    ~ProcessLogSink() {
        if (m_file != nullptr && ::getpid() == m_ownerPid) {
            std::fclose(m_file);
        }
    }

    ProcessLogSink(const ProcessLogSink&) = delete;
    ProcessLogSink& operator=(const ProcessLogSink&) = delete;

    // AMORTIZE_LOG_DIR wins over the per-user SDL preference directory
    static fs::path logDirectory() {
        if (const char* overrideDir = std::getenv("AMORTIZE_LOG_DIR")) {
            if (*overrideDir != '\0') {
                return fs::path(overrideDir);
            }
        }
        // AMORTIZE_APP_NAME is defined via CMake from ${PROJECT_NAME}
        char* prefPath = SDL_GetPrefPath("Amortize", AMORTIZE_APP_NAME);
        if (prefPath == nullptr) {
            return {};
        }
        fs::path dir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);
        return dir;
    }

    static void pruneOldLogs(const fs::path& dir, size_t keep) {
        struct Entry {
            fs::path path;
            fs::file_time_type written;
        };
        std::vector<Entry> logs;

        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            const std::string name = entry.path().filename().string();
            if (entry.path().extension() != ".log" || !name.starts_with(LOG_PREFIX)) {
                continue;
            }
            auto written = entry.last_write_time(ec);
            if (!ec) {
                logs.push_back({entry.path(), written});
            }
        }
        if (logs.size() <= keep) {
            return;
        }

        std::sort(logs.begin(), logs.end(),
                  [](const Entry& a, const Entry& b) { return a.written < b.written; });
        for (size_t i = 0; i + keep < logs.size(); ++i) {
            fs::remove(logs[i].path, ec);
        }
    }

    void open(std::chrono::system_clock::time_point now) {
        m_openAttempted = true;

        const fs::path dir = logDirectory();
        if (dir.empty()) {
            return;
        }
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return;
        }

        // Leave room for the file about to be created
        pruneOldLogs(dir, LOG_FILES_KEPT - 1);

        const fs::path file = dir / std::format("{}{}_{}.log", LOG_PREFIX,
                                                localTime(now, "%Y%m%d_%H%M%S"),
                                                static_cast<int>(m_ownerPid));
        m_file = std::fopen(file.c_str(), "a");
        if (m_file != nullptr) {
            std::fprintf(m_file, "=== %s log, pid %d, started %s ===\n", AMORTIZE_APP_NAME,
                         static_cast<int>(m_ownerPid),
                         localTime(now, "%Y-%m-%d %H:%M:%S").c_str());
        }
    }

    const pid_t m_ownerPid;
    std::mutex m_mutex;
    std::FILE* m_file{nullptr};
    bool m_openAttempted{false};
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    ProcessLogSink::Instance().write(level, system, message);
}

} // namespace Amortize

#endif // ifndef DEBUG
