/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/BatchTuner.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace Amortize {

namespace {

const ControllerConfig& validated(const ControllerConfig& config) {
    config.validate();
    return config;
}

} // anonymous namespace

BatchTuner::BatchTuner(const ControllerConfig& config)
    : m_window(validated(config).windowCapacity),
      m_currentBatchSize(std::clamp(config.initialBatchSize, config.minBatch, config.maxBatch)),
      m_enabled(config.enabled),
      m_minBatch(config.minBatch),
      m_maxBatch(config.maxBatch),
      m_adaptationRate(config.adaptationRate),
      m_targetDuration(config.targetChunkDuration),
      m_tolerance(config.deviationTolerance),
      m_minSamples(config.minSamplesBeforeAdapting) {
    if (m_currentBatchSize != config.initialBatchSize) {
        CONTROLLER_WARN(std::format("Initial batch size {} clipped to {}",
                                    config.initialBatchSize, m_currentBatchSize));
    }
}

bool BatchTuner::observe(double durationSeconds, size_t itemsProcessed) {
    const bool valid = std::isfinite(durationSeconds) && durationSeconds >= 0.0;
    std::optional<Adjustment> adjustment;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_totalProcessed += itemsProcessed;

        if (valid) {
            // Oldest entry falls out of a full window
            if (m_window.full()) {
                m_windowSum -= m_window.front();
            }
            m_window.push_back(durationSeconds);
            m_windowSum += durationSeconds;
            m_lastAverage = windowAverage();

            if (m_enabled && m_window.size() >= m_minSamples) {
                adjustment = evaluate();
            }
        }
    }

    // Log outside the lock; completions on other workers wait on m_mutex
    if (!valid) {
        CONTROLLER_WARN(std::format("Ignoring invalid batch duration {}", durationSeconds));
        return false;
    }
    if (!adjustment) {
        return false;
    }
    CONTROLLER_DEBUG(std::format("Batch size {} -> {} (window avg {:.4f}s, target {:.4f}s)",
                                 adjustment->from, adjustment->to, adjustment->windowAverage,
                                 m_targetDuration));
    return true;
}

std::optional<BatchTuner::Adjustment> BatchTuner::evaluate() {
    const double average = windowAverage();
    if (average <= 0.0) {
        return std::nullopt;
    }

    const double deviation = average / m_targetDuration - 1.0;
    if (std::abs(deviation) <= m_tolerance) {
        return std::nullopt;
    }

    const double factor = 1.0 + m_adaptationRate * (m_targetDuration / average - 1.0);
    const double proposed = std::max(1.0, std::round(static_cast<double>(m_currentBatchSize) * factor));

    // Clip in floating point first so huge proposals cannot overflow size_t
    size_t newSize = m_maxBatch;
    if (proposed < static_cast<double>(m_maxBatch)) {
        newSize = static_cast<size_t>(proposed);
    }
    newSize = std::clamp(newSize, m_minBatch, m_maxBatch);

    if (newSize == m_currentBatchSize) {
        return std::nullopt;
    }

    const Adjustment adjustment{m_currentBatchSize, newSize, average};
    m_currentBatchSize = newSize;
    ++m_adaptationCount;

    // Restart observation so stale durations do not drive the next decision
    m_window.clear();
    m_windowSum = 0.0;
    return adjustment;
}

void BatchTuner::countUntracked(size_t itemsProcessed) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_totalProcessed += itemsProcessed;
}

size_t BatchTuner::currentBatchSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currentBatchSize;
}

void BatchTuner::setEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_enabled = enabled;
}

BatchTunerStats BatchTuner::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    BatchTunerStats stats;
    stats.currentBatchSize = m_currentBatchSize;
    stats.totalProcessed = m_totalProcessed;
    stats.adaptationCount = m_adaptationCount;
    stats.averageBatchDuration = m_window.empty() ? m_lastAverage : windowAverage();
    stats.windowDepth = m_window.size();
    stats.windowCapacity = m_window.capacity();
    stats.enabled = m_enabled;
    return stats;
}

double BatchTuner::windowAverage() const {
    if (m_window.empty()) {
        return 0.0;
    }
    return m_windowSum / static_cast<double>(m_window.size());
}

} // namespace Amortize
