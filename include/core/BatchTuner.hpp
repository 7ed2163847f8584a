/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BATCH_TUNER_HPP
#define BATCH_TUNER_HPP

#include "core/Config.hpp"
#include <boost/circular_buffer.hpp>
#include <cstddef>
#include <mutex>
#include <optional>

namespace Amortize {

/**
 * @brief Consistent snapshot of the tuner state
 */
struct BatchTunerStats {
    size_t currentBatchSize{0};
    size_t totalProcessed{0};
    size_t adaptationCount{0};
    double averageBatchDuration{0.0};  // seconds, over the current window
    size_t windowDepth{0};
    size_t windowCapacity{0};
    bool enabled{false};
};

/**
 * @brief Observe -> evaluate -> adjust state machine for the batch size
 *
 * Completed batch durations go into a fixed-capacity sliding window. Once
 * the window holds enough samples and its average drifts from the target
 * beyond the tolerance, the batch size moves part of the way toward the
 * size that would have hit the target:
 *
 *   newSize = size * (1 + rate * (target / average - 1))
 *
 * rounded and clipped to [minBatch, maxBatch]. A committed change restarts
 * the window so the next decision only sees batches of the new size.
 *
 * Thread Safety:
 * - One mutex guards all state; it covers only the O(1) update and reads
 * - Completion callbacks from several workers may call observe() concurrently
 */
class BatchTuner {
public:
    /**
     * @throws ConfigurationError if the config does not validate
     */
    explicit BatchTuner(const ControllerConfig& config);

    /**
     * @brief Record one completed batch
     *
     * @param durationSeconds Wall-clock time of the batch
     * @param itemsProcessed Items in the batch
     * @return true if the batch size changed
     */
    bool observe(double durationSeconds, size_t itemsProcessed);

    /**
     * @brief Count items that ran without adaptation tracking
     */
    void countUntracked(size_t itemsProcessed);

    size_t currentBatchSize() const;
    void setEnabled(bool enabled);
    BatchTunerStats getStats() const;

private:
    struct Adjustment {
        size_t from;
        size_t to;
        double windowAverage;
    };

    // Caller holds m_mutex
    double windowAverage() const;
    std::optional<Adjustment> evaluate();

    mutable std::mutex m_mutex;
    boost::circular_buffer<double> m_window;
    double m_windowSum{0.0};
    double m_lastAverage{0.0};

    size_t m_currentBatchSize;
    size_t m_totalProcessed{0};
    size_t m_adaptationCount{0};
    bool m_enabled;

    const size_t m_minBatch;
    const size_t m_maxBatch;
    const double m_adaptationRate;
    const double m_targetDuration;
    const double m_tolerance;
    const size_t m_minSamples;
};

} // namespace Amortize

#endif // BATCH_TUNER_HPP
