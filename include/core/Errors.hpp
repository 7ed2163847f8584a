/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Amortize {

/**
 * @brief Base class for every error the library raises
 */
class AmortizeError : public std::runtime_error {
public:
    explicit AmortizeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid construction parameters (bounds, rates, worker counts)
 *
 * Raised at construction time and never retried.
 */
class ConfigurationError : public AmortizeError {
public:
    explicit ConfigurationError(const std::string& message)
        : AmortizeError("Configuration error: " + message) {}
};

/**
 * @brief An item or result cannot cross the worker process boundary
 */
class TransferabilityError : public AmortizeError {
public:
    explicit TransferabilityError(const std::string& message)
        : AmortizeError("Not transferable: " + message) {}
};

/**
 * @brief Every sampled item raised during the dry run
 */
class SamplingFailure : public AmortizeError {
public:
    SamplingFailure(const std::string& message, size_t failedItems)
        : AmortizeError("Sampling failed: " + message), m_failedItems(failedItems) {}

    size_t failedItems() const { return m_failedItems; }

private:
    size_t m_failedItems;
};

/**
 * @brief Spawn-cost measurement outside its plausibility bounds
 *
 * Only used inside the profiler; callers always receive a fallback value.
 */
class MeasurementImplausible : public AmortizeError {
public:
    MeasurementImplausible(const std::string& message, double measuredSeconds)
        : AmortizeError("Implausible measurement: " + message),
          m_measuredSeconds(measuredSeconds) {}

    double measuredSeconds() const { return m_measuredSeconds; }

private:
    double m_measuredSeconds;
};

/**
 * @brief Operation on a controller after close() or terminate()
 */
class ClosedControllerError : public AmortizeError {
public:
    explicit ClosedControllerError(const std::string& message)
        : AmortizeError("Controller closed: " + message) {}
};

/**
 * @brief An isolated worker process died or broke the frame protocol
 */
class WorkerProcessError : public AmortizeError {
public:
    explicit WorkerProcessError(const std::string& message)
        : AmortizeError("Worker process failure: " + message) {}
};

} // namespace Amortize

#endif // ERRORS_HPP
