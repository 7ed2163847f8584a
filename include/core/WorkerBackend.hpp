/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORKER_BACKEND_HPP
#define WORKER_BACKEND_HPP

#include "core/ThreadPool.hpp"
#include "planning/PlanningTypes.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>

namespace Amortize {

/**
 * @brief Completed batch as reported by a backend
 */
template <typename R> struct BatchOutcome {
    size_t batchId{0};
    size_t itemCount{0};
    std::vector<R> results;
    std::exception_ptr error;  // set instead of results when the batch failed
    double seconds{0.0};       // execution time, queue wait excluded
};

/**
 * @brief Pool of real workers that runs whole batches
 *
 * Completions arrive on backend threads, in any order. A batch is never
 * split or resized once dispatched.
 */
template <typename T, typename R> class WorkerBackend {
public:
    using Completion = std::function<void(BatchOutcome<R>&&)>;

    virtual ~WorkerBackend() = default;

    /**
     * @brief Queue a batch; onComplete runs exactly once unless terminated
     * @throws std::logic_error after close() or terminate()
     */
    virtual void dispatch(size_t batchId, std::vector<T> items, Completion onComplete) = 0;

    // Stop accepting batches; queued batches still run
    virtual void close() = 0;

    // Wait for queued batches and release the workers
    virtual void join() = 0;

    // Drop queued batches and stop workers as fast as the backend allows
    virtual void terminate() = 0;

    virtual BackendKind kind() const = 0;
    virtual size_t workerCount() const = 0;
};

/**
 * @brief Worker threads sharing the caller's memory
 *
 * terminate() discards queued batches; batches already running finish
 * because threads cannot be interrupted safely.
 */
template <typename T, typename R> class SharedMemoryBackend : public WorkerBackend<T, R> {
public:
    using Function = std::function<R(const T&)>;
    using Completion = typename WorkerBackend<T, R>::Completion;

    SharedMemoryBackend(Function fn, size_t workers)
        : m_fn(std::move(fn)), m_pool(std::max<size_t>(1, workers), "Shared") {
        if (!m_fn) {
            throw std::invalid_argument("SharedMemoryBackend needs a callable");
        }
    }

    ~SharedMemoryBackend() override { m_pool.shutdown(true); }

    void dispatch(size_t batchId, std::vector<T> items, Completion onComplete) override {
        auto task = [this, batchId, items = std::move(items),
                     onComplete = std::move(onComplete)]() mutable {
            BatchOutcome<R> outcome;
            outcome.batchId = batchId;
            outcome.itemCount = items.size();

            const auto start = std::chrono::steady_clock::now();
            try {
                outcome.results.reserve(items.size());
                for (const auto& item : items) {
                    outcome.results.push_back(m_fn(item));
                }
            } catch (...) {
                // Carried to the consumer of this batch
                outcome.results.clear();
                outcome.error = std::current_exception();
            }
            outcome.seconds =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

            onComplete(std::move(outcome));
        };

        if (!m_pool.enqueue(std::move(task), std::format("batch {}", batchId))) {
            throw std::logic_error("dispatch on a closed shared-memory backend");
        }
    }

    void close() override { m_closed = true; }

    void join() override {
        m_closed = true;
        m_pool.shutdown(true);
    }

    void terminate() override {
        m_closed = true;
        m_pool.shutdown(false);
    }

    BackendKind kind() const override { return BackendKind::SharedMemoryWorker; }
    size_t workerCount() const override { return m_pool.threadCount(); }

private:
    Function m_fn;
    ThreadPool m_pool;
    std::atomic<bool> m_closed{false};
};

} // namespace Amortize

#endif // WORKER_BACKEND_HPP
