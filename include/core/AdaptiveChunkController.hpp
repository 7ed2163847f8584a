/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ADAPTIVE_CHUNK_CONTROLLER_HPP
#define ADAPTIVE_CHUNK_CONTROLLER_HPP

/**
 * @file AdaptiveChunkController.hpp
 * @brief Runs batches on a worker backend and retunes the batch size live
 *
 * The controller slices each submission into batches of the tuner's current
 * size, dispatches them under an in-flight limit and feeds every completed
 * batch duration back into the BatchTuner. Results go to the ResultStream
 * of the submission that produced them.
 *
 * Usage:
 * @code
 *   auto controller = AdaptiveChunkController<int, int>::fromDecision(decision, fn);
 *   std::vector<int> squares = controller->map(items);
 *   controller->close();
 *   controller->join();
 * @endcode
 */

#include "core/BatchTuner.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/IsolatedProcessBackend.hpp"
#include "core/Logger.hpp"
#include "core/ResultStream.hpp"
#include "core/WorkerBackend.hpp"
#include "planning/PlanningTypes.hpp"
#include "utils/BinarySerializer.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <vector>

namespace Amortize {

/**
 * @brief Build the backend a Decision names
 *
 * @throws TransferabilityError if isolated workers are requested for item
 *         or result types without a BinarySerial::Codec
 */
template <typename T, typename R>
std::unique_ptr<WorkerBackend<T, R>> makeWorkerBackend(BackendKind kind,
                                                       std::function<R(const T&)> fn,
                                                       size_t workers) {
    if (kind == BackendKind::IsolatedWorker) {
        if constexpr (BinarySerial::IsTransferable<T> && BinarySerial::IsTransferable<R>) {
            return std::make_unique<IsolatedProcessBackend<T, R>>(std::move(fn), workers);
        } else {
            throw TransferabilityError(
                "isolated workers need a wire codec for the item and result types");
        }
    }
    return std::make_unique<SharedMemoryBackend<T, R>>(std::move(fn), workers);
}

template <typename T, typename R> class AdaptiveChunkController {
public:
    using Function = std::function<R(const T&)>;

    /**
     * @throws ConfigurationError if the config does not validate
     */
    AdaptiveChunkController(std::unique_ptr<WorkerBackend<T, R>> backend,
                            ControllerConfig config)
        : m_backend(std::move(backend)), m_config(withBackendWorkers(config, *m_backend)),
          m_shared(std::make_shared<Shared>(m_config)) {
        CONTROLLER_INFO(std::format("{} {} workers, batch {}, in-flight limit {}",
                                    m_backend->workerCount(), toString(m_backend->kind()),
                                    m_shared->tuner.currentBatchSize(),
                                    m_config.effectiveInFlightLimit()));
    }

    ~AdaptiveChunkController() { join(); }

    AdaptiveChunkController(const AdaptiveChunkController&) = delete;
    AdaptiveChunkController& operator=(const AdaptiveChunkController&) = delete;

    /**
     * @brief Controller seeded with a planner decision
     *
     * A serial decision runs on one shared-memory worker so no process is
     * forked for it.
     */
    static std::unique_ptr<AdaptiveChunkController> fromDecision(const Decision& decision,
                                                                 Function fn,
                                                                 ControllerConfig config = {}) {
        config.workerCount = std::max<size_t>(1, decision.workerCount);
        config.initialBatchSize = std::max<size_t>(1, decision.batchSize);

        const BackendKind kind =
            decision.isParallel() ? decision.backend : BackendKind::SharedMemoryWorker;
        return std::make_unique<AdaptiveChunkController>(
            makeWorkerBackend<T, R>(kind, std::move(fn), config.workerCount), config);
    }

    /**
     * @brief Slice, dispatch and return the stream of results
     *
     * Inputs of at most twice the current batch size go straight to the
     * backend without duration tracking. Blocks while the in-flight limit is
     * reached.
     * @throws ClosedControllerError after close() or terminate()
     */
    ResultStream<R> submit(std::vector<T> items, Ordering ordering) {
        if (m_closed) {
            throw ClosedControllerError("submit after close");
        }

        auto stream = std::make_shared<typename ResultStream<R>::State>(ordering);
        registerStream(stream);

        const size_t total = items.size();
        const size_t startSize = m_shared->tuner.currentBatchSize();
        const bool tracked = total > startSize && total - startSize > startSize;

        size_t offset = 0;
        size_t batchIndex = 0;
        while (offset < total) {
            const size_t size =
                std::min(tracked ? m_shared->tuner.currentBatchSize() : startSize, total - offset);
            std::vector<T> slice(std::make_move_iterator(items.begin() + offset),
                                 std::make_move_iterator(items.begin() + offset + size));

            m_shared->acquireSlot(m_config.effectiveInFlightLimit());
            try {
                m_backend->dispatch(batchIndex, std::move(slice),
                                    makeCompletion(stream, tracked));
            } catch (const std::logic_error&) {
                m_shared->releaseSlot();
                throw ClosedControllerError("backend stopped during submit");
            }

            offset += size;
            ++batchIndex;
        }
        stream->seal(batchIndex);

        if (!tracked && total > 0) {
            CONTROLLER_DEBUG(std::format("{} items bypassed adaptation", total));
        }
        return ResultStream<R>(stream);
    }

    // Ordered and blocking
    std::vector<R> map(std::vector<T> items) {
        return submit(std::move(items), Ordering::Ordered).collect();
    }

    ResultStream<R> imap(std::vector<T> items) {
        return submit(std::move(items), Ordering::Ordered);
    }

    ResultStream<R> imapUnordered(std::vector<T> items) {
        return submit(std::move(items), Ordering::Unordered);
    }

    // No further submissions; batches already dispatched still run
    void close() {
        m_closed = true;
        m_backend->close();
    }

    // Waits for every dispatched batch, then releases the workers
    void join() {
        close();
        if (m_joined.exchange(true)) {
            return;
        }
        m_shared->waitForDrain();
        m_backend->join();

        const auto stats = m_shared->tuner.getStats();
        CONTROLLER_INFO(std::format("Joined: {} items, {} adaptations, final batch {}",
                                    stats.totalProcessed, stats.adaptationCount,
                                    stats.currentBatchSize));
    }

    /**
     * @brief Irreversible stop; pending streams raise ClosedControllerError
     */
    void terminate() {
        m_closed = true;
        m_shared->markTerminated();
        m_backend->terminate();

        std::lock_guard<std::mutex> lock(m_streamsMutex);
        for (auto& weak : m_streams) {
            if (auto stream = weak.lock()) {
                stream->abort();
            }
        }
        m_streams.clear();
        CONTROLLER_WARN("Terminated");
    }

    bool isClosed() const { return m_closed; }

    BatchTunerStats getStats() const { return m_shared->tuner.getStats(); }

    size_t workerCount() const { return m_backend->workerCount(); }
    BackendKind backendKind() const { return m_backend->kind(); }

private:
    // Outlives the controller while completions are still running
    struct Shared {
        explicit Shared(const ControllerConfig& config) : tuner(config) {}

        void acquireSlot(size_t limit) {
            std::unique_lock<std::mutex> lock(mutex);
            slotFreed.wait(lock, [&] { return inFlight < limit || terminated; });
            if (terminated) {
                throw ClosedControllerError("terminated while waiting to dispatch");
            }
            ++inFlight;
        }

        void releaseSlot() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                --inFlight;
            }
            slotFreed.notify_all();
        }

        void waitForDrain() {
            std::unique_lock<std::mutex> lock(mutex);
            slotFreed.wait(lock, [this] { return inFlight == 0 || terminated; });
        }

        void markTerminated() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                terminated = true;
            }
            slotFreed.notify_all();
        }

        BatchTuner tuner;
        std::mutex mutex;
        std::condition_variable slotFreed;
        size_t inFlight{0};
        bool terminated{false};
    };

    static ControllerConfig withBackendWorkers(ControllerConfig config,
                                               const WorkerBackend<T, R>& backend) {
        config.workerCount = backend.workerCount();
        return config;
    }

    typename WorkerBackend<T, R>::Completion
    makeCompletion(std::shared_ptr<typename ResultStream<R>::State> stream, bool tracked) {
        return [shared = m_shared, stream = std::move(stream),
                tracked](BatchOutcome<R>&& outcome) {
            if (!outcome.error) {
                if (tracked) {
                    if (shared->tuner.observe(outcome.seconds, outcome.itemCount)) {
                        CONTROLLER_DEBUG(std::format("Batch size now {}",
                                                     shared->tuner.currentBatchSize()));
                    }
                } else {
                    shared->tuner.countUntracked(outcome.itemCount);
                }
            }
            stream->deliver(std::move(outcome));
            shared->releaseSlot();
        };
    }

    void registerStream(const std::shared_ptr<typename ResultStream<R>::State>& stream) {
        std::lock_guard<std::mutex> lock(m_streamsMutex);
        std::erase_if(m_streams, [](const auto& weak) { return weak.expired(); });
        m_streams.push_back(stream);
    }

    std::unique_ptr<WorkerBackend<T, R>> m_backend;
    ControllerConfig m_config;
    std::shared_ptr<Shared> m_shared;

    std::mutex m_streamsMutex;
    std::vector<std::weak_ptr<typename ResultStream<R>::State>> m_streams;

    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_joined{false};
};

} // namespace Amortize

#endif // ADAPTIVE_CHUNK_CONTROLLER_HPP
