/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESULT_STREAM_HPP
#define RESULT_STREAM_HPP

#include "core/Errors.hpp"
#include "core/WorkerBackend.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace Amortize {

enum class Ordering : uint8_t {
    Ordered,    // input order, early arrivals buffered
    Unordered   // completion order
};

/**
 * @brief Results of one submit() call, consumed item by item
 *
 * Backends deliver whole batches into the shared state; the consumer
 * unpacks them. A failed batch rethrows its exception from next() once,
 * then the stream continues with the following batch.
 */
template <typename R> class ResultStream {
public:
    struct State {
        explicit State(Ordering order) : ordering(order) {}

        void deliver(BatchOutcome<R>&& outcome) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (ordering == Ordering::Ordered) {
                    const size_t id = outcome.batchId;
                    arrived.emplace(id, std::move(outcome));
                } else {
                    completed.push_back(std::move(outcome));
                }
            }
            ready.notify_all();
        }

        void seal(size_t batches) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                totalBatches = batches;
                sealed = true;
            }
            ready.notify_all();
        }

        void abort() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                terminated = true;
            }
            ready.notify_all();
        }

        // Callers hold mutex
        bool hasBatch() const {
            return ordering == Ordering::Ordered ? arrived.contains(nextBatch)
                                                 : !completed.empty();
        }
        bool finished() const { return sealed && consumedBatches == totalBatches; }

        BatchOutcome<R> takeBatch() {
            BatchOutcome<R> outcome;
            if (ordering == Ordering::Ordered) {
                auto it = arrived.find(nextBatch);
                outcome = std::move(it->second);
                arrived.erase(it);
                ++nextBatch;
            } else {
                outcome = std::move(completed.front());
                completed.pop_front();
            }
            ++consumedBatches;
            return outcome;
        }

        const Ordering ordering;
        std::mutex mutex;
        std::condition_variable ready;
        std::map<size_t, BatchOutcome<R>> arrived;
        std::deque<BatchOutcome<R>> completed;
        size_t nextBatch{0};
        size_t consumedBatches{0};
        size_t totalBatches{0};
        bool sealed{false};
        bool terminated{false};
    };

    explicit ResultStream(std::shared_ptr<State> state) : m_state(std::move(state)) {}

    /**
     * @brief Next result, or nullopt once every batch is consumed
     *
     * @throws the batch's own exception when a batch failed
     * @throws ClosedControllerError if the controller was terminated first
     */
    std::optional<R> next() {
        while (true) {
            if (m_position < m_current.size()) {
                return std::move(m_current[m_position++]);
            }

            std::unique_lock<std::mutex> lock(m_state->mutex);
            m_state->ready.wait(lock, [this] {
                return m_state->hasBatch() || m_state->finished() || m_state->terminated;
            });

            if (m_state->hasBatch()) {
                BatchOutcome<R> outcome = m_state->takeBatch();
                lock.unlock();

                m_current = std::move(outcome.results);
                m_position = 0;
                if (outcome.error) {
                    std::rethrow_exception(outcome.error);
                }
                continue;
            }
            if (m_state->finished()) {
                return std::nullopt;
            }
            throw ClosedControllerError("stream terminated before all batches arrived");
        }
    }

    std::vector<R> collect() {
        std::vector<R> results;
        while (auto value = next()) {
            results.push_back(std::move(*value));
        }
        return results;
    }

private:
    std::shared_ptr<State> m_state;
    std::vector<R> m_current;
    size_t m_position{0};
};

} // namespace Amortize

#endif // RESULT_STREAM_HPP
