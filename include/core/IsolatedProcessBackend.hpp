/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ISOLATED_PROCESS_BACKEND_HPP
#define ISOLATED_PROCESS_BACKEND_HPP

#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/ProcessChannel.hpp"
#include "core/ThreadPool.hpp"
#include "core/WorkerBackend.hpp"
#include "utils/BinarySerializer.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace Amortize {

/**
 * @brief Forked worker processes with private memory
 *
 * Each worker owns one socket pair. A batch travels as one encoded frame
 * and its results come back as one frame; a dispatcher thread per worker
 * does the blocking I/O. The callable is inherited through fork, so it
 * needs no encoding; items and results do.
 */
template <typename T, typename R> class IsolatedProcessBackend : public WorkerBackend<T, R> {
    static_assert(BinarySerial::IsTransferable<T> && BinarySerial::IsTransferable<R>,
                  "Isolated workers need a BinarySerial::Codec for items and results");

public:
    using Function = std::function<R(const T&)>;
    using Completion = typename WorkerBackend<T, R>::Completion;

    IsolatedProcessBackend(Function fn, size_t workers) : m_fn(std::move(fn)) {
        if (!m_fn) {
            throw std::invalid_argument("IsolatedProcessBackend needs a callable");
        }
        workers = std::max<size_t>(1, workers);

        // Children first: the dispatcher threads must not exist at fork time
        try {
            for (size_t i = 0; i < workers; ++i) {
                m_children.push_back(
                    ProcessChannel::spawnWorker([this](int fd) { return childLoop(fd); }));
                m_free.push_back(i);
            }
        } catch (const WorkerProcessError&) {
            for (auto& child : m_children) {
                ProcessChannel::reap(child, true);
                ProcessChannel::closeChannel(child);
            }
            throw;
        }

        m_live = m_children.size();
        m_dispatcher = std::make_unique<ThreadPool>(m_children.size(), "Isolated");
        WORKER_INFO(std::format("Started {} worker processes", m_children.size()));
    }

    ~IsolatedProcessBackend() override { join(); }

    IsolatedProcessBackend(const IsolatedProcessBackend&) = delete;
    IsolatedProcessBackend& operator=(const IsolatedProcessBackend&) = delete;

    void dispatch(size_t batchId, std::vector<T> items, Completion onComplete) override {
        if (m_closed) {
            throw std::logic_error("dispatch on a closed isolated backend");
        }

        auto task = [this, batchId, items = std::move(items),
                     onComplete = std::move(onComplete)]() mutable {
            BatchOutcome<R> outcome;
            outcome.batchId = batchId;
            outcome.itemCount = items.size();
            try {
                outcome.results = runOnWorker(items, outcome.seconds);
            } catch (...) {
                // Carried to the consumer of this batch
                outcome.results.clear();
                outcome.error = std::current_exception();
            }
            onComplete(std::move(outcome));
        };

        if (!m_dispatcher->enqueue(std::move(task), std::format("batch {}", batchId))) {
            throw std::logic_error("dispatch on a closed isolated backend");
        }
    }

    void close() override { m_closed = true; }

    void join() override {
        m_closed = true;
        if (m_stopped.exchange(true)) {
            return;
        }
        m_dispatcher->shutdown(true);
        for (auto& child : m_children) {
            // EOF on the channel ends the child's loop
            ProcessChannel::closeChannel(child);
            ProcessChannel::reap(child, false);
        }
        WORKER_DEBUG("Worker processes joined");
    }

    void terminate() override {
        m_closed = true;
        if (m_stopped.exchange(true)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_slotMutex);
            m_terminated = true;
        }
        m_slotCondition.notify_all();

        // Killing first turns blocked reads in the dispatchers into EOF
        for (auto& child : m_children) {
            ProcessChannel::reap(child, true);
        }
        m_dispatcher->shutdown(false);
        for (auto& child : m_children) {
            ProcessChannel::closeChannel(child);
        }
        WORKER_WARN("Worker processes terminated");
    }

    BackendKind kind() const override { return BackendKind::IsolatedWorker; }
    size_t workerCount() const override { return m_children.size(); }

    size_t liveWorkers() const {
        std::lock_guard<std::mutex> lock(m_slotMutex);
        return m_live;
    }

private:
    // Runs in the child process until the parent closes the channel
    int childLoop(int fd) {
        ProcessChannel::FrameStatus status;
        std::string request;
        while (ProcessChannel::readFrame(fd, status, request)) {
            std::vector<T> items;
            std::string reply;
            ProcessChannel::FrameStatus replyStatus = ProcessChannel::FrameStatus::Ok;

            if (!BinarySerial::decodeBatch(request, items)) {
                replyStatus = ProcessChannel::FrameStatus::Undecodable;
                reply = "batch payload could not be decoded";
            } else {
                try {
                    std::vector<R> results;
                    results.reserve(items.size());
                    for (const auto& item : items) {
                        results.push_back(m_fn(item));
                    }
                    if (!BinarySerial::encodeBatch(results, reply)) {
                        replyStatus = ProcessChannel::FrameStatus::Undecodable;
                        reply = "results could not be encoded";
                    }
                } catch (const std::exception& e) {
                    replyStatus = ProcessChannel::FrameStatus::TaskFailed;
                    reply = e.what();
                } catch (...) {
                    replyStatus = ProcessChannel::FrameStatus::TaskFailed;
                    reply = "non-standard exception";
                }
            }

            if (!ProcessChannel::writeFrame(fd, replyStatus, reply)) {
                return 1;
            }
        }
        return 0;
    }

    std::vector<R> runOnWorker(const std::vector<T>& items, double& seconds) {
        std::string request;
        if (!BinarySerial::encodeBatch(items, request)) {
            throw TransferabilityError("batch could not be encoded");
        }

        const size_t slot = acquireSlot();
        ProcessChannel::ChildProcess& child = m_children[slot];

        const auto start = std::chrono::steady_clock::now();
        ProcessChannel::FrameStatus status = ProcessChannel::FrameStatus::Ok;
        std::string reply;
        const bool delivered =
            ProcessChannel::writeFrame(child.fd, ProcessChannel::FrameStatus::Ok, request) &&
            ProcessChannel::readFrame(child.fd, status, reply);
        seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        if (!delivered) {
            const pid_t pid = child.pid;
            if (retireSlot(slot)) {
                throw ClosedControllerError(std::format("batch cancelled, worker {} killed", pid));
            }
            throw WorkerProcessError(std::format("worker process {} stopped responding", pid));
        }
        releaseSlot(slot);

        if (status == ProcessChannel::FrameStatus::TaskFailed) {
            throw AmortizeError(std::format("Batch raised in worker process: {}", reply));
        }
        if (status != ProcessChannel::FrameStatus::Ok) {
            throw TransferabilityError(reply);
        }

        std::vector<R> results;
        if (!BinarySerial::decodeBatch(reply, results) || results.size() != items.size()) {
            throw TransferabilityError("worker results could not be decoded");
        }
        return results;
    }

    size_t acquireSlot() {
        std::unique_lock<std::mutex> lock(m_slotMutex);
        m_slotCondition.wait(lock, [this] {
            return !m_free.empty() || m_live == 0 || m_terminated;
        });
        if (m_terminated) {
            throw ClosedControllerError("batch cancelled by terminate");
        }
        if (m_free.empty()) {
            throw WorkerProcessError("no live worker processes");
        }
        size_t slot = m_free.back();
        m_free.pop_back();
        return slot;
    }

    void releaseSlot(size_t slot) {
        {
            std::lock_guard<std::mutex> lock(m_slotMutex);
            m_free.push_back(slot);
        }
        m_slotCondition.notify_one();
    }

    // Returns true when the loss was caused by terminate()
    bool retireSlot(size_t slot) {
        bool terminated = false;
        {
            std::lock_guard<std::mutex> lock(m_slotMutex);
            --m_live;
            terminated = m_terminated;
            if (!terminated) {
                WORKER_ERROR(std::format("Worker process {} lost, {} remain",
                                         m_children[slot].pid, m_live));
            }
        }
        m_slotCondition.notify_all();
        return terminated;
    }

    Function m_fn;
    std::vector<ProcessChannel::ChildProcess> m_children;
    std::unique_ptr<ThreadPool> m_dispatcher;

    mutable std::mutex m_slotMutex;
    std::condition_variable m_slotCondition;
    std::vector<size_t> m_free;
    size_t m_live{0};
    bool m_terminated{false};

    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_stopped{false};
};

} // namespace Amortize

#endif // ISOLATED_PROCESS_BACKEND_HPP
