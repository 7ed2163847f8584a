/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * Thread Pool: shared-memory worker threads fed from one FIFO task queue
 */

#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include "core/Logger.hpp"
#include <boost/container/small_vector.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

// Platform-specific includes for thread naming
#if defined(__linux__) || defined(__APPLE__) || defined(_GNU_SOURCE)
#include <pthread.h>
#endif

namespace Amortize {

// Task wrapper with bookkeeping for wait-time statistics
struct PooledTask {
  std::function<void()> task;
  std::chrono::steady_clock::time_point enqueueTime;
  std::string description;

  PooledTask() : enqueueTime(std::chrono::steady_clock::now()) {}

  PooledTask(std::function<void()> t, std::string desc)
      : task(std::move(t)), enqueueTime(std::chrono::steady_clock::now()),
        description(std::move(desc)) {}
};

/**
 * @brief Thread-safe FIFO task queue
 *
 * Workers block in pop() until a task arrives or the queue is stopped.
 * A stopped queue can either hand out its remaining tasks (drain) or
 * discard them.
 */
class TaskQueue {
public:
  void push(std::function<void()> task, const std::string &description = "") {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_queue.emplace_back(std::move(task), description);
      m_totalTasksEnqueued.fetch_add(1, std::memory_order_relaxed);
    }
    m_condition.notify_one();
  }

  /**
   * @brief Enqueue many tasks with a single lock acquisition
   */
  void batchPush(std::vector<std::function<void()>> &tasks,
                 const std::string &description = "") {
    if (tasks.empty()) {
      return;
    }

    const size_t batchSize = tasks.size();
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      for (auto &task : tasks) {
        m_queue.emplace_back(std::move(task), description);
      }
      m_totalTasksEnqueued.fetch_add(batchSize, std::memory_order_relaxed);
    }

    if (batchSize > 1) {
      m_condition.notify_all();
    } else {
      m_condition.notify_one();
    }
  }

  bool pop(std::function<void()> &task) {
    std::unique_lock<std::mutex> lock(m_mutex);

    m_condition.wait(lock, [this] { return m_stopping || !m_queue.empty(); });

    if (m_queue.empty()) {
      // Only reachable when stopping
      return false;
    }
    if (m_stopping && !m_drainOnStop) {
      return false;
    }

    PooledTask pooled = std::move(m_queue.front());
    m_queue.pop_front();

    auto waitTime = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - pooled.enqueueTime)
                        .count();
    m_totalWaitTimeMs += static_cast<size_t>(waitTime);

    task = std::move(pooled.task);
    m_totalTasksDequeued.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  /**
   * @brief Stop handing out work
   *
   * @param drain true to let workers finish the queued tasks first,
   *              false to discard everything still queued
   * @return number of discarded tasks
   */
  size_t stop(bool drain) {
    size_t discarded = 0;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_stopping = true;
      m_drainOnStop = drain;
      if (!drain) {
        discarded = m_queue.size();
        m_queue.clear();
      }
    }
    m_condition.notify_all();
    return discarded;
  }

  bool isEmpty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.empty();
  }

  bool isStopping() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stopping;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
  }

  size_t getTotalTasksEnqueued() const {
    return m_totalTasksEnqueued.load(std::memory_order_relaxed);
  }

  size_t getTotalTasksDequeued() const {
    return m_totalTasksDequeued.load(std::memory_order_relaxed);
  }

  double getAverageWaitTimeMs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t dequeued = m_totalTasksDequeued.load(std::memory_order_relaxed);
    return dequeued > 0 ? static_cast<double>(m_totalWaitTimeMs) / dequeued
                        : 0.0;
  }

private:
  std::deque<PooledTask> m_queue{};
  mutable std::mutex m_mutex{};
  std::condition_variable m_condition{};
  bool m_stopping{false};
  bool m_drainOnStop{true};
  size_t m_totalWaitTimeMs{0};
  std::atomic<size_t> m_totalTasksEnqueued{0};
  std::atomic<size_t> m_totalTasksDequeued{0};
};

/**
 * @brief Fixed-size pool of worker threads
 *
 * Used directly as the shared-memory backend and as the dispatcher for
 * isolated worker processes.
 */
class ThreadPool {

public:
  /**
   * @brief Construct a new Thread Pool object
   *
   * @param numThreads Number of worker threads to create (at least one)
   * @param name Prefix used for thread names and log messages
   */
  explicit ThreadPool(size_t numThreads, std::string name = "Worker")
      : m_name(std::move(name)) {
    if (numThreads == 0) {
      numThreads = 1;
    }

    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
      m_workers.emplace_back([this, i] {
#if defined(__linux__) || defined(_GNU_SOURCE)
        // Linux thread names are limited to 15 characters
        std::string threadName = std::format("{}-{}", m_name, i).substr(0, 15);
        pthread_setname_np(pthread_self(), threadName.c_str());
#elif defined(__APPLE__)
        std::string threadName = std::format("{}-{}", m_name, i);
        pthread_setname_np(threadName.c_str());
#endif
        workerThread(i);
      });
    }

    THREADPOOL_DEBUG(std::format("{} pool created with {} threads", m_name,
                                 numThreads));
  }

  ~ThreadPool() { shutdown(true); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /**
   * @brief Enqueue a task
   *
   * @param task The task to execute
   * @param description Optional description for debugging
   * @return false if the pool is already shutting down
   */
  bool enqueue(std::function<void()> task, const std::string &description = "") {
    if (m_taskQueue.isStopping()) {
      THREADPOOL_WARN(std::format("{} pool rejected task after shutdown", m_name));
      return false;
    }
    m_taskQueue.push(std::move(task), description);
    return true;
  }

  /**
   * @brief Enqueue several tasks with one lock acquisition
   */
  bool batchEnqueue(std::vector<std::function<void()>> &tasks,
                    const std::string &description = "") {
    if (m_taskQueue.isStopping()) {
      return false;
    }
    m_taskQueue.batchPush(tasks, description);
    return true;
  }

  /**
   * @brief Enqueue a task that returns a result
   *
   * @return A future carrying the result or the exception the task threw
   */
  template <class F, class... Args>
  auto enqueueWithResult(F &&f, const std::string &description = "",
                         Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));

    std::future<return_type> result = task->get_future();
    if (!enqueue([task]() { (*task)(); }, description)) {
      throw std::runtime_error(m_name + " pool is shut down");
    }
    return result;
  }

  /**
   * @brief Stop the pool and join every worker
   *
   * @param drain true to run the tasks still queued before stopping
   */
  void shutdown(bool drain) {
    if (m_shutdown.exchange(true, std::memory_order_acq_rel)) {
      return;
    }

    const size_t discarded = m_taskQueue.stop(drain);
    if (discarded > 0) {
      THREADPOOL_WARN(std::format("{} pool discarded {} queued tasks", m_name,
                                  discarded));
    }

    for (auto &worker : m_workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    THREADPOOL_DEBUG(std::format("{} pool shutdown completed", m_name));
  }

  bool busy() const {
    if (!m_taskQueue.isEmpty()) {
      return true;
    }
    return m_activeTasks.load(std::memory_order_relaxed) > 0;
  }

  size_t threadCount() const { return m_workers.size(); }

  const TaskQueue &getTaskQueue() const { return m_taskQueue; }

  size_t getTotalTasksProcessed() const {
    return m_totalTasksProcessed.load(std::memory_order_relaxed);
  }

private:
  std::string m_name;
  boost::container::small_vector<std::thread, 16> m_workers; // No heap allocation up to 16 threads
  TaskQueue m_taskQueue;
  std::atomic<bool> m_shutdown{false};
  std::atomic<size_t> m_activeTasks{0};
  std::atomic<size_t> m_totalTasksProcessed{0};

  void workerThread(size_t threadIndex) {
    std::function<void()> task;
    auto startTime = std::chrono::steady_clock::now();
    size_t tasksProcessed = 0;

    while (m_taskQueue.pop(task)) {
      m_activeTasks.fetch_add(1, std::memory_order_relaxed);

      try {
        task();
        tasksProcessed++;
        m_totalTasksProcessed.fetch_add(1, std::memory_order_relaxed);
      } catch (const std::exception &e) {
        THREADPOOL_ERROR(std::format("Error in {} thread {}: {}", m_name,
                                     threadIndex, e.what()));
      } catch (...) {
        THREADPOOL_ERROR(std::format("Unknown error in {} thread {}", m_name,
                                     threadIndex));
      }

      m_activeTasks.fetch_sub(1, std::memory_order_relaxed);
      task = nullptr;
    }

    auto totalDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - startTime)
                             .count();
    THREADPOOL_DEBUG(std::format("{} {} exiting after processing {} tasks over {}ms",
                                 m_name, threadIndex, tasksProcessed,
                                 totalDuration));

    // Suppress unused variable warnings in release builds
    (void)tasksProcessed;
    (void)totalDuration;
  }
};

} // namespace Amortize

#endif // THREAD_POOL_HPP
