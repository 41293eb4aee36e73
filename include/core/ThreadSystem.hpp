/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * Thread System: worker pool with prioritized task queue used by the
 * fetcher, sprite cache and cache renewal
 */

#ifndef THREAD_SYSTEM_HPP
#define THREAD_SYSTEM_HPP

#include "Logger.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#if defined(__linux__) || defined(__APPLE__) || defined(_GNU_SOURCE)
#include <pthread.h>
#endif

namespace DexVault {

// Task priority levels
enum class TaskPriority {
  Critical = 0, // Lifecycle transitions
  High = 1,     // User-visible work (on-demand sprite downloads)
  Normal = 2,   // Default priority for most tasks
  Low = 3,      // Bulk fetch helpers
  Idle = 4      // Only execute when nothing else is pending
};

constexpr size_t TASK_PRIORITY_COUNT = 5;

/**
 * @brief Thread-safe task queue with one FIFO per priority level
 *
 * pop() blocks until a task is available or stop() is called. Tasks are
 * taken from the highest non-empty priority first.
 */
class TaskQueue {
public:
  void push(std::function<void()> task,
            TaskPriority priority = TaskPriority::Normal) {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_queues[static_cast<size_t>(priority)].push_back(std::move(task));
      ++m_size;
    }
    m_condition.notify_one();
  }

  bool pop(std::function<void()> &task) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait(lock, [this] { return m_stopping || m_size > 0; });

    if (m_stopping) {
      return false;
    }

    for (auto &queue : m_queues) {
      if (!queue.empty()) {
        task = std::move(queue.front());
        queue.pop_front();
        --m_size;
        return true;
      }
    }
    return false;
  }

  // Discards pending tasks and wakes every waiting worker
  size_t stop() {
    size_t discarded = 0;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_stopping = true;
      discarded = m_size;
      for (auto &queue : m_queues) {
        queue.clear();
      }
      m_size = 0;
    }
    m_condition.notify_all();
    return discarded;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_size;
  }

  bool isEmpty() const { return size() == 0; }

private:
  std::array<std::deque<std::function<void()>>, TASK_PRIORITY_COUNT> m_queues;
  mutable std::mutex m_mutex;
  std::condition_variable m_condition;
  size_t m_size{0};
  bool m_stopping{false};
};

// Fixed set of worker threads draining one TaskQueue
class ThreadPool {
public:
  explicit ThreadPool(size_t numThreads) {
    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
      m_workers.emplace_back([this, i] {
#if defined(__linux__) || defined(_GNU_SOURCE)
        std::string threadName = std::format("DexWorker-{}", i);
        pthread_setname_np(pthread_self(), threadName.c_str());
#elif defined(__APPLE__)
        std::string threadName = std::format("DexWorker-{}", i);
        pthread_setname_np(threadName.c_str());
#endif
        workerThread(i);
      });
    }
  }

  ~ThreadPool() {
    size_t discarded = m_taskQueue.stop();
    if (discarded > 0) {
      THREADSYSTEM_INFO(std::format("Discarded {} pending tasks during shutdown",
                                    discarded));
    }

    for (auto &worker : m_workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    THREADSYSTEM_INFO("ThreadPool shutdown completed");
  }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  void enqueue(std::function<void()> task,
               TaskPriority priority = TaskPriority::Normal) {
    m_taskQueue.push(std::move(task), priority);
    m_totalTasksEnqueued.fetch_add(1, std::memory_order_relaxed);
  }

  template <class F>
  auto enqueueWithResult(F &&f, TaskPriority priority = TaskPriority::Normal)
      -> std::future<std::invoke_result_t<F>> {
    using ReturnType = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::forward<F>(f));
    std::future<ReturnType> result = task->get_future();
    enqueue([task]() { (*task)(); }, priority);
    return result;
  }

  bool busy() const {
    return !m_taskQueue.isEmpty() ||
           m_activeTasks.load(std::memory_order_relaxed) > 0;
  }

  size_t queueSize() const { return m_taskQueue.size(); }
  size_t threadCount() const { return m_workers.size(); }

  size_t getTotalTasksEnqueued() const {
    return m_totalTasksEnqueued.load(std::memory_order_relaxed);
  }

  size_t getTotalTasksProcessed() const {
    return m_totalTasksProcessed.load(std::memory_order_relaxed);
  }

private:
  std::vector<std::thread> m_workers;
  TaskQueue m_taskQueue;
  std::atomic<size_t> m_activeTasks{0};
  std::atomic<size_t> m_totalTasksEnqueued{0};
  std::atomic<size_t> m_totalTasksProcessed{0};

  void workerThread(size_t threadIndex) {
    std::function<void()> task;
    size_t tasksProcessed = 0;

    while (m_taskQueue.pop(task)) {
      m_activeTasks.fetch_add(1, std::memory_order_relaxed);
      auto started = std::chrono::steady_clock::now();

      try {
        task();
        ++tasksProcessed;
        m_totalTasksProcessed.fetch_add(1, std::memory_order_relaxed);
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR(std::format("Error in worker thread {}: {}",
                                       threadIndex, e.what()));
      }

      m_activeTasks.fetch_sub(1, std::memory_order_relaxed);
      task = nullptr;

      // Network tasks are expected to be slow; only flag the extreme ones
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - started)
                         .count();
      if (elapsed > 30000) {
        THREADSYSTEM_WARN(std::format("Worker {} - Slow task: {}ms",
                                      threadIndex, elapsed));
      }
    }

    THREADSYSTEM_DEBUG(std::format("Worker {} exiting after processing {} tasks",
                                   threadIndex, tasksProcessed));
    (void)tasksProcessed;
  }
};

// Singleton Thread System Manager
class ThreadSystem {
public:
  static ThreadSystem &Instance() {
    static ThreadSystem instance;
    return instance;
  }

  static bool Exists() {
    return !Instance().m_isShutdown.load(std::memory_order_acquire);
  }

  /**
   * @brief Starts the worker pool
   *
   * @param customThreadCount exact worker count, 0 for hardware_concurrency
   * @return false after clean() or if the pool could not be created
   */
  bool init(unsigned int customThreadCount = 0) {
    if (m_isShutdown.load(std::memory_order_acquire)) {
      THREADSYSTEM_WARN("ThreadSystem already shut down, ignoring init request");
      return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_threadPool) {
      return true;
    }

    if (customThreadCount > 0) {
      m_numThreads = customThreadCount;
    } else {
      unsigned int hardwareThreads = std::thread::hardware_concurrency();
      m_numThreads = hardwareThreads > 0 ? hardwareThreads : 2;
    }

    try {
      m_threadPool = std::make_unique<ThreadPool>(m_numThreads);
      THREADSYSTEM_INFO(std::format("ThreadSystem initialized with {} worker threads",
                                    m_numThreads));
      return true;
    } catch (const std::exception &e) {
      THREADSYSTEM_ERROR(std::format("Failed to initialize ThreadSystem: {}",
                                     e.what()));
      return false;
    }
  }

  void clean() {
    m_isShutdown.store(true, std::memory_order_release);

    std::unique_ptr<ThreadPool> pool;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      pool = std::move(m_threadPool);
    }
    if (pool) {
      pool.reset();
      THREADSYSTEM_INFO("ThreadSystem resources cleaned!");
    }
  }

  ~ThreadSystem() { clean(); }

  /**
   * @brief Enqueue a fire-and-forget task
   * @return false if the system is shut down or not initialized
   */
  bool enqueueTask(std::function<void()> task,
                   TaskPriority priority = TaskPriority::Normal,
                   const std::string &description = "") {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_isShutdown.load(std::memory_order_acquire) || !m_threadPool) {
      THREADSYSTEM_DEBUG("Rejecting task, pool not running" +
                         (description.empty() ? "" : " (" + description + ")"));
      return false;
    }

    m_threadPool->enqueue(std::move(task), priority);
    return true;
  }

  /**
   * @brief Enqueue a task whose result is delivered through a future
   * @throws std::runtime_error if the system is shut down or not initialized
   */
  template <class F>
  auto enqueueTaskWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                             const std::string &description = "")
      -> std::future<std::invoke_result_t<F>> {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_isShutdown.load(std::memory_order_acquire) || !m_threadPool) {
      throw std::runtime_error(
          "ThreadSystem not running" +
          (description.empty() ? std::string() : ": " + description));
    }
    return m_threadPool->enqueueWithResult(std::forward<F>(f), priority);
  }

  bool isBusy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool && m_threadPool->busy();
  }

  bool isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool != nullptr;
  }

  unsigned int getThreadCount() const { return m_numThreads; }

  bool isShutdown() const {
    return m_isShutdown.load(std::memory_order_acquire);
  }

  size_t getQueueSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->queueSize() : 0;
  }

  size_t getTotalTasksProcessed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTotalTasksProcessed() : 0;
  }

  size_t getTotalTasksEnqueued() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTotalTasksEnqueued() : 0;
  }

private:
  std::unique_ptr<ThreadPool> m_threadPool{nullptr};
  unsigned int m_numThreads{};
  std::atomic<bool> m_isShutdown{false};
  mutable std::mutex m_mutex{};

  ThreadSystem(const ThreadSystem &) = delete;
  ThreadSystem &operator=(const ThreadSystem &) = delete;

  ThreadSystem() = default;
};

} // namespace DexVault

#endif // THREAD_SYSTEM_HPP
