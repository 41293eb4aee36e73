/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORKER_GROUP_HPP
#define WORKER_GROUP_HPP

#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace DexVault {

/**
 * @brief Runs work(index) for every index in [0, count) on a bounded set of
 * workers: the calling thread plus up to (workers - 1) ThreadSystem helpers
 * pulling from one shared cursor.
 *
 * The caller always participates, so run() finishes even when every pool
 * thread is busy (for example when run() itself executes on the pool).
 * Helpers that start after the caller has returned find the cursor closed
 * and exit without calling work.
 *
 * Usage:
 *   size_t done = WorkerGroup::run(urls.size(), 8,
 *       [&](size_t i) { download(urls[i]); }, &cancelFlag);
 */
class WorkerGroup {
public:
  /**
   * @return number of indices whose work ran (less than count when cancelled)
   */
  static size_t run(size_t count, size_t workers, const std::function<void(size_t)> &work,
                    const std::atomic<bool> *cancel = nullptr,
                    TaskPriority priority = TaskPriority::Low,
                    const std::string &description = "WorkerGroup") {
    if (count == 0) {
      return 0;
    }

    auto state = std::make_shared<State>();
    state->count = count;
    state->work = &work;
    state->cancel = cancel;

    const size_t total = std::min(std::max<size_t>(workers, 1), count);
    for (size_t i = 1; i < total; ++i) {
      if (!ThreadSystem::Instance().enqueueTask([state]() { drain(*state); }, priority,
                                                description)) {
        THREADSYSTEM_DEBUG(description + ": pool unavailable, caller runs remaining work");
        break;
      }
    }

    drain(*state);

    std::unique_lock<std::mutex> lock(state->mutex);
    state->closed = true;
    state->idle.wait(lock, [&state]() { return state->inFlight == 0; });
    return state->finished;
  }

private:
  struct State {
    size_t count{0};
    const std::function<void(size_t)> *work{nullptr};
    const std::atomic<bool> *cancel{nullptr};

    std::mutex mutex;
    std::condition_variable idle;
    size_t next{0};
    size_t inFlight{0};
    size_t finished{0};
    bool closed{false};
  };

  static std::optional<size_t> claim(State &state) {
    std::lock_guard<std::mutex> lock(state.mutex);
    bool cancelled = state.cancel != nullptr && state.cancel->load(std::memory_order_relaxed);
    if (state.closed || cancelled || state.next >= state.count) {
      return std::nullopt;
    }
    ++state.inFlight;
    return state.next++;
  }

  static void drain(State &state) {
    while (auto index = claim(state)) {
      try {
        (*state.work)(*index);
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR(std::string("WorkerGroup task threw: ") + e.what());
      }
      {
        std::lock_guard<std::mutex> lock(state.mutex);
        --state.inFlight;
        ++state.finished;
      }
      state.idle.notify_all();
    }
  }
};

} // namespace DexVault

#endif // WORKER_GROUP_HPP
