/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CACHE_LIFECYCLE_MANAGER_HPP
#define CACHE_LIFECYCLE_MANAGER_HPP

#include "archive/ArchiveStore.hpp"
#include "archive/SpeciesFilter.hpp"
#include "managers/RemoteFetcher.hpp"
#include "managers/SpriteCacheManager.hpp"
#include "utils/CachePaths.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace DexVault {

class IHttpTransport;

enum class LifecycleState { Uninitialized, Building, Ready, Renewing, Failed };

const char *lifecycleStateName(LifecycleState state);

enum class LifecyclePhase { Fetching, Writing, StoringSprites, Done };

struct LifecycleProgress {
  LifecyclePhase phase{LifecyclePhase::Fetching};
  size_t done{0};
  size_t total{0};

  float fraction() const {
    return total == 0 ? 0.0f : static_cast<float>(done) / static_cast<float>(total);
  }
};

using ProgressListener = std::function<void(const LifecycleProgress &)>;

struct LifecycleConfig {
  CachePaths paths{std::filesystem::path()};
  FetcherConfig fetcher;
  int maxAgeDays{0};        // 0 = never stale
  int maxFailedPercent{25}; // species failures tolerated in one build

  // Resolves the cache directory; std::nullopt when none is available
  static std::optional<LifecycleConfig> fromSettings();
};

struct RenewResult {
  bool success{false};
  bool cancelled{false};
  size_t recordCount{0};
  size_t failedRecords{0};
  size_t failedSprites{0};
  std::string error;
};

/**
 * @brief Owns the local data store for the rest of the application
 *
 * State machine:
 *   Uninitialized -> Ready                 archive opened as-is
 *   Uninitialized -> Building -> Ready     first run, missing or corrupt archive
 *   Ready -> Renewing -> Ready             manual renew, success or failure
 *   Building -> Failed                     nothing usable could be built
 *
 * Readers borrow the current ArchiveStore through snapshot(). A renew builds
 * and validates a new archive, then swaps it in; snapshots taken before the
 * swap keep the old mapping alive. Views returned by query() and get() point
 * into stores the manager keeps until it is destroyed.
 *
 * Retired stores are not trimmed while the manager lives, since plain views
 * hold no reference to them. Memory and descriptors grow by one archive
 * mapping per successful renew; recreate the manager to release them.
 */
class CacheLifecycleManager {
public:
  explicit CacheLifecycleManager(LifecycleConfig config,
                                 std::shared_ptr<IHttpTransport> transport = nullptr);
  ~CacheLifecycleManager();

  CacheLifecycleManager(const CacheLifecycleManager &) = delete;
  CacheLifecycleManager &operator=(const CacheLifecycleManager &) = delete;

  /**
   * @brief Opens the archive, building it synchronously when it is missing
   * or invalid
   *
   * Calls are serialised: a second caller blocks until the first finishes
   * and then returns the resulting state without fetching again.
   * @return Ready or Failed (see lastError())
   */
  LifecycleState openOrBuild();

  /**
   * @brief Rebuilds the archive on the ThreadSystem pool
   *
   * Only valid in Ready; any other state yields an already-satisfied future
   * with success == false. Progress goes to registered listeners.
   */
  std::future<RenewResult> renew();

  // Asks an in-flight renew to stop; the current archive stays in use
  void cancelRenew();

  /**
   * @brief Deletes every cached sprite and downloads them again using the
   * sprite URLs stored in the current archive (Ready state only)
   */
  RenewResult repairSprites();

  std::shared_ptr<const ArchiveStore> snapshot() const;

  std::vector<SpeciesView> query(const SpeciesFilter &filter) const;
  std::optional<SpeciesView> get(int32_t id) const;
  SpriteLookup spritePath(int32_t id);

  // True when max age is set and the open archive is older than it
  bool isStale() const;

  LifecycleState getState() const { return m_state.load(std::memory_order_acquire); }
  std::string lastError() const;

  size_t registerProgressListener(ProgressListener listener);
  void unregisterProgressListener(size_t listenerId);

  // Seconds since the Unix epoch; replaced by tests
  void setClock(std::function<int64_t()> clock);

  const CachePaths &paths() const { return m_config.paths; }
  SpriteCacheManager &sprites() { return *m_sprites; }

private:
  RenewResult rebuild(const std::atomic<bool> *cancel);
  RenewResult runRenew();
  void finishRenew();
  void publish(std::shared_ptr<const ArchiveStore> store);
  void notifyProgress(LifecyclePhase phase, size_t done, size_t total);
  void setError(std::string error);
  int64_t now() const;

  LifecycleConfig m_config;
  std::shared_ptr<RemoteFetcher> m_fetcher;
  std::unique_ptr<SpriteCacheManager> m_sprites;

  std::atomic<LifecycleState> m_state{LifecycleState::Uninitialized};
  std::atomic<bool> m_cancel{false};

  mutable std::mutex m_storeMutex;
  std::shared_ptr<const ArchiveStore> m_store;
  std::vector<std::shared_ptr<const ArchiveStore>> m_retiredStores;
  std::string m_lastError;

  std::mutex m_openMutex;

  std::mutex m_renewMutex;
  std::condition_variable m_renewDone;
  bool m_renewActive{false};

  std::mutex m_listenerMutex;
  std::map<size_t, ProgressListener> m_listeners;
  size_t m_nextListenerId{1};

  std::function<int64_t()> m_clock;
};

} // namespace DexVault

#endif // CACHE_LIFECYCLE_MANAGER_HPP
