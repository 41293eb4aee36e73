/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CacheLifecycleManager.hpp"
#include "archive/ArchiveBuilder.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/SettingsManager.hpp"
#include "net/HttpClient.hpp"
#include <algorithm>
#include <chrono>
#include <format>
#include <stdexcept>

namespace DexVault {

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;

std::future<RenewResult> readyFuture(RenewResult result) {
  std::promise<RenewResult> promise;
  promise.set_value(std::move(result));
  return promise.get_future();
}

// Clears the renew-in-progress flag when the queued task finishes or is
// discarded by a pool shutdown
class RenewTicket {
public:
  explicit RenewTicket(std::function<void()> onRelease) : m_onRelease(std::move(onRelease)) {}
  ~RenewTicket() { m_onRelease(); }
  RenewTicket(const RenewTicket &) = delete;
  RenewTicket &operator=(const RenewTicket &) = delete;

private:
  std::function<void()> m_onRelease;
};

} // namespace

const char *lifecycleStateName(LifecycleState state) {
  switch (state) {
  case LifecycleState::Uninitialized:
    return "Uninitialized";
  case LifecycleState::Building:
    return "Building";
  case LifecycleState::Ready:
    return "Ready";
  case LifecycleState::Renewing:
    return "Renewing";
  case LifecycleState::Failed:
    return "Failed";
  }
  return "Unknown";
}

std::optional<LifecycleConfig> LifecycleConfig::fromSettings() {
  namespace Keys = SettingsKeys;
  const auto &settings = SettingsManager::Instance();

  auto paths = CachePaths::resolve(settings.get<std::string>(Keys::CACHE, Keys::DIRECTORY, ""));
  if (!paths) {
    return std::nullopt;
  }

  LifecycleConfig config;
  config.paths = std::move(*paths);
  config.fetcher = FetcherConfig::fromSettings();
  config.maxAgeDays = std::max(0, settings.get<int>(Keys::CACHE, Keys::MAX_AGE_DAYS, 0));
  config.maxFailedPercent =
      std::clamp(settings.get<int>(Keys::CACHE, Keys::MAX_FAILED_PERCENT, 25), 0, 100);
  return config;
}

CacheLifecycleManager::CacheLifecycleManager(LifecycleConfig config,
                                             std::shared_ptr<IHttpTransport> transport)
    : m_config(std::move(config)) {
  if (!transport) {
    transport = std::make_shared<CurlTransport>(m_config.fetcher.connectTimeoutSeconds,
                                                m_config.fetcher.transferTimeoutSeconds);
  }
  m_fetcher = std::make_shared<RemoteFetcher>(std::move(transport), m_config.fetcher);
  m_sprites = std::make_unique<SpriteCacheManager>(m_config.paths, m_fetcher,
                                                   m_config.fetcher.workerCount);
  m_clock = []() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  };
}

CacheLifecycleManager::~CacheLifecycleManager() {
  cancelRenew();
  std::unique_lock<std::mutex> lock(m_renewMutex);
  m_renewDone.wait(lock, [this]() { return !m_renewActive; });
}

void CacheLifecycleManager::setClock(std::function<int64_t()> clock) {
  m_clock = std::move(clock);
}

int64_t CacheLifecycleManager::now() const { return m_clock(); }

void CacheLifecycleManager::setError(std::string error) {
  std::lock_guard<std::mutex> lock(m_storeMutex);
  m_lastError = std::move(error);
}

std::string CacheLifecycleManager::lastError() const {
  std::lock_guard<std::mutex> lock(m_storeMutex);
  return m_lastError;
}

std::shared_ptr<const ArchiveStore> CacheLifecycleManager::snapshot() const {
  std::lock_guard<std::mutex> lock(m_storeMutex);
  return m_store;
}

void CacheLifecycleManager::publish(std::shared_ptr<const ArchiveStore> store) {
  std::lock_guard<std::mutex> lock(m_storeMutex);
  if (m_store) {
    m_retiredStores.push_back(std::move(m_store));
  }
  m_store = std::move(store);
  m_lastError.clear();
}

size_t CacheLifecycleManager::registerProgressListener(ProgressListener listener) {
  std::lock_guard<std::mutex> lock(m_listenerMutex);
  size_t id = m_nextListenerId++;
  m_listeners.emplace(id, std::move(listener));
  return id;
}

void CacheLifecycleManager::unregisterProgressListener(size_t listenerId) {
  std::lock_guard<std::mutex> lock(m_listenerMutex);
  m_listeners.erase(listenerId);
}

void CacheLifecycleManager::notifyProgress(LifecyclePhase phase, size_t done, size_t total) {
  std::vector<ProgressListener> listeners;
  {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    listeners.reserve(m_listeners.size());
    for (const auto &[id, listener] : m_listeners) {
      listeners.push_back(listener);
    }
  }

  LifecycleProgress progress{phase, done, total};
  for (const auto &listener : listeners) {
    listener(progress);
  }
}

LifecycleState CacheLifecycleManager::openOrBuild() {
  // Concurrent callers wait here and then see the winner's Ready
  std::lock_guard<std::mutex> openLock(m_openMutex);
  LifecycleState state = getState();
  if (state != LifecycleState::Uninitialized && state != LifecycleState::Failed) {
    LIFECYCLE_WARN(std::format("openOrBuild called in state {}", lifecycleStateName(state)));
    return state;
  }

  if (!m_config.paths.ensureDirectories()) {
    setError("Cannot create cache directory " + m_config.paths.root().string());
    m_state.store(LifecycleState::Failed, std::memory_order_release);
    return LifecycleState::Failed;
  }

  auto store = std::make_shared<ArchiveStore>();
  ArchiveStatus status = store->open(m_config.paths.archivePath());
  if (status == ArchiveStatus::Ok) {
    publish(std::move(store));
    m_state.store(LifecycleState::Ready, std::memory_order_release);
    if (isStale()) {
      LIFECYCLE_INFO(std::format("Archive is older than {} days, consider a renew",
                                 m_config.maxAgeDays));
    }
    return LifecycleState::Ready;
  }

  LIFECYCLE_WARN(std::format("Archive {} ({}), building a new one",
                             archiveStatusName(status), store->getLastError()));
  m_state.store(LifecycleState::Building, std::memory_order_release);
  m_cancel.store(false, std::memory_order_relaxed);

  RenewResult result;
  try {
    result = rebuild(&m_cancel);
  } catch (const std::exception &e) {
    result.success = false;
    result.error = std::format("Build failed: {}", e.what());
  }

  if (!result.success) {
    LIFECYCLE_ERROR(result.error);
    setError(result.error);
    m_state.store(LifecycleState::Failed, std::memory_order_release);
    return LifecycleState::Failed;
  }

  m_state.store(LifecycleState::Ready, std::memory_order_release);
  return LifecycleState::Ready;
}

RenewResult CacheLifecycleManager::rebuild(const std::atomic<bool> *cancel) {
  RenewResult result;
  const bool hasPrevious = snapshot() != nullptr;

  FetchOptions options;
  options.sprites = m_config.fetcher.downloadSprites;
  notifyProgress(LifecyclePhase::Fetching, 0, 0);
  FetchResult fetched = m_fetcher->fetchAll(
      options,
      [this](size_t done, size_t total) { notifyProgress(LifecyclePhase::Fetching, done, total); },
      cancel);

  result.failedRecords = fetched.failedRecords;
  result.failedSprites = fetched.failedSprites;

  if (fetched.cancelled || (cancel != nullptr && cancel->load())) {
    result.cancelled = true;
    result.error = "Renew cancelled";
    return result;
  }
  if (fetched.indexFailed) {
    result.error = "Cannot fetch species index: " + fetched.error;
    return result;
  }
  if (fetched.records.empty()) {
    result.error = std::format("No species could be fetched ({} failed)", fetched.failedRecords);
    return result;
  }

  const size_t failedPercent = fetched.total == 0 ? 0 : fetched.failedRecords * 100 / fetched.total;
  if (failedPercent > static_cast<size_t>(m_config.maxFailedPercent)) {
    result.error = std::format("{} of {} species failed ({}%, limit {}%){}", fetched.failedRecords,
                               fetched.total, failedPercent, m_config.maxFailedPercent,
                               hasPrevious ? ", keeping the current archive" : "");
    return result;
  }

  notifyProgress(LifecyclePhase::Writing, 0, 1);
  BuildReport report = ArchiveBuilder::writeArchive(std::move(fetched.records),
                                                    m_config.paths.archivePath(), now());
  if (report.status != BuildStatus::Ok) {
    result.error = std::format("Cannot write archive ({}): {}", buildStatusName(report.status),
                               report.error);
    return result;
  }

  auto store = std::make_shared<ArchiveStore>();
  ArchiveStatus status = store->open(m_config.paths.archivePath());
  if (status != ArchiveStatus::Ok) {
    result.error = std::format("New archive failed to open ({}): {}", archiveStatusName(status),
                               store->getLastError());
    return result;
  }
  notifyProgress(LifecyclePhase::Writing, 1, 1);

  notifyProgress(LifecyclePhase::StoringSprites, 0, fetched.sprites.size());
  result.failedSprites += m_sprites->storeAll(fetched.sprites);
  notifyProgress(LifecyclePhase::StoringSprites, fetched.sprites.size(), fetched.sprites.size());

  result.recordCount = store->count();
  publish(std::move(store));
  result.success = true;

  notifyProgress(LifecyclePhase::Done, result.recordCount, result.recordCount);
  LIFECYCLE_INFO(std::format("Archive ready with {} species ({} failed, {} sprites missing)",
                             result.recordCount, result.failedRecords, result.failedSprites));
  return result;
}

std::future<RenewResult> CacheLifecycleManager::renew() {
  LifecycleState expected = LifecycleState::Ready;
  if (!m_state.compare_exchange_strong(expected, LifecycleState::Renewing,
                                       std::memory_order_acq_rel)) {
    RenewResult rejected;
    rejected.error = std::format("Renew needs state Ready, current state is {}",
                                 lifecycleStateName(expected));
    LIFECYCLE_WARN(rejected.error);
    return readyFuture(std::move(rejected));
  }

  m_cancel.store(false, std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lock(m_renewMutex);
    m_renewActive = true;
  }

  auto ticket = std::make_shared<RenewTicket>([this]() { finishRenew(); });
  try {
    return ThreadSystem::Instance().enqueueTaskWithResult(
        [this, ticket]() mutable {
          RenewResult result = runRenew();
          ticket.reset();
          return result;
        },
        TaskPriority::Normal, "CacheLifecycleManager renew");
  } catch (const std::runtime_error &e) {
    // The lambda copy was never queued; dropping ours releases the ticket
    ticket.reset();
    RenewResult rejected;
    rejected.error = std::format("Cannot start renew: {}", e.what());
    LIFECYCLE_ERROR(rejected.error);
    return readyFuture(std::move(rejected));
  }
}

RenewResult CacheLifecycleManager::runRenew() {
  LIFECYCLE_INFO("Renew started");
  RenewResult result;
  try {
    result = rebuild(&m_cancel);
  } catch (const std::exception &e) {
    result.success = false;
    result.error = std::format("Renew failed: {}", e.what());
  }

  if (!result.success) {
    // The previous archive stays authoritative
    LIFECYCLE_WARN(result.error);
    setError(result.error);
  }
  return result;
}

void CacheLifecycleManager::finishRenew() {
  LifecycleState expected = LifecycleState::Renewing;
  m_state.compare_exchange_strong(expected, LifecycleState::Ready, std::memory_order_acq_rel);
  // Notify under the lock: the destructor may be waiting to tear this down
  std::lock_guard<std::mutex> lock(m_renewMutex);
  m_renewActive = false;
  m_renewDone.notify_all();
}

void CacheLifecycleManager::cancelRenew() {
  m_cancel.store(true, std::memory_order_relaxed);
}

RenewResult CacheLifecycleManager::repairSprites() {
  RenewResult result;
  LifecycleState expected = LifecycleState::Ready;
  if (!m_state.compare_exchange_strong(expected, LifecycleState::Renewing,
                                       std::memory_order_acq_rel)) {
    result.error = std::format("Sprite repair needs state Ready, current state is {}",
                               lifecycleStateName(expected));
    LIFECYCLE_WARN(result.error);
    return result;
  }

  auto store = snapshot();
  std::vector<std::pair<int32_t, std::string>> entries;
  entries.reserve(store->count());
  for (const SpeciesView &view : store->iterate()) {
    entries.emplace_back(view.id(), std::string(view.spriteUrl()));
  }

  m_cancel.store(false, std::memory_order_relaxed);
  result.failedSprites = m_sprites->renewAll(entries, &m_cancel);
  result.recordCount = entries.size();
  result.cancelled = m_cancel.load();
  result.success = !result.cancelled;
  m_state.store(LifecycleState::Ready, std::memory_order_release);

  LIFECYCLE_INFO(std::format("Sprite repair finished, {} of {} missing", result.failedSprites,
                             entries.size()));
  return result;
}

std::vector<SpeciesView> CacheLifecycleManager::query(const SpeciesFilter &filter) const {
  auto store = snapshot();
  if (!store) {
    return {};
  }
  return store->filter(filter);
}

std::optional<SpeciesView> CacheLifecycleManager::get(int32_t id) const {
  auto store = snapshot();
  if (!store) {
    return std::nullopt;
  }
  return store->get(id);
}

SpriteLookup CacheLifecycleManager::spritePath(int32_t id) {
  std::string url;
  if (auto view = get(id)) {
    url = std::string(view->spriteUrl());
  }
  return m_sprites->ensure(id, url);
}

bool CacheLifecycleManager::isStale() const {
  if (m_config.maxAgeDays <= 0) {
    return false;
  }
  auto store = snapshot();
  if (!store) {
    return false;
  }
  return now() - store->builtAt() > static_cast<int64_t>(m_config.maxAgeDays) * SECONDS_PER_DAY;
}

} // namespace DexVault
