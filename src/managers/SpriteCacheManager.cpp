/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SpriteCacheManager.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "core/WorkerGroup.hpp"
#include "managers/RemoteFetcher.hpp"
#include "utils/BinarySerializer.hpp"
#include <format>
#include <stdexcept>

namespace DexVault {

namespace fs = std::filesystem;

const char *spriteStatusName(SpriteStatus status) {
  switch (status) {
  case SpriteStatus::Ready:
    return "Ready";
  case SpriteStatus::Pending:
    return "Pending";
  case SpriteStatus::Unavailable:
    return "Unavailable";
  }
  return "Unknown";
}

SpriteCacheManager::SpriteCacheManager(CachePaths paths, std::shared_ptr<RemoteFetcher> fetcher,
                                       unsigned int workerCount)
    : m_paths(std::move(paths)),
      m_fetcher(std::move(fetcher)),
      m_workerCount(workerCount == 0 ? 1 : workerCount),
      m_downloads(std::make_shared<Downloads>()) {}

fs::path SpriteCacheManager::spritePath(int32_t speciesId) const {
  return m_paths.spritePath(speciesId);
}

bool SpriteCacheManager::hasSprite(int32_t speciesId) const {
  std::error_code ec;
  return fs::is_regular_file(spritePath(speciesId), ec);
}

bool SpriteCacheManager::writeSprite(const fs::path &path, const std::vector<uint8_t> &bytes) {
  std::string error;
  if (!BinarySerial::writeFileAtomic(path, bytes, error)) {
    SPRITE_ERROR(std::format("Cannot write {}: {}", path.string(), error));
    return false;
  }
  return true;
}

bool SpriteCacheManager::store(int32_t speciesId, const std::vector<uint8_t> &bytes) {
  if (bytes.empty()) {
    SPRITE_WARN(std::format("Refusing to store empty sprite for #{}", speciesId));
    return false;
  }
  return writeSprite(spritePath(speciesId), bytes);
}

size_t SpriteCacheManager::storeAll(
    const std::unordered_map<int32_t, std::vector<uint8_t>> &sprites) {
  size_t failures = 0;
  for (const auto &[speciesId, bytes] : sprites) {
    if (!store(speciesId, bytes)) {
      ++failures;
    }
  }
  SPRITE_INFO(std::format("Stored {} sprites ({} failed)", sprites.size() - failures, failures));
  return failures;
}

SpriteLookup SpriteCacheManager::ensure(int32_t speciesId, const std::string &url) {
  SpriteLookup lookup;
  lookup.path = spritePath(speciesId);

  if (hasSprite(speciesId)) {
    lookup.status = SpriteStatus::Ready;
    return lookup;
  }
  if (!m_fetcher || url.empty()) {
    lookup.status = SpriteStatus::Unavailable;
    return lookup;
  }

  std::lock_guard<std::mutex> lock(m_downloads->mutex);
  auto existing = m_downloads->inFlight.find(speciesId);
  if (existing != m_downloads->inFlight.end()) {
    lookup.status = SpriteStatus::Pending;
    lookup.download = existing->second;
    return lookup;
  }
  // A download may have finished between the check above and the lock
  if (hasSprite(speciesId)) {
    lookup.status = SpriteStatus::Ready;
    return lookup;
  }

  auto promise = std::make_shared<std::promise<bool>>();
  std::shared_future<bool> future = promise->get_future().share();
  m_downloads->inFlight.emplace(speciesId, future);

  auto downloads = m_downloads;
  auto fetcher = m_fetcher;
  fs::path path = lookup.path;
  bool queued = ThreadSystem::Instance().enqueueTask(
      [downloads, fetcher, promise, speciesId, url, path]() {
        bool ok = false;
        try {
          HttpResponse response = fetcher->getWithRetry(url);
          ok = response.ok() && !response.body.empty() && writeSprite(path, response.body);
          if (!ok) {
            SPRITE_WARN(std::format("Sprite download for #{} failed (status {} {})", speciesId,
                                    response.status, response.error));
          }
        } catch (const std::exception &e) {
          SPRITE_ERROR(std::format("Sprite download for #{} threw: {}", speciesId, e.what()));
        }
        {
          std::lock_guard<std::mutex> taskLock(downloads->mutex);
          downloads->inFlight.erase(speciesId);
        }
        promise->set_value(ok);
      },
      TaskPriority::High, "sprite download");

  if (!queued) {
    m_downloads->inFlight.erase(speciesId);
    promise->set_value(false);
    SPRITE_WARN(std::format("Cannot queue sprite download for #{}", speciesId));
    lookup.status = SpriteStatus::Unavailable;
    return lookup;
  }

  SPRITE_DEBUG(std::format("Queued sprite download for #{}", speciesId));
  lookup.status = SpriteStatus::Pending;
  lookup.download = std::move(future);
  return lookup;
}

size_t SpriteCacheManager::pendingDownloads() const {
  std::lock_guard<std::mutex> lock(m_downloads->mutex);
  return m_downloads->inFlight.size();
}

bool SpriteCacheManager::clear() {
  std::error_code ec;
  const fs::path directory = m_paths.spriteDirectory();
  fs::remove_all(directory, ec);
  if (ec) {
    SPRITE_ERROR(std::format("Cannot remove {}: {}", directory.string(), ec.message()));
    return false;
  }
  fs::create_directories(directory, ec);
  if (ec) {
    SPRITE_ERROR(std::format("Cannot recreate {}: {}", directory.string(), ec.message()));
    return false;
  }
  SPRITE_INFO("Cleared sprite cache " + directory.string());
  return true;
}

size_t SpriteCacheManager::renewAll(const std::vector<std::pair<int32_t, std::string>> &entries,
                                    const std::atomic<bool> *cancel) {
  if (!m_fetcher) {
    SPRITE_ERROR("Cannot renew sprites without a fetcher");
    return entries.size();
  }
  if (!clear()) {
    return entries.size();
  }

  std::atomic<size_t> restored{0};
  WorkerGroup::run(
      entries.size(), m_workerCount,
      [this, &entries, &restored, cancel](size_t i) {
        const auto &[speciesId, url] = entries[i];
        if (url.empty()) {
          return;
        }
        HttpResponse response = m_fetcher->getWithRetry(url, cancel);
        if (response.ok() && !response.body.empty() &&
            writeSprite(spritePath(speciesId), response.body)) {
          restored.fetch_add(1, std::memory_order_relaxed);
        }
      },
      cancel, TaskPriority::Low, "SpriteCacheManager renew");

  size_t failures = entries.size() - restored.load();
  SPRITE_INFO(std::format("Renewed {} of {} sprites", restored.load(), entries.size()));
  return failures;
}

} // namespace DexVault
