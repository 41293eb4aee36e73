/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPRITE_CACHE_MANAGER_HPP
#define SPRITE_CACHE_MANAGER_HPP

#include "utils/CachePaths.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace DexVault {

class RemoteFetcher;

enum class SpriteStatus {
  Ready,      // file exists at path
  Pending,    // download queued, download future resolves to success
  Unavailable // absent and nothing to fetch it with
};

const char *spriteStatusName(SpriteStatus status);

struct SpriteLookup {
  SpriteStatus status{SpriteStatus::Unavailable};
  std::filesystem::path path;
  std::shared_future<bool> download; // valid only when Pending
};

/**
 * @brief On-disk sprite images keyed by species id
 *
 * Files live at <cache>/sprites/<id>.png. Missing sprites are fetched on
 * demand through the RemoteFetcher (if one was supplied) on the ThreadSystem
 * pool; concurrent ensure() calls for one id share a single download.
 * Every write goes through a temporary file and a rename.
 */
class SpriteCacheManager {
public:
  SpriteCacheManager(CachePaths paths, std::shared_ptr<RemoteFetcher> fetcher,
                     unsigned int workerCount = 8);
  ~SpriteCacheManager() = default;

  SpriteCacheManager(const SpriteCacheManager &) = delete;
  SpriteCacheManager &operator=(const SpriteCacheManager &) = delete;

  std::filesystem::path spritePath(int32_t speciesId) const;
  bool hasSprite(int32_t speciesId) const;

  SpriteLookup ensure(int32_t speciesId, const std::string &url);

  bool store(int32_t speciesId, const std::vector<uint8_t> &bytes);

  // Writes every entry; returns how many writes failed
  size_t storeAll(const std::unordered_map<int32_t, std::vector<uint8_t>> &sprites);

  /**
   * @brief Deletes every cached sprite and downloads all entries again
   * @param entries (species id, sprite URL) pairs; empty URLs count as failures
   * @return number of sprites that could not be restored
   */
  size_t renewAll(const std::vector<std::pair<int32_t, std::string>> &entries,
                  const std::atomic<bool> *cancel = nullptr);

  // Removes the sprite directory contents; false (and logs) on failure
  bool clear();

  size_t pendingDownloads() const;

private:
  struct Downloads {
    std::mutex mutex;
    std::unordered_map<int32_t, std::shared_future<bool>> inFlight;
  };

  static bool writeSprite(const std::filesystem::path &path, const std::vector<uint8_t> &bytes);

  CachePaths m_paths;
  std::shared_ptr<RemoteFetcher> m_fetcher;
  unsigned int m_workerCount;
  // Shared with queued download tasks so they never reference this object
  std::shared_ptr<Downloads> m_downloads;
};

} // namespace DexVault

#endif // SPRITE_CACHE_MANAGER_HPP
