/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REMOTE_FETCHER_HPP
#define REMOTE_FETCHER_HPP

#include "entities/SpeciesRecord.hpp"
#include "net/HttpClient.hpp"
#include "net/PokeApiParser.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace DexVault {

struct FetcherConfig {
  // Backoff doubles per attempt, so the count is capped
  static constexpr unsigned int MAX_ATTEMPTS_LIMIT = 10;

  std::string baseUrl{"https://pokeapi.co/api/v2"};
  unsigned int workerCount{8};
  unsigned int maxAttempts{3};
  std::chrono::milliseconds retryBackoff{250};
  long connectTimeoutSeconds{10};
  long transferTimeoutSeconds{30};
  bool downloadSprites{true};

  // Reads the "network" and "cache" categories of SettingsManager
  static FetcherConfig fromSettings();
};

struct FetchOptions {
  bool sprites{true};
  size_t limit{0}; // first N index entries only, 0 = all
};

struct FetchResult {
  std::vector<SpeciesRecord> records; // index order, failed species omitted
  std::unordered_map<int32_t, std::vector<uint8_t>> sprites;
  size_t total{0};
  size_t failedRecords{0};
  size_t failedSprites{0};
  bool indexFailed{false};
  bool cancelled{false};
  std::string error;
};

// done / total species, called from worker threads one at a time
using FetchProgress = std::function<void(size_t done, size_t total)>;

/**
 * @brief Pulls the species dataset from the upstream API
 *
 * fetchAll() spreads per-species work over a WorkerGroup: a bounded number
 * of workers, the calling thread included, pulling from a shared cursor. Every request is retried with exponential backoff; a species
 * whose detail document cannot be fetched is skipped and counted.
 */
class RemoteFetcher {
public:
  RemoteFetcher(std::shared_ptr<IHttpTransport> transport, FetcherConfig config);

  /**
   * @brief Fetches the species index that fixes count and order
   * @param error receives the reason on failure
   */
  std::optional<std::vector<SpeciesIndexEntry>> fetchIndex(std::string &error,
                                                           const std::atomic<bool> *cancel = nullptr);

  /**
   * @brief Fetches index, details and (optionally) sprite bytes
   *
   * When cancel becomes true the workers stop claiming species and the
   * result comes back with cancelled set and no data.
   */
  FetchResult fetchAll(const FetchOptions &options, const FetchProgress &progress = {},
                       const std::atomic<bool> *cancel = nullptr);

  /**
   * @brief GET with retry; 4xx other than 408/429 is not retried
   * @return the last response
   */
  HttpResponse getWithRetry(const std::string &url, const std::atomic<bool> *cancel = nullptr);

  const FetcherConfig &getConfig() const { return m_config; }

private:
  struct FetchBatch;

  void processEntry(size_t index, FetchBatch &batch);
  std::optional<SpeciesRecord> fetchSpecies(const SpeciesIndexEntry &entry, FetchBatch &batch);
  std::optional<std::vector<EvolutionLink>> fetchEvolutionChain(const std::string &url,
                                                                FetchBatch &batch);
  std::string resourceUrl(const std::string &path) const;

  std::shared_ptr<IHttpTransport> m_transport;
  FetcherConfig m_config;
};

} // namespace DexVault

#endif // REMOTE_FETCHER_HPP
