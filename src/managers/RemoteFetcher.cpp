/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/RemoteFetcher.hpp"
#include "core/Logger.hpp"
#include "core/WorkerGroup.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <format>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace DexVault {

namespace {

bool isCancelled(const std::atomic<bool> *cancel) {
  return cancel != nullptr && cancel->load(std::memory_order_relaxed);
}

// Sleeps in short slices so a cancel is noticed quickly
void backoffSleep(std::chrono::milliseconds duration, const std::atomic<bool> *cancel) {
  constexpr auto SLICE = std::chrono::milliseconds(20);
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (!isCancelled(cancel)) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return;
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(SLICE, deadline - now));
  }
}

bool isAbsoluteUrl(const std::string &url) {
  return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

} // namespace

struct RemoteFetcher::FetchBatch {
  std::vector<SpeciesIndexEntry> entries;
  FetchOptions options;
  const std::atomic<bool> *cancel{nullptr};

  // One slot per entry, written only by the worker that claimed it
  std::vector<std::optional<SpeciesRecord>> records;
  std::vector<std::optional<std::vector<uint8_t>>> sprites;
  std::atomic<size_t> failedRecords{0};
  std::atomic<size_t> failedSprites{0};

  std::mutex chainMutex;
  std::unordered_map<std::string, std::vector<EvolutionLink>> chains;

  std::mutex progressMutex;
  size_t completed{0};
};

FetcherConfig FetcherConfig::fromSettings() {
  namespace Keys = SettingsKeys;
  const auto &settings = SettingsManager::Instance();
  FetcherConfig config;

  config.baseUrl = settings.get<std::string>(Keys::NETWORK, Keys::BASE_URL, config.baseUrl);
  config.workerCount = static_cast<unsigned int>(
      std::max(1, settings.get<int>(Keys::NETWORK, Keys::WORKER_COUNT, 8)));
  config.maxAttempts = static_cast<unsigned int>(
      std::clamp(settings.get<int>(Keys::NETWORK, Keys::MAX_ATTEMPTS, 3), 1,
                 static_cast<int>(FetcherConfig::MAX_ATTEMPTS_LIMIT)));
  config.retryBackoff = std::chrono::milliseconds(
      std::max(0, settings.get<int>(Keys::NETWORK, Keys::RETRY_BACKOFF_MS, 250)));
  config.connectTimeoutSeconds =
      std::max(1, settings.get<int>(Keys::NETWORK, Keys::CONNECT_TIMEOUT_S, 10));
  config.transferTimeoutSeconds =
      std::max(1, settings.get<int>(Keys::NETWORK, Keys::TRANSFER_TIMEOUT_S, 30));
  config.downloadSprites = settings.get<bool>(Keys::CACHE, Keys::DOWNLOAD_SPRITES, true);
  return config;
}

RemoteFetcher::RemoteFetcher(std::shared_ptr<IHttpTransport> transport, FetcherConfig config)
    : m_transport(std::move(transport)), m_config(std::move(config)) {
  m_config.maxAttempts = std::clamp(m_config.maxAttempts, 1u, FetcherConfig::MAX_ATTEMPTS_LIMIT);
  while (!m_config.baseUrl.empty() && m_config.baseUrl.back() == '/') {
    m_config.baseUrl.pop_back();
  }
}

std::string RemoteFetcher::resourceUrl(const std::string &path) const {
  return m_config.baseUrl + path;
}

HttpResponse RemoteFetcher::getWithRetry(const std::string &url,
                                         const std::atomic<bool> *cancel) {
  HttpResponse response;
  const unsigned int attempts = m_config.maxAttempts;

  for (unsigned int attempt = 1; attempt <= attempts; ++attempt) {
    if (isCancelled(cancel)) {
      response = HttpResponse{};
      response.error = "cancelled";
      return response;
    }

    response = m_transport->get(url);
    if (response.ok()) {
      return response;
    }

    bool retryable = !response.error.empty() || response.status >= 500 ||
                     response.status == 408 || response.status == 429;
    if (!retryable || attempt == attempts) {
      break;
    }
    auto delay = m_config.retryBackoff * (1u << (attempt - 1));
    FETCHER_DEBUG(std::format("GET {} attempt {} failed (status {}, {}), retrying in {}ms",
                              url, attempt, response.status, response.error, delay.count()));
    backoffSleep(delay, cancel);
  }
  return response;
}

std::optional<std::vector<SpeciesIndexEntry>>
RemoteFetcher::fetchIndex(std::string &error, const std::atomic<bool> *cancel) {
  const std::string url = resourceUrl("/pokemon?limit=100000&offset=0");
  HttpResponse response = getWithRetry(url, cancel);
  if (!response.ok()) {
    error = response.error.empty() ? std::format("species index returned HTTP {}", response.status)
                                   : "species index request failed: " + response.error;
    FETCHER_ERROR(error);
    return std::nullopt;
  }

  auto entries = PokeApiParser::parseIndex(response.text(), error);
  if (!entries) {
    FETCHER_ERROR("Cannot parse species index: " + error);
    return std::nullopt;
  }
  FETCHER_INFO(std::format("Species index lists {} entries", entries->size()));
  return entries;
}

std::optional<std::vector<EvolutionLink>>
RemoteFetcher::fetchEvolutionChain(const std::string &url, FetchBatch &batch) {
  {
    std::lock_guard<std::mutex> lock(batch.chainMutex);
    auto it = batch.chains.find(url);
    if (it != batch.chains.end()) {
      return it->second;
    }
  }

  HttpResponse response = getWithRetry(url, batch.cancel);
  if (!response.ok()) {
    return std::nullopt;
  }
  std::string error;
  auto links = PokeApiParser::parseEvolutionChain(response.text(), error);
  if (!links) {
    FETCHER_WARN(std::format("Evolution chain {}: {}", url, error));
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(batch.chainMutex);
  batch.chains.try_emplace(url, *links);
  return links;
}

std::optional<SpeciesRecord> RemoteFetcher::fetchSpecies(const SpeciesIndexEntry &entry,
                                                         FetchBatch &batch) {
  const std::string detailUrl = resourceUrl(std::format("/pokemon/{}", entry.id));
  HttpResponse response = getWithRetry(detailUrl, batch.cancel);
  if (!response.ok()) {
    FETCHER_WARN(std::format("Skipping {} (#{}): status {} {}", entry.name, entry.id,
                             response.status, response.error));
    return std::nullopt;
  }

  std::string error;
  auto detail = PokeApiParser::parsePokemon(response.text(), error);
  if (!detail) {
    FETCHER_WARN(std::format("Skipping {} (#{}): {}", entry.name, entry.id, error));
    return std::nullopt;
  }
  SpeciesRecord record = std::move(detail->record);

  // Species metadata, evolution chain and encounters are optional parts
  std::string speciesUrl = isAbsoluteUrl(detail->speciesUrl)
                               ? detail->speciesUrl
                               : resourceUrl(std::format("/pokemon-species/{}", entry.id));
  HttpResponse speciesResponse = getWithRetry(speciesUrl, batch.cancel);
  if (speciesResponse.ok()) {
    if (auto metadata = PokeApiParser::parseSpecies(speciesResponse.text(), error)) {
      record.flavorText = std::move(metadata->flavorText);
      record.generation = metadata->generation;
      if (isAbsoluteUrl(metadata->evolutionChainUrl)) {
        if (auto links = fetchEvolutionChain(metadata->evolutionChainUrl, batch)) {
          record.evolutions = std::move(*links);
        }
      }
    } else {
      FETCHER_DEBUG(std::format("Species metadata for #{}: {}", entry.id, error));
    }
  }

  std::string encountersUrl = isAbsoluteUrl(detail->encountersUrl)
                                  ? detail->encountersUrl
                                  : resourceUrl(std::format("/pokemon/{}/encounters", entry.id));
  HttpResponse encounterResponse = getWithRetry(encountersUrl, batch.cancel);
  if (encounterResponse.ok()) {
    if (auto encounters = PokeApiParser::parseEncounters(encounterResponse.text(), error)) {
      record.encounters = std::move(*encounters);
    }
  }

  return record;
}

void RemoteFetcher::processEntry(size_t index, FetchBatch &batch) {
  const SpeciesIndexEntry &entry = batch.entries[index];

  std::optional<SpeciesRecord> record;
  try {
    record = fetchSpecies(entry, batch);
  } catch (const std::exception &e) {
    FETCHER_ERROR(std::format("Species #{} failed: {}", entry.id, e.what()));
    record.reset();
  }

  if (!record) {
    batch.failedRecords.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  if (batch.options.sprites && !record->spriteUrl.empty() && !isCancelled(batch.cancel)) {
    HttpResponse sprite = getWithRetry(record->spriteUrl, batch.cancel);
    if (sprite.ok() && !sprite.body.empty()) {
      batch.sprites[index] = std::move(sprite.body);
    } else {
      batch.failedSprites.fetch_add(1, std::memory_order_relaxed);
      FETCHER_DEBUG(std::format("No sprite for #{} (status {})", record->id, sprite.status));
    }
  }
  batch.records[index] = std::move(record);
}

FetchResult RemoteFetcher::fetchAll(const FetchOptions &options, const FetchProgress &progress,
                                    const std::atomic<bool> *cancel) {
  FetchResult result;

  auto index = fetchIndex(result.error, cancel);
  if (!index) {
    result.indexFailed = true;
    result.cancelled = isCancelled(cancel);
    return result;
  }
  if (options.limit > 0 && index->size() > options.limit) {
    index->resize(options.limit);
  }

  FetchBatch batch;
  batch.entries = std::move(*index);
  batch.options = options;
  batch.cancel = cancel;
  batch.records.resize(batch.entries.size());
  batch.sprites.resize(batch.entries.size());

  const size_t total = batch.entries.size();
  result.total = total;
  if (progress) {
    progress(0, total);
  }

  FETCHER_INFO(std::format("Fetching {} species with up to {} workers", total,
                           m_config.workerCount));
  WorkerGroup::run(
      total, m_config.workerCount,
      [this, &batch, &progress](size_t i) {
        processEntry(i, batch);
        std::lock_guard<std::mutex> lock(batch.progressMutex);
        ++batch.completed;
        if (progress) {
          progress(batch.completed, batch.entries.size());
        }
      },
      cancel, TaskPriority::Low, "RemoteFetcher");

  if (isCancelled(cancel)) {
    FETCHER_INFO("Fetch cancelled, discarding partial data");
    result.cancelled = true;
    result.error = "cancelled";
    return result;
  }

  result.failedRecords = batch.failedRecords.load();
  result.failedSprites = batch.failedSprites.load();
  result.records.reserve(total - result.failedRecords);
  for (size_t i = 0; i < total; ++i) {
    if (!batch.records[i]) {
      continue;
    }
    if (batch.sprites[i]) {
      result.sprites.emplace(batch.records[i]->id, std::move(*batch.sprites[i]));
    }
    result.records.push_back(std::move(*batch.records[i]));
  }

  FETCHER_INFO(std::format("Fetched {} of {} species ({} failed, {} sprites missing)",
                           result.records.size(), total, result.failedRecords,
                           result.failedSprites));
  return result;
}

} // namespace DexVault
