/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ARCHIVE_BUILDER_HPP
#define ARCHIVE_BUILDER_HPP

#include "entities/SpeciesRecord.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace DexVault {

enum class BuildStatus { Ok, Empty, DiskFailure };

const char *buildStatusName(BuildStatus status);

/**
 * @brief In-memory form of the archive's filter indices
 *
 * Every id list is sorted ascending and every id appears in lookup.
 */
struct FilterIndex {
  std::array<std::vector<int32_t>, TYPE_TAG_COUNT> byType;
  std::array<std::vector<int32_t>, GENERATION_COUNT> byGeneration;
  // (id, ordinal) sorted by id; ordinal is the stored position
  std::vector<std::pair<int32_t, uint32_t>> lookup;
};

struct BuildReport {
  BuildStatus status{BuildStatus::Ok};
  size_t recordCount{0};
  size_t duplicatesDropped{0};
  size_t bytesWritten{0};
  std::string error;
};

/**
 * @brief Serializes species records into a single memory-mappable archive
 *
 * Records keep the order they are given in. When two records share an id
 * the first one wins and later ones are dropped with a warning.
 */
class ArchiveBuilder {
public:
  /**
   * @brief Removes records whose id was already seen earlier in the list
   * @return number of records dropped
   */
  static size_t dropDuplicateIds(std::vector<SpeciesRecord> &records);

  /**
   * @brief Groups records by type and generation and builds the id lookup
   * @param records records in stored order, ids must be unique
   */
  static FilterIndex buildIndices(const std::vector<SpeciesRecord> &records);

  /**
   * @brief Produces the complete archive image including checksum
   * @param records records in stored order, ids must be unique
   * @param builtAt build time in seconds since the Unix epoch
   */
  static std::vector<uint8_t> serialize(const std::vector<SpeciesRecord> &records,
                                        int64_t builtAt);

  /**
   * @brief Serializes and atomically replaces the archive at path
   *
   * Writes a <path>.<n>.tmp file and renames it into place. On DiskFailure the file
   * previously at path is unchanged. An empty record list writes nothing
   * and reports Empty.
   */
  static BuildReport writeArchive(std::vector<SpeciesRecord> records,
                                  const std::filesystem::path &path);

  static BuildReport writeArchive(std::vector<SpeciesRecord> records,
                                  const std::filesystem::path &path,
                                  int64_t builtAt);
};

} // namespace DexVault

#endif // ARCHIVE_BUILDER_HPP
