/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "archive/ArchiveBuilder.hpp"
#include "archive/ArchiveFormat.hpp"
#include "core/Logger.hpp"
#include "utils/BinarySerializer.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <format>
#include <stdexcept>

namespace DexVault {

namespace {

using namespace ArchiveFormat;

size_t typeSlot(TypeTag tag) {
  auto slot = static_cast<size_t>(tag);
  return slot < TYPE_TAG_COUNT ? slot : static_cast<size_t>(TypeTag::Unknown);
}

uint32_t toU32(size_t value, const char *what) {
  if (value > UINT32_MAX) {
    throw std::length_error(std::format("{} exceeds the archive's 32-bit limit", what));
  }
  return static_cast<uint32_t>(value);
}

// Writes one record block at the writer's current (aligned) position
class RecordWriter {
public:
  explicit RecordWriter(BinarySerial::Writer &writer)
      : m_writer(writer), m_start(writer.size()) {}

  uint32_t write(const SpeciesRecord &record) {
    size_t headerAt = m_writer.reserve<RecordHeader>();

    RecordHeader header{};
    header.id = record.id;
    header.height = record.height;
    header.weight = record.weight;
    for (size_t i = 0; i < STAT_COUNT; ++i) {
      header.stats[i] = record.stats.value(static_cast<StatKind>(i));
    }
    header.generation = static_cast<uint8_t>(record.generation);
    if (header.generation >= GENERATION_COUNT) {
      header.generation = static_cast<uint8_t>(Generation::Unknown);
    }

    size_t typeCount = std::min(record.types.size(), MAX_TYPES_PER_RECORD);
    if (typeCount < record.types.size()) {
      ARCHIVE_WARN(std::format("Species {} has {} types, keeping the first {}",
                               record.id, record.types.size(), MAX_TYPES_PER_RECORD));
    }
    header.typeCount = static_cast<uint8_t>(typeCount);
    for (size_t i = 0; i < typeCount; ++i) {
      header.types[i] = static_cast<uint8_t>(typeSlot(record.types[i]));
    }

    // Fixed-size tables first, string bytes after them
    size_t abilitiesAt = m_writer.reserve<StrRef>(record.abilities.size());
    size_t evolutionsAt = m_writer.reserve<EvolutionEntry>(record.evolutions.size());
    size_t encountersAt =
        m_writer.reserve<ArchiveFormat::EncounterEntry>(record.encounters.size());

    std::vector<size_t> locationTables;
    locationTables.reserve(record.encounters.size());
    for (const auto &encounter : record.encounters) {
      locationTables.push_back(m_writer.reserve<StrRef>(encounter.locations.size()));
    }

    header.name = putString(record.name);
    if (record.flavorText) {
      header.flags |= RECORD_FLAG_HAS_FLAVOR;
      header.flavorText = putString(*record.flavorText);
    }
    header.spriteUrl = putString(record.spriteUrl);

    header.abilities = {relative(abilitiesAt), toU32(record.abilities.size(), "ability count")};
    for (size_t i = 0; i < record.abilities.size(); ++i) {
      m_writer.patch(abilitiesAt + i * sizeof(StrRef), putString(record.abilities[i]));
    }

    header.evolutions = {relative(evolutionsAt), toU32(record.evolutions.size(), "evolution count")};
    for (size_t i = 0; i < record.evolutions.size(); ++i) {
      EvolutionEntry entry{};
      entry.speciesId = record.evolutions[i].speciesId;
      entry.requirement = putString(record.evolutions[i].requirement);
      m_writer.patch(evolutionsAt + i * sizeof(EvolutionEntry), entry);
    }

    header.encounters = {relative(encountersAt), toU32(record.encounters.size(), "encounter count")};
    for (size_t i = 0; i < record.encounters.size(); ++i) {
      const auto &encounter = record.encounters[i];
      ArchiveFormat::EncounterEntry entry{};
      entry.game = putString(encounter.game);
      entry.locations = {relative(locationTables[i]),
                         toU32(encounter.locations.size(), "location count")};
      for (size_t j = 0; j < encounter.locations.size(); ++j) {
        m_writer.patch(locationTables[i] + j * sizeof(StrRef),
                       putString(encounter.locations[j]));
      }
      m_writer.patch(encountersAt + i * sizeof(ArchiveFormat::EncounterEntry), entry);
    }

    m_writer.align(RECORD_ALIGNMENT);
    header.recordSize = toU32(m_writer.size() - m_start, "record size");
    m_writer.patch(headerAt, header);
    return header.recordSize;
  }

private:
  BinarySerial::Writer &m_writer;
  size_t m_start;

  uint32_t relative(size_t absolute) const {
    return toU32(absolute - m_start, "record offset");
  }

  StrRef putString(const std::string &text) {
    StrRef ref{};
    ref.offset = relative(m_writer.writeString(text));
    ref.length = toU32(text.size(), "string length");
    return ref;
  }
};

} // namespace

const char *buildStatusName(BuildStatus status) {
  switch (status) {
  case BuildStatus::Ok:
    return "Ok";
  case BuildStatus::Empty:
    return "Empty";
  case BuildStatus::DiskFailure:
    return "DiskFailure";
  }
  return "Unknown";
}

size_t ArchiveBuilder::dropDuplicateIds(std::vector<SpeciesRecord> &records) {
  boost::container::flat_set<int32_t> seen;
  seen.reserve(records.size());

  size_t before = records.size();
  auto kept = std::remove_if(records.begin(), records.end(),
                             [&seen](const SpeciesRecord &record) {
                               if (seen.insert(record.id).second) {
                                 return false;
                               }
                               ARCHIVE_WARN(std::format(
                                   "Duplicate species id {} ({}), keeping first occurrence",
                                   record.id, record.name));
                               return true;
                             });
  records.erase(kept, records.end());
  return before - records.size();
}

FilterIndex ArchiveBuilder::buildIndices(const std::vector<SpeciesRecord> &records) {
  FilterIndex index;
  boost::container::flat_map<int32_t, uint32_t> lookup;
  lookup.reserve(records.size());

  for (size_t ordinal = 0; ordinal < records.size(); ++ordinal) {
    const SpeciesRecord &record = records[ordinal];
    lookup.emplace(record.id, static_cast<uint32_t>(ordinal));

    size_t typeCount = std::min(record.types.size(), MAX_TYPES_PER_RECORD);
    for (size_t i = 0; i < typeCount; ++i) {
      index.byType[typeSlot(record.types[i])].push_back(record.id);
    }

    auto generation = static_cast<size_t>(record.generation);
    if (generation >= GENERATION_COUNT) {
      generation = static_cast<size_t>(Generation::Unknown);
    }
    index.byGeneration[generation].push_back(record.id);
  }

  // A record listing the same type twice still appears once
  auto sortUnique = [](std::vector<int32_t> &ids) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  };
  for (auto &bucket : index.byType) {
    sortUnique(bucket);
  }
  for (auto &bucket : index.byGeneration) {
    sortUnique(bucket);
  }

  index.lookup.assign(lookup.begin(), lookup.end());
  return index;
}

std::vector<uint8_t> ArchiveBuilder::serialize(const std::vector<SpeciesRecord> &records,
                                               int64_t builtAt) {
  // Record section first so the order table knows every offset
  BinarySerial::Writer recordSection(records.size() * 512);
  std::vector<uint32_t> recordOffsets;
  recordOffsets.reserve(records.size());
  for (const auto &record : records) {
    recordOffsets.push_back(toU32(recordSection.size(), "record section"));
    RecordWriter(recordSection).write(record);
  }

  FilterIndex index = buildIndices(records);

  BinarySerial::Writer indexSection;
  size_t indexHeaderAt = indexSection.reserve<IndexHeader>();
  size_t bucketsAt = indexSection.reserve<IndexBucket>(TYPE_TAG_COUNT + GENERATION_COUNT);

  IndexHeader indexHeader{};
  indexHeader.typeBucketCount = static_cast<uint32_t>(TYPE_TAG_COUNT);
  indexHeader.generationBucketCount = static_cast<uint32_t>(GENERATION_COUNT);
  indexHeader.idPoolOffset = toU32(indexSection.size(), "index section");

  uint32_t poolSlot = 0;
  auto appendBucket = [&](size_t bucketNumber, const std::vector<int32_t> &ids) {
    IndexBucket bucket{poolSlot, toU32(ids.size(), "bucket size")};
    indexSection.patch(bucketsAt + bucketNumber * sizeof(IndexBucket), bucket);
    for (int32_t id : ids) {
      indexSection.write(id);
    }
    poolSlot += bucket.count;
  };
  for (size_t t = 0; t < TYPE_TAG_COUNT; ++t) {
    appendBucket(t, index.byType[t]);
  }
  for (size_t g = 0; g < GENERATION_COUNT; ++g) {
    appendBucket(TYPE_TAG_COUNT + g, index.byGeneration[g]);
  }
  indexHeader.idPoolCount = poolSlot;

  indexSection.align(sizeof(IdLookupEntry));
  indexHeader.lookupOffset = toU32(indexSection.size(), "index section");
  for (const auto &[id, ordinal] : index.lookup) {
    indexSection.write(IdLookupEntry{id, ordinal});
  }

  indexHeader.orderOffset = toU32(indexSection.size(), "index section");
  for (uint32_t offset : recordOffsets) {
    indexSection.write(offset);
  }
  indexSection.patch(indexHeaderAt, indexHeader);
  indexSection.align(RECORD_ALIGNMENT);

  FileHeader header{};
  std::memcpy(header.magic, MAGIC, sizeof(header.magic));
  header.versionMajor = VERSION_MAJOR;
  header.versionMinor = VERSION_MINOR;
  header.headerSize = sizeof(FileHeader);
  header.recordCount = toU32(records.size(), "record count");
  header.builtAt = builtAt;
  header.indexOffset = sizeof(FileHeader);
  header.indexLength = indexSection.size();
  header.recordOffset = header.indexOffset + header.indexLength;
  header.recordLength = recordSection.size();
  header.fileSize = header.recordOffset + header.recordLength;

  BinarySerial::Writer file(static_cast<size_t>(header.fileSize));
  file.write(header);
  file.writeBytes(indexSection.buffer().data(), indexSection.size());
  file.writeBytes(recordSection.buffer().data(), recordSection.size());

  std::vector<uint8_t> image = file.release();
  uint32_t checksum = computeChecksum(image.data(), image.size());
  std::memcpy(image.data() + CHECKSUM_OFFSET, &checksum, sizeof(checksum));
  return image;
}

BuildReport ArchiveBuilder::writeArchive(std::vector<SpeciesRecord> records,
                                         const std::filesystem::path &path) {
  auto now = std::chrono::system_clock::now();
  int64_t builtAt = std::chrono::duration_cast<std::chrono::seconds>(
                        now.time_since_epoch())
                        .count();
  return writeArchive(std::move(records), path, builtAt);
}

BuildReport ArchiveBuilder::writeArchive(std::vector<SpeciesRecord> records,
                                         const std::filesystem::path &path,
                                         int64_t builtAt) {
  BuildReport report;
  report.duplicatesDropped = dropDuplicateIds(records);
  report.recordCount = records.size();

  if (records.empty()) {
    report.status = BuildStatus::Empty;
    report.error = "No records to archive";
    ARCHIVE_ERROR("Refusing to write an empty archive to " + path.string());
    return report;
  }

  std::vector<uint8_t> image;
  try {
    image = serialize(records, builtAt);
  } catch (const std::length_error &e) {
    report.status = BuildStatus::DiskFailure;
    report.error = e.what();
    ARCHIVE_ERROR(std::format("Cannot serialize archive: {}", e.what()));
    return report;
  }

  if (!BinarySerial::writeFileAtomic(path, image, report.error)) {
    report.status = BuildStatus::DiskFailure;
    ARCHIVE_ERROR(std::format("Failed to write archive {}: {}", path.string(), report.error));
    return report;
  }

  report.bytesWritten = image.size();
  ARCHIVE_INFO(std::format("Wrote archive {} ({} records, {} bytes)", path.string(),
                           report.recordCount, report.bytesWritten));
  return report;
}

} // namespace DexVault
