/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "archive/ArchiveStore.hpp"
#include "core/Logger.hpp"
#include "utils/BinarySerializer.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>
#include <cstring>
#include <format>
#include <iterator>

namespace DexVault {

namespace {

using namespace ArchiveFormat;

constexpr size_t BUCKET_COUNT = TYPE_TAG_COUNT + GENERATION_COUNT;

// Absolute offsets of every section, filled in by a successful validation
struct Layout {
  size_t recordCount{0};
  int64_t builtAt{0};
  size_t indexAt{0};
  size_t bucketsAt{0};
  size_t poolAt{0};
  size_t poolCount{0};
  size_t lookupAt{0};
  size_t orderAt{0};
  size_t recordsAt{0};
  size_t recordLength{0};
};

/**
 * Walks a mapped archive image and checks every offset before the store
 * dereferences any of them.
 */
class ArchiveValidator {
public:
  explicit ArchiveValidator(BinarySerial::Reader file) : m_file(file) {}

  bool validate(Layout &layout) {
    return checkHeader(layout) && checkIndex(layout) && checkLookup(layout) &&
           checkRecords(layout) && checkBuckets(layout);
  }

  const std::string &getLastError() const { return m_error; }

private:
  struct RecordSummary {
    uint32_t typeMask{0};
    uint8_t generation{0};
  };

  BinarySerial::Reader m_file;
  std::string m_error;
  std::vector<int32_t> m_sortedIds;
  std::vector<uint32_t> m_sortedOrdinals; // parallel to m_sortedIds
  std::vector<int32_t> m_idByOrdinal;
  std::vector<RecordSummary> m_summaries;

  bool fail(std::string message) {
    m_error = std::move(message);
    return false;
  }

  bool checkHeader(Layout &layout) {
    auto header = m_file.read<FileHeader>(0);
    if (!header) {
      return fail(std::format("file is {} bytes, smaller than the archive header",
                              m_file.size()));
    }
    if (std::memcmp(header->magic, MAGIC, sizeof(MAGIC)) != 0) {
      return fail("bad magic, not a DexVault archive");
    }
    if (header->versionMajor != VERSION_MAJOR ||
        header->versionMinor != VERSION_MINOR) {
      unsigned major = header->versionMajor;
      unsigned minor = header->versionMinor;
      return fail(std::format("format version {}.{} does not match {}.{}", major,
                              minor, VERSION_MAJOR, VERSION_MINOR));
    }
    if (header->headerSize != sizeof(FileHeader)) {
      uint32_t headerSize = header->headerSize;
      return fail(std::format("header size {} is not {}", headerSize,
                              sizeof(FileHeader)));
    }
    if (header->fileSize != m_file.size()) {
      uint64_t declared = header->fileSize;
      return fail(std::format("header declares {} bytes but file has {}", declared,
                              m_file.size()));
    }

    uint32_t checksum = computeChecksum(m_file.data(), m_file.size());
    uint32_t stored = header->checksum;
    if (checksum != stored) {
      return fail(std::format("checksum mismatch (stored {:08x}, computed {:08x})",
                              stored, checksum));
    }

    const uint64_t fileSize = header->fileSize;
    if (header->indexOffset != header->headerSize ||
        header->indexLength > fileSize - header->indexOffset) {
      return fail("index section out of bounds");
    }
    if (header->recordOffset != header->indexOffset + header->indexLength ||
        header->recordOffset % RECORD_ALIGNMENT != 0) {
      return fail("record section misplaced");
    }
    if (header->recordLength != fileSize - header->recordOffset) {
      return fail("record section does not end at end of file");
    }
    if (header->recordCount == 0) {
      return fail("archive holds no records");
    }

    layout.recordCount = header->recordCount;
    layout.builtAt = header->builtAt;
    layout.indexAt = static_cast<size_t>(header->indexOffset);
    layout.recordsAt = static_cast<size_t>(header->recordOffset);
    layout.recordLength = static_cast<size_t>(header->recordLength);
    return true;
  }

  bool checkIndex(Layout &layout) {
    const size_t indexAt = layout.indexAt;
    BinarySerial::Reader index = m_file.slice(indexAt, layout.recordsAt - indexAt);

    auto header = index.read<IndexHeader>(0);
    if (!header) {
      return fail("index header truncated");
    }
    if (header->typeBucketCount != TYPE_TAG_COUNT ||
        header->generationBucketCount != GENERATION_COUNT) {
      uint32_t typeBuckets = header->typeBucketCount;
      uint32_t generationBuckets = header->generationBucketCount;
      return fail(std::format("index has {} type and {} generation buckets",
                              typeBuckets, generationBuckets));
    }

    const size_t bucketsEnd = sizeof(IndexHeader) + BUCKET_COUNT * sizeof(IndexBucket);
    const size_t count = layout.recordCount;
    const size_t poolBytes = size_t{header->idPoolCount} * sizeof(int32_t);
    if (header->idPoolOffset < bucketsEnd || header->idPoolOffset % alignof(int32_t) != 0 ||
        !index.contains(header->idPoolOffset, poolBytes)) {
      return fail("id pool out of bounds");
    }
    if (header->lookupOffset < header->idPoolOffset + poolBytes ||
        header->lookupOffset % sizeof(IdLookupEntry) != 0 ||
        !index.contains(header->lookupOffset, count * sizeof(IdLookupEntry))) {
      return fail("id lookup table out of bounds");
    }
    if (header->orderOffset < header->lookupOffset + count * sizeof(IdLookupEntry) ||
        header->orderOffset % alignof(uint32_t) != 0 ||
        !index.contains(header->orderOffset, count * sizeof(uint32_t))) {
      return fail("order table out of bounds");
    }

    layout.poolAt = indexAt + header->idPoolOffset;
    layout.poolCount = header->idPoolCount;
    layout.lookupAt = indexAt + header->lookupOffset;
    layout.orderAt = indexAt + header->orderOffset;
    layout.bucketsAt = indexAt + sizeof(IndexHeader);
    return true;
  }

  bool checkLookup(const Layout &layout) {
    const size_t count = layout.recordCount;
    m_sortedIds.reserve(count);
    m_sortedOrdinals.reserve(count);
    m_idByOrdinal.assign(count, 0);
    std::vector<bool> ordinalSeen(count, false);

    for (size_t i = 0; i < count; ++i) {
      auto entry = m_file.read<IdLookupEntry>(layout.lookupAt + i * sizeof(IdLookupEntry));
      if (!entry) {
        return fail("id lookup table truncated");
      }
      const int32_t id = entry->id;
      const uint32_t ordinal = entry->ordinal;
      if (!m_sortedIds.empty() && id <= m_sortedIds.back()) {
        return fail(std::format("id lookup not strictly ascending at entry {}", i));
      }
      if (ordinal >= count || ordinalSeen[ordinal]) {
        return fail(std::format("id {} has invalid ordinal {}", id, ordinal));
      }
      ordinalSeen[ordinal] = true;
      m_sortedIds.push_back(id);
      m_sortedOrdinals.push_back(ordinal);
      m_idByOrdinal[ordinal] = id;
    }
    return true;
  }

  bool checkRecords(const Layout &layout) {
    BinarySerial::Reader records = m_file.slice(layout.recordsAt, layout.recordLength);
    m_summaries.resize(layout.recordCount);

    size_t expected = 0;
    for (size_t ordinal = 0; ordinal < layout.recordCount; ++ordinal) {
      auto offset = m_file.read<uint32_t>(layout.orderAt + ordinal * sizeof(uint32_t));
      if (!offset || *offset != expected) {
        return fail(std::format("record {} is not where the order table says", ordinal));
      }
      auto header = records.read<RecordHeader>(*offset);
      if (!header) {
        return fail(std::format("record {} header truncated", ordinal));
      }
      const uint32_t recordSize = header->recordSize;
      if (recordSize < sizeof(RecordHeader) || recordSize % RECORD_ALIGNMENT != 0 ||
          !records.contains(*offset, recordSize)) {
        return fail(std::format("record {} has invalid size {}", ordinal,
                                recordSize));
      }
      if (!checkRecord(records.slice(*offset, recordSize), *header, ordinal)) {
        return false;
      }
      expected += recordSize;
    }

    if (expected != layout.recordLength) {
      return fail(std::format("record section has {} trailing bytes",
                              layout.recordLength - expected));
    }
    return true;
  }

  bool checkRecord(const BinarySerial::Reader &record, const RecordHeader &header,
                   size_t ordinal) {
    const int32_t id = header.id;
    if (id != m_idByOrdinal[ordinal]) {
      return fail(std::format("record {} carries id {}, lookup expects {}", ordinal,
                              id, m_idByOrdinal[ordinal]));
    }
    if (header.typeCount > MAX_TYPES_PER_RECORD) {
      return fail(std::format("species {} has {} types", id, header.typeCount));
    }
    RecordSummary &summary = m_summaries[ordinal];
    for (uint8_t i = 0; i < header.typeCount; ++i) {
      if (header.types[i] >= TYPE_TAG_COUNT) {
        return fail(std::format("species {} has type tag {}", id, header.types[i]));
      }
      summary.typeMask |= 1u << header.types[i];
    }
    if (header.generation >= GENERATION_COUNT) {
      return fail(std::format("species {} has generation tag {}", id,
                              header.generation));
    }
    summary.generation = header.generation;

    bool hasFlavor = (header.flags & RECORD_FLAG_HAS_FLAVOR) != 0;
    if (!string(record, header.name) || !string(record, header.spriteUrl) ||
        (hasFlavor && !string(record, header.flavorText))) {
      return fail(std::format("species {} string out of bounds", id));
    }

    if (!stringList(record, header.abilities)) {
      return fail(std::format("species {} ability list out of bounds", id));
    }

    if (!list(record, header.evolutions, sizeof(EvolutionEntry))) {
      return fail(std::format("species {} evolution list out of bounds", id));
    }
    for (uint32_t i = 0; i < header.evolutions.count; ++i) {
      auto entry = record.read<EvolutionEntry>(header.evolutions.offset +
                                               i * sizeof(EvolutionEntry));
      if (!entry || !string(record, entry->requirement)) {
        return fail(std::format("species {} evolution {} out of bounds", id, i));
      }
    }

    if (!list(record, header.encounters, sizeof(ArchiveFormat::EncounterEntry))) {
      return fail(std::format("species {} encounter list out of bounds", id));
    }
    for (uint32_t i = 0; i < header.encounters.count; ++i) {
      auto entry = record.read<ArchiveFormat::EncounterEntry>(
          header.encounters.offset + i * sizeof(ArchiveFormat::EncounterEntry));
      if (!entry || !string(record, entry->game) || !stringList(record, entry->locations)) {
        return fail(std::format("species {} encounter {} out of bounds", id, i));
      }
    }
    return true;
  }

  // Every bucket is sorted, inside the pool and names records that match it
  bool checkBuckets(const Layout &layout) {
    for (size_t b = 0; b < BUCKET_COUNT; ++b) {
      auto bucket = m_file.read<IndexBucket>(layout.bucketsAt + b * sizeof(IndexBucket));
      if (!bucket || size_t{bucket->first} + bucket->count > layout.poolCount) {
        return fail(std::format("index bucket {} out of bounds", b));
      }

      const bool isType = b < TYPE_TAG_COUNT;
      const size_t tag = isType ? b : b - TYPE_TAG_COUNT;
      int32_t previous = 0;
      for (uint32_t i = 0; i < bucket->count; ++i) {
        auto id = m_file.read<int32_t>(layout.poolAt +
                                       (size_t{bucket->first} + i) * sizeof(int32_t));
        if (!id || (i > 0 && *id <= previous)) {
          return fail(std::format("index bucket {} is not sorted", b));
        }
        previous = *id;

        auto it = std::lower_bound(m_sortedIds.begin(), m_sortedIds.end(), *id);
        if (it == m_sortedIds.end() || *it != *id) {
          return fail(std::format("index bucket {} names unknown id {}", b, *id));
        }
        auto position = static_cast<size_t>(std::distance(m_sortedIds.begin(), it));
        const RecordSummary &summary = m_summaries[m_sortedOrdinals[position]];
        bool member = isType ? (summary.typeMask & (1u << tag)) != 0
                             : summary.generation == tag;
        if (!member) {
          return fail(std::format("index bucket {} lists id {} which does not match it",
                                  b, *id));
        }
      }
    }
    return true;
  }

  static bool string(const BinarySerial::Reader &record, const StrRef &ref) {
    return record.contains(ref.offset, ref.length);
  }

  static bool list(const BinarySerial::Reader &record, const ListRef &ref,
                   size_t entrySize) {
    return record.contains(ref.offset, size_t{ref.count} * entrySize);
  }

  bool stringList(const BinarySerial::Reader &record, const ListRef &ref) {
    if (!list(record, ref, sizeof(StrRef))) {
      return false;
    }
    for (uint32_t i = 0; i < ref.count; ++i) {
      auto entry = record.read<StrRef>(ref.offset + i * sizeof(StrRef));
      if (!entry || !string(record, *entry)) {
        return false;
      }
    }
    return true;
  }
};

} // namespace

const char *archiveStatusName(ArchiveStatus status) {
  switch (status) {
  case ArchiveStatus::Ok:
    return "Ok";
  case ArchiveStatus::Missing:
    return "Missing";
  case ArchiveStatus::Corrupt:
    return "Corrupt";
  case ArchiveStatus::IoError:
    return "IoError";
  }
  return "Unknown";
}

ArchiveStatus ArchiveStore::fail(ArchiveStatus status, std::string message) {
  close();
  m_lastError = std::move(message);
  return status;
}

void ArchiveStore::close() {
  m_file = MappedFile();
  m_count = 0;
  m_builtAt = 0;
  m_buckets = nullptr;
  m_idPool = nullptr;
  m_lookup = nullptr;
  m_order = nullptr;
  m_records = nullptr;
}

ArchiveStatus ArchiveStore::open(const std::filesystem::path &path) {
  close();
  m_path = path;
  m_lastError.clear();

  MappedFile mapping;
  std::string error;
  switch (mapping.open(path.string(), error)) {
  case MappedFile::Result::Ok:
    break;
  case MappedFile::Result::NotFound:
    STORE_INFO("No archive at " + path.string());
    return fail(ArchiveStatus::Missing, error);
  case MappedFile::Result::OpenFailed:
  case MappedFile::Result::MapFailed:
    STORE_ERROR(error);
    return fail(ArchiveStatus::IoError, error);
  }

  Layout layout;
  ArchiveValidator validator(BinarySerial::Reader(mapping.data(), mapping.size()));
  if (!validator.validate(layout)) {
    STORE_WARN(std::format("Archive {} is corrupt: {}", path.string(),
                           validator.getLastError()));
    return fail(ArchiveStatus::Corrupt, validator.getLastError());
  }

  const uint8_t *base = mapping.data();
  m_file = std::move(mapping);
  m_count = layout.recordCount;
  m_builtAt = layout.builtAt;
  m_buckets = reinterpret_cast<const IndexBucket *>(base + layout.bucketsAt);
  m_idPool = reinterpret_cast<const int32_t *>(base + layout.poolAt);
  m_lookup = reinterpret_cast<const IdLookupEntry *>(base + layout.lookupAt);
  m_order = reinterpret_cast<const uint32_t *>(base + layout.orderAt);
  m_records = base + layout.recordsAt;

  STORE_INFO(std::format("Opened {} ({} records, {} bytes)", path.string(), m_count,
                         m_file.size()));
  return ArchiveStatus::Ok;
}

std::optional<uint32_t> ArchiveStore::ordinalOf(int32_t id) const {
  const IdLookupEntry *first = m_lookup;
  const IdLookupEntry *last = m_lookup + m_count;
  const IdLookupEntry *it = std::lower_bound(
      first, last, id,
      [](const IdLookupEntry &entry, int32_t value) { return entry.id < value; });
  if (it == last || it->id != id) {
    return std::nullopt;
  }
  return it->ordinal;
}

SpeciesView ArchiveStore::at(size_t ordinal) const {
  return SpeciesView(m_records + m_order[ordinal]);
}

std::optional<SpeciesView> ArchiveStore::get(int32_t id) const {
  if (!isOpen()) {
    return std::nullopt;
  }
  auto ordinal = ordinalOf(id);
  if (!ordinal) {
    return std::nullopt;
  }
  return at(*ordinal);
}

std::vector<SpeciesView> ArchiveStore::page(size_t offset, size_t limit) const {
  std::vector<SpeciesView> result;
  if (offset >= m_count) {
    return result;
  }
  size_t end = offset + std::min(limit, m_count - offset);
  result.reserve(end - offset);
  for (size_t ordinal = offset; ordinal < end; ++ordinal) {
    result.push_back(at(ordinal));
  }
  return result;
}

ArchiveStore::IdSlice ArchiveStore::bucket(size_t index) const {
  const IndexBucket &entry = m_buckets[index];
  return IdSlice{m_idPool + entry.first, entry.count};
}

ArchiveStore::IdSlice ArchiveStore::typeBucket(TypeTag tag) const {
  auto slot = static_cast<size_t>(tag);
  if (slot >= TYPE_TAG_COUNT) {
    return IdSlice{};
  }
  return bucket(slot);
}

ArchiveStore::IdSlice ArchiveStore::generationBucket(Generation generation) const {
  auto slot = static_cast<size_t>(generation);
  if (slot >= GENERATION_COUNT) {
    return IdSlice{};
  }
  return bucket(TYPE_TAG_COUNT + slot);
}

std::vector<int32_t> ArchiveStore::typeCandidates(const SpeciesFilter &filter) const {
  std::vector<int32_t> ids;

  if (filter.typeMode == TypeFilterMode::Exclusive) {
    // A type nobody can carry empties the intersection
    if (filter.unresolvedType || filter.types.empty()) {
      return ids;
    }
    IdSlice first = typeBucket(filter.types.front());
    ids.assign(first.first, first.first + first.count);
    for (size_t i = 1; i < filter.types.size() && !ids.empty(); ++i) {
      IdSlice next = typeBucket(filter.types[i]);
      std::vector<int32_t> narrowed;
      std::set_intersection(ids.begin(), ids.end(), next.first, next.first + next.count,
                            std::back_inserter(narrowed));
      ids.swap(narrowed);
    }
    return ids;
  }

  for (TypeTag tag : filter.types) {
    IdSlice slice = typeBucket(tag);
    std::vector<int32_t> merged;
    merged.reserve(ids.size() + slice.count);
    std::set_union(ids.begin(), ids.end(), slice.first, slice.first + slice.count,
                   std::back_inserter(merged));
    ids.swap(merged);
  }
  return ids;
}

std::vector<int32_t> ArchiveStore::generationCandidates(const SpeciesFilter &filter) const {
  std::vector<int32_t> ids;
  for (Generation generation : filter.generations) {
    IdSlice slice = generationBucket(generation);
    std::vector<int32_t> merged;
    merged.reserve(ids.size() + slice.count);
    std::set_union(ids.begin(), ids.end(), slice.first, slice.first + slice.count,
                   std::back_inserter(merged));
    ids.swap(merged);
  }
  return ids;
}

bool ArchiveStore::matchesPredicates(const SpeciesView &view, const SpeciesFilter &filter) {
  for (size_t i = 0; i < STAT_COUNT; ++i) {
    const auto &minimum = filter.minStats[i];
    if (minimum && view.stat(static_cast<StatKind>(i)) < *minimum) {
      return false;
    }
  }
  if (filter.minTotalStats && view.totalStats() < *filter.minTotalStats) {
    return false;
  }
  if (!filter.nameQuery.empty() &&
      !StringUtils::containsIgnoreCase(view.name(), filter.nameQuery)) {
    return false;
  }
  return true;
}

std::vector<SpeciesView> ArchiveStore::filter(const SpeciesFilter &filter) const {
  std::vector<SpeciesView> result;
  if (!isOpen()) {
    return result;
  }

  const bool byType = filter.hasTypeConstraint();
  const bool byGeneration = filter.hasGenerationConstraint();

  if (!byType && !byGeneration) {
    for (size_t ordinal = 0; ordinal < m_count; ++ordinal) {
      SpeciesView view = at(ordinal);
      if (matchesPredicates(view, filter)) {
        result.push_back(view);
      }
    }
    return result;
  }

  std::vector<int32_t> ids;
  if (byType && byGeneration) {
    std::vector<int32_t> types = typeCandidates(filter);
    std::vector<int32_t> generations = generationCandidates(filter);
    std::set_intersection(types.begin(), types.end(), generations.begin(),
                          generations.end(), std::back_inserter(ids));
  } else if (byType) {
    ids = typeCandidates(filter);
  } else {
    ids = generationCandidates(filter);
  }

  std::vector<uint32_t> ordinals;
  ordinals.reserve(ids.size());
  for (int32_t id : ids) {
    if (auto ordinal = ordinalOf(id)) {
      ordinals.push_back(*ordinal);
    }
  }
  std::sort(ordinals.begin(), ordinals.end());

  for (uint32_t ordinal : ordinals) {
    SpeciesView view = at(ordinal);
    if (matchesPredicates(view, filter)) {
      result.push_back(view);
    }
  }
  STORE_DEBUG(std::format("Filter narrowed {} index candidates to {} results",
                          ordinals.size(), result.size()));
  return result;
}

std::vector<SpeciesView> ArchiveStore::search(std::string_view text) const {
  SpeciesFilter byName;
  byName.nameQuery = std::string(text);
  return filter(byName);
}

} // namespace DexVault
