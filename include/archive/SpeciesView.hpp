/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPECIES_VIEW_HPP
#define SPECIES_VIEW_HPP

#include "archive/ArchiveFormat.hpp"
#include "entities/SpeciesRecord.hpp"
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>

namespace DexVault {

/**
 * @brief Read-only view over a fixed-stride table inside a mapped record
 *
 * Elements are decoded on access; nothing is copied out of the mapping
 * except scalars.
 */
template <typename Entry, typename Value,
          Value (*Decode)(const uint8_t *record, const Entry &entry)>
class PackedListView {
public:
  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Value;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = Value;

    Iterator() = default;
    Iterator(const PackedListView *list, size_t index)
        : m_list(list), m_index(index) {}

    Value operator*() const { return (*m_list)[m_index]; }
    Iterator &operator++() {
      ++m_index;
      return *this;
    }
    Iterator operator++(int) {
      Iterator copy = *this;
      ++m_index;
      return copy;
    }
    bool operator==(const Iterator &other) const {
      return m_index == other.m_index;
    }

  private:
    const PackedListView *m_list{nullptr};
    size_t m_index{0};
  };

  PackedListView() = default;
  PackedListView(const uint8_t *record, ArchiveFormat::ListRef ref)
      : m_record(record), m_table(record + ref.offset), m_count(ref.count) {}

  size_t size() const { return m_count; }
  bool empty() const { return m_count == 0; }

  Value operator[](size_t index) const {
    const auto *entry =
        reinterpret_cast<const Entry *>(m_table + index * sizeof(Entry));
    return Decode(m_record, *entry);
  }

  Iterator begin() const { return Iterator(this, 0); }
  Iterator end() const { return Iterator(this, m_count); }

private:
  const uint8_t *m_record{nullptr};
  const uint8_t *m_table{nullptr};
  size_t m_count{0};
};

inline std::string_view decodeString(const uint8_t *record,
                                     const ArchiveFormat::StrRef &ref) {
  return std::string_view(reinterpret_cast<const char *>(record + ref.offset),
                          ref.length);
}

using StringListView =
    PackedListView<ArchiveFormat::StrRef, std::string_view, &decodeString>;

struct EvolutionView {
  int32_t speciesId;
  std::string_view requirement;
};

struct EncounterView {
  std::string_view game;
  StringListView locations;
};

inline EvolutionView decodeEvolution(const uint8_t *record,
                                     const ArchiveFormat::EvolutionEntry &entry) {
  return EvolutionView{entry.speciesId, decodeString(record, entry.requirement)};
}

inline EncounterView decodeEncounter(const uint8_t *record,
                                     const ArchiveFormat::EncounterEntry &entry) {
  return EncounterView{decodeString(record, entry.game),
                       StringListView(record, entry.locations)};
}

using EvolutionListView =
    PackedListView<ArchiveFormat::EvolutionEntry, EvolutionView, &decodeEvolution>;
using EncounterListView =
    PackedListView<ArchiveFormat::EncounterEntry, EncounterView, &decodeEncounter>;

/**
 * @brief Zero-copy accessor for one archived species
 *
 * Valid only while the ArchiveStore that produced it is alive; hold a
 * store snapshot (CacheLifecycleManager::snapshot) for longer use.
 */
class SpeciesView {
public:
  explicit SpeciesView(const uint8_t *record) : m_record(record) {}

  int32_t id() const { return header().id; }
  std::string_view name() const { return decodeString(m_record, header().name); }

  TypeList types() const;
  bool hasType(TypeTag tag) const;

  BaseStats stats() const;
  int32_t stat(StatKind kind) const {
    return header().stats[static_cast<size_t>(kind)];
  }
  int32_t totalStats() const;

  int32_t height() const { return header().height; }
  int32_t weight() const { return header().weight; }
  Generation generation() const {
    return static_cast<Generation>(header().generation);
  }

  std::optional<std::string_view> flavorText() const;
  std::string_view spriteUrl() const {
    return decodeString(m_record, header().spriteUrl);
  }

  StringListView abilities() const {
    return StringListView(m_record, header().abilities);
  }
  EvolutionListView evolutions() const {
    return EvolutionListView(m_record, header().evolutions);
  }
  EncounterListView encounters() const {
    return EncounterListView(m_record, header().encounters);
  }

  // Owned copy of every field
  SpeciesRecord toRecord() const;

private:
  const ArchiveFormat::RecordHeader &header() const {
    return *reinterpret_cast<const ArchiveFormat::RecordHeader *>(m_record);
  }

  const uint8_t *m_record;
};

} // namespace DexVault

#endif // SPECIES_VIEW_HPP
