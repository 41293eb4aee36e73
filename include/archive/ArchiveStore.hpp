/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ARCHIVE_STORE_HPP
#define ARCHIVE_STORE_HPP

#include "archive/ArchiveFormat.hpp"
#include "archive/MappedFile.hpp"
#include "archive/SpeciesFilter.hpp"
#include "archive/SpeciesView.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DexVault {

enum class ArchiveStatus { Ok, Missing, Corrupt, IoError };

const char *archiveStatusName(ArchiveStatus status);

/**
 * @brief Read-only, memory-mapped species archive
 *
 * open() validates the whole file (header, checksum, every index entry and
 * every record reference) before anything becomes visible. After a failed
 * open the store is closed; it never serves a partially validated file.
 *
 * Queries never copy record bodies: results are SpeciesView objects that
 * point into the mapping and stay valid for the lifetime of the store.
 * All const members are safe to call from several threads at once.
 */
class ArchiveStore {
public:
  // Stored-order walk over every record; restartable
  class Range {
  public:
    class Iterator {
    public:
      using iterator_category = std::input_iterator_tag;
      using value_type = SpeciesView;
      using difference_type = std::ptrdiff_t;
      using pointer = void;
      using reference = SpeciesView;

      Iterator() = default;
      Iterator(const ArchiveStore *store, size_t ordinal)
          : m_store(store), m_ordinal(ordinal) {}

      SpeciesView operator*() const { return m_store->at(m_ordinal); }
      Iterator &operator++() {
        ++m_ordinal;
        return *this;
      }
      Iterator operator++(int) {
        Iterator copy = *this;
        ++m_ordinal;
        return copy;
      }
      bool operator==(const Iterator &other) const {
        return m_ordinal == other.m_ordinal;
      }

    private:
      const ArchiveStore *m_store{nullptr};
      size_t m_ordinal{0};
    };

    explicit Range(const ArchiveStore *store) : m_store(store) {}

    Iterator begin() const { return Iterator(m_store, 0); }
    Iterator end() const { return Iterator(m_store, m_store->count()); }
    size_t size() const { return m_store->count(); }

  private:
    const ArchiveStore *m_store;
  };

  ArchiveStore() = default;
  ~ArchiveStore() = default;
  ArchiveStore(const ArchiveStore &) = delete;
  ArchiveStore &operator=(const ArchiveStore &) = delete;
  ArchiveStore(ArchiveStore &&) = delete;
  ArchiveStore &operator=(ArchiveStore &&) = delete;

  /**
   * @brief Maps and validates the archive at path
   *
   * Any previously opened archive is closed first. Missing when no file
   * exists, IoError when it cannot be opened or mapped, Corrupt on any
   * format, version, size, checksum or structural mismatch.
   */
  ArchiveStatus open(const std::filesystem::path &path);
  void close();

  bool isOpen() const { return m_records != nullptr; }
  size_t count() const { return m_count; }
  int64_t builtAt() const { return m_builtAt; }
  const std::filesystem::path &path() const { return m_path; }
  size_t fileSize() const { return m_file.size(); }
  const std::string &getLastError() const { return m_lastError; }

  std::optional<SpeciesView> get(int32_t id) const;

  // ordinal must be below count()
  SpeciesView at(size_t ordinal) const;

  Range iterate() const { return Range(this); }

  /**
   * @brief Stored-order slice [offset, offset + limit)
   * @return fewer than limit views at the end of the archive, none past it
   */
  std::vector<SpeciesView> page(size_t offset, size_t limit) const;

  /**
   * @brief Species matching every constraint in filter, in stored order
   *
   * Candidates come from the type and generation indices; stat and name
   * predicates only run over that subset. Without a type or generation
   * constraint the predicates run over the whole archive.
   */
  std::vector<SpeciesView> filter(const SpeciesFilter &filter) const;

  // Case-insensitive name substring; empty text matches everything
  std::vector<SpeciesView> search(std::string_view text) const;

private:
  // Sorted id slice of the pool for one bucket
  struct IdSlice {
    const int32_t *first{nullptr};
    size_t count{0};
  };

  IdSlice typeBucket(TypeTag tag) const;
  IdSlice generationBucket(Generation generation) const;
  IdSlice bucket(size_t index) const;
  std::optional<uint32_t> ordinalOf(int32_t id) const;

  std::vector<int32_t> typeCandidates(const SpeciesFilter &filter) const;
  std::vector<int32_t> generationCandidates(const SpeciesFilter &filter) const;
  static bool matchesPredicates(const SpeciesView &view, const SpeciesFilter &filter);

  ArchiveStatus fail(ArchiveStatus status, std::string message);

  MappedFile m_file;
  std::filesystem::path m_path;
  std::string m_lastError;

  size_t m_count{0};
  int64_t m_builtAt{0};
  const ArchiveFormat::IndexBucket *m_buckets{nullptr};
  const int32_t *m_idPool{nullptr};
  const ArchiveFormat::IdLookupEntry *m_lookup{nullptr};
  const uint32_t *m_order{nullptr};
  const uint8_t *m_records{nullptr};
};

} // namespace DexVault

#endif // ARCHIVE_STORE_HPP
