/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPECIES_FILTER_HPP
#define SPECIES_FILTER_HPP

#include "entities/SpeciesRecord.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DexVault {

// How multiple selected types combine
enum class TypeFilterMode {
  Exclusive, // species must carry every selected type
  Inclusive  // species must carry at least one selected type
};

std::optional<TypeFilterMode> parseTypeFilterMode(std::string_view text);
const char *typeFilterModeName(TypeFilterMode mode);

/**
 * @brief Query against the archive
 *
 * Empty type and generation lists mean "no constraint". Names that do not
 * resolve to a known tag (addTypeName / addGenerationName) make their
 * constraint match nothing instead of failing.
 */
struct SpeciesFilter {
  std::vector<TypeTag> types;
  TypeFilterMode typeMode{TypeFilterMode::Exclusive};
  std::vector<Generation> generations;
  std::array<std::optional<int32_t>, STAT_COUNT> minStats{};
  std::optional<int32_t> minTotalStats;
  std::string nameQuery; // case-insensitive substring, empty = any

  bool unresolvedType{false};
  bool unresolvedGeneration{false};

  SpeciesFilter &addType(TypeTag tag);
  SpeciesFilter &addTypeName(std::string_view name);
  SpeciesFilter &addGeneration(Generation generation);
  SpeciesFilter &addGenerationName(std::string_view name);
  SpeciesFilter &setMinStat(StatKind kind, int32_t minimum);

  bool hasTypeConstraint() const { return !types.empty() || unresolvedType; }
  bool hasGenerationConstraint() const {
    return !generations.empty() || unresolvedGeneration;
  }
  bool hasStatConstraint() const;
  bool isEmpty() const;
};

} // namespace DexVault

#endif // SPECIES_FILTER_HPP
