/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "archive/SpeciesFilter.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>

namespace DexVault {

std::optional<TypeFilterMode> parseTypeFilterMode(std::string_view text) {
  if (StringUtils::equalsIgnoreCase(text, "exclusive")) {
    return TypeFilterMode::Exclusive;
  }
  if (StringUtils::equalsIgnoreCase(text, "inclusive")) {
    return TypeFilterMode::Inclusive;
  }
  return std::nullopt;
}

const char *typeFilterModeName(TypeFilterMode mode) {
  return mode == TypeFilterMode::Inclusive ? "inclusive" : "exclusive";
}

SpeciesFilter &SpeciesFilter::addType(TypeTag tag) {
  if (std::find(types.begin(), types.end(), tag) == types.end()) {
    types.push_back(tag);
  }
  return *this;
}

SpeciesFilter &SpeciesFilter::addTypeName(std::string_view name) {
  if (auto tag = parseTypeTag(name)) {
    return addType(*tag);
  }
  unresolvedType = true;
  return *this;
}

SpeciesFilter &SpeciesFilter::addGeneration(Generation generation) {
  if (std::find(generations.begin(), generations.end(), generation) ==
      generations.end()) {
    generations.push_back(generation);
  }
  return *this;
}

SpeciesFilter &SpeciesFilter::addGenerationName(std::string_view name) {
  if (auto generation = parseGeneration(name)) {
    return addGeneration(*generation);
  }
  unresolvedGeneration = true;
  return *this;
}

SpeciesFilter &SpeciesFilter::setMinStat(StatKind kind, int32_t minimum) {
  minStats[static_cast<size_t>(kind)] = minimum;
  return *this;
}

bool SpeciesFilter::hasStatConstraint() const {
  return minTotalStats.has_value() ||
         std::any_of(minStats.begin(), minStats.end(),
                     [](const std::optional<int32_t> &m) { return m.has_value(); });
}

bool SpeciesFilter::isEmpty() const {
  return !hasTypeConstraint() && !hasGenerationConstraint() &&
         !hasStatConstraint() && nameQuery.empty();
}

} // namespace DexVault
