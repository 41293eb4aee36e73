/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "archive/SpeciesView.hpp"

namespace DexVault {

TypeList SpeciesView::types() const {
  const auto &h = header();
  TypeList result;
  for (uint8_t i = 0; i < h.typeCount; ++i) {
    result.push_back(static_cast<TypeTag>(h.types[i]));
  }
  return result;
}

bool SpeciesView::hasType(TypeTag tag) const {
  const auto &h = header();
  for (uint8_t i = 0; i < h.typeCount; ++i) {
    if (h.types[i] == static_cast<uint8_t>(tag)) {
      return true;
    }
  }
  return false;
}

BaseStats SpeciesView::stats() const {
  BaseStats result;
  for (size_t i = 0; i < STAT_COUNT; ++i) {
    result.setValue(static_cast<StatKind>(i), header().stats[i]);
  }
  return result;
}

int32_t SpeciesView::totalStats() const {
  int32_t total = 0;
  for (size_t i = 0; i < STAT_COUNT; ++i) {
    total += header().stats[i];
  }
  return total;
}

std::optional<std::string_view> SpeciesView::flavorText() const {
  const auto &h = header();
  if ((h.flags & ArchiveFormat::RECORD_FLAG_HAS_FLAVOR) == 0) {
    return std::nullopt;
  }
  return decodeString(m_record, h.flavorText);
}

SpeciesRecord SpeciesView::toRecord() const {
  SpeciesRecord record;
  record.id = id();
  record.name = std::string(name());
  record.types = types();
  for (std::string_view ability : abilities()) {
    record.abilities.emplace_back(ability);
  }
  record.stats = stats();
  record.height = height();
  record.weight = weight();
  record.generation = generation();
  if (auto flavor = flavorText()) {
    record.flavorText = std::string(*flavor);
  }
  for (const EvolutionView &evolution : evolutions()) {
    record.evolutions.push_back(
        EvolutionLink{evolution.speciesId, std::string(evolution.requirement)});
  }
  for (const EncounterView &encounter : encounters()) {
    EncounterEntry entry;
    entry.game = std::string(encounter.game);
    for (std::string_view location : encounter.locations) {
      entry.locations.emplace_back(location);
    }
    record.encounters.push_back(std::move(entry));
  }
  record.spriteUrl = std::string(spriteUrl());
  return record;
}

} // namespace DexVault
