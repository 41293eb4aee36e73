/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/SpeciesRecord.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>

namespace DexVault {

namespace {

constexpr std::array<std::string_view, TYPE_TAG_COUNT> TYPE_NAMES = {
    "normal", "fire",    "water", "electric", "grass",  "ice",   "fighting",
    "poison", "ground",  "flying", "psychic", "bug",    "rock",  "ghost",
    "dragon", "dark",    "steel", "fairy",    "unknown"};

constexpr std::array<std::string_view, GENERATION_COUNT> GENERATION_NUMERALS = {
    "Unknown", "I", "II", "III", "IV", "V", "VI", "VII", "VIII", "IX"};

constexpr std::array<std::string_view, STAT_COUNT> STAT_NAMES = {
    "hp", "attack", "defense", "special-attack", "special-defense", "speed"};

} // namespace

int32_t BaseStats::value(StatKind kind) const {
  switch (kind) {
  case StatKind::Hp:
    return hp;
  case StatKind::Attack:
    return attack;
  case StatKind::Defense:
    return defense;
  case StatKind::SpecialAttack:
    return specialAttack;
  case StatKind::SpecialDefense:
    return specialDefense;
  case StatKind::Speed:
    return speed;
  }
  return 0;
}

void BaseStats::setValue(StatKind kind, int32_t value) {
  switch (kind) {
  case StatKind::Hp:
    hp = value;
    break;
  case StatKind::Attack:
    attack = value;
    break;
  case StatKind::Defense:
    defense = value;
    break;
  case StatKind::SpecialAttack:
    specialAttack = value;
    break;
  case StatKind::SpecialDefense:
    specialDefense = value;
    break;
  case StatKind::Speed:
    speed = value;
    break;
  }
}

bool SpeciesRecord::operator==(const SpeciesRecord &other) const {
  return id == other.id && name == other.name &&
         std::equal(types.begin(), types.end(), other.types.begin(),
                    other.types.end()) &&
         abilities == other.abilities && stats == other.stats &&
         height == other.height && weight == other.weight &&
         generation == other.generation && flavorText == other.flavorText &&
         evolutions == other.evolutions && encounters == other.encounters &&
         spriteUrl == other.spriteUrl;
}

std::string_view typeTagName(TypeTag tag) {
  auto index = static_cast<size_t>(tag);
  return index < TYPE_TAG_COUNT ? TYPE_NAMES[index] : TYPE_NAMES.back();
}

std::optional<TypeTag> parseTypeTag(std::string_view name) {
  // Unknown is a storage bucket, not something a user can ask for
  for (size_t i = 0; i + 1 < TYPE_TAG_COUNT; ++i) {
    if (StringUtils::equalsIgnoreCase(name, TYPE_NAMES[i])) {
      return static_cast<TypeTag>(i);
    }
  }
  return std::nullopt;
}

TypeTag typeTagFromUpstream(std::string_view name) {
  return parseTypeTag(name).value_or(TypeTag::Unknown);
}

std::string_view generationName(Generation generation) {
  auto index = static_cast<size_t>(generation);
  return index < GENERATION_COUNT ? GENERATION_NUMERALS[index]
                                  : GENERATION_NUMERALS[0];
}

std::optional<Generation> parseGeneration(std::string_view text) {
  constexpr std::string_view prefix = "generation-";
  if (text.size() > prefix.size() &&
      StringUtils::equalsIgnoreCase(text.substr(0, prefix.size()), prefix)) {
    text.remove_prefix(prefix.size());
  }

  if (auto number = StringUtils::parseInt(text)) {
    if (*number >= 1 && *number < static_cast<int>(GENERATION_COUNT)) {
      return static_cast<Generation>(*number);
    }
    return std::nullopt;
  }

  for (size_t i = 1; i < GENERATION_COUNT; ++i) {
    if (StringUtils::equalsIgnoreCase(text, GENERATION_NUMERALS[i])) {
      return static_cast<Generation>(i);
    }
  }
  return std::nullopt;
}

std::string_view statName(StatKind kind) {
  auto index = static_cast<size_t>(kind);
  return index < STAT_COUNT ? STAT_NAMES[index] : std::string_view("unknown");
}

std::optional<StatKind> parseStatKind(std::string_view name) {
  for (size_t i = 0; i < STAT_COUNT; ++i) {
    if (StringUtils::equalsIgnoreCase(name, STAT_NAMES[i])) {
      return static_cast<StatKind>(i);
    }
  }

  struct Alias {
    std::string_view name;
    StatKind kind;
  };
  constexpr std::array<Alias, 6> aliases = {{{"atk", StatKind::Attack},
                                             {"def", StatKind::Defense},
                                             {"spatk", StatKind::SpecialAttack},
                                             {"sp-attack", StatKind::SpecialAttack},
                                             {"spdef", StatKind::SpecialDefense},
                                             {"sp-defense", StatKind::SpecialDefense}}};
  auto it = std::find_if(aliases.begin(), aliases.end(), [name](const Alias &a) {
    return StringUtils::equalsIgnoreCase(name, a.name);
  });
  if (it != aliases.end()) {
    return it->kind;
  }
  return std::nullopt;
}

} // namespace DexVault
