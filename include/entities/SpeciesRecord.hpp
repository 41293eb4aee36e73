/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPECIES_RECORD_HPP
#define SPECIES_RECORD_HPP

#include <boost/container/small_vector.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DexVault {

/**
 * @brief Elemental type of a species
 *
 * Values are stored in the archive; never reorder.
 */
enum class TypeTag : uint8_t {
  Normal = 0,
  Fire,
  Water,
  Electric,
  Grass,
  Ice,
  Fighting,
  Poison,
  Ground,
  Flying,
  Psychic,
  Bug,
  Rock,
  Ghost,
  Dragon,
  Dark,
  Steel,
  Fairy,
  Unknown // upstream type outside the list above
};

constexpr size_t TYPE_TAG_COUNT = static_cast<size_t>(TypeTag::Unknown) + 1;
constexpr size_t MAX_TYPES_PER_RECORD = 4;

// Generation a species was introduced in. Stored in the archive.
enum class Generation : uint8_t {
  Unknown = 0,
  I,
  II,
  III,
  IV,
  V,
  VI,
  VII,
  VIII,
  IX
};

constexpr size_t GENERATION_COUNT = static_cast<size_t>(Generation::IX) + 1;

enum class StatKind : uint8_t {
  Hp = 0,
  Attack,
  Defense,
  SpecialAttack,
  SpecialDefense,
  Speed
};

constexpr size_t STAT_COUNT = 6;

struct BaseStats {
  int32_t hp{0};
  int32_t attack{0};
  int32_t defense{0};
  int32_t specialAttack{0};
  int32_t specialDefense{0};
  int32_t speed{0};

  int32_t value(StatKind kind) const;
  void setValue(StatKind kind, int32_t value);
  int32_t total() const {
    return hp + attack + defense + specialAttack + specialDefense + speed;
  }

  bool operator==(const BaseStats &) const = default;
};

struct EvolutionLink {
  int32_t speciesId{0};
  std::string requirement; // e.g. "Level 16", empty for the base form

  bool operator==(const EvolutionLink &) const = default;
};

struct EncounterEntry {
  std::string game;
  std::vector<std::string> locations;

  bool operator==(const EncounterEntry &) const = default;
};

using TypeList = boost::container::small_vector<TypeTag, 2>;

/**
 * @brief Owned form of one species, produced by the fetcher and consumed by
 * the archive builder. The archive hands out SpeciesView instead.
 */
struct SpeciesRecord {
  int32_t id{0};
  std::string name;
  TypeList types;
  std::vector<std::string> abilities;
  BaseStats stats;
  int32_t height{0}; // decimetres
  int32_t weight{0}; // hectograms
  Generation generation{Generation::Unknown};
  std::optional<std::string> flavorText;
  std::vector<EvolutionLink> evolutions;
  std::vector<EncounterEntry> encounters;
  std::string spriteUrl;

  bool operator==(const SpeciesRecord &other) const;
};

// Lower-case tag name ("fire"); "unknown" for TypeTag::Unknown
std::string_view typeTagName(TypeTag tag);

// Case-insensitive; std::nullopt for anything but the 18 known names
std::optional<TypeTag> parseTypeTag(std::string_view name);

// Maps an upstream type name, anything unrecognized becomes Unknown
TypeTag typeTagFromUpstream(std::string_view name);

// Roman numeral ("IV"); "Unknown" for Generation::Unknown
std::string_view generationName(Generation generation);

/**
 * @brief Parses a generation written as "generation-iv", "iv" or "4"
 * @return std::nullopt when the text names no known generation
 */
std::optional<Generation> parseGeneration(std::string_view text);

std::string_view statName(StatKind kind);

// Accepts upstream names ("special-attack") and short forms ("spatk")
std::optional<StatKind> parseStatKind(std::string_view name);

} // namespace DexVault

#endif // SPECIES_RECORD_HPP
