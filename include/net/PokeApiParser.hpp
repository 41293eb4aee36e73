/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POKE_API_PARSER_HPP
#define POKE_API_PARSER_HPP

#include "entities/SpeciesRecord.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DexVault {

class JsonValue;

// One row of /pokemon?limit=N
struct SpeciesIndexEntry {
  int32_t id{0};
  std::string name;
  std::string url;
};

// Fields taken from /pokemon/{id}
struct PokemonDetail {
  SpeciesRecord record; // id, name, types, abilities, stats, size, spriteUrl
  std::string speciesUrl;
  std::string encountersUrl;
};

// Fields taken from /pokemon-species/{id}
struct SpeciesMetadata {
  std::optional<std::string> flavorText;
  Generation generation{Generation::Unknown};
  std::string evolutionChainUrl;
};

/**
 * @brief Converts upstream (PokeAPI v2) JSON documents into record fields
 *
 * Every parse function returns std::nullopt and fills error when the
 * document is not valid JSON or lacks a required field. Optional upstream
 * fields that are missing or null are left at their defaults.
 */
class PokeApiParser {
public:
  // Entries whose URL does not end in a numeric id are skipped
  static std::optional<std::vector<SpeciesIndexEntry>> parseIndex(std::string_view json,
                                                                  std::string &error);

  static std::optional<PokemonDetail> parsePokemon(std::string_view json,
                                                   std::string &error);

  static std::optional<SpeciesMetadata> parseSpecies(std::string_view json,
                                                     std::string &error);

  /**
   * @brief Flattens an evolution chain depth-first
   *
   * The root species comes first with an empty requirement; each later
   * entry carries the requirement to evolve into it.
   */
  static std::optional<std::vector<EvolutionLink>> parseEvolutionChain(std::string_view json,
                                                                       std::string &error);

  /**
   * @brief Groups encounter areas by game
   *
   * Games keep first-seen order. Each location reads "Area (Method, Method)"
   * with repeated methods removed.
   */
  static std::optional<std::vector<EncounterEntry>> parseEncounters(std::string_view json,
                                                                    std::string &error);

  // Display text for the first evolution_details entry, empty when none applies
  static std::string evolutionRequirement(const JsonValue &details);

  // Trailing numeric path segment of a resource URL
  static std::optional<int32_t> idFromUrl(std::string_view url);
};

} // namespace DexVault

#endif // POKE_API_PARSER_HPP
