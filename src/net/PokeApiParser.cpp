/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "net/PokeApiParser.hpp"
#include "utils/JsonReader.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

namespace DexVault {

namespace {

std::string stringOr(const JsonValue &value, std::string fallback = {}) {
  auto text = value.tryAsString();
  return text ? std::move(*text) : std::move(fallback);
}

// Most upstream references look like {"name": "...", "url": "..."}
std::string refName(const JsonValue &object, const std::string &key) {
  return stringOr(object[key]["name"]);
}

std::string refUrl(const JsonValue &object, const std::string &key) {
  return stringOr(object[key]["url"]);
}

bool parseDocument(std::string_view json, JsonReader &reader, std::string &error) {
  if (!reader.parse(json)) {
    error = "invalid JSON: " + reader.getLastError();
    return false;
  }
  return true;
}

void flattenChain(const JsonValue &link, std::string requirement,
                  std::vector<EvolutionLink> &out) {
  auto id = PokeApiParser::idFromUrl(refUrl(link, "species"));
  if (id) {
    out.push_back(EvolutionLink{*id, std::move(requirement)});
  }
  const JsonArray *next = link["evolves_to"].tryAsArray();
  if (next == nullptr) {
    return;
  }
  for (const JsonValue &child : *next) {
    flattenChain(child, PokeApiParser::evolutionRequirement(child["evolution_details"]),
                 out);
  }
}

} // namespace

std::optional<int32_t> PokeApiParser::idFromUrl(std::string_view url) {
  auto id = StringUtils::parseInt(StringUtils::lastPathSegment(url));
  if (!id || *id <= 0) {
    return std::nullopt;
  }
  return *id;
}

std::optional<std::vector<SpeciesIndexEntry>>
PokeApiParser::parseIndex(std::string_view json, std::string &error) {
  JsonReader reader;
  if (!parseDocument(json, reader, error)) {
    return std::nullopt;
  }

  const JsonArray *results = reader.getRoot()["results"].tryAsArray();
  if (results == nullptr) {
    error = "species index has no results array";
    return std::nullopt;
  }

  std::vector<SpeciesIndexEntry> entries;
  entries.reserve(results->size());
  for (const JsonValue &result : *results) {
    SpeciesIndexEntry entry;
    entry.url = stringOr(result["url"]);
    entry.name = stringOr(result["name"]);
    auto id = idFromUrl(entry.url);
    if (!id) {
      continue;
    }
    entry.id = *id;
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::optional<PokemonDetail> PokeApiParser::parsePokemon(std::string_view json,
                                                         std::string &error) {
  JsonReader reader;
  if (!parseDocument(json, reader, error)) {
    return std::nullopt;
  }
  const JsonValue &root = reader.getRoot();

  auto id = root["id"].tryAsInt();
  auto name = root["name"].tryAsString();
  if (!id || !name) {
    error = "pokemon document lacks id or name";
    return std::nullopt;
  }

  PokemonDetail detail;
  SpeciesRecord &record = detail.record;
  record.id = *id;
  record.name = std::move(*name);
  record.height = root["height"].tryAsInt().value_or(0);
  record.weight = root["weight"].tryAsInt().value_or(0);

  if (const JsonArray *types = root["types"].tryAsArray()) {
    std::vector<std::pair<int, TypeTag>> slots;
    for (const JsonValue &type : *types) {
      slots.emplace_back(type["slot"].tryAsInt().value_or(0),
                         typeTagFromUpstream(refName(type, "type")));
    }
    std::stable_sort(slots.begin(), slots.end(),
                     [](const auto &a, const auto &b) { return a.first < b.first; });
    for (const auto &[slot, tag] : slots) {
      record.types.push_back(tag);
    }
  }

  if (const JsonArray *abilities = root["abilities"].tryAsArray()) {
    std::vector<std::pair<int, std::string>> slots;
    for (const JsonValue &ability : *abilities) {
      std::string abilityName = refName(ability, "ability");
      if (abilityName.empty()) {
        continue;
      }
      if (ability["is_hidden"].tryAsBool().value_or(false)) {
        abilityName += " (HIDDEN)";
      }
      slots.emplace_back(ability["slot"].tryAsInt().value_or(0), std::move(abilityName));
    }
    std::stable_sort(slots.begin(), slots.end(),
                     [](const auto &a, const auto &b) { return a.first < b.first; });
    for (auto &slot : slots) {
      record.abilities.push_back(std::move(slot.second));
    }
  }

  if (const JsonArray *stats = root["stats"].tryAsArray()) {
    for (const JsonValue &stat : *stats) {
      auto kind = parseStatKind(refName(stat, "stat"));
      if (kind) {
        record.stats.setValue(*kind, stat["base_stat"].tryAsInt().value_or(0));
      }
    }
  }

  record.spriteUrl = stringOr(root["sprites"]["front_default"]);
  detail.speciesUrl = refUrl(root, "species");
  detail.encountersUrl = stringOr(root["location_area_encounters"]);
  return detail;
}

std::optional<SpeciesMetadata> PokeApiParser::parseSpecies(std::string_view json,
                                                           std::string &error) {
  JsonReader reader;
  if (!parseDocument(json, reader, error)) {
    return std::nullopt;
  }
  const JsonValue &root = reader.getRoot();
  if (!root.isObject()) {
    error = "species document is not an object";
    return std::nullopt;
  }

  SpeciesMetadata metadata;
  if (const JsonArray *entries = root["flavor_text_entries"].tryAsArray()) {
    for (const JsonValue &entry : *entries) {
      if (refName(entry, "language") == "en") {
        metadata.flavorText = StringUtils::collapseWhitespace(stringOr(entry["flavor_text"]));
        break;
      }
    }
  }

  metadata.generation =
      parseGeneration(refName(root, "generation")).value_or(Generation::Unknown);
  metadata.evolutionChainUrl = refUrl(root, "evolution_chain");
  return metadata;
}

std::optional<std::vector<EvolutionLink>>
PokeApiParser::parseEvolutionChain(std::string_view json, std::string &error) {
  JsonReader reader;
  if (!parseDocument(json, reader, error)) {
    return std::nullopt;
  }
  const JsonValue *chain = reader.getRoot().find("chain");
  if (chain == nullptr || !chain->isObject()) {
    error = "evolution chain document has no chain";
    return std::nullopt;
  }

  std::vector<EvolutionLink> links;
  flattenChain(*chain, std::string(), links);
  return links;
}

std::string PokeApiParser::evolutionRequirement(const JsonValue &details) {
  const JsonValue &detail = details[0];
  if (!detail.isObject()) {
    return {};
  }

  if (auto level = detail["min_level"].tryAsInt()) {
    return std::format("Level {}", *level);
  }
  if (std::string item = refName(detail, "item"); !item.empty()) {
    return StringUtils::titleCaseKebab(item);
  }
  if (std::string held = refName(detail, "held_item"); !held.empty()) {
    return "Holding " + StringUtils::titleCaseKebab(held);
  }
  if (auto happiness = detail["min_happiness"].tryAsInt()) {
    return std::format("Happiness {}", *happiness);
  }
  if (std::string time = stringOr(detail["time_of_day"]); !time.empty()) {
    return "During " + StringUtils::titleCaseKebab(time);
  }
  if (std::string location = refName(detail, "location"); !location.empty()) {
    return "At " + StringUtils::titleCaseKebab(location);
  }
  if (std::string move = refName(detail, "known_move"); !move.empty()) {
    return "Knowing " + StringUtils::titleCaseKebab(move);
  }
  if (auto relative = detail["relative_physical_stats"].tryAsInt()) {
    switch (*relative) {
    case 1:
      return "Attack > Defense";
    case -1:
      return "Defense > Attack";
    case 0:
      return "Attack = Defense";
    default:
      break;
    }
  }
  return {};
}

std::optional<std::vector<EncounterEntry>>
PokeApiParser::parseEncounters(std::string_view json, std::string &error) {
  JsonReader reader;
  if (!parseDocument(json, reader, error)) {
    return std::nullopt;
  }
  const JsonArray *areas = reader.getRoot().tryAsArray();
  if (areas == nullptr) {
    error = "encounter document is not an array";
    return std::nullopt;
  }

  std::vector<EncounterEntry> games;
  for (const JsonValue &area : *areas) {
    std::string areaName = StringUtils::titleCaseKebab(refName(area, "location_area"));
    const JsonArray *versions = area["version_details"].tryAsArray();
    if (areaName.empty() || versions == nullptr) {
      continue;
    }

    for (const JsonValue &version : *versions) {
      std::string game = StringUtils::titleCaseKebab(refName(version, "version"));
      if (game.empty()) {
        continue;
      }

      std::vector<std::string> methods;
      if (const JsonArray *details = version["encounter_details"].tryAsArray()) {
        for (const JsonValue &detail : *details) {
          std::string method = StringUtils::titleCaseKebab(refName(detail, "method"));
          if (!method.empty() &&
              std::find(methods.begin(), methods.end(), method) == methods.end()) {
            methods.push_back(std::move(method));
          }
        }
      }

      std::string location = areaName;
      if (!methods.empty()) {
        location += " (";
        for (size_t i = 0; i < methods.size(); ++i) {
          if (i > 0) {
            location += ", ";
          }
          location += methods[i];
        }
        location += ')';
      }

      auto it = std::find_if(games.begin(), games.end(),
                             [&game](const EncounterEntry &entry) { return entry.game == game; });
      if (it == games.end()) {
        games.push_back(EncounterEntry{std::move(game), {}});
        it = std::prev(games.end());
      }
      if (std::find(it->locations.begin(), it->locations.end(), location) ==
          it->locations.end()) {
        it->locations.push_back(std::move(location));
      }
    }
  }
  return games;
}

} // namespace DexVault
