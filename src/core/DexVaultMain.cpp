/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "archive/SpeciesFilter.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/CacheLifecycleManager.hpp"
#include "managers/SettingsManager.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace DexVault;

namespace {

const std::string APP_NAME{DEXVAULT_APP_NAME};
const std::string DEFAULT_SETTINGS_FILE{"res/settings.json"};
constexpr auto SPRITE_WAIT = std::chrono::seconds(15);

enum class Command { Summary, List, Get, Search, Renew, FixSprites };

struct CliOptions {
  Command command{Command::Summary};
  std::string settingsFile{DEFAULT_SETTINGS_FILE};
  int page{1};
  int32_t speciesId{0};
  std::string searchText;
  std::vector<std::string> typeNames;
  std::vector<std::string> generationNames;
  std::optional<TypeFilterMode> typeMode;
  std::vector<std::pair<StatKind, int32_t>> minStats;
  std::optional<int32_t> minTotal;
  bool quiet{false};
};

void printUsage() {
  std::cout << std::format(
      "Usage: {} [command] [filters] [options]\n"
      "\n"
      "Commands:\n"
      "  --list [PAGE]        list species page by page (default page 1)\n"
      "  --get ID             show one species in full\n"
      "  --search TEXT        species whose name contains TEXT\n"
      "  --renew              download everything again and replace the archive\n"
      "  --fix-sprites        delete and download every sprite again\n"
      "\n"
      "Filters (with --list or --search):\n"
      "  --type NAME          repeatable, combined per type_filter_mode\n"
      "  --inclusive          any selected type matches\n"
      "  --exclusive          every selected type must match\n"
      "  --gen N              repeatable, number, numeral or generation-N name\n"
      "  --min-STAT N         hp, attack, defense, special-attack, special-defense, speed\n"
      "  --min-total N        minimum sum of base stats\n"
      "\n"
      "Options:\n"
      "  --settings FILE      settings JSON (default {})\n"
      "  --quiet              no log output\n",
      APP_NAME, DEFAULT_SETTINGS_FILE);
}

std::optional<int> requireInt(std::string_view flag, std::string_view value) {
  auto parsed = StringUtils::parseInt(value);
  if (!parsed) {
    std::cerr << std::format("{} expects a number, got '{}'\n", flag, value);
  }
  return parsed;
}

// false when the arguments are unusable; usage has already been reported
bool parseArguments(int argc, char *argv[], CliOptions &options) {
  std::vector<std::string_view> args(argv + 1, argv + argc);

  for (size_t i = 0; i < args.size(); ++i) {
    std::string_view arg = args[i];
    auto next = [&]() -> std::optional<std::string_view> {
      if (i + 1 >= args.size()) {
        std::cerr << std::format("{} needs a value\n", arg);
        return std::nullopt;
      }
      return args[++i];
    };

    if (arg == "--help" || arg == "-h") {
      printUsage();
      std::exit(0);
    } else if (arg == "--list") {
      options.command = Command::List;
      if (i + 1 < args.size() && StringUtils::parseInt(args[i + 1])) {
        options.page = *StringUtils::parseInt(args[++i]);
      }
    } else if (arg == "--get") {
      auto value = next();
      auto id = value ? requireInt(arg, *value) : std::nullopt;
      if (!id) {
        return false;
      }
      options.command = Command::Get;
      options.speciesId = *id;
    } else if (arg == "--search") {
      auto value = next();
      if (!value) {
        return false;
      }
      options.command = Command::Search;
      options.searchText = std::string(*value);
    } else if (arg == "--renew" || arg == "--build") {
      options.command = Command::Renew;
    } else if (arg == "--fix-sprites") {
      options.command = Command::FixSprites;
    } else if (arg == "--type") {
      auto value = next();
      if (!value) {
        return false;
      }
      options.typeNames.emplace_back(*value);
    } else if (arg == "--gen") {
      auto value = next();
      if (!value) {
        return false;
      }
      options.generationNames.emplace_back(*value);
    } else if (arg == "--inclusive") {
      options.typeMode = TypeFilterMode::Inclusive;
    } else if (arg == "--exclusive") {
      options.typeMode = TypeFilterMode::Exclusive;
    } else if (arg == "--min-total") {
      auto value = next();
      auto total = value ? requireInt(arg, *value) : std::nullopt;
      if (!total) {
        return false;
      }
      options.minTotal = *total;
    } else if (arg.starts_with("--min-")) {
      auto kind = parseStatKind(arg.substr(6));
      if (!kind) {
        std::cerr << std::format("Unknown stat in {}\n", arg);
        return false;
      }
      auto value = next();
      auto minimum = value ? requireInt(arg, *value) : std::nullopt;
      if (!minimum) {
        return false;
      }
      options.minStats.emplace_back(*kind, *minimum);
    } else if (arg == "--settings") {
      auto value = next();
      if (!value) {
        return false;
      }
      options.settingsFile = std::string(*value);
    } else if (arg == "--quiet") {
      options.quiet = true;
    } else {
      std::cerr << std::format("Unknown argument '{}'\n\n", arg);
      printUsage();
      return false;
    }
  }
  return true;
}

SpeciesFilter buildFilter(const CliOptions &options) {
  const auto &settings = SettingsManager::Instance();
  SpeciesFilter filter;

  filter.typeMode = options.typeMode.value_or(
      parseTypeFilterMode(settings.get<std::string>(SettingsKeys::DISPLAY,
                                                    SettingsKeys::TYPE_FILTER_MODE, "exclusive"))
          .value_or(TypeFilterMode::Exclusive));

  for (const auto &name : options.typeNames) {
    filter.addTypeName(name);
  }
  for (const auto &name : options.generationNames) {
    filter.addGenerationName(name);
  }
  for (const auto &[kind, minimum] : options.minStats) {
    filter.setMinStat(kind, minimum);
  }
  filter.minTotalStats = options.minTotal;
  filter.nameQuery = options.searchText;

  if (filter.unresolvedType) {
    CLI_WARN("Unknown type name in filter, nothing will match");
  }
  if (filter.unresolvedGeneration) {
    CLI_WARN("Unknown generation in filter, nothing will match");
  }
  return filter;
}

std::string joinTypes(const SpeciesView &view) {
  std::string out;
  for (TypeTag tag : view.types()) {
    if (!out.empty()) {
      out += '/';
    }
    out += typeTagName(tag);
  }
  return out;
}

void printSummaryLine(const SpeciesView &view) {
  std::cout << std::format("#{:<5} {:<24} {:<18} gen {:<5} total {}\n", view.id(), view.name(),
                           joinTypes(view), generationName(view.generation()),
                           view.totalStats());
}

void printSpecies(CacheLifecycleManager &manager, const SpeciesView &view) {
  std::cout << std::format("#{} {}\n", view.id(), StringUtils::titleCaseKebab(view.name()));
  std::cout << std::format("  Types:       {}\n", joinTypes(view));
  std::cout << std::format("  Generation:  {}\n", generationName(view.generation()));
  std::cout << std::format("  Height:      {:.1f} m\n", view.height() / 10.0);
  std::cout << std::format("  Weight:      {:.1f} kg\n", view.weight() / 10.0);

  std::cout << "  Abilities:  ";
  for (std::string_view ability : view.abilities()) {
    std::cout << ' ' << ability;
  }
  std::cout << '\n';

  std::cout << "  Base stats:\n";
  for (size_t i = 0; i < STAT_COUNT; ++i) {
    auto kind = static_cast<StatKind>(i);
    std::cout << std::format("    {:<16} {}\n", statName(kind), view.stat(kind));
  }
  std::cout << std::format("    {:<16} {}\n", "total", view.totalStats());

  if (auto text = view.flavorText()) {
    std::cout << std::format("  {}\n", *text);
  }

  if (!view.evolutions().empty()) {
    std::cout << "  Evolution chain:\n";
    for (const EvolutionView evolution : view.evolutions()) {
      std::string name = std::format("#{}", evolution.speciesId);
      if (auto target = manager.get(evolution.speciesId)) {
        name = StringUtils::titleCaseKebab(target->name());
      }
      if (evolution.requirement.empty()) {
        std::cout << std::format("    {}\n", name);
      } else {
        std::cout << std::format("    {} ({})\n", name, evolution.requirement);
      }
    }
  }

  if (!view.encounters().empty()) {
    std::cout << "  Encounters:\n";
    for (const EncounterView encounter : view.encounters()) {
      std::cout << std::format("    {}\n", encounter.game);
      for (std::string_view location : encounter.locations) {
        std::cout << std::format("      {}\n", location);
      }
    }
  }

  SpriteLookup sprite = manager.spritePath(view.id());
  if (sprite.status == SpriteStatus::Pending &&
      sprite.download.wait_for(SPRITE_WAIT) == std::future_status::ready && sprite.download.get()) {
    sprite.status = SpriteStatus::Ready;
  }
  std::cout << std::format("  Sprite:      {} ({})\n", sprite.path.string(),
                           spriteStatusName(sprite.status));
}

int runList(CacheLifecycleManager &manager, const CliOptions &options) {
  const int perPage = SettingsManager::Instance().getRecordsPerPage();
  SpeciesFilter filter = buildFilter(options);

  std::vector<SpeciesView> matches;
  if (filter.isEmpty()) {
    auto store = manager.snapshot();
    matches = store->page(0, store->count());
  } else {
    matches = manager.query(filter);
  }

  const size_t pageCount = (matches.size() + perPage - 1) / perPage;
  const size_t page = static_cast<size_t>(std::max(1, options.page));
  const size_t first = (page - 1) * perPage;
  for (size_t i = first; i < std::min(matches.size(), first + perPage); ++i) {
    printSummaryLine(matches[i]);
  }
  std::cout << std::format("Page {} of {} ({} species)\n", page, std::max<size_t>(pageCount, 1),
                           matches.size());
  return 0;
}

int runGet(CacheLifecycleManager &manager, const CliOptions &options) {
  auto view = manager.get(options.speciesId);
  if (!view) {
    std::cerr << std::format("No species with id {}\n", options.speciesId);
    return 1;
  }
  printSpecies(manager, *view);
  return 0;
}

int runRenew(CacheLifecycleManager &manager) {
  RenewResult result = manager.renew().get();
  if (!result.success) {
    std::cerr << std::format("Renew failed: {}\n", result.error);
    return 1;
  }
  std::cout << std::format("Archive renewed: {} species, {} failed, {} sprites missing\n",
                           result.recordCount, result.failedRecords, result.failedSprites);
  return 0;
}

int runFixSprites(CacheLifecycleManager &manager) {
  RenewResult result = manager.repairSprites();
  if (!result.success) {
    std::cerr << std::format("Sprite repair failed: {}\n",
                             result.error.empty() ? "cancelled" : result.error);
    return 1;
  }
  std::cout << std::format("Sprites renewed: {} of {} restored\n",
                           result.recordCount - result.failedSprites, result.recordCount);
  return 0;
}

int run(const CliOptions &options) {
  auto config = LifecycleConfig::fromSettings();
  if (!config) {
    CLI_CRITICAL("No cache directory available");
    return 1;
  }
  CLI_INFO("Cache directory " + config->paths.root().string());

  CacheLifecycleManager manager(std::move(*config));
  size_t listenerId = manager.registerProgressListener([](const LifecycleProgress &progress) {
    if (progress.phase == LifecyclePhase::Fetching && progress.total > 0 &&
        (progress.done % 50 == 0 || progress.done == progress.total)) {
      std::cerr << std::format("\rFetching {}/{} ({:.0f}%)", progress.done, progress.total,
                               progress.fraction() * 100.0f);
      if (progress.done == progress.total) {
        std::cerr << '\n';
      }
    }
  });

  if (manager.openOrBuild() != LifecycleState::Ready) {
    std::cerr << std::format("No usable archive: {}\n", manager.lastError());
    return 1;
  }
  if (manager.isStale()) {
    std::cerr << "Archive is older than the configured maximum age, run with --renew\n";
  }

  int status = 0;
  switch (options.command) {
  case Command::Summary: {
    auto store = manager.snapshot();
    std::cout << std::format("{} species in {}\n", store->count(), store->path().string());
    break;
  }
  case Command::List:
  case Command::Search:
    status = runList(manager, options);
    break;
  case Command::Get:
    status = runGet(manager, options);
    break;
  case Command::Renew:
    status = runRenew(manager);
    break;
  case Command::FixSprites:
    status = runFixSprites(manager);
    break;
  }

  manager.unregisterProgressListener(listenerId);
  return status;
}

} // namespace

int main(int argc, char *argv[]) {
  CliOptions options;
  if (!parseArguments(argc, argv, options)) {
    return 2;
  }
  if (options.quiet) {
    DEXVAULT_ENABLE_SILENT_MODE();
  }

  CLI_INFO(std::format("Initializing {}", APP_NAME));

  ThreadSystem &threadSystem = ThreadSystem::Instance();
  try {
    if (!threadSystem.init()) {
      THREADSYSTEM_CRITICAL("Failed to initialize thread system");
      return -1;
    }
  } catch (const std::exception &e) {
    THREADSYSTEM_CRITICAL(std::format("Exception during thread system init: {}", e.what()));
    return -1;
  }
  THREADSYSTEM_INFO(std::format("Thread system initialized with {} worker threads",
                                threadSystem.getThreadCount()));

  auto &settingsManager = SettingsManager::Instance();
  if (!settingsManager.loadFromFile(options.settingsFile)) {
    CLI_WARN(std::format("Failed to load {} - using defaults", options.settingsFile));
  } else {
    CLI_INFO("Settings loaded from " + options.settingsFile);
  }
  settingsManager.applyDefaults();

  int status = 1;
  try {
    status = run(options);
  } catch (const std::exception &e) {
    CLI_CRITICAL(std::format("Unhandled exception: {}", e.what()));
  }

  CLI_INFO(std::format("{} shutting down", APP_NAME));
  threadSystem.clean();
  return status;
}
