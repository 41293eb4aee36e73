/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> silent mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace DexVault {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (release builds write it to the log file)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Debug builds print every level to stdout
class Logger {
private:
  static std::atomic<bool> s_silentMode;
  static std::mutex s_logMutex;

public:
  static void SetSilentMode(bool enabled) {
    s_silentMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsSilentMode() {
    return s_silentMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_silentMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("DexVault - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define DEXVAULT_CRITICAL(system, msg)                                         \
  DexVault::Logger::Log(DexVault::LogLevel::CRITICAL, system, msg)
#define DEXVAULT_ERROR(system, msg)                                            \
  DexVault::Logger::Log(DexVault::LogLevel::ERROR_LEVEL, system, msg)
#define DEXVAULT_WARN(system, msg)                                             \
  DexVault::Logger::Log(DexVault::LogLevel::WARNING, system, msg)
#define DEXVAULT_INFO(system, msg)                                             \
  DexVault::Logger::Log(DexVault::LogLevel::INFO, system, msg)
#define DEXVAULT_DEBUG(system, msg)                                            \
  DexVault::Logger::Log(DexVault::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to the rotating log file
// (see Logger.cpp), everything else compiles away
class Logger {
private:
  static std::atomic<bool> s_silentMode;

public:
  static std::mutex s_logMutex;

  static void SetSilentMode(bool enabled) {
    s_silentMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsSilentMode() {
    return s_silentMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define DEXVAULT_CRITICAL(system, msg)                                         \
  DexVault::Logger::Log("CRITICAL", system, msg)

#define DEXVAULT_ERROR(system, msg) DexVault::Logger::Log("ERROR", system, msg)

#define DEXVAULT_WARN(system, msg) ((void)0)  // Zero overhead
#define DEXVAULT_INFO(system, msg) ((void)0)  // Zero overhead
#define DEXVAULT_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_silentMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each component

// Core Systems
#define THREADSYSTEM_CRITICAL(msg) DEXVAULT_CRITICAL("ThreadSystem", msg)
#define THREADSYSTEM_ERROR(msg) DEXVAULT_ERROR("ThreadSystem", msg)
#define THREADSYSTEM_WARN(msg) DEXVAULT_WARN("ThreadSystem", msg)
#define THREADSYSTEM_INFO(msg) DEXVAULT_INFO("ThreadSystem", msg)
#define THREADSYSTEM_DEBUG(msg) DEXVAULT_DEBUG("ThreadSystem", msg)

#define PATHS_CRITICAL(msg) DEXVAULT_CRITICAL("CachePaths", msg)
#define PATHS_ERROR(msg) DEXVAULT_ERROR("CachePaths", msg)
#define PATHS_WARN(msg) DEXVAULT_WARN("CachePaths", msg)
#define PATHS_INFO(msg) DEXVAULT_INFO("CachePaths", msg)
#define PATHS_DEBUG(msg) DEXVAULT_DEBUG("CachePaths", msg)

// Archive Systems
#define ARCHIVE_CRITICAL(msg) DEXVAULT_CRITICAL("ArchiveBuilder", msg)
#define ARCHIVE_ERROR(msg) DEXVAULT_ERROR("ArchiveBuilder", msg)
#define ARCHIVE_WARN(msg) DEXVAULT_WARN("ArchiveBuilder", msg)
#define ARCHIVE_INFO(msg) DEXVAULT_INFO("ArchiveBuilder", msg)
#define ARCHIVE_DEBUG(msg) DEXVAULT_DEBUG("ArchiveBuilder", msg)

#define STORE_CRITICAL(msg) DEXVAULT_CRITICAL("ArchiveStore", msg)
#define STORE_ERROR(msg) DEXVAULT_ERROR("ArchiveStore", msg)
#define STORE_WARN(msg) DEXVAULT_WARN("ArchiveStore", msg)
#define STORE_INFO(msg) DEXVAULT_INFO("ArchiveStore", msg)
#define STORE_DEBUG(msg) DEXVAULT_DEBUG("ArchiveStore", msg)

// Network Systems
#define HTTP_CRITICAL(msg) DEXVAULT_CRITICAL("HttpClient", msg)
#define HTTP_ERROR(msg) DEXVAULT_ERROR("HttpClient", msg)
#define HTTP_WARN(msg) DEXVAULT_WARN("HttpClient", msg)
#define HTTP_INFO(msg) DEXVAULT_INFO("HttpClient", msg)
#define HTTP_DEBUG(msg) DEXVAULT_DEBUG("HttpClient", msg)

#define FETCHER_CRITICAL(msg) DEXVAULT_CRITICAL("RemoteFetcher", msg)
#define FETCHER_ERROR(msg) DEXVAULT_ERROR("RemoteFetcher", msg)
#define FETCHER_WARN(msg) DEXVAULT_WARN("RemoteFetcher", msg)
#define FETCHER_INFO(msg) DEXVAULT_INFO("RemoteFetcher", msg)
#define FETCHER_DEBUG(msg) DEXVAULT_DEBUG("RemoteFetcher", msg)

// Manager Systems
#define SPRITE_CRITICAL(msg) DEXVAULT_CRITICAL("SpriteCacheManager", msg)
#define SPRITE_ERROR(msg) DEXVAULT_ERROR("SpriteCacheManager", msg)
#define SPRITE_WARN(msg) DEXVAULT_WARN("SpriteCacheManager", msg)
#define SPRITE_INFO(msg) DEXVAULT_INFO("SpriteCacheManager", msg)
#define SPRITE_DEBUG(msg) DEXVAULT_DEBUG("SpriteCacheManager", msg)

#define LIFECYCLE_CRITICAL(msg) DEXVAULT_CRITICAL("CacheLifecycleManager", msg)
#define LIFECYCLE_ERROR(msg) DEXVAULT_ERROR("CacheLifecycleManager", msg)
#define LIFECYCLE_WARN(msg) DEXVAULT_WARN("CacheLifecycleManager", msg)
#define LIFECYCLE_INFO(msg) DEXVAULT_INFO("CacheLifecycleManager", msg)
#define LIFECYCLE_DEBUG(msg) DEXVAULT_DEBUG("CacheLifecycleManager", msg)

#define SETTINGS_CRITICAL(msg) DEXVAULT_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) DEXVAULT_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) DEXVAULT_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) DEXVAULT_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) DEXVAULT_DEBUG("SettingsManager", msg)

// Front end
#define CLI_CRITICAL(msg) DEXVAULT_CRITICAL("DexVault", msg)
#define CLI_ERROR(msg) DEXVAULT_ERROR("DexVault", msg)
#define CLI_WARN(msg) DEXVAULT_WARN("DexVault", msg)
#define CLI_INFO(msg) DEXVAULT_INFO("DexVault", msg)
#define CLI_DEBUG(msg) DEXVAULT_DEBUG("DexVault", msg)

// Silent mode convenience macros (tests and scripted runs)
#define DEXVAULT_ENABLE_SILENT_MODE() DexVault::Logger::SetSilentMode(true)
#define DEXVAULT_DISABLE_SILENT_MODE() DexVault::Logger::SetSilentMode(false)

} // namespace DexVault

#endif // LOGGER_HPP
