/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/CachePaths.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <format>

namespace DexVault {

namespace fs = std::filesystem;

CachePaths::CachePaths(fs::path root) : m_root(std::move(root)) {}

std::optional<CachePaths> CachePaths::resolve(const std::string& configuredDir) {
    if (!configuredDir.empty()) {
        PATHS_INFO(std::format("Using configured cache directory = {}", configuredDir));
        return CachePaths(fs::path(configuredDir));
    }

    fs::path userPath = userDataPath();
    if (userPath.empty()) {
        PATHS_ERROR("No cache directory configured and no user data path available");
        return std::nullopt;
    }

    PATHS_INFO(std::format("Cache directory = {}", userPath.string()));
    return CachePaths(userPath);
}

fs::path CachePaths::userDataPath() {
    // SDL3 returns an allocated string that must be released with SDL_free
    char* prefPath = SDL_GetPrefPath("DexVault", DEXVAULT_APP_NAME);
    if (prefPath == nullptr) {
        PATHS_WARN(std::format("SDL_GetPrefPath failed: {}", SDL_GetError()));
        return {};
    }

    fs::path path(prefPath);
    SDL_free(prefPath);
    return path;
}

fs::path CachePaths::archivePath() const {
    return m_root / ARCHIVE_FILE;
}

fs::path CachePaths::spriteDirectory() const {
    return m_root / SPRITE_DIR;
}

fs::path CachePaths::spritePath(int32_t speciesId) const {
    return spriteDirectory() / (std::to_string(speciesId) + SPRITE_EXTENSION);
}

bool CachePaths::ensureDirectories() const {
    std::error_code ec;
    fs::create_directories(spriteDirectory(), ec);
    if (ec) {
        PATHS_ERROR(std::format("Failed to create cache directory {}: {}",
                                spriteDirectory().string(), ec.message()));
        return false;
    }
    return true;
}

} // namespace DexVault
