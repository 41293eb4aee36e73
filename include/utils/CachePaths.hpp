/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CACHEPATHS_HPP
#define CACHEPATHS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace DexVault {

/**
 * CachePaths - Locates the on-disk cache (archive file and sprite directory).
 *
 * Layout under the cache root:
 *   species.dexv          the species archive
 *   species.dexv.<n>.tmp  in-progress build, renamed over species.dexv
 *   sprites/<id>.png      one image per species id
 *
 * Usage:
 *   auto paths = CachePaths::resolve(configuredDir);
 *   if (paths && paths->ensureDirectories()) { ... paths->archivePath() ... }
 */
class CachePaths {
public:
    static constexpr const char* ARCHIVE_FILE = "species.dexv";
    static constexpr const char* SPRITE_DIR = "sprites";
    static constexpr const char* SPRITE_EXTENSION = ".png";

    explicit CachePaths(std::filesystem::path root);

    /**
     * Resolve the cache root.
     *
     * @param configuredDir Explicit directory (cache.directory setting); when
     *        empty the per-user SDL pref path is used
     * @return std::nullopt if no directory could be determined
     */
    static std::optional<CachePaths> resolve(const std::string& configuredDir);

    // Per-user writable directory from SDL_GetPrefPath, empty on failure
    static std::filesystem::path userDataPath();

    const std::filesystem::path& root() const { return m_root; }
    std::filesystem::path archivePath() const;
    std::filesystem::path spriteDirectory() const;
    std::filesystem::path spritePath(int32_t speciesId) const;

    // Creates root and sprite directory; false (and logs) on failure
    bool ensureDirectories() const;

private:
    std::filesystem::path m_root;
};

} // namespace DexVault

#endif // CACHEPATHS_HPP
