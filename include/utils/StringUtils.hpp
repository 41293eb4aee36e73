/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <optional>
#include <string>
#include <string_view>

namespace DexVault::StringUtils {

std::string toLowerAscii(std::string_view text);

bool equalsIgnoreCase(std::string_view a, std::string_view b);

// Empty needle matches everything
bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

// "special-attack" -> "Special Attack"
std::string titleCaseKebab(std::string_view kebab);

// Control characters become spaces, runs of whitespace collapse to one
std::string collapseWhitespace(std::string_view text);

// Last non-empty path segment: ".../pokemon/25/" -> "25"
std::string_view lastPathSegment(std::string_view url);

std::optional<int> parseInt(std::string_view text);

} // namespace DexVault::StringUtils

#endif // STRING_UTILS_HPP
