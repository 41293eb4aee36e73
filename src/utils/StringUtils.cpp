/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/StringUtils.hpp"
#include <algorithm>
#include <charconv>

namespace DexVault::StringUtils {

namespace {

char lowerAscii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

char upperAscii(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

bool isSpaceOrControl(unsigned char c) {
    return c <= 0x20 || c == 0x7F;
}

} // namespace

std::string toLowerAscii(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(), lowerAscii);
    return result;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return lowerAscii(x) == lowerAscii(y); });
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) {
        return true;
    }
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char x, char y) { return lowerAscii(x) == lowerAscii(y); });
    return it != haystack.end();
}

std::string titleCaseKebab(std::string_view kebab) {
    std::string result;
    result.reserve(kebab.size());

    bool startOfWord = true;
    for (char c : kebab) {
        if (c == '-') {
            result += ' ';
            startOfWord = true;
        } else if (startOfWord) {
            result += upperAscii(c);
            startOfWord = false;
        } else {
            result += c;
        }
    }
    return result;
}

std::string collapseWhitespace(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    bool pendingSpace = false;
    for (char c : text) {
        // Bytes >= 0x80 belong to UTF-8 sequences and are kept as-is
        if (isSpaceOrControl(static_cast<unsigned char>(c))) {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace) {
            result += ' ';
            pendingSpace = false;
        }
        result += c;
    }
    return result;
}

std::string_view lastPathSegment(std::string_view url) {
    while (!url.empty() && url.back() == '/') {
        url.remove_suffix(1);
    }
    size_t slash = url.rfind('/');
    return slash == std::string_view::npos ? url : url.substr(slash + 1);
}

std::optional<int> parseInt(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace DexVault::StringUtils
