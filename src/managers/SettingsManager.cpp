/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <tuple>

namespace DexVault {

void SettingsManager::setDefault(const std::string& category, const std::string& key, SettingValue value) {
    m_settings[category].try_emplace(key, std::move(value));
}

int SettingsManager::getRecordsPerPage() const {
    return std::max(1, get<int>(SettingsKeys::DISPLAY, SettingsKeys::RECORDS_PER_PAGE,
                                SettingsDefaults::RECORDS_PER_PAGE));
}

void SettingsManager::applyDefaults() {
    using namespace SettingsKeys;
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    setDefault(DISPLAY, TYPE_FILTER_MODE, std::string("exclusive"));
    setDefault(DISPLAY, RECORDS_PER_PAGE, SettingsDefaults::RECORDS_PER_PAGE);
    setDefault(DISPLAY, RECORDS_PER_ROW, SettingsDefaults::RECORDS_PER_ROW);

    setDefault(NETWORK, BASE_URL, std::string("https://pokeapi.co/api/v2"));
    setDefault(NETWORK, WORKER_COUNT, 8);
    setDefault(NETWORK, MAX_ATTEMPTS, 3);
    setDefault(NETWORK, RETRY_BACKOFF_MS, 250);
    setDefault(NETWORK, CONNECT_TIMEOUT_S, 10);
    setDefault(NETWORK, TRANSFER_TIMEOUT_S, 30);

    setDefault(CACHE, DIRECTORY, std::string());
    setDefault(CACHE, MAX_AGE_DAYS, 0);
    setDefault(CACHE, DOWNLOAD_SPRITES, true);
    setDefault(CACHE, MAX_FAILED_PERCENT, 25);
}

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    std::vector<std::tuple<std::string, std::string, SettingValue>> changed;
    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

        for (const auto& [categoryName, categoryValue] : root.asObject()) {
            const JsonObject* categoryObj = categoryValue.tryAsObject();
            if (categoryObj == nullptr) {
                SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
                continue;
            }

            for (const auto& [key, value] : *categoryObj) {
                SettingValue settingValue;
                if (value.isBool()) {
                    settingValue = value.asBool();
                } else if (auto integral = value.tryAsInt()) {
                    settingValue = *integral;
                } else if (value.isNumber()) {
                    settingValue = static_cast<float>(value.asNumber());
                } else if (value.isString()) {
                    settingValue = value.asString();
                } else {
                    SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                    continue;
                }

                SettingValue& slot = m_settings[categoryName][key];
                if (slot != settingValue) {
                    slot = settingValue;
                    changed.emplace_back(categoryName, key, settingValue);
                }
            }
        }
    }

    for (const auto& [category, key, value] : changed) {
        notifyListeners(category, key, value);
    }

    SETTINGS_INFO(std::format("Loaded settings from file: {} ({} changed)", filepath, changed.size()));
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    std::string document = "{\n";
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

        size_t categoryIndex = 0;
        for (const auto& [categoryName, categorySettings] : m_settings) {
            document += "  " + JsonValue(categoryName).toString() + ": {\n";

            size_t keyIndex = 0;
            for (const auto& [key, value] : categorySettings) {
                document += "    " + JsonValue(key).toString() + ": ";
                document += std::visit([](const auto& arg) -> std::string {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, bool>) {
                        return arg ? "true" : "false";
                    } else if constexpr (std::is_same_v<T, int>) {
                        return std::to_string(arg);
                    } else if constexpr (std::is_same_v<T, float>) {
                        return std::format("{}", arg);
                    } else {
                        return JsonValue(arg).toString();
                    }
                }, value);

                if (++keyIndex < categorySettings.size()) {
                    document += ",";
                }
                document += "\n";
            }

            document += "  }";
            if (++categoryIndex < m_settings.size()) {
                document += ",";
            }
            document += "\n";
        }
    }
    document += "}\n";

    namespace fs = std::filesystem;
    fs::path target(filepath);
    fs::path temp = target;
    temp += ".tmp";

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            SETTINGS_ERROR("Failed to open settings file for writing: " + temp.string());
            return false;
        }
        file << document;
        file.flush();
        if (!file) {
            SETTINGS_ERROR("Failed to write settings file: " + temp.string());
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        SETTINGS_ERROR("Failed to replace settings file " + filepath + ": " + ec.message());
        fs::remove(temp, ec);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() && categoryIt->second.count(key) > 0;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }

    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    return m_settings.erase(category) > 0;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);

    size_t id = m_nextCallbackId++;
    m_listeners.push_back({id, category, std::move(callback)});
    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);

    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
            [callbackId](const ListenerInfo& info) {
                return info.id == callbackId;
            }),
        m_listeners.end());
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    return keys;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue) {
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& listener : m_listeners) {
            if (listener.category.empty() || listener.category == category) {
                callbacks.push_back(listener.callback);
            }
        }
    }

    // Invoked outside the lock so a callback may (un)register listeners
    for (const auto& callback : callbacks) {
        callback(category, key, newValue);
    }
}

} // namespace DexVault
