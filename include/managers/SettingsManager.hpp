/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace DexVault {

// Category and key names read by the rest of the application
namespace SettingsKeys {
inline constexpr const char* DISPLAY = "display";
inline constexpr const char* TYPE_FILTER_MODE = "type_filter_mode"; // "exclusive" | "inclusive"
inline constexpr const char* RECORDS_PER_PAGE = "records_per_page";
inline constexpr const char* RECORDS_PER_ROW = "records_per_row"; // 0 = responsive

inline constexpr const char* NETWORK = "network";
inline constexpr const char* BASE_URL = "base_url";
inline constexpr const char* WORKER_COUNT = "worker_count";
inline constexpr const char* MAX_ATTEMPTS = "max_attempts";
inline constexpr const char* RETRY_BACKOFF_MS = "retry_backoff_ms";
inline constexpr const char* CONNECT_TIMEOUT_S = "connect_timeout_s";
inline constexpr const char* TRANSFER_TIMEOUT_S = "transfer_timeout_s";

inline constexpr const char* CACHE = "cache";
inline constexpr const char* DIRECTORY = "directory";
inline constexpr const char* MAX_AGE_DAYS = "max_age_days"; // 0 = never stale
inline constexpr const char* DOWNLOAD_SPRITES = "download_sprites";
inline constexpr const char* MAX_FAILED_PERCENT = "max_failed_percent";
} // namespace SettingsKeys

// Default values shared by applyDefaults() and the typed readers
namespace SettingsDefaults {
inline constexpr int RECORDS_PER_PAGE = 30;
inline constexpr int RECORDS_PER_ROW = 0;
} // namespace SettingsDefaults

/**
 * @brief Thread-safe settings store organized by category
 *
 * Values persist as a two-level JSON object ({"category": {"key": value}}).
 * Listeners are told about every set() that changes a value.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.applyDefaults();
 *   settings.loadFromFile("dexvault.json");
 *   int workers = settings.get<int>("network", "worker_count", 8);
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Fills in the application defaults for every key not yet set
     */
    void applyDefaults();

    /**
     * @brief Merges settings from a JSON file over the current values
     * @return false if the file is unreadable or not a JSON object
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Writes every setting to a JSON file (temp file + rename)
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value
     *
     * int and float values convert into each other; any other type mismatch
     * returns defaultValue.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value and notifies listeners on change
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    /**
     * @brief Registers a callback for setting changes
     * @param category Category to watch (empty string watches all categories)
     * @return Callback ID that can be used to unregister
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    // display.records_per_page, never below one
    int getRecordsPerPage() const;

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    // Ordered so saved files are stable across runs
    using CategorySettings = std::map<std::string, SettingValue>;
    std::map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId = 0;

    void notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue);
    void setDefault(const std::string& category, const std::string& key, SettingValue value);

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }
    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& stored = keyIt->second;
    if constexpr (std::is_same_v<T, int>) {
        if (const int* value = std::get_if<int>(&stored)) {
            return *value;
        }
        if (const float* value = std::get_if<float>(&stored)) {
            return static_cast<int>(*value);
        }
    } else if constexpr (std::is_same_v<T, float>) {
        if (const float* value = std::get_if<float>(&stored)) {
            return *value;
        }
        if (const int* value = std::get_if<int>(&stored)) {
            return static_cast<float>(*value);
        }
    } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* value = std::get_if<T>(&stored)) {
            return *value;
        }
    } else {
        static_assert(std::is_same_v<T, void>, "Unsupported setting type");
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue newValue;
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        newValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        newValue = std::string(value);
    } else {
        static_assert(std::is_same_v<T, void>, "Unsupported setting type");
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        CategorySettings& settings = m_settings[category];
        auto [it, inserted] = settings.try_emplace(key, newValue);
        if (!inserted) {
            if (it->second == newValue) {
                return true;
            }
            it->second = newValue;
        }
    }

    notifyListeners(category, key, newValue);
    return true;
}

} // namespace DexVault

#endif // SETTINGS_MANAGER_HPP
