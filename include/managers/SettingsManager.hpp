/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace GridRoute {

class JsonValue;

/**
 * @brief Thread-safe category/key store for engine settings
 *
 * Values are int, float, bool or string. Settings are read from and written
 * to a two-level JSON document, one object per category.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   int limit = settings.get<int>("planner", "exhaustive_waypoint_limit", 8);
 *   settings.set("logging", "quiet", true);
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Merges settings from a JSON file into the store
     * @return false if the file cannot be read or its root is not an object
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Merges settings from an already parsed document.
     * Non-object categories and unsupported value types are skipped with a warning.
     */
    bool loadFromJson(const JsonValue& root);

    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value
     *
     * int and float convert into each other; a float outside the int range,
     * any other type mismatch, or a missing key returns defaultValue. Thread-safe for concurrent reads.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

    // Two-level JSON document of the current store
    JsonValue toJson() const;

    SettingsManager() = default;
    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    // Multiple concurrent reads or a single write
    mutable std::shared_mutex m_settingsMutex;
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
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float>) {
        if (const int* i = std::get_if<int>(&stored)) {
            return static_cast<T>(*i);
        }
        if (const float* f = std::get_if<float>(&stored)) {
            if constexpr (std::is_same_v<T, int>) {
                // Out of range (or NaN) has no int value
                constexpr float intLower = -2147483648.0f;
                constexpr float intUpper = 2147483648.0f;
                if (!(*f >= intLower && *f < intUpper)) {
                    return defaultValue;
                }
            }
            return static_cast<T>(*f);
        }
        return defaultValue;
    } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* v = std::get_if<T>(&stored)) {
            return *v;
        }
        return defaultValue;
    } else {
        static_assert(!sizeof(T*), "SettingsManager::get supports int, float, bool and std::string");
    }
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(settingValue);
    return true;
}

} // namespace GridRoute

#endif // SETTINGS_MANAGER_HPP
