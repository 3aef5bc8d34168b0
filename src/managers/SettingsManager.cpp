/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <limits>

namespace GridRoute {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    if (!loadFromJson(reader.getRoot())) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    SETTINGS_INFO("Loaded settings from file: " + filepath);
    return true;
}

bool SettingsManager::loadFromJson(const JsonValue& root) {
    const JsonObject* rootObj = root.tryAsObject();
    if (!rootObj) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    for (const auto& [categoryName, categoryValue] : *rootObj) {
        const JsonObject* categoryObj = categoryValue.tryAsObject();
        if (!categoryObj) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *categoryObj) {
            SettingValue settingValue;
            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isInteger()) {
                settingValue = value.asInt();
            } else if (value.isNumber()) {
                const double number = value.asNumber();
                if (std::abs(number) > static_cast<double>(std::numeric_limits<float>::max())) {
                    SETTINGS_WARNING("Setting '" + categoryName + "." + key + "' is out of range, skipping");
                    continue;
                }
                settingValue = static_cast<float>(number);
            } else if (value.isString()) {
                settingValue = value.asString();
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }
            m_settings[categoryName][key] = std::move(settingValue);
        }
    }
    return true;
}

JsonValue SettingsManager::toJson() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    JsonValue root{JsonObject{}};
    for (const auto& [categoryName, categorySettings] : m_settings) {
        JsonObject category;
        for (const auto& [key, value] : categorySettings) {
            category[key] = std::visit([](const auto& arg) { return JsonValue(arg); }, value);
        }
        root[categoryName] = JsonValue(std::move(category));
    }
    return root;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    if (!JsonReader::saveToFile(toJson(), filepath)) {
        SETTINGS_ERROR("Failed to write settings file: " + filepath);
        return false;
    }
    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }
    return categoryIt->second.count(key) > 0;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }

    // Empty categories are dropped
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

} // namespace GridRoute
