/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace Wayfinder {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return loadFromRoot(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings - " + reader.getLastError());
        return false;
    }
    return loadFromRoot(reader.getRoot(), "<string>");
}

bool SettingsManager::loadFromRoot(const JsonValue& root, const std::string& source) {
    const JsonObject* rootObj = root.tryAsObject();
    if (!rootObj) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + source);
        return false;
    }

    struct Change {
        std::string category;
        std::string key;
        SettingValue value;
    };
    std::vector<Change> changes;

    {
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
                } else if (value.isNumber()) {
                    const double numValue = value.asNumber();
                    const bool integral = std::floor(numValue) == numValue &&
                        std::abs(numValue) <= static_cast<double>(std::numeric_limits<int>::max());
                    if (integral) {
                        settingValue = static_cast<int>(numValue);
                    } else if (auto floatValue = value.tryAsFloat()) {
                        settingValue = *floatValue;
                    } else {
                        SETTINGS_WARNING("Setting '" + categoryName + "." + key + "' is out of float range, skipping");
                        continue;
                    }
                } else if (value.isString()) {
                    settingValue = value.asString();
                } else {
                    SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                    continue;
                }

                m_settings[categoryName][key] = settingValue;
                changes.push_back({categoryName, key, settingValue});
            }
        }
    }

    for (const auto& change : changes) {
        notifyListeners(change.category, change.key, change.value);
    }

    SETTINGS_INFO("Loaded settings from: " + source);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    return categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return false;
    }

    categoryIt->second.erase(keyIt);

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
        m_listeners.end()
    );
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
    // Copy matching callbacks so a listener may (un)register without deadlocking
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& listener : m_listeners) {
            if (listener.category.empty() || listener.category == category) {
                callbacks.push_back(listener.callback);
            }
        }
    }

    for (const auto& callback : callbacks) {
        callback(category, key, newValue);
    }
}

} // namespace Wayfinder
