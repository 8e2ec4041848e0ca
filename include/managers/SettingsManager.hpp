/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Wayfinder {

class JsonValue;

/**
 * @brief Thread-safe walkthrough configuration store with category organization
 *
 * Values are read from a JSON object of categories. Unknown keys are kept so
 * hosts can store their own settings next to the engine's.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   float speed = settings.get<float>("walker", "speed", 2.0f);
 *   settings.set("camera", "follow_enabled", true);
 *
 * Categories read by the engine: "walker", "gait", "camera", "floors".
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    /**
     * @brief Gets the singleton instance of SettingsManager
     */
    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Callback function type for change notifications
     * @param category The category that changed
     * @param key The setting key that changed
     * @param newValue The new value of the setting
     */
    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Loads settings from a JSON file, merging into current values
     * @return true if loading successful, false otherwise
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Loads settings from JSON text, merging into current values
     * @return true if parsing successful, false otherwise
     */
    bool loadFromString(const std::string& json);

    /**
     * @brief Gets a typed setting value with optional default
     * @tparam T int, float, bool or std::string
     *
     * Integer values satisfy a float request, since JSON does not
     * distinguish "2" from "2.0". Any other type mismatch returns defaultValue.
     * Thread-safe for concurrent reads.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value and notifies listeners
     * @return true if set successful, false for unsupported types
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

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    // Multiple concurrent reads or a single write
    mutable std::shared_mutex m_settingsMutex;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId = 0;

    bool loadFromRoot(const JsonValue& root, const std::string& source);
    void notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue);

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

// Template implementations must be in header for linking

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

    const SettingValue& value = keyIt->second;
    if constexpr (std::is_same_v<T, int>) {
        if (const int* v = std::get_if<int>(&value)) return *v;
    } else if constexpr (std::is_same_v<T, float>) {
        if (const float* v = std::get_if<float>(&value)) return *v;
        if (const int* v = std::get_if<int>(&value)) return static_cast<float>(*v);
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const bool* v = std::get_if<bool>(&value)) return *v;
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const std::string* v = std::get_if<std::string>(&value)) return *v;
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_same_v<T, double>) {
        settingValue = static_cast<float>(value);
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        m_settings[category][key] = settingValue;
    }

    // Notify listeners outside the lock to prevent deadlock
    notifyListeners(category, key, settingValue);

    return true;
}

} // namespace Wayfinder

#endif // SETTINGS_MANAGER_HPP
