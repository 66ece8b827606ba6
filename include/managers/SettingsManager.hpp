/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Tessera {

/**
 * @brief Thread-safe settings store organised by category and key
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/world.json");
 *   int periodMs = settings.get<int>("world", "heartbeat_period_ms", 500);
 *   settings.set("world", "align_heartbeat", false);
 *
 * Whole JSON numbers are stored as 64-bit integers, everything else as double.
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int64_t, double, bool, std::string>;

    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Merges settings from a JSON file of the form {"category": {"key": value}}
     * @return false if the file cannot be read or is not a JSON object
     */
    bool loadFromFile(const std::string& filepath);
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Typed lookup; returns @p defaultValue when missing or of another type
     *
     * Integer settings also satisfy floating point requests. Thread-safe for concurrent reads.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Stores a value and notifies listeners
     * @return false for unsupported types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    /**
     * @param category Category to watch, empty for all
     * @return Id for unregisterChangeListener()
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId = 0;

    void storeValue(const std::string& category, const std::string& key, SettingValue value);

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
    if constexpr (std::is_same_v<T, bool>) {
        const bool* stored = std::get_if<bool>(&value);
        return stored ? *stored : defaultValue;
    } else if constexpr (std::is_integral_v<T>) {
        const int64_t* stored = std::get_if<int64_t>(&value);
        return stored ? static_cast<T>(*stored) : defaultValue;
    } else if constexpr (std::is_floating_point_v<T>) {
        if (const double* stored = std::get_if<double>(&value)) {
            return static_cast<T>(*stored);
        }
        const int64_t* whole = std::get_if<int64_t>(&value);
        return whole ? static_cast<T>(*whole) : defaultValue;
    } else if constexpr (std::is_same_v<T, std::string>) {
        const std::string* stored = std::get_if<std::string>(&value);
        return stored ? *stored : defaultValue;
    } else {
        return defaultValue;
    }
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        storeValue(category, key, value);
    } else if constexpr (std::is_integral_v<T>) {
        storeValue(category, key, static_cast<int64_t>(value));
    } else if constexpr (std::is_floating_point_v<T>) {
        storeValue(category, key, static_cast<double>(value));
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        storeValue(category, key, std::string(value));
    } else {
        return false;
    }
    return true;
}

} // namespace Tessera

#endif // SETTINGS_MANAGER_HPP
