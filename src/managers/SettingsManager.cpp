/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>

namespace Tessera {

namespace {

bool isWholeNumber(double value) {
    return std::isfinite(value) && std::floor(value) == value &&
           std::abs(value) < static_cast<double>(std::numeric_limits<int64_t>::max());
}

std::string escapeJson(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '"': escaped += "\\\""; break;
        case '\\': escaped += "\\\\"; break;
        case '\n': escaped += "\\n"; break;
        case '\t': escaped += "\\t"; break;
        default: escaped += c; break;
        }
    }
    return escaped;
}

} // anonymous namespace

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

    size_t loaded = 0;
    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

        for (const auto& [categoryName, categoryValue] : root.asObject()) {
            if (!categoryValue.isObject()) {
                SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
                continue;
            }

            for (const auto& [key, value] : categoryValue.asObject()) {
                SettingValue settingValue;
                if (value.isBool()) {
                    settingValue = value.asBool();
                } else if (value.isNumber()) {
                    double number = value.asNumber();
                    if (isWholeNumber(number)) {
                        settingValue = static_cast<int64_t>(number);
                    } else {
                        settingValue = number;
                    }
                } else if (value.isString()) {
                    settingValue = value.asString();
                } else {
                    SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                    continue;
                }

                m_settings[categoryName][key] = std::move(settingValue);
                ++loaded;
            }
        }
    }

    SETTINGS_INFO("Loaded " + std::to_string(loaded) + " settings from file: " + filepath);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }

    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    // Sorted output keeps saved files diffable
    std::map<std::string, std::map<std::string, SettingValue>> sorted;
    for (const auto& [category, values] : m_settings) {
        sorted[category].insert(values.begin(), values.end());
    }

    file << std::setprecision(std::numeric_limits<double>::max_digits10);
    file << "{\n";
    size_t categoryIndex = 0;
    for (const auto& [category, values] : sorted) {
        file << "  \"" << escapeJson(category) << "\": {\n";

        size_t keyIndex = 0;
        for (const auto& [key, value] : values) {
            file << "    \"" << escapeJson(key) << "\": ";
            std::visit([&file](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, bool>) {
                    file << (arg ? "true" : "false");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    file << "\"" << escapeJson(arg) << "\"";
                } else {
                    file << arg;
                }
            }, value);
            file << (++keyIndex < values.size() ? ",\n" : "\n");
        }

        file << "  }" << (++categoryIndex < sorted.size() ? ",\n" : "\n");
    }
    file << "}\n";

    if (!file.good()) {
        SETTINGS_ERROR("Failed writing settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

void SettingsManager::storeValue(const std::string& category, const std::string& key, SettingValue value) {
    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        m_settings[category][key] = value;
    }

    // Listeners run without either lock so they may read or write settings
    std::vector<ChangeCallback> toNotify;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& listener : m_listeners) {
            if (listener.category.empty() || listener.category == category) {
                toNotify.push_back(listener.callback);
            }
        }
    }
    for (const auto& callback : toNotify) {
        callback(category, key, value);
    }
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() && categoryIt->second.count(key) != 0;
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
                       [callbackId](const ListenerInfo& info) { return info.id == callbackId; }),
        m_listeners.end());
}

} // namespace Tessera
