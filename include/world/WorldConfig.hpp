/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_CONFIG_HPP
#define WORLD_CONFIG_HPP

#include "core/HeartbeatScheduler.hpp"
#include <chrono>

namespace Tessera {

class SettingsManager;

/**
 * @brief Runtime tunables of the world, read from the "world" settings category.
 *
 *   heartbeat_period_ms  int   Heartbeat period (default 500)
 *   align_heartbeat      bool  Align the first tick to the wall clock (default true)
 *   slow_tick_warn_ms    int   Log a warning for ticks slower than this (default 250)
 */
struct WorldConfig {
    static constexpr const char* SETTINGS_CATEGORY = "world";

    std::chrono::milliseconds heartbeatPeriod{HeartbeatScheduler::DEFAULT_PERIOD};
    bool alignHeartbeat{true};
    std::chrono::milliseconds slowTickWarning{HeartbeatScheduler::DEFAULT_SLOW_TICK_THRESHOLD};

    /**
     * @brief Reads the world category; invalid values fall back to defaults.
     */
    static WorldConfig fromSettings(const SettingsManager& settings);
};

} // namespace Tessera

#endif // WORLD_CONFIG_HPP
