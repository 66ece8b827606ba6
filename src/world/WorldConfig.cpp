/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/WorldConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <cstdint>
#include <string>

namespace Tessera {

WorldConfig WorldConfig::fromSettings(const SettingsManager& settings) {
    WorldConfig config;

    int64_t periodMs = settings.get<int64_t>(SETTINGS_CATEGORY, "heartbeat_period_ms",
                                             config.heartbeatPeriod.count());
    if (periodMs > 0) {
        config.heartbeatPeriod = std::chrono::milliseconds(periodMs);
    } else {
        WORLD_MANAGER_WARN("Ignoring non-positive heartbeat_period_ms " + std::to_string(periodMs) +
                           ", using " + std::to_string(config.heartbeatPeriod.count()) + "ms");
    }

    config.alignHeartbeat = settings.get<bool>(SETTINGS_CATEGORY, "align_heartbeat", config.alignHeartbeat);

    int64_t slowMs = settings.get<int64_t>(SETTINGS_CATEGORY, "slow_tick_warn_ms",
                                           config.slowTickWarning.count());
    if (slowMs >= 0) {
        config.slowTickWarning = std::chrono::milliseconds(slowMs);
    }

    return config;
}

} // namespace Tessera
