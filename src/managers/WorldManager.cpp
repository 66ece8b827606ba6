/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/WorldManager.hpp"
#include "core/Logger.hpp"
#include <boost/container/small_vector.hpp>
#include <exception>
#include <stdexcept>

namespace Tessera {

bool WorldManager::init(const std::vector<MapDefinition>& definitions,
                        const WorldConfig& config,
                        const PartitionFactory& factory) {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);

    if (m_initialized.load(std::memory_order_acquire)) {
        WORLD_MANAGER_WARN("WorldManager already initialized, call clean() first");
        return false;
    }

    // Maps first: the heartbeat must never observe a half-populated world
    try {
        m_registry.initialize(definitions, factory);
    } catch (const std::invalid_argument& ex) {
        WORLD_MANAGER_CRITICAL("World startup aborted, invalid map definitions: " + std::string(ex.what()));
        return false;
    } catch (const std::exception& ex) {
        WORLD_MANAGER_CRITICAL("World startup aborted, failed to create maps: " + std::string(ex.what()));
        return false;
    }

    try {
        m_heartbeat = std::make_unique<HeartbeatScheduler>(config.heartbeatPeriod, config.alignHeartbeat);
        m_heartbeat->setSlowTickThreshold(config.slowTickWarning);
    } catch (const std::exception& ex) {
        WORLD_MANAGER_CRITICAL("World startup aborted, invalid heartbeat configuration: " + std::string(ex.what()));
        m_registry.clear();
        return false;
    }

    m_heartbeatCount.store(0, std::memory_order_release);
    m_heartbeatState.store(HeartbeatScheduler::State::Scheduled, std::memory_order_release);

    if (!m_heartbeat->start([this](uint64_t) { updateEntities(); })) {
        WORLD_MANAGER_CRITICAL("World startup aborted, heartbeat failed to start");
        m_heartbeatState.store(HeartbeatScheduler::State::Uninitialized, std::memory_order_release);
        m_heartbeat.reset();
        m_registry.clear();
        return false;
    }

    m_initialized.store(true, std::memory_order_release);
    WORLD_MANAGER_INFO("World initialized with " + std::to_string(m_registry.count()) + " maps");
    return true;
}

void WorldManager::clean() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);

    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }

    // Stop ticking before the maps it sweeps go away
    if (m_heartbeat) {
        m_heartbeatState.store(HeartbeatScheduler::State::Stopped, std::memory_order_release);
        m_heartbeat->stop();
        m_heartbeat.reset();
    }
    m_heartbeatState.store(HeartbeatScheduler::State::Uninitialized, std::memory_order_release);
    m_registry.clear();

    m_initialized.store(false, std::memory_order_release);
    WORLD_MANAGER_INFO("WorldManager cleaned up");
}

void WorldManager::updateEntities() {
    auto scheduled = HeartbeatScheduler::State::Scheduled;
    m_heartbeatState.compare_exchange_strong(scheduled, HeartbeatScheduler::State::Ticking,
                                             std::memory_order_acq_rel);

    boost::container::small_vector<int32_t, 8> faultedMaps;

    m_registry.forEach([&faultedMaps](Partition& map) {
        try {
            map.advanceTick();
        } catch (const std::exception& ex) {
            faultedMaps.push_back(map.getId());
            WORLD_MANAGER_ERROR("Map " + std::to_string(map.getId()) + " ('" + map.getName() +
                                "') failed to update: " + std::string(ex.what()));
        } catch (...) {
            faultedMaps.push_back(map.getId());
            WORLD_MANAGER_ERROR("Map " + std::to_string(map.getId()) + " ('" + map.getName() +
                                "') failed to update: unknown exception");
        }
    });

    if (!faultedMaps.empty()) {
        m_partitionFaults.fetch_add(faultedMaps.size(), std::memory_order_relaxed);

        std::string ids;
        for (int32_t id : faultedMaps) {
            ids += (ids.empty() ? "" : ", ") + std::to_string(id);
        }
        WORLD_MANAGER_WARN(std::to_string(faultedMaps.size()) + " map(s) skipped this heartbeat: " + ids);
    }

    m_heartbeatCount.fetch_add(1, std::memory_order_release);
}

} // namespace Tessera
