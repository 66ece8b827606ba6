/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_MANAGER_HPP
#define WORLD_MANAGER_HPP

#include "core/HeartbeatScheduler.hpp"
#include "entities/Character.hpp"
#include "utils/IdentityAllocator.hpp"
#include "world/Map.hpp"
#include "world/Partition.hpp"
#include "world/PartitionRegistry.hpp"
#include "world/WorldConfig.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Tessera {

/**
 * @brief Owns the world: its maps, the heartbeat that advances them, and the
 * identity counters used by the session and script layers.
 *
 * Lookups, queries and id allocation are safe from any thread, including
 * from a partition's advanceTick() on the heartbeat thread. Partition
 * pointers returned by getMap() stay valid until clean(). init() and clean()
 * must not be called from the heartbeat thread.
 */
class WorldManager {
public:
    static WorldManager& Instance() {
        static WorldManager instance;
        return instance;
    }

    /**
     * @brief Registers the maps, then starts the heartbeat.
     *
     * The heartbeat only starts once every map is registered, so the first
     * tick always sees the complete world.
     *
     * @param definitions Map definitions from the map database
     * @param config Heartbeat tunables
     * @param factory Builds the partition for each definition
     * @return false if the definitions collide (nothing is registered in that
     *         case), the world is already initialized, or the heartbeat fails to start
     */
    bool init(const std::vector<MapDefinition>& definitions,
              const WorldConfig& config = WorldConfig{},
              const PartitionFactory& factory = createMapPartition);

    /**
     * @brief Stops the heartbeat and drops every map. Identity counters keep counting.
     */
    void clean();

    bool isInitialized() const { return m_initialized.load(std::memory_order_acquire); }

    /**
     * @brief Number of maps in the world.
     */
    size_t count() const { return m_registry.count(); }

    /**
     * @brief New handle for a character or monster.
     */
    int64_t createHandle() { return m_identities.nextHandle(); }

    int64_t createSessionObjectId() { return m_identities.nextSessionObjectId(); }
    int64_t createSkillObjectId() { return m_identities.nextSkillObjectId(); }

    /**
     * @return The map with the given id, or nullptr if it doesn't exist
     */
    Partition* getMap(int32_t mapId) const { return m_registry.get(mapId); }

    /**
     * @return The map with the given name, or nullptr if it doesn't exist
     */
    Partition* getMap(const std::string& mapName) const { return m_registry.get(mapName); }

    /**
     * @brief Removes all scripted entities, like NPCs, from every map.
     */
    void removeScriptedEntities() { m_registry.removeScriptedEntities(); }

    /**
     * @return The first character found with the given team name, or nullptr
     */
    CharacterPtr getCharacterByTeamName(const std::string& teamName) {
        return m_registry.findCharacterByTeamName(teamName);
    }

    /**
     * @brief All characters currently in the world.
     */
    CharacterList getCharacters() { return m_registry.getCharacters(); }

    /**
     * @brief All characters in the world matching @p predicate.
     */
    CharacterList getCharacters(const CharacterPredicate& predicate) {
        return m_registry.getCharacters(predicate);
    }

    /**
     * @brief Advances every map by one heartbeat.
     *
     * Called by the heartbeat thread. A map whose advanceTick() throws is
     * logged and skipped; the remaining maps still advance.
     */
    void updateEntities();

    /**
     * @brief Lock-free view of the heartbeat: Uninitialized before init() and
     * after clean(), Stopped while clean() is shutting it down.
     */
    HeartbeatScheduler::State getHeartbeatState() const {
        return m_heartbeatState.load(std::memory_order_acquire);
    }

    /**
     * @brief Heartbeats run since the last init(). Kept after clean().
     */
    uint64_t getHeartbeatCount() const { return m_heartbeatCount.load(std::memory_order_acquire); }

    /**
     * @brief Total map updates that threw since startup.
     */
    uint64_t getPartitionFaultCount() const { return m_partitionFaults.load(std::memory_order_relaxed); }

    const IdentityAllocator& getIdentities() const { return m_identities; }

private:
    WorldManager() = default;
    ~WorldManager() { clean(); }
    WorldManager(const WorldManager&) = delete;
    WorldManager& operator=(const WorldManager&) = delete;

    IdentityAllocator m_identities;
    PartitionRegistry m_registry;
    std::unique_ptr<HeartbeatScheduler> m_heartbeat;

    // Serializes init() and clean(); never taken by the heartbeat thread
    mutable std::mutex m_lifecycleMutex;
    std::atomic<bool> m_initialized{false};
    std::atomic<uint64_t> m_partitionFaults{0};
    std::atomic<HeartbeatScheduler::State> m_heartbeatState{HeartbeatScheduler::State::Uninitialized};
    std::atomic<uint64_t> m_heartbeatCount{0};
};

} // namespace Tessera

#endif // WORLD_MANAGER_HPP
