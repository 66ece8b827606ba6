/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MAP_HPP
#define MAP_HPP

#include "entities/Actor.hpp"
#include "entities/Character.hpp"
#include "world/Partition.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Tessera {

/**
 * @brief Default partition: a map holding characters and other actors.
 *
 * Maps are reachable both from registry sweeps and directly through
 * WorldManager::getMap(), so the actor lists carry their own lock.
 * onHeartbeat() hooks and character predicates run on a snapshot taken
 * under that lock, with the lock released, so they may call back into the
 * map. An actor added during a tick is first notified on the next one.
 */
class Map : public Partition {
public:
    Map(int32_t id, std::string name, std::string className = "");
    explicit Map(const MapDefinition& definition);
    ~Map() override = default;

    int32_t getId() const override { return m_id; }
    const std::string& getName() const override { return m_name; }
    const std::string& getClassName() const { return m_className; }

    /**
     * @brief Adds a character; ignored if one with the same handle is present.
     * @return true if the character was added
     */
    bool addCharacter(const CharacterPtr& character);
    bool removeCharacter(int64_t handle);

    /**
     * @brief Adds a non-character actor (monster, NPC, prop).
     * @return true if the actor was added
     */
    bool addActor(const ActorPtr& actor);
    bool removeActor(int64_t handle);

    size_t getActorCount() const;
    size_t getCharacterCount() const;
    uint64_t getTickCount() const { return m_tickCount.load(std::memory_order_acquire); }

    void advanceTick() override;
    void removeScriptedEntities() override;
    CharacterPtr getCharacterByTeamName(const std::string& teamName) const override;
    CharacterList getCharacters() const override;
    CharacterList getCharacters(const CharacterPredicate& predicate) const override;

    Map(const Map&) = delete;
    Map& operator=(const Map&) = delete;

private:
    bool containsHandleUnsafe(int64_t handle) const;  // Caller holds m_actorsMutex

    const int32_t m_id;
    const std::string m_name;
    const std::string m_className;

    CharacterList m_characters;
    std::vector<ActorPtr> m_actors;
    mutable std::shared_mutex m_actorsMutex;

    std::atomic<uint64_t> m_tickCount{0};
};

/**
 * @brief Factory used by WorldManager::init() unless one is supplied.
 */
PartitionPtr createMapPartition(const MapDefinition& definition);

} // namespace Tessera

#endif // MAP_HPP
