/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTOR_HPP
#define ACTOR_HPP

#include <cstdint>
#include <memory>

namespace Tessera {

class Actor;

using ActorPtr = std::shared_ptr<Actor>;

/**
 * @brief Base class for anything a map holds: characters, monsters, NPCs.
 *
 * The world core only needs the actor's handle (allocated through
 * WorldManager::createHandle()), whether a script spawned it, and a hook the
 * map calls once per heartbeat. Behaviour lives in the subclasses.
 */
class Actor {
public:
    explicit Actor(int64_t handle, bool scripted = false)
        : m_handle(handle), m_scripted(scripted) {}

    virtual ~Actor() = default;

    int64_t getHandle() const { return m_handle; }

    /**
     * @brief True for entities created by script logic (NPCs, props).
     *
     * Scripted actors are dropped in bulk by Map::removeScriptedEntities(),
     * e.g. before a script reload.
     */
    bool isScripted() const { return m_scripted; }

    /**
     * @brief Called by the owning map on every heartbeat.
     */
    virtual void onHeartbeat() {}

    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

private:
    const int64_t m_handle;
    const bool m_scripted;
};

} // namespace Tessera

#endif // ACTOR_HPP
