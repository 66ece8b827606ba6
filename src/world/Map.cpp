/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Map.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <iterator>
#include <memory>
#include <mutex>

namespace Tessera {

Map::Map(int32_t id, std::string name, std::string className)
    : m_id(id), m_name(std::move(name)), m_className(std::move(className)) {}

Map::Map(const MapDefinition& definition)
    : Map(definition.id, definition.name, definition.className) {}

bool Map::containsHandleUnsafe(int64_t handle) const {
    auto sameHandle = [handle](const auto& actor) { return actor->getHandle() == handle; };
    return std::any_of(m_characters.begin(), m_characters.end(), sameHandle) ||
           std::any_of(m_actors.begin(), m_actors.end(), sameHandle);
}

bool Map::addCharacter(const CharacterPtr& character) {
    if (!character) {
        MAP_WARN("Map " + m_name + ": refusing to add null character");
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_actorsMutex);
    if (containsHandleUnsafe(character->getHandle())) {
        MAP_WARN("Map " + m_name + ": handle " + std::to_string(character->getHandle()) +
                 " already present");
        return false;
    }
    m_characters.push_back(character);
    return true;
}

bool Map::removeCharacter(int64_t handle) {
    std::unique_lock<std::shared_mutex> lock(m_actorsMutex);
    auto it = std::find_if(m_characters.begin(), m_characters.end(),
                           [handle](const CharacterPtr& c) { return c->getHandle() == handle; });
    if (it == m_characters.end()) {
        return false;
    }
    m_characters.erase(it);
    return true;
}

bool Map::addActor(const ActorPtr& actor) {
    if (!actor) {
        MAP_WARN("Map " + m_name + ": refusing to add null actor");
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_actorsMutex);
    if (containsHandleUnsafe(actor->getHandle())) {
        MAP_WARN("Map " + m_name + ": handle " + std::to_string(actor->getHandle()) +
                 " already present");
        return false;
    }
    m_actors.push_back(actor);
    return true;
}

bool Map::removeActor(int64_t handle) {
    std::unique_lock<std::shared_mutex> lock(m_actorsMutex);
    auto it = std::find_if(m_actors.begin(), m_actors.end(),
                           [handle](const ActorPtr& a) { return a->getHandle() == handle; });
    if (it == m_actors.end()) {
        return false;
    }
    m_actors.erase(it);
    return true;
}

size_t Map::getActorCount() const {
    std::shared_lock<std::shared_mutex> lock(m_actorsMutex);
    return m_actors.size();
}

size_t Map::getCharacterCount() const {
    std::shared_lock<std::shared_mutex> lock(m_actorsMutex);
    return m_characters.size();
}

void Map::advanceTick() {
    // Hooks run on a snapshot so an actor may query or modify its own map
    CharacterList characters;
    std::vector<ActorPtr> actors;
    {
        std::shared_lock<std::shared_mutex> lock(m_actorsMutex);
        characters = m_characters;
        actors = m_actors;
    }

    for (const auto& character : characters) {
        character->onHeartbeat();
    }
    for (const auto& actor : actors) {
        actor->onHeartbeat();
    }

    m_tickCount.fetch_add(1, std::memory_order_release);
}

void Map::removeScriptedEntities() {
    std::unique_lock<std::shared_mutex> lock(m_actorsMutex);

    auto scripted = [](const auto& actor) { return actor->isScripted(); };
    size_t before = m_actors.size() + m_characters.size();

    m_actors.erase(std::remove_if(m_actors.begin(), m_actors.end(), scripted), m_actors.end());
    m_characters.erase(std::remove_if(m_characters.begin(), m_characters.end(), scripted),
                       m_characters.end());

    size_t removed = before - (m_actors.size() + m_characters.size());
    if (removed > 0) {
        MAP_DEBUG("Map " + m_name + ": removed " + std::to_string(removed) + " scripted entities");
    }
}

CharacterPtr Map::getCharacterByTeamName(const std::string& teamName) const {
    std::shared_lock<std::shared_mutex> lock(m_actorsMutex);
    auto it = std::find_if(m_characters.begin(), m_characters.end(),
                           [&teamName](const CharacterPtr& c) { return c->getTeamName() == teamName; });
    return it != m_characters.end() ? *it : nullptr;
}

CharacterList Map::getCharacters() const {
    std::shared_lock<std::shared_mutex> lock(m_actorsMutex);
    return m_characters;
}

CharacterList Map::getCharacters(const CharacterPredicate& predicate) const {
    // Predicates are caller code; evaluate them outside the lock
    CharacterList snapshot = getCharacters();
    CharacterList result;
    std::copy_if(snapshot.begin(), snapshot.end(), std::back_inserter(result),
                 [&predicate](const CharacterPtr& c) { return predicate(*c); });
    return result;
}

PartitionPtr createMapPartition(const MapDefinition& definition) {
    return std::make_unique<Map>(definition);
}

} // namespace Tessera
