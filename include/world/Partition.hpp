/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTITION_HPP
#define PARTITION_HPP

#include "entities/Character.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace Tessera {

/**
 * @brief One map-definition record, as provided by the map database.
 */
struct MapDefinition {
    int32_t id{0};
    std::string name;
    std::string className;  // Opaque reference to the map's class data
};

/**
 * @brief A spatial subdivision of the world (a map).
 *
 * PartitionRegistry owns partitions exclusively and calls into them only
 * through this interface. id and name must not change once constructed.
 */
class Partition {
public:
    virtual ~Partition() = default;

    virtual int32_t getId() const = 0;
    virtual const std::string& getName() const = 0;

    /**
     * @brief Advances the partition's simulation by one heartbeat.
     */
    virtual void advanceTick() = 0;

    /**
     * @brief Removes every entity that was created by script logic.
     */
    virtual void removeScriptedEntities() = 0;

    /**
     * @return The first character with the given team name, or nullptr
     */
    virtual CharacterPtr getCharacterByTeamName(const std::string& teamName) const = 0;

    virtual CharacterList getCharacters() const = 0;
    virtual CharacterList getCharacters(const CharacterPredicate& predicate) const = 0;
};

using PartitionPtr = std::unique_ptr<Partition>;
using PartitionFactory = std::function<PartitionPtr(const MapDefinition&)>;

} // namespace Tessera

#endif // PARTITION_HPP
