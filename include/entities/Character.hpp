/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHARACTER_HPP
#define CHARACTER_HPP

#include "entities/Actor.hpp"
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Tessera {

class Character;

using CharacterPtr = std::shared_ptr<Character>;
using CharacterList = std::vector<CharacterPtr>;
using CharacterPredicate = std::function<bool(const Character&)>;

/**
 * @brief A player-controlled actor, identified by name and team name.
 */
class Character : public Actor {
public:
    Character(int64_t handle, std::string name, std::string teamName)
        : Actor(handle), m_name(std::move(name)), m_teamName(std::move(teamName)) {}

    const std::string& getName() const { return m_name; }
    const std::string& getTeamName() const { return m_teamName; }

private:
    std::string m_name;
    std::string m_teamName;
};

} // namespace Tessera

#endif // CHARACTER_HPP
