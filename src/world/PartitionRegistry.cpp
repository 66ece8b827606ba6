/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/PartitionRegistry.hpp"
#include "core/Logger.hpp"
#include <mutex>
#include <string>
#include <thread>
#include <stdexcept>
#include <unordered_set>

namespace Tessera {

namespace {

std::string describe(const MapDefinition& definition) {
    return "map " + std::to_string(definition.id) + " ('" + definition.name + "')";
}

} // anonymous namespace

PartitionRegistry::SweepScope::SweepScope(PartitionRegistry& registry)
    : m_registry(registry)
    , m_lock(registry.m_partitionsMutex, std::defer_lock)
    , m_outermost(!registry.isSweepingThread())
{
    if (m_outermost) {
        m_lock.lock();
        m_registry.m_sweepThread.store(std::this_thread::get_id(), std::memory_order_release);
    }
}

PartitionRegistry::SweepScope::~SweepScope() {
    if (m_outermost) {
        m_registry.m_sweepThread.store(std::thread::id{}, std::memory_order_release);
    }
}

void PartitionRegistry::initialize(const std::vector<MapDefinition>& definitions,
                                   const PartitionFactory& factory) {
    if (isSweepingThread()) {
        throw std::logic_error("PartitionRegistry::initialize - cannot register maps from inside a sweep");
    }
    if (!factory) {
        throw std::invalid_argument("PartitionRegistry::initialize - no partition factory");
    }

    // Build and validate everything before touching shared state
    std::vector<PartitionPtr> staged;
    staged.reserve(definitions.size());
    std::unordered_set<int32_t> stagedIds;
    std::unordered_set<std::string> stagedNames;

    for (const auto& definition : definitions) {
        if (!stagedIds.insert(definition.id).second) {
            throw std::invalid_argument("Duplicate map id " + std::to_string(definition.id) +
                                        " in definitions (" + describe(definition) + ")");
        }
        if (!stagedNames.insert(definition.name).second) {
            throw std::invalid_argument("Duplicate map name '" + definition.name +
                                        "' in definitions (" + describe(definition) + ")");
        }

        PartitionPtr partition = factory(definition);
        if (!partition) {
            throw std::invalid_argument("Partition factory returned nothing for " + describe(definition));
        }
        if (partition->getId() != definition.id || partition->getName() != definition.name) {
            throw std::invalid_argument("Partition built for " + describe(definition) +
                                        " reports id " + std::to_string(partition->getId()) +
                                        " and name '" + partition->getName() + "'");
        }
        staged.push_back(std::move(partition));
    }

    std::unique_lock<std::shared_mutex> lock(m_partitionsMutex);

    for (const auto& partition : staged) {
        if (m_byId.count(partition->getId()) != 0) {
            throw std::invalid_argument("Map id " + std::to_string(partition->getId()) +
                                        " is already registered");
        }
        if (m_byName.count(partition->getName()) != 0) {
            throw std::invalid_argument("Map name '" + partition->getName() +
                                        "' is already registered");
        }
    }

    m_partitions.reserve(m_partitions.size() + staged.size());
    for (auto& partition : staged) {
        Partition* raw = partition.get();
        m_byId.emplace(raw->getId(), raw);
        m_byName.emplace(raw->getName(), raw);
        m_partitions.push_back(std::move(partition));
    }

    REGISTRY_INFO("Registered " + std::to_string(staged.size()) + " partitions (" +
                  std::to_string(m_partitions.size()) + " total)");
}

Partition* PartitionRegistry::get(int32_t id) const {
    std::shared_lock<std::shared_mutex> lock(m_partitionsMutex, std::defer_lock);
    if (!isSweepingThread()) {
        lock.lock();
    }
    auto it = m_byId.find(id);
    return it != m_byId.end() ? it->second : nullptr;
}

Partition* PartitionRegistry::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(m_partitionsMutex, std::defer_lock);
    if (!isSweepingThread()) {
        lock.lock();
    }
    auto it = m_byName.find(name);
    return it != m_byName.end() ? it->second : nullptr;
}

size_t PartitionRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(m_partitionsMutex, std::defer_lock);
    if (!isSweepingThread()) {
        lock.lock();
    }
    return m_partitions.size();
}

std::vector<int32_t> PartitionRegistry::getIds() const {
    std::shared_lock<std::shared_mutex> lock(m_partitionsMutex, std::defer_lock);
    if (!isSweepingThread()) {
        lock.lock();
    }
    std::vector<int32_t> ids;
    ids.reserve(m_partitions.size());
    for (const auto& partition : m_partitions) {
        ids.push_back(partition->getId());
    }
    return ids;
}

std::vector<std::string> PartitionRegistry::getNames() const {
    std::shared_lock<std::shared_mutex> lock(m_partitionsMutex, std::defer_lock);
    if (!isSweepingThread()) {
        lock.lock();
    }
    std::vector<std::string> names;
    names.reserve(m_partitions.size());
    for (const auto& partition : m_partitions) {
        names.push_back(partition->getName());
    }
    return names;
}

void PartitionRegistry::forEach(const Visitor& visitor) {
    SweepScope sweep(*this);
    for (const auto& partition : m_partitions) {
        visitor(*partition);
    }
}

CharacterPtr PartitionRegistry::findCharacterByTeamName(const std::string& teamName) {
    SweepScope sweep(*this);
    for (const auto& partition : m_partitions) {
        if (auto character = partition->getCharacterByTeamName(teamName)) {
            return character;
        }
    }
    return nullptr;
}

CharacterList PartitionRegistry::getCharacters() {
    CharacterList result;
    forEach([&result](Partition& partition) {
        CharacterList characters = partition.getCharacters();
        result.insert(result.end(), characters.begin(), characters.end());
    });
    return result;
}

CharacterList PartitionRegistry::getCharacters(const CharacterPredicate& predicate) {
    CharacterList result;
    forEach([&result, &predicate](Partition& partition) {
        CharacterList characters = partition.getCharacters(predicate);
        result.insert(result.end(), characters.begin(), characters.end());
    });
    return result;
}

void PartitionRegistry::removeScriptedEntities() {
    forEach([](Partition& partition) { partition.removeScriptedEntities(); });
}

void PartitionRegistry::clear() {
    if (isSweepingThread()) {
        throw std::logic_error("PartitionRegistry::clear - cannot drop maps from inside a sweep");
    }
    std::unique_lock<std::shared_mutex> lock(m_partitionsMutex);
    m_byId.clear();
    m_byName.clear();
    m_partitions.clear();
}

} // namespace Tessera
