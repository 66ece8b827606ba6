/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTITION_REGISTRY_HPP
#define PARTITION_REGISTRY_HPP

#include "entities/Character.hpp"
#include "world/Partition.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace Tessera {

/**
 * @brief Thread-safe collection of the world's partitions, indexed by id and by name.
 *
 * Both indices always describe the same set of partitions: the only writers
 * are initialize() and clear(), which update them together under the
 * exclusive lock. Point lookups take a shared lock. Sweeps (forEach and
 * the character queries built on it) hold the exclusive lock for the whole
 * iteration, so a sweep sees one consistent membership and two sweeps never
 * interleave. Sweeps visit partitions in registration order.
 *
 * Sweeps are re-entrant on the sweeping thread: a visitor (for instance a
 * partition's advanceTick() during the heartbeat) may call get(), count() or
 * start a nested sweep. Changing membership from inside a sweep is rejected
 * with std::logic_error.
 */
class PartitionRegistry {
public:
    using Visitor = std::function<void(Partition&)>;

    PartitionRegistry() = default;
    ~PartitionRegistry() = default;

    /**
     * @brief Creates one partition per definition and registers all of them.
     *
     * All-or-nothing: every partition is built and checked before any is
     * published. Exceptions from @p factory propagate unchanged.
     *
     * @throws std::invalid_argument on a duplicate id or name (within
     *         @p definitions or against already registered partitions), when
     *         @p factory returns nullptr, or when a built partition reports an
     *         id/name different from its definition
     * @throws std::logic_error when called from inside a sweep
     */
    void initialize(const std::vector<MapDefinition>& definitions, const PartitionFactory& factory);

    /**
     * @return The partition with the given id, or nullptr
     */
    Partition* get(int32_t id) const;

    /**
     * @return The partition with the given name, or nullptr
     */
    Partition* get(const std::string& name) const;

    size_t count() const;

    std::vector<int32_t> getIds() const;
    std::vector<std::string> getNames() const;

    void forEach(const Visitor& visitor);

    CharacterPtr findCharacterByTeamName(const std::string& teamName);
    CharacterList getCharacters();
    CharacterList getCharacters(const CharacterPredicate& predicate);

    void removeScriptedEntities();

    /**
     * @brief Drops every partition. Only for world teardown.
     * @throws std::logic_error when called from inside a sweep
     */
    void clear();

    PartitionRegistry(const PartitionRegistry&) = delete;
    PartitionRegistry& operator=(const PartitionRegistry&) = delete;

private:
    // Exclusive lock plus sweep ownership for the calling thread. Nested
    // scopes on the owning thread neither lock nor release.
    class SweepScope {
    public:
        explicit SweepScope(PartitionRegistry& registry);
        ~SweepScope();

        SweepScope(const SweepScope&) = delete;
        SweepScope& operator=(const SweepScope&) = delete;

    private:
        PartitionRegistry& m_registry;
        std::unique_lock<std::shared_mutex> m_lock;
        bool m_outermost;
    };

    bool isSweepingThread() const {
        return m_sweepThread.load(std::memory_order_acquire) == std::this_thread::get_id();
    }

    // Registration order; owns the partitions
    std::vector<PartitionPtr> m_partitions;
    std::unordered_map<int32_t, Partition*> m_byId;
    std::unordered_map<std::string, Partition*> m_byName;

    mutable std::shared_mutex m_partitionsMutex;
    // Thread currently holding the exclusive lock for a sweep
    std::atomic<std::thread::id> m_sweepThread{};
};

} // namespace Tessera

#endif // PARTITION_REGISTRY_HPP
