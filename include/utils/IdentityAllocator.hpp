/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IDENTITY_ALLOCATOR_HPP
#define IDENTITY_ALLOCATOR_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace Tessera {

/**
 * @brief The independent identity spaces handed out by the world.
 */
enum class CounterKind : uint8_t {
    EntityHandle = 0,   // In-memory handles for characters and monsters
    SessionObject = 1,  // Objects scoped to a client session
    SkillObject = 2,    // Objects spawned by skills
    COUNT
};

/**
 * @brief Starting points of each identity space.
 *
 * Skill objects observed in the client sit above 0x54B600000000, session and
 * ability objects above 0xE1A900000000. Keeping the generated ids inside those
 * ranges is kept as a safety margin; nothing so far shows the client requires it.
 */
namespace IdentityBases {
    inline constexpr int64_t ENTITY_HANDLE_BASE = 0;
    inline constexpr int64_t SESSION_OBJECT_ID_BASE = 0x0000E1A900000000;
    inline constexpr int64_t SKILL_OBJECT_ID_BASE = 0x000054B600000000;
}

/**
 * @brief Lock-free generator for world-unique 64-bit identities.
 *
 * Each CounterKind owns its own atomic counter. Every call to next() bumps the
 * counter exactly once and returns the new value, so the first handle issued
 * is ENTITY_HANDLE_BASE + 1. Values are never reused or reset; overflow of the
 * 64-bit range is not guarded against.
 */
class IdentityAllocator {
public:
    IdentityAllocator()
        : IdentityAllocator(IdentityBases::ENTITY_HANDLE_BASE,
                            IdentityBases::SESSION_OBJECT_ID_BASE,
                            IdentityBases::SKILL_OBJECT_ID_BASE) {}

    IdentityAllocator(int64_t handleBase, int64_t sessionObjectBase,
                      int64_t skillObjectBase) {
        m_counters[index(CounterKind::EntityHandle)].value.store(handleBase, std::memory_order_relaxed);
        m_counters[index(CounterKind::SessionObject)].value.store(sessionObjectBase, std::memory_order_relaxed);
        m_counters[index(CounterKind::SkillObject)].value.store(skillObjectBase, std::memory_order_relaxed);
    }

    /**
     * @brief Allocates the next identity of the given kind.
     * @return A value strictly greater than any previously returned for @p kind
     */
    int64_t next(CounterKind kind) {
        return m_counters[index(kind)].value.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    /**
     * @brief Last identity handed out for @p kind (the base if none yet).
     */
    int64_t peek(CounterKind kind) const {
        return m_counters[index(kind)].value.load(std::memory_order_relaxed);
    }

    int64_t nextHandle() { return next(CounterKind::EntityHandle); }
    int64_t nextSessionObjectId() { return next(CounterKind::SessionObject); }
    int64_t nextSkillObjectId() { return next(CounterKind::SkillObject); }

    IdentityAllocator(const IdentityAllocator&) = delete;
    IdentityAllocator& operator=(const IdentityAllocator&) = delete;

private:
    static constexpr size_t index(CounterKind kind) {
        return static_cast<size_t>(kind);
    }

    // Cache-line aligned to prevent false sharing between hot counters
    struct alignas(64) AlignedCounter {
        std::atomic<int64_t> value{0};
    };

    std::array<AlignedCounter, static_cast<size_t>(CounterKind::COUNT)> m_counters{};
};

} // namespace Tessera

#endif // IDENTITY_ALLOCATOR_HPP
