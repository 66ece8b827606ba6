/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE IdentityAllocatorTests
#include <boost/test/unit_test.hpp>

#include "utils/IdentityAllocator.hpp"

#include <algorithm>
#include <cstdint>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace Tessera;

BOOST_AUTO_TEST_SUITE(IdentityAllocatorTestSuite)

BOOST_AUTO_TEST_CASE(TestDefaultBases) {
    IdentityAllocator ids;

    BOOST_CHECK_EQUAL(ids.peek(CounterKind::EntityHandle), IdentityBases::ENTITY_HANDLE_BASE);
    BOOST_CHECK_EQUAL(ids.peek(CounterKind::SessionObject), IdentityBases::SESSION_OBJECT_ID_BASE);
    BOOST_CHECK_EQUAL(ids.peek(CounterKind::SkillObject), IdentityBases::SKILL_OBJECT_ID_BASE);

    // First allocation is base + 1
    BOOST_CHECK_EQUAL(ids.nextHandle(), 1);
    BOOST_CHECK_EQUAL(ids.nextSessionObjectId(), 0x0000E1A900000001);
    BOOST_CHECK_EQUAL(ids.nextSkillObjectId(), 0x000054B600000001);
}

BOOST_AUTO_TEST_CASE(TestCountersAreIndependent) {
    IdentityAllocator ids(100, 200, 300);

    for (int i = 0; i < 5; ++i) {
        ids.next(CounterKind::EntityHandle);
    }

    BOOST_CHECK_EQUAL(ids.peek(CounterKind::EntityHandle), 105);
    BOOST_CHECK_EQUAL(ids.peek(CounterKind::SessionObject), 200);
    BOOST_CHECK_EQUAL(ids.peek(CounterKind::SkillObject), 300);

    BOOST_CHECK_EQUAL(ids.next(CounterKind::SkillObject), 301);
    BOOST_CHECK_EQUAL(ids.peek(CounterKind::EntityHandle), 105);
}

BOOST_AUTO_TEST_CASE(TestSequentialAllocationIsStrictlyIncreasing) {
    IdentityAllocator ids;
    int64_t previous = ids.nextSessionObjectId();
    for (int i = 0; i < 1000; ++i) {
        int64_t current = ids.nextSessionObjectId();
        BOOST_REQUIRE_GT(current, previous);
        previous = current;
    }
}

BOOST_AUTO_TEST_CASE(TestConcurrentAllocationHasNoDuplicates) {
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 2500;

    IdentityAllocator ids;
    std::vector<std::vector<int64_t>> results(THREADS);
    std::vector<std::thread> workers;

    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&ids, &results, t]() {
            results[t].reserve(PER_THREAD);
            for (int i = 0; i < PER_THREAD; ++i) {
                results[t].push_back(ids.next(CounterKind::SkillObject));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::unordered_set<int64_t> seen;
    for (const auto& perThread : results) {
        // Each caller observes its own values in increasing order
        BOOST_CHECK(std::is_sorted(perThread.begin(), perThread.end()));
        for (int64_t value : perThread) {
            BOOST_REQUIRE_MESSAGE(seen.insert(value).second, "duplicate id " << value);
        }
    }

    BOOST_CHECK_EQUAL(seen.size(), static_cast<size_t>(THREADS * PER_THREAD));
    // No gaps either: exactly base+1 .. base+N were handed out
    BOOST_CHECK_EQUAL(ids.peek(CounterKind::SkillObject),
                      IdentityBases::SKILL_OBJECT_ID_BASE + THREADS * PER_THREAD);
    BOOST_CHECK_EQUAL(*std::min_element(seen.begin(), seen.end()),
                      IdentityBases::SKILL_OBJECT_ID_BASE + 1);
}

BOOST_AUTO_TEST_CASE(TestConcurrentMixedKinds) {
    constexpr int THREADS = 9;
    constexpr int PER_THREAD = 500;

    IdentityAllocator ids;
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        auto kind = static_cast<CounterKind>(t % 3);
        workers.emplace_back([&ids, kind]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                ids.next(kind);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    // Three threads per kind
    BOOST_CHECK_EQUAL(ids.peek(CounterKind::EntityHandle), 3 * PER_THREAD);
    BOOST_CHECK_EQUAL(ids.peek(CounterKind::SessionObject),
                      IdentityBases::SESSION_OBJECT_ID_BASE + 3 * PER_THREAD);
    BOOST_CHECK_EQUAL(ids.peek(CounterKind::SkillObject),
                      IdentityBases::SKILL_OBJECT_ID_BASE + 3 * PER_THREAD);
}

BOOST_AUTO_TEST_SUITE_END()
