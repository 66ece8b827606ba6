/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WorldManagerTests
#include <boost/test/unit_test.hpp>

#include "managers/WorldManager.hpp"
#include "world/Map.hpp"
#include "../mocks/MockPartition.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace Tessera;
using namespace std::chrono_literals;

namespace {

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return predicate();
}

WorldConfig fastConfig() {
    WorldConfig config;
    config.heartbeatPeriod = 20ms;
    config.alignHeartbeat = false;
    return config;
}

std::vector<MapDefinition> makeDefinitions(int32_t count) {
    std::vector<MapDefinition> definitions;
    for (int32_t i = 1; i <= count; ++i) {
        definitions.push_back({i, "map_" + std::to_string(i), "f_map"});
    }
    return definitions;
}

// Factory handing out mocks whose counters outlive the world
struct RecordingFactory {
    std::mutex mutex;
    std::vector<std::shared_ptr<MockPartition::Counters>> counters;

    PartitionFactory factory() {
        return [this](const MapDefinition& definition) -> PartitionPtr {
            auto shared = std::make_shared<MockPartition::Counters>();
            {
                std::lock_guard<std::mutex> lock(mutex);
                counters.push_back(shared);
            }
            return std::make_unique<MockPartition>(definition.id, definition.name, shared);
        };
    }
};

// Reads the world from its own tick, like a map warping a character to a neighbour
class NeighbourLookupPartition : public MockPartition {
public:
    NeighbourLookupPartition(int32_t id, std::string name, int32_t neighbourId)
        : MockPartition(id, std::move(name)), m_neighbourId(neighbourId) {}

    void advanceTick() override {
        auto& world = WorldManager::Instance();
        Partition* neighbour = world.getMap(m_neighbourId);
        if (neighbour == nullptr || world.getMap(neighbour->getName()) != neighbour) {
            throw std::runtime_error("neighbour lookup failed");
        }
        seenMaps.store(world.count());
        world.getCharacters();
        world.getCharacterByTeamName("Lions");
        // Heartbeat diagnostics are readable while clean() joins this thread
        world.getHeartbeatState();
        world.getHeartbeatCount();
        MockPartition::advanceTick();
    }

    std::atomic<size_t> seenMaps{0};

private:
    int32_t m_neighbourId;
};

} // namespace

struct WorldManagerFixture {
    WorldManagerFixture() { WorldManager::Instance().clean(); }
    ~WorldManagerFixture() { WorldManager::Instance().clean(); }
};

BOOST_FIXTURE_TEST_SUITE(WorldManagerTestSuite, WorldManagerFixture)

BOOST_AUTO_TEST_CASE(TestInitRegistersMapsAndStartsHeartbeat) {
    auto& world = WorldManager::Instance();
    BOOST_REQUIRE(world.init(makeDefinitions(3), fastConfig()));

    BOOST_CHECK(world.isInitialized());
    BOOST_CHECK_EQUAL(world.count(), 3);
    BOOST_REQUIRE(world.getMap(2) != nullptr);
    BOOST_CHECK_EQUAL(world.getMap(2)->getName(), "map_2");
    BOOST_CHECK(world.getMap("map_3") == world.getMap(3));
    BOOST_CHECK(world.getMap(99) == nullptr);
    BOOST_CHECK(world.getMap("nowhere") == nullptr);

    // Default factory builds real maps
    BOOST_CHECK(dynamic_cast<Map*>(world.getMap(1)) != nullptr);

    BOOST_REQUIRE(waitFor([&world] { return world.getHeartbeatCount() >= 2; }, 3000ms));
    BOOST_CHECK(world.getHeartbeatState() == HeartbeatScheduler::State::Ticking);

    auto* map = static_cast<Map*>(world.getMap(1));
    BOOST_CHECK_GE(map->getTickCount(), 1);
}

BOOST_AUTO_TEST_CASE(TestEveryPartitionTickedOncePerHeartbeat) {
    auto& world = WorldManager::Instance();
    RecordingFactory recorder;

    BOOST_REQUIRE(world.init(makeDefinitions(50), fastConfig(), recorder.factory()));
    BOOST_REQUIRE(waitFor([&world] { return world.getHeartbeatCount() >= 5; }, 5000ms));

    // clean() joins the heartbeat, so no sweep is cut short and the count is final
    world.clean();
    uint64_t firings = world.getHeartbeatCount();
    BOOST_CHECK_GE(firings, 5);

    BOOST_REQUIRE_EQUAL(recorder.counters.size(), 50);
    for (const auto& counters : recorder.counters) {
        BOOST_CHECK_EQUAL(counters->ticks.load(), firings);
    }
}

BOOST_AUTO_TEST_CASE(TestUpdateEntitiesAdvancesEachMapOnce) {
    auto& world = WorldManager::Instance();
    RecordingFactory recorder;

    WorldConfig slow;
    slow.heartbeatPeriod = std::chrono::milliseconds(60'000);
    slow.alignHeartbeat = false;
    BOOST_REQUIRE(world.init(makeDefinitions(10), slow, recorder.factory()));

    uint64_t before = world.getHeartbeatCount();
    world.updateEntities();
    world.updateEntities();
    world.updateEntities();

    BOOST_CHECK_EQUAL(world.getHeartbeatCount(), before + 3);
    for (const auto& counters : recorder.counters) {
        BOOST_CHECK_EQUAL(counters->ticks.load(), 3);
    }
}

BOOST_AUTO_TEST_CASE(TestPartitionMayQueryWorldDuringTick,
                     *boost::unit_test::timeout(30)) {
    auto& world = WorldManager::Instance();
    std::mutex partitionsMutex;
    std::vector<NeighbourLookupPartition*> partitions;

    PartitionFactory factory = [&](const MapDefinition& definition) -> PartitionPtr {
        int32_t neighbour = definition.id == 1 ? 2 : 1;
        auto partition = std::make_unique<NeighbourLookupPartition>(definition.id, definition.name, neighbour);
        std::lock_guard<std::mutex> lock(partitionsMutex);
        partitions.push_back(partition.get());
        return partition;
    };

    uint64_t faultsBefore = world.getPartitionFaultCount();
    BOOST_REQUIRE(world.init(makeDefinitions(2), fastConfig(), factory));
    BOOST_REQUIRE(waitFor([&world] { return world.getHeartbeatCount() >= 5; }, 5000ms));

    BOOST_REQUIRE_EQUAL(partitions.size(), 2);
    BOOST_CHECK_EQUAL(partitions[0]->seenMaps.load(), 2);
    BOOST_CHECK_GE(partitions[1]->counters()->ticks.load(), 5);
    BOOST_CHECK_EQUAL(world.getPartitionFaultCount(), faultsBefore);

    // Shutting down while partitions read heartbeat state must not hang
    world.clean();
    BOOST_CHECK(world.getHeartbeatState() == HeartbeatScheduler::State::Uninitialized);
}

BOOST_AUTO_TEST_CASE(TestDuplicateDefinitionsAbortStartup) {
    auto& world = WorldManager::Instance();
    std::vector<MapDefinition> definitions{{1, "Alpha", ""}, {2, "Beta", ""}, {1, "Gamma", ""}};

    BOOST_CHECK(!world.init(definitions, fastConfig()));
    BOOST_CHECK(!world.isInitialized());
    BOOST_CHECK_EQUAL(world.count(), 0);
    BOOST_CHECK(world.getMap("Alpha") == nullptr);
    // No heartbeat was ever scheduled
    BOOST_CHECK(world.getHeartbeatState() == HeartbeatScheduler::State::Uninitialized);

    std::vector<MapDefinition> sameName{{1, "Alpha", ""}, {2, "Alpha", ""}};
    BOOST_CHECK(!world.init(sameName, fastConfig()));
    BOOST_CHECK_EQUAL(world.count(), 0);

    // A valid set still works afterwards
    BOOST_CHECK(world.init(makeDefinitions(2), fastConfig()));
    BOOST_CHECK_EQUAL(world.count(), 2);
}

BOOST_AUTO_TEST_CASE(TestInvalidHeartbeatConfigAbortsStartup) {
    auto& world = WorldManager::Instance();
    WorldConfig config;
    config.heartbeatPeriod = 0ms;

    BOOST_CHECK(!world.init(makeDefinitions(2), config));
    BOOST_CHECK(!world.isInitialized());
    BOOST_CHECK_EQUAL(world.count(), 0);
}

BOOST_AUTO_TEST_CASE(TestSecondInitRejected) {
    auto& world = WorldManager::Instance();
    BOOST_REQUIRE(world.init(makeDefinitions(2), fastConfig()));

    std::vector<MapDefinition> more{{10, "Other", ""}};
    BOOST_CHECK(!world.init(more, fastConfig()));
    BOOST_CHECK_EQUAL(world.count(), 2);
    BOOST_CHECK(world.getMap(10) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestCleanStopsHeartbeatAndDropsMaps) {
    auto& world = WorldManager::Instance();
    BOOST_REQUIRE(world.init(makeDefinitions(4), fastConfig()));

    world.clean();
    BOOST_CHECK(!world.isInitialized());
    BOOST_CHECK_EQUAL(world.count(), 0);
    BOOST_CHECK(world.getHeartbeatState() == HeartbeatScheduler::State::Uninitialized);
    BOOST_CHECK_NO_THROW(world.clean());

    // Queries on an empty world are harmless
    BOOST_CHECK(world.getCharacters().empty());
    BOOST_CHECK(world.getCharacterByTeamName("Lions") == nullptr);
    BOOST_CHECK_NO_THROW(world.removeScriptedEntities());
}

BOOST_AUTO_TEST_CASE(TestFaultyPartitionDoesNotStopOthers) {
    auto& world = WorldManager::Instance();
    RecordingFactory recorder;

    BOOST_REQUIRE(world.init(makeDefinitions(5), fastConfig(), recorder.factory()));
    BOOST_REQUIRE_EQUAL(recorder.counters.size(), 5);
    uint64_t faultsBefore = world.getPartitionFaultCount();

    recorder.counters[2]->failTicks.store(true);
    uint64_t healthyBefore = recorder.counters[4]->ticks.load();

    BOOST_REQUIRE(waitFor([&] { return recorder.counters[4]->ticks.load() >= healthyBefore + 3; }, 5000ms));
    world.clean();

    BOOST_CHECK_GT(world.getPartitionFaultCount(), faultsBefore);
    // Maps before and after the failing one keep advancing in step
    BOOST_CHECK_EQUAL(recorder.counters[0]->ticks.load(), recorder.counters[4]->ticks.load());
    BOOST_CHECK_EQUAL(recorder.counters[1]->ticks.load(), recorder.counters[3]->ticks.load());
    BOOST_CHECK_LT(recorder.counters[2]->ticks.load(), recorder.counters[4]->ticks.load());
}

BOOST_AUTO_TEST_CASE(TestIdentityCountersSurviveClean) {
    auto& world = WorldManager::Instance();
    BOOST_REQUIRE(world.init(makeDefinitions(1), fastConfig()));

    int64_t handle = world.createHandle();
    int64_t session = world.createSessionObjectId();
    int64_t skill = world.createSkillObjectId();

    BOOST_CHECK_GT(handle, IdentityBases::ENTITY_HANDLE_BASE);
    BOOST_CHECK_GT(session, IdentityBases::SESSION_OBJECT_ID_BASE);
    BOOST_CHECK_GT(skill, IdentityBases::SKILL_OBJECT_ID_BASE);

    world.clean();
    BOOST_REQUIRE(world.init(makeDefinitions(1), fastConfig()));

    BOOST_CHECK_GT(world.createHandle(), handle);
    BOOST_CHECK_GT(world.createSessionObjectId(), session);
    BOOST_CHECK_GT(world.createSkillObjectId(), skill);
}

BOOST_AUTO_TEST_CASE(TestConcurrentHandleCreation) {
    auto& world = WorldManager::Instance();
    std::mutex resultsMutex;
    std::set<int64_t> handles;
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            std::vector<int64_t> local;
            for (int i = 0; i < 500; ++i) {
                local.push_back(world.createHandle());
            }
            std::lock_guard<std::mutex> lock(resultsMutex);
            handles.insert(local.begin(), local.end());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(handles.size(), 8u * 500u);
}

BOOST_AUTO_TEST_CASE(TestCharacterQueriesAcrossMaps) {
    auto& world = WorldManager::Instance();
    BOOST_REQUIRE(world.init(makeDefinitions(2), fastConfig()));

    auto* first = dynamic_cast<Map*>(world.getMap(1));
    auto* second = dynamic_cast<Map*>(world.getMap(2));
    BOOST_REQUIRE(first != nullptr && second != nullptr);

    auto a = std::make_shared<Character>(world.createHandle(), "A", "Lions");
    auto b = std::make_shared<Character>(world.createHandle(), "B", "Wolves");
    auto c = std::make_shared<Character>(world.createHandle(), "C", "Lions");
    first->addCharacter(a);
    first->addCharacter(b);
    second->addCharacter(c);

    CharacterList lions = world.getCharacters([](const Character& ch) { return ch.getTeamName() == "Lions"; });
    BOOST_REQUIRE_EQUAL(lions.size(), 2);
    BOOST_CHECK(lions[0] == a);
    BOOST_CHECK(lions[1] == c);

    BOOST_CHECK_EQUAL(world.getCharacters().size(), 3);
    BOOST_CHECK(world.getCharacterByTeamName("Wolves") == b);
    BOOST_CHECK(world.getCharacterByTeamName("Eagles") == nullptr);
}

BOOST_AUTO_TEST_CASE(TestRemoveScriptedEntitiesAcrossMaps) {
    auto& world = WorldManager::Instance();
    BOOST_REQUIRE(world.init(makeDefinitions(2), fastConfig()));

    auto* first = dynamic_cast<Map*>(world.getMap(1));
    auto* second = dynamic_cast<Map*>(world.getMap(2));
    BOOST_REQUIRE(first != nullptr && second != nullptr);

    first->addActor(std::make_shared<Actor>(world.createHandle(), true));
    first->addActor(std::make_shared<Actor>(world.createHandle(), false));
    second->addActor(std::make_shared<Actor>(world.createHandle(), true));
    second->addCharacter(std::make_shared<Character>(world.createHandle(), "Player", "Lions"));

    world.removeScriptedEntities();

    BOOST_CHECK_EQUAL(first->getActorCount(), 1);
    BOOST_CHECK_EQUAL(second->getActorCount(), 0);
    BOOST_CHECK_EQUAL(second->getCharacterCount(), 1);
}

BOOST_AUTO_TEST_SUITE_END()
