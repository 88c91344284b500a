// Unit tests for MemoryPeerRegistry
#include <catch2/catch_test_macros.hpp>
#include "dht/memory_peer_registry.hpp"
#include "infra/discovery_test_helpers.hpp"
#include <set>
#include <thread>

using namespace dhtnode::dht;
using dhtnode::dht::test::MakeId;
using dhtnode::dht::test::MakePeer;

TEST_CASE("MemoryPeerRegistry merge semantics", "[dht][registry]")
{
    MemoryPeerRegistry registry;

    SECTION("New records are added, known ones count as duplicates")
    {
        auto first = registry.MergePeers({MakePeer(MakeId(0x01)), MakePeer(MakeId(0x02))});
        REQUIRE(first.num_added() == 2);
        REQUIRE(first.num_duplicates() == 0);
        REQUIRE(registry.Count() == 2);

        auto second = registry.MergePeers({MakePeer(MakeId(0x02)), MakePeer(MakeId(0x03))});
        REQUIRE(second.num_added() == 1);
        REQUIRE(second.added[0] == MakeId(0x03));
        REQUIRE(second.num_duplicates() == 1);
        REQUIRE(second.updated[0] == MakeId(0x02));
        REQUIRE(registry.Count() == 3);
    }

    SECTION("Addresses are unioned and newest last_seen wins")
    {
        registry.MergePeers({MakePeer(MakeId(0x05), "10.0.0.5:9590", 100)});
        registry.MergePeers({MakePeer(MakeId(0x05), "10.0.0.6:9590", 50)});
        registry.MergePeers({MakePeer(MakeId(0x05), "10.0.0.5:9590", 200)});

        auto record = registry.Get(MakeId(0x05));
        REQUIRE(record.has_value());
        REQUIRE(record->addresses.size() == 2);
        REQUIRE(record->addresses[0] == "10.0.0.5:9590");
        REQUIRE(record->addresses[1] == "10.0.0.6:9590");
        REQUIRE(record->last_seen == 200);
    }

    SECTION("Invalid records are ignored")
    {
        PeerRecord no_address;
        no_address.node_id = MakeId(0x07);
        PeerRecord null_id = MakePeer(NodeId());

        auto result = registry.MergePeers({no_address, null_id});
        REQUIRE(result.num_added() == 0);
        REQUIRE(result.num_duplicates() == 0);
        REQUIRE(registry.Count() == 0);
    }

    SECTION("Remove and Contains")
    {
        registry.MergePeers({MakePeer(MakeId(0x09))});
        REQUIRE(registry.Contains(MakeId(0x09)));
        REQUIRE(registry.Remove(MakeId(0x09)));
        REQUIRE_FALSE(registry.Contains(MakeId(0x09)));
        REQUIRE_FALSE(registry.Remove(MakeId(0x09)));
        REQUIRE_FALSE(registry.Get(MakeId(0x09)).has_value());
    }
}

TEST_CASE("MemoryPeerRegistry peer selection", "[dht][registry]")
{
    MemoryPeerRegistry registry;
    registry.TestSeedRng(7);
    for (uint8_t high : {0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80}) {
        registry.MergePeers({MakePeer(MakeId(high))});
    }

    SECTION("ClosestPeers returns nearest first")
    {
        auto closest = registry.ClosestPeers(MakeId(0x00), 3, {});
        REQUIRE(closest.size() == 3);
        REQUIRE(closest[0].node_id == MakeId(0x01));
        REQUIRE(closest[1].node_id == MakeId(0x02));
        REQUIRE(closest[2].node_id == MakeId(0x04));
    }

    SECTION("ClosestPeers honours exclusions")
    {
        auto closest = registry.ClosestPeers(MakeId(0x00), 2, {MakeId(0x01), MakeId(0x04)});
        REQUIRE(closest.size() == 2);
        REQUIRE(closest[0].node_id == MakeId(0x02));
        REQUIRE(closest[1].node_id == MakeId(0x08));
    }

    SECTION("ClosestPeers with n larger than registry returns everything")
    {
        auto closest = registry.ClosestPeers(MakeId(0x80), 100, {});
        REQUIRE(closest.size() == 8);
        REQUIRE(closest[0].node_id == MakeId(0x80));
    }

    SECTION("RandomPeers returns distinct, non-excluded peers")
    {
        auto random = registry.RandomPeers(5, {MakeId(0x10)});
        REQUIRE(random.size() == 5);
        std::set<NodeId> ids;
        for (const auto& r : random) {
            REQUIRE(r.node_id != MakeId(0x10));
            ids.insert(r.node_id);
        }
        REQUIRE(ids.size() == 5);
    }

    SECTION("Everything excluded yields empty selections")
    {
        std::vector<NodeId> all;
        for (const auto& r : registry.GetAll()) {
            all.push_back(r.node_id);
        }
        REQUIRE(all.size() == 8);
        REQUIRE(registry.RandomPeers(3, all).empty());
        REQUIRE(registry.ClosestPeers(MakeId(0x00), 3, all).empty());
    }
}

TEST_CASE("MemoryPeerRegistry concurrent merges", "[dht][registry][threading]")
{
    MemoryPeerRegistry registry;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t]() {
            for (int i = 0; i < 50; ++i) {
                // Half of the ids are shared between threads
                uint8_t high = static_cast<uint8_t>(i % 2 == 0 ? i : 100 + t * 25 + i / 2);
                registry.MergePeers({MakePeer(MakeId(high, 0x01))});
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    // 25 shared ids + 4 threads * 25 private ids
    REQUIRE(registry.Count() == 125);
}
