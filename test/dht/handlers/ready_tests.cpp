// DiscoveryReady decision tests
#include <catch2/catch_test_macros.hpp>
#include "dht/discovery/ready.hpp"
#include "infra/discovery_test_helpers.hpp"
#include <algorithm>
#include <optional>

using namespace dhtnode::dht;
using namespace dhtnode::dht::test;

namespace {

StateEvent Decide(DiscoveryReady ready) {
    std::optional<StateEvent> result;
    ready.NextEvent([&](StateEvent ev) { result = std::move(ev); });
    // Ready always completes synchronously
    REQUIRE(result.has_value());
    return *result;
}

RoundInfo SuccessfulRound(size_t new_peers, size_t new_neighbours, std::vector<NodeId> sync_peers = {}) {
    RoundInfo info;
    info.num_new_peers = new_peers;
    info.num_new_neighbours = new_neighbours;
    info.sync_peers = std::move(sync_peers);
    info.num_succeeded = std::max<size_t>(1, info.sync_peers.size());
    return info;
}

void AddPeers(MemoryPeerRegistry& registry, std::initializer_list<uint8_t> highs) {
    for (uint8_t high : highs) {
        registry.MergePeers({MakePeer(MakeId(high))});
    }
}

// Count() taken before another subsystem inserted our own id
class StaleCountRegistry : public MemoryPeerRegistry {
public:
    size_t Count() const override { return 0; }
};

bool Contains(const std::vector<NodeId>& ids, const NodeId& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // namespace

TEST_CASE("Ready with no peers fails the round", "[dht][discovery][ready]") {
    DiscoveryFixture f;

    SECTION("Empty registry") {
        auto ev = Decide(DiscoveryReady::Initial(f.context));
        auto* errored = std::get_if<events::Errored>(&ev);
        REQUIRE(errored != nullptr);
        REQUIRE(errored->error.kind == DiscoveryErrorKind::RoundFailed);
        REQUIRE(errored->error.message == "no peers available");
    }

    SECTION("Registry holding only ourselves") {
        f.registry->MergePeers({MakePeer(f.self_id())});
        auto ev = Decide(DiscoveryReady::Initial(f.context));
        REQUIRE(std::holds_alternative<events::Errored>(ev));
    }

    REQUIRE(f.context.RoundCount() == 0);
}

TEST_CASE("Ready treats a stale empty count as no peers", "[dht][discovery][ready]") {
    boost::asio::io_context io;
    auto identity = std::make_shared<NodeIdentity>(MakeId(0x00, 0x01), "127.0.0.1:9590");
    auto registry = std::make_shared<StaleCountRegistry>();
    registry->MergePeers({MakePeer(identity->node_id)});
    REQUIRE(registry->Contains(identity->node_id));

    DiscoveryContext context(io, FastConfig(), identity, registry, std::make_shared<MockConnectivity>());
    auto ev = Decide(DiscoveryReady::Initial(context));
    auto* errored = std::get_if<events::Errored>(&ev);
    REQUIRE(errored != nullptr);
    REQUIRE(errored->error.message == "no peers available");
    REQUIRE(context.RoundCount() == 0);
}

TEST_CASE("Fresh Ready starts a new cycle", "[dht][discovery][ready]") {
    DiscoveryFixture f;
    AddPeers(*f.registry, {0x10, 0x20, 0x30});

    // Leftover count from a previous cycle
    for (int i = 0; i < 15; ++i) {
        f.context.IncrementRoundCount();
    }

    auto ev = Decide(DiscoveryReady::Initial(f.context));
    auto* begin = std::get_if<events::BeginDiscovery>(&ev);
    REQUIRE(begin != nullptr);
    REQUIRE(f.context.RoundCount() == 1);

    const auto& params = begin->params;
    REQUIRE(params.peers.size() == 3);
    REQUIRE_FALSE(Contains(params.peers, f.self_id()));
    REQUIRE(params.num_peers_to_request == f.config.max_peers_to_sync_per_round);
    REQUIRE(params.max_accept_closer_peers == f.config.num_neighbouring_nodes);
}

TEST_CASE("Ready selects at most max_sync_peers and never ourselves", "[dht][discovery][ready]") {
    auto config = FastConfig();
    config.max_sync_peers = 2;
    DiscoveryFixture f(config);
    f.registry->MergePeers({MakePeer(f.self_id())});
    AddPeers(*f.registry, {0x10, 0x20, 0x30, 0x40, 0x50});

    for (int i = 0; i < 10; ++i) {
        auto ev = Decide(DiscoveryReady::Initial(f.context));
        auto* begin = std::get_if<events::BeginDiscovery>(&ev);
        REQUIRE(begin != nullptr);
        REQUIRE(begin->params.peers.size() == 2);
        REQUIRE(begin->params.peers[0] != begin->params.peers[1]);
        REQUIRE_FALSE(Contains(begin->params.peers, f.self_id()));
    }
}

TEST_CASE("Ready idles after the round cap", "[dht][discovery][ready]") {
    auto config = FastConfig();
    config.idle_after_num_rounds = 3;
    DiscoveryFixture f(config);
    AddPeers(*f.registry, {0x10, 0x20, 0x30});

    auto last = SuccessfulRound(5, 1, {MakeId(0x10)});

    // Round 1 from a fresh Ready, rounds 2 and 3 carrying statistics
    REQUIRE(std::holds_alternative<events::BeginDiscovery>(Decide(DiscoveryReady::Initial(f.context))));
    REQUIRE(std::holds_alternative<events::BeginDiscovery>(Decide(DiscoveryReady(f.context, last))));
    REQUIRE(std::holds_alternative<events::BeginDiscovery>(Decide(DiscoveryReady(f.context, last))));
    REQUIRE(f.context.RoundCount() == 3);

    REQUIRE(std::holds_alternative<events::Idle>(Decide(DiscoveryReady(f.context, last))));
    REQUIRE(f.context.RoundCount() == 3);

    // A fresh Ready (after Waiting) starts over
    REQUIRE(std::holds_alternative<events::BeginDiscovery>(Decide(DiscoveryReady::Initial(f.context))));
    REQUIRE(f.context.RoundCount() == 1);
}

TEST_CASE("Ready idles once the network looks saturated", "[dht][discovery][ready]") {
    auto config = FastConfig();
    config.min_desired_peers = 4;
    DiscoveryFixture f(config);
    AddPeers(*f.registry, {0x10, 0x20, 0x30});

    auto no_new_peers = SuccessfulRound(0, 0, {MakeId(0x10)});

    SECTION("Below min_desired_peers keeps discovering") {
        auto ev = Decide(DiscoveryReady(f.context, no_new_peers));
        REQUIRE(std::holds_alternative<events::BeginDiscovery>(ev));
    }

    SECTION("At min_desired_peers with nothing new idles") {
        AddPeers(*f.registry, {0x40});
        auto ev = Decide(DiscoveryReady(f.context, no_new_peers));
        REQUIRE(std::holds_alternative<events::Idle>(ev));
    }

    SECTION("At min_desired_peers but the last round found peers keeps discovering") {
        AddPeers(*f.registry, {0x40});
        auto ev = Decide(DiscoveryReady(f.context, SuccessfulRound(2, 0, {MakeId(0x10)})));
        REQUIRE(std::holds_alternative<events::BeginDiscovery>(ev));
    }

    SECTION("Ourselves does not count toward min_desired_peers") {
        f.registry->MergePeers({MakePeer(f.self_id())});
        auto ev = Decide(DiscoveryReady(f.context, no_new_peers));
        REQUIRE(std::holds_alternative<events::BeginDiscovery>(ev));
    }
}

TEST_CASE("Ready prefers closest peers after new neighbours", "[dht][discovery][ready]") {
    auto config = FastConfig();
    config.max_sync_peers = 3;
    DiscoveryFixture f(config);
    AddPeers(*f.registry, {0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80});

    SECTION("Closest to our id") {
        auto ev = Decide(DiscoveryReady(f.context, SuccessfulRound(3, 2)));
        auto* begin = std::get_if<events::BeginDiscovery>(&ev);
        REQUIRE(begin != nullptr);
        REQUIRE(begin->params.peers == std::vector<NodeId>{MakeId(0x01), MakeId(0x02), MakeId(0x04)});
    }

    SECTION("Last round's sync peers are skipped") {
        auto ev = Decide(DiscoveryReady(f.context, SuccessfulRound(3, 2, {MakeId(0x01), MakeId(0x02)})));
        auto* begin = std::get_if<events::BeginDiscovery>(&ev);
        REQUIRE(begin != nullptr);
        REQUIRE(begin->params.peers == std::vector<NodeId>{MakeId(0x04), MakeId(0x08), MakeId(0x10)});
    }
}

TEST_CASE("Ready picks random peers without new neighbours", "[dht][discovery][ready]") {
    auto config = FastConfig();
    config.max_sync_peers = 3;
    DiscoveryFixture f(config);
    AddPeers(*f.registry, {0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80});

    std::vector<NodeId> last_sync = {MakeId(0x01), MakeId(0x02), MakeId(0x04)};
    for (int i = 0; i < 10; ++i) {
        f.context.ResetRoundCount();
        auto ev = Decide(DiscoveryReady(f.context, SuccessfulRound(3, 0, last_sync)));
        auto* begin = std::get_if<events::BeginDiscovery>(&ev);
        REQUIRE(begin != nullptr);
        REQUIRE(begin->params.peers.size() == 3);
        for (const auto& id : begin->params.peers) {
            REQUIRE_FALSE(Contains(last_sync, id));
        }
    }
}

TEST_CASE("Ready reuses last round's peers when nobody else is known", "[dht][discovery][ready]") {
    DiscoveryFixture f;
    AddPeers(*f.registry, {0x10, 0x20});

    auto ev = Decide(DiscoveryReady(f.context, SuccessfulRound(1, 0, {MakeId(0x10), MakeId(0x20)})));
    auto* begin = std::get_if<events::BeginDiscovery>(&ev);
    REQUIRE(begin != nullptr);
    REQUIRE(begin->params.peers.size() == 2);
    REQUIRE(Contains(begin->params.peers, MakeId(0x10)));
    REQUIRE(Contains(begin->params.peers, MakeId(0x20)));
}
