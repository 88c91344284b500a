// Unit tests for NodeId and the XOR metric
#include <catch2/catch_test_macros.hpp>
#include "dht/node_id.hpp"
#include "dht/peer.hpp"
#include "infra/discovery_test_helpers.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_set>

using namespace dhtnode::dht;
using dhtnode::dht::test::MakeId;

TEST_CASE("NodeId basic operations", "[dht][node_id]")
{
    SECTION("Default constructor creates null id")
    {
        NodeId id;
        REQUIRE(id.IsNull());
        REQUIRE(id.ToString() == std::string(64, '0'));
    }

    SECTION("SetNull clears the id")
    {
        NodeId id = MakeId(0xab, 0xcd);
        REQUIRE_FALSE(id.IsNull());
        id.SetNull();
        REQUIRE(id.IsNull());
    }

    SECTION("Comparison operators follow byte order")
    {
        NodeId a = MakeId(0x01);
        NodeId b = MakeId(0x02);
        REQUIRE(a < b);
        REQUIRE_FALSE(b < a);
        REQUIRE(a != b);
        REQUIRE(a == MakeId(0x01));
    }

    SECTION("Random ids are distinct and non-null")
    {
        std::set<NodeId> ids;
        for (int i = 0; i < 32; ++i) {
            NodeId id = NodeId::Random();
            REQUIRE_FALSE(id.IsNull());
            ids.insert(id);
        }
        REQUIRE(ids.size() == 32);
    }
}

TEST_CASE("NodeId hex conversion", "[dht][node_id]")
{
    NodeId id = MakeId(0xab, 0x0f);
    std::string hex = id.ToString();
    REQUIRE(hex.size() == 64);
    REQUIRE(hex.substr(0, 2) == "ab");
    REQUIRE(hex.substr(62, 2) == "0f");
    REQUIRE(id.ShortString() == "ab000000");

    auto parsed = NodeId::FromHex(hex);
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == id);

    SECTION("Uppercase is accepted")
    {
        std::string upper = hex;
        std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
        auto p = NodeId::FromHex(upper);
        REQUIRE(p.has_value());
        REQUIRE(*p == id);
    }

    SECTION("Wrong length or non-hex is rejected")
    {
        REQUIRE_FALSE(NodeId::FromHex("").has_value());
        REQUIRE_FALSE(NodeId::FromHex(hex.substr(2)).has_value());
        REQUIRE_FALSE(NodeId::FromHex(hex + "00").has_value());
        std::string bad = hex;
        bad[10] = 'g';
        REQUIRE_FALSE(NodeId::FromHex(bad).has_value());
    }
}

TEST_CASE("NodeId XOR distance", "[dht][node_id]")
{
    NodeId a = MakeId(0x0f, 0x01);
    NodeId b = MakeId(0xf0, 0x03);

    SECTION("Distance is symmetric and zero to self")
    {
        REQUIRE(NodeId::Distance(a, b) == NodeId::Distance(b, a));
        REQUIRE(NodeId::Distance(a, a).IsNull());
    }

    SECTION("Distance is bytewise XOR")
    {
        NodeId d = NodeId::Distance(a, b);
        REQUIRE(d.bytes()[0] == 0xff);
        REQUIRE(d.bytes()[NodeId::SIZE - 1] == 0x02);
    }

    SECTION("High bytes dominate closeness")
    {
        NodeId target = MakeId(0x00);
        NodeId near = MakeId(0x01, 0xff);
        NodeId far = MakeId(0x80, 0x00);
        REQUIRE(NodeId::IsCloser(near, far, target));
        REQUIRE_FALSE(NodeId::IsCloser(far, near, target));
        REQUIRE_FALSE(NodeId::IsCloser(near, near, target));
    }

    SECTION("Sorting by distance orders by XOR metric")
    {
        NodeId target = MakeId(0x40);
        std::vector<NodeId> ids = {MakeId(0x00), MakeId(0x41), MakeId(0xc0), MakeId(0x48)};
        std::sort(ids.begin(), ids.end(), [&](const NodeId& x, const NodeId& y) {
            return NodeId::IsCloser(x, y, target);
        });
        REQUIRE(ids[0] == MakeId(0x41));
        REQUIRE(ids[1] == MakeId(0x48));
        REQUIRE(ids[2] == MakeId(0x00));
        REQUIRE(ids[3] == MakeId(0xc0));
    }
}

TEST_CASE("NodeIdHasher works in unordered containers", "[dht][node_id]")
{
    std::unordered_set<NodeId, NodeIdHasher> set;
    set.insert(MakeId(0x01));
    set.insert(MakeId(0x02));
    set.insert(MakeId(0x01));
    REQUIRE(set.size() == 2);
}

TEST_CASE("PeerRecord validity", "[dht][peer]")
{
    PeerRecord record;
    REQUIRE_FALSE(record.IsValid());

    record.node_id = MakeId(0x11);
    REQUIRE_FALSE(record.IsValid());

    record.addresses.push_back("");
    REQUIRE_FALSE(record.IsValid());

    record.addresses.push_back("10.0.0.1:9590");
    REQUIRE(record.IsValid());
    REQUIRE(record.ToString().find("11000000") != std::string::npos);
}
