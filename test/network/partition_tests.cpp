// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/node.hpp"
#include "network/simulated_transport.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <memory>
#include <vector>

using namespace gossipnet::network;
using gossipnet::test::WaitFor;

namespace {

Address Addr(uint16_t port) { return Address("127.0.0.1", port); }

std::vector<Address> Range(uint16_t first, uint16_t count) {
    std::vector<Address> out;
    for (uint16_t i = 0; i < count; ++i) {
        out.push_back(Addr(static_cast<uint16_t>(first + i)));
    }
    return out;
}

} // namespace

TEST_CASE("Partition - sends across the split fail until healed", "[network][partition]") {
    SimulatedTransport transport;
    const auto group_a = Range(8000, 3);
    const auto group_b = Range(8010, 3);

    std::vector<ListenerPtr> listeners;
    for (const auto& addr : group_a) {
        listeners.emplace_back();
        REQUIRE(transport.Listen(addr, listeners.back()) == TransportResult::Success);
    }
    for (const auto& addr : group_b) {
        listeners.emplace_back();
        REQUIRE(transport.Listen(addr, listeners.back()) == TransportResult::Success);
    }

    auto send = [&](const Address& from, const Address& to) {
        Message m;
        m.from = from;
        m.to = to;
        m.payload = message::EncodePayload(MessageKind::Ping, std::string_view(""));
        return transport.Send(m);
    };

    transport.Partition(group_a, group_b);

    for (const auto& a : group_a) {
        for (const auto& b : group_b) {
            REQUIRE(transport.IsPartitioned(a, b));
            REQUIRE(send(a, b) == TransportResult::NetworkPartitioned);
            REQUIRE(send(b, a) == TransportResult::NetworkPartitioned);
        }
    }
    REQUIRE(transport.GetStats().rejected_partitioned == 18);

    SECTION("Marks are per address, not per pair") {
        // Same-side traffic and traffic from an unmarked outsider are blocked too
        REQUIRE(send(group_a[0], group_a[1]) == TransportResult::NetworkPartitioned);
        ListenerPtr outsider;
        REQUIRE(transport.Listen(Addr(9000), outsider) == TransportResult::Success);
        REQUIRE_FALSE(transport.IsPartitioned(Addr(9000)));
        REQUIRE(send(Addr(9000), group_b[0]) == TransportResult::NetworkPartitioned);
        REQUIRE(send(group_b[0], Addr(9000)) == TransportResult::NetworkPartitioned);
    }

    SECTION("Heal restores every pair") {
        transport.Heal();
        for (const auto& a : group_a) {
            REQUIRE_FALSE(transport.IsPartitioned(a));
            for (const auto& b : group_b) {
                REQUIRE(send(a, b) == TransportResult::Success);
                REQUIRE(send(b, a) == TransportResult::Success);
            }
        }
    }

    SECTION("Partition checks come before the registry lookup") {
        REQUIRE(send(group_a[0], Addr(9999)) == TransportResult::NetworkPartitioned);
        transport.Heal();
        REQUIRE(send(group_a[0], Addr(9999)) == TransportResult::AddressNotFound);
    }
}

TEST_CASE("Partition - nodes stop exchanging and resume after heal", "[network][partition]") {
    SimulatedTransport transport;
    Node alice(transport, Addr(8000));
    Node bob(transport, Addr(8001));

    std::atomic<int> bob_received{0};
    bob.Handle(MessageKind::Request, [&](const Message&) {
        bob_received.fetch_add(1);
        return true;
    });

    REQUIRE(alice.Listen() == TransportResult::Success);
    REQUIRE(bob.Listen() == TransportResult::Success);
    REQUIRE(alice.Start());
    REQUIRE(bob.Start());

    transport.Partition({alice.address()}, {bob.address()});
    REQUIRE(alice.SendString(bob.address(), MessageKind::Request, "1") ==
            TransportResult::NetworkPartitioned);

    transport.Heal();
    REQUIRE(alice.SendString(bob.address(), MessageKind::Request, "2") == TransportResult::Success);
    REQUIRE(WaitFor([&] { return bob_received.load() == 1; }));
}
