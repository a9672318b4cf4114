// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "gossip/gossip_node.hpp"
#include "network/simulated_transport.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace gossipnet;
using namespace gossipnet::gossip;
using network::Address;
using network::MessageKind;
using network::TransportResult;
using gossipnet::test::WaitFor;

namespace {

Address Addr(int id) { return Address("127.0.0.1", static_cast<uint16_t>(8000 + id)); }

// Plain node that records every gossip body it receives
class Collector {
public:
    Collector(network::Transport& transport, int id) : node_(transport, Addr(id)) {
        node_.Handle(MessageKind::Gossip, [this](const network::Message& msg) {
            auto gossip = GossipMessage::Deserialize(msg.Body());
            std::lock_guard<std::mutex> lock(mutex_);
            if (gossip) received_.push_back(*gossip);
            return gossip.has_value();
        });
        node_.Handle(MessageKind::Peers, [this](const network::Message& msg) {
            std::lock_guard<std::mutex> lock(mutex_);
            peer_lists_.push_back(msg.Body());
            return true;
        });
        REQUIRE(node_.Listen() == TransportResult::Success);
        REQUIRE(node_.Start());
    }

    std::vector<GossipMessage> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    std::vector<std::string> peer_lists() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peer_lists_;
    }

    network::Node& node() { return node_; }

private:
    mutable std::mutex mutex_;
    std::vector<GossipMessage> received_;
    std::vector<std::string> peer_lists_;
    network::Node node_;  // Last: its receive loop uses the members above
};

GossipMessage MakeGossip(const std::string& id, int sender, int ttl) {
    GossipMessage msg;
    msg.id = id;
    msg.content = "payload";
    msg.sender = sender;
    msg.timestamp = "2025-01-01T00:00:00.000Z";
    msg.ttl = ttl;
    return msg;
}

// Give stray fan-outs a chance to show up before asserting "nothing happened"
void SettleBriefly(const GossipNode& node) {
    WaitFor([&] { return node.IsIdle(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
}

} // namespace

TEST_CASE("GossipNode - AddPeer", "[gossip][gossip_node]") {
    network::SimulatedTransport transport;
    GossipNode node(transport, 0, Addr(0));

    REQUIRE(node.AddPeer(Addr(1)));
    REQUIRE(node.AddPeer(Addr(2)));

    SECTION("Self is rejected") {
        REQUIRE_FALSE(node.AddPeer(Addr(0)));
    }

    SECTION("Duplicates are rejected") {
        REQUIRE_FALSE(node.AddPeer(Addr(1)));
    }

    REQUIRE(node.GetPeers() == std::vector<Address>{Addr(1), Addr(2)});
    REQUIRE(node.GetStats().peer_count == 2);
}

TEST_CASE("GossipNode - Origination", "[gossip][gossip_node]") {
    network::SimulatedTransport transport;
    Collector c1(transport, 1);
    Collector c2(transport, 2);

    GossipNode::Config config;
    config.max_ttl = 7;
    GossipNode node(transport, 0, Addr(0), config);
    REQUIRE(node.Listen() == TransportResult::Success);
    REQUIRE(node.Start());
    node.AddPeer(Addr(1));
    node.AddPeer(Addr(2));

    const std::string id = node.Gossip("hello");
    REQUIRE(id.size() == 32);

    // Originator has seen and logged its own message
    REQUIRE(node.HasSeen(id));
    auto log = node.GetReceivedMessages();
    REQUIRE(log.size() == 1);
    REQUIRE(log[0].id == id);
    REQUIRE(log[0].sender == 0);
    REQUIRE(log[0].ttl == 7);
    REQUIRE(node.GetStats().messages_received == 0);

    REQUIRE(WaitFor([&] { return c1.received().size() == 1 && c2.received().size() == 1; }));
    for (const auto& got : {c1.received()[0], c2.received()[0]}) {
        REQUIRE(got.id == id);
        REQUIRE(got.content == "hello");
        REQUIRE(got.sender == 0);
        REQUIRE(got.ttl == 7);
        REQUIRE_FALSE(got.timestamp.empty());
    }
    REQUIRE(WaitFor([&] { return node.GetStats().messages_sent == 2; }));
}

TEST_CASE("GossipNode - Invalid UTF-8 content is gossiped", "[gossip][gossip_node]") {
    network::SimulatedTransport transport;
    GossipNode b(transport, 1, Addr(1));
    GossipNode a(transport, 0, Addr(0));
    REQUIRE(b.Listen() == TransportResult::Success);
    REQUIRE(b.Start());
    REQUIRE(a.Listen() == TransportResult::Success);
    REQUIRE(a.Start());
    REQUIRE(a.AddPeer(Addr(1)));

    const std::string raw = "bad\xff\xfe bytes";
    std::string id;
    REQUIRE_NOTHROW(id = a.Gossip(raw));
    REQUIRE(a.HasSeen(id));

    REQUIRE(WaitFor([&] { return b.HasSeen(id); }));
    auto sent = a.GetReceivedMessages();
    auto got = b.GetReceivedMessages();
    REQUIRE(sent.size() == 1);
    REQUIRE(got.size() == 1);
    REQUIRE(sent[0].content == ToValidUtf8(raw));
    REQUIRE(got[0].content == sent[0].content);
    REQUIRE(WaitFor([&] { return a.GetStats().messages_sent == 1; }));

    a.Close();
    b.Close();
}

TEST_CASE("GossipNode - Several fan-out workers", "[gossip][gossip_node]") {
    network::SimulatedTransport transport;
    std::vector<std::unique_ptr<Collector>> peers;
    for (int i = 1; i <= 6; ++i) {
        peers.push_back(std::make_unique<Collector>(transport, i));
    }

    GossipNode::Config config;
    config.fanout_threads = 4;
    GossipNode node(transport, 0, Addr(0), config);
    REQUIRE(node.Listen() == TransportResult::Success);
    REQUIRE(node.Start());
    for (int i = 1; i <= 6; ++i) {
        REQUIRE(node.AddPeer(Addr(i)));
    }

    const std::string id = node.Gossip("wide");
    REQUIRE(WaitFor([&] { return node.GetStats().messages_sent == 6; }));
    SettleBriefly(node);

    for (const auto& peer : peers) {
        auto got = peer->received();
        REQUIRE(got.size() == 1);
        REQUIRE(got[0].id == id);
        REQUIRE(got[0].content == "wide");
    }
    REQUIRE(node.GetStats().messages_sent == 6);
    node.Close();
}

TEST_CASE("GossipNode - Duplicate delivery is a no-op", "[gossip][gossip_node]") {
    network::SimulatedTransport transport;
    Collector peer(transport, 1);
    TraceLog traces;

    GossipNode node(transport, 0, Addr(0), GossipNode::Config{}, &traces);
    REQUIRE(node.Listen() == TransportResult::Success);
    REQUIRE(node.Start());
    node.AddPeer(Addr(1));

    auto msg = MakeGossip("dup-id", 5, 3);
    REQUIRE(node.HandleGossipMessage(msg, 5));
    REQUIRE_FALSE(node.HandleGossipMessage(msg, 6));
    REQUIRE_FALSE(node.HandleGossipMessage(msg, 5));

    SettleBriefly(node);

    REQUIRE(node.GetReceivedMessages().size() == 1);
    REQUIRE(node.GetStats().messages_received == 1);
    REQUIRE(traces.Size() == 1);
    // Forwarded once, from the first delivery only
    REQUIRE(peer.received().size() == 1);
}

TEST_CASE("GossipNode - TTL decreases by one per hop", "[gossip][gossip_node]") {
    network::SimulatedTransport transport;
    Collector peer(transport, 1);

    GossipNode node(transport, 0, Addr(0));
    REQUIRE(node.Listen() == TransportResult::Success);
    REQUIRE(node.Start());
    node.AddPeer(Addr(1));

    SECTION("Forwarded copy carries ttl - 1") {
        REQUIRE(node.HandleGossipMessage(MakeGossip("ttl-5", 9, 5), 9));
        REQUIRE(WaitFor([&] { return peer.received().size() == 1; }));
        REQUIRE(peer.received()[0].ttl == 4);
        REQUIRE(peer.received()[0].sender == 9);

        // The logged copy keeps the ttl it arrived with
        REQUIRE(node.GetReceivedMessages()[0].ttl == 5);
    }

    SECTION("ttl 0 is accepted but never forwarded") {
        REQUIRE(node.HandleGossipMessage(MakeGossip("ttl-0", 9, 0), 9));
        SettleBriefly(node);
        REQUIRE(node.HasSeen("ttl-0"));
        REQUIRE(node.GetReceivedMessages().size() == 1);
        REQUIRE(peer.received().empty());
        REQUIRE(node.GetStats().messages_sent == 0);
    }
}

TEST_CASE("GossipNode - Forwarder is derived from the sending port", "[gossip][gossip_node]") {
    network::SimulatedTransport transport;
    Collector relay(transport, 7);
    TraceLog traces;

    GossipNode node(transport, 0, Addr(0), GossipNode::Config{}, &traces);
    REQUIRE(node.Listen() == TransportResult::Success);
    REQUIRE(node.Start());

    // Node 7 relays a message originated by node 3, then originates its own
    REQUIRE(relay.node().SendString(node.GetAddress(), MessageKind::Gossip,
                                    MakeGossip("via-7", 3, 4).Serialize()) == TransportResult::Success);
    REQUIRE(relay.node().SendString(node.GetAddress(), MessageKind::Gossip,
                                    MakeGossip("from-7", 7, 4).Serialize()) == TransportResult::Success);

    REQUIRE(WaitFor([&] { return traces.Size() == 2; }));
    auto snapshot = traces.Snapshot();
    REQUIRE(snapshot[0].message_id == "via-7");
    REQUIRE(snapshot[0].original_sender == 3);
    REQUIRE(snapshot[0].immediate_forwarder == 7);
    REQUIRE(snapshot[0].receiver == 0);
    REQUIRE(snapshot[0].ttl == 4);
    REQUIRE_FALSE(snapshot[0].is_direct);

    REQUIRE(snapshot[1].message_id == "from-7");
    REQUIRE(snapshot[1].is_direct);
    REQUIRE(node.GetStats().messages_received == 2);
}

TEST_CASE("GossipNode - Malformed gossip is rejected without stopping the node", "[gossip][gossip_node]") {
    network::SimulatedTransport transport;
    Collector sender(transport, 1);

    GossipNode node(transport, 0, Addr(0));
    REQUIRE(node.Listen() == TransportResult::Success);
    REQUIRE(node.Start());

    REQUIRE(sender.node().SendString(node.GetAddress(), MessageKind::Gossip, "{not json") ==
            TransportResult::Success);
    REQUIRE(sender.node().SendString(node.GetAddress(), MessageKind::Gossip,
                                     MakeGossip("good", 1, 1).Serialize()) == TransportResult::Success);

    REQUIRE(WaitFor([&] { return node.HasSeen("good"); }));
    REQUIRE(node.GetReceivedMessages().size() == 1);
}

TEST_CASE("GossipNode - Peer discovery", "[gossip][gossip_node]") {
    network::SimulatedTransport transport;

    GossipNode a(transport, 0, Addr(0));
    GossipNode b(transport, 1, Addr(1));
    REQUIRE(a.Listen() == TransportResult::Success);
    REQUIRE(b.Listen() == TransportResult::Success);
    REQUIRE(a.Start());
    REQUIRE(b.Start());

    a.AddPeer(Addr(1));
    a.AddPeer(Addr(2));
    a.AddPeer(Addr(3));

    SECTION("discover is answered with a JSON list of addresses") {
        Collector asker(transport, 9);
        REQUIRE(asker.node().SendString(a.GetAddress(), MessageKind::Discover, "") ==
                TransportResult::Success);
        REQUIRE(WaitFor([&] { return asker.peer_lists().size() == 1; }));
        REQUIRE(asker.peer_lists()[0] == R"(["127.0.0.1:8001","127.0.0.1:8002","127.0.0.1:8003"])");
    }

    SECTION("RequestPeers merges the answer, skipping self") {
        REQUIRE(b.RequestPeers(a.GetAddress()) == TransportResult::Success);
        REQUIRE(WaitFor([&] { return b.GetPeers().size() == 2; }));
        REQUIRE(b.GetPeers() == std::vector<Address>{Addr(2), Addr(3)});
    }
}

TEST_CASE("GossipNode - Close drains fan-out and stays closed", "[gossip][gossip_node]") {
    network::SimulatedTransport transport;
    Collector peer(transport, 1);

    GossipNode node(transport, 0, Addr(0));
    REQUIRE(node.Listen() == TransportResult::Success);
    REQUIRE(node.Start());
    node.AddPeer(Addr(1));

    node.Close();
    REQUIRE(node.IsIdle());
    REQUIRE_FALSE(transport.IsListening(Addr(0)));

    // Origination after close is local only
    const std::string id = node.Gossip("late");
    REQUIRE(node.HasSeen(id));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(peer.received().empty());

    node.Close();
}
