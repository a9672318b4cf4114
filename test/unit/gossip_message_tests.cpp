// Unit tests for the gossip wire body
#include <catch2/catch_test_macros.hpp>
#include "gossip/gossip_message.hpp"
#include <nlohmann/json.hpp>
#include <set>

using namespace gossipnet::gossip;
using json = nlohmann::json;

TEST_CASE("GossipMessage - JSON field names", "[gossip][message]") {
    GossipMessage msg;
    msg.id = "00112233445566778899aabbccddeeff";
    msg.content = "hello";
    msg.sender = 7;
    msg.timestamp = "2025-01-01T00:00:00.000Z";
    msg.ttl = 20;

    json j = json::parse(msg.Serialize());
    REQUIRE(j["id"] == msg.id);
    REQUIRE(j["content"] == "hello");
    REQUIRE(j["sender"] == 7);
    REQUIRE(j["timestamp"] == msg.timestamp);
    REQUIRE(j["ttl"] == 20);

    auto decoded = GossipMessage::Deserialize(msg.Serialize());
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == msg);
}

TEST_CASE("GossipMessage - Deserialize rejects malformed bodies", "[gossip][message]") {
    SECTION("Not JSON") {
        REQUIRE_FALSE(GossipMessage::Deserialize("not json").has_value());
        REQUIRE_FALSE(GossipMessage::Deserialize("").has_value());
    }

    SECTION("Not an object") {
        REQUIRE_FALSE(GossipMessage::Deserialize("[1,2,3]").has_value());
    }

    SECTION("Missing fields") {
        REQUIRE_FALSE(GossipMessage::Deserialize(R"({"id":"a","content":"x","sender":1})").has_value());
        REQUIRE_FALSE(GossipMessage::Deserialize(R"({"content":"x","sender":1,"ttl":3})").has_value());
    }

    SECTION("Wrong types") {
        REQUIRE_FALSE(GossipMessage::Deserialize(R"({"id":1,"content":"x","sender":1,"ttl":3})").has_value());
        REQUIRE_FALSE(GossipMessage::Deserialize(R"({"id":"a","content":"x","sender":"1","ttl":3})").has_value());
        REQUIRE_FALSE(GossipMessage::Deserialize(R"({"id":"a","content":"x","sender":1,"ttl":1.5})").has_value());
    }

    SECTION("Empty id or negative ttl") {
        REQUIRE_FALSE(GossipMessage::Deserialize(R"({"id":"","content":"x","sender":1,"ttl":3})").has_value());
        REQUIRE_FALSE(GossipMessage::Deserialize(R"({"id":"a","content":"x","sender":1,"ttl":-1})").has_value());
    }

    SECTION("Timestamp is optional") {
        auto msg = GossipMessage::Deserialize(R"({"id":"a","content":"x","sender":1,"ttl":0})");
        REQUIRE(msg.has_value());
        REQUIRE(msg->timestamp.empty());
        REQUIRE(msg->ttl == 0);
    }
}

TEST_CASE("GossipMessage - Invalid UTF-8 content", "[gossip][message]") {
    const std::string replacement = "\xEF\xBF\xBD";

    GossipMessage msg;
    msg.id = "00112233445566778899aabbccddeeff";
    msg.content = "bad\xff\xfe bytes";
    msg.sender = 3;
    msg.ttl = 20;

    std::string body;
    REQUIRE_NOTHROW(body = msg.Serialize());

    auto decoded = GossipMessage::Deserialize(body);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->content == "bad" + replacement + replacement + " bytes");
    REQUIRE(decoded->content == ToValidUtf8(msg.content));
    REQUIRE(decoded->id == msg.id);
    REQUIRE(decoded->ttl == 20);
}

TEST_CASE("ToValidUtf8 - replaces only invalid sequences", "[gossip][message]") {
    REQUIRE(ToValidUtf8("") == "");
    REQUIRE(ToValidUtf8("plain ascii") == "plain ascii");
    REQUIRE(ToValidUtf8("caf\xC3\xA9") == "caf\xC3\xA9");
    REQUIRE(ToValidUtf8("quote \" and \\ slash") == "quote \" and \\ slash");
    REQUIRE(ToValidUtf8("x\xC3") == "x\xEF\xBF\xBD");
}

TEST_CASE("GenerateMessageId - 32 lower-case hex characters", "[gossip][message]") {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        std::string id = GenerateMessageId();
        REQUIRE(id.size() == 32);
        for (char c : id) {
            REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
        }
        ids.insert(id);
    }
    REQUIRE(ids.size() == 1000);
}
