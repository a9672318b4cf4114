#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace gossipnet {
namespace gossip {

/**
 * GossipMessage - body of a "gossip" envelope
 *
 * Wire format (JSON object):
 *   {"id": "<32 hex>", "content": "...", "sender": <node id>,
 *    "timestamp": "<RFC 3339>", "ttl": <hops remaining>}
 *
 * ttl drops by exactly one per forwarding hop; a copy received with ttl 0
 * is accepted but not forwarded.
 */
struct GossipMessage {
  std::string id;
  std::string content;
  int sender = -1;        // Originating node id
  std::string timestamp;  // Creation time at the originator
  int ttl = 0;

  nlohmann::json ToJson() const;

  // Compact JSON; never throws on invalid UTF-8 content
  std::string Serialize() const;

  // std::nullopt if body is not a well-formed gossip object
  static std::optional<GossipMessage> Deserialize(std::string_view body);

  bool operator==(const GossipMessage &) const = default;
};

// Copy of text with every invalid UTF-8 sequence replaced by U+FFFD
std::string ToValidUtf8(const std::string &text);

// 16 random bytes, lower-case hex
std::string GenerateMessageId();

} // namespace gossip
} // namespace gossipnet
