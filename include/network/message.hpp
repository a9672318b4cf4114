#pragma once

#include "network/address.hpp"
#include "network/protocol.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gossipnet {
namespace network {

/**
 * MessageKind - dispatch key for tagged payloads
 *
 * Wire kinds map 1:1 to protocol::tags. Two kinds never appear on the wire:
 * - Default: fallback handler slot for anything without a dedicated handler
 * - Unknown: the tag of a received payload did not match any wire kind
 */
enum class MessageKind : uint8_t {
  Unknown = 0,
  Default,
  Gossip,
  Discover,
  Peers,
  Ping,
  Pong,
  Request,
  Response,
  Broadcast,
};

// Wire tag for a kind ("" for Unknown/Default)
const char *KindToTag(MessageKind kind);

// Kind for a wire tag (Unknown if not recognised)
MessageKind KindFromTag(std::string_view tag);

// True for kinds that may be sent
bool IsWireKind(MessageKind kind);

// Printable name, also valid for Unknown/Default
std::string ToString(MessageKind kind);

/**
 * Message - envelope routed by the transport
 *
 * payload is "<tag>:<body>" as raw bytes. The transport never looks inside
 * it; Node builds and splits it.
 */
struct Message {
  Address from;
  Address to;
  std::vector<uint8_t> payload;

  // Substring before the first delimiter (whole payload if there is none)
  std::string Tag() const;

  MessageKind Kind() const;

  // Everything after the first delimiter ("" if there is none)
  std::string Body() const;
};

namespace message {

// Build "<tag>:<body>"
std::vector<uint8_t> EncodePayload(MessageKind kind, const std::vector<uint8_t> &body);
std::vector<uint8_t> EncodePayload(MessageKind kind, std::string_view body);

// Split a payload at the first delimiter
void SplitPayload(const std::vector<uint8_t> &payload, std::string &tag, std::string &body);

} // namespace message

} // namespace network
} // namespace gossipnet
