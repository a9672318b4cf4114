#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace gossipnet {
namespace protocol {

// Envelope payloads are "<tag>:<body>"; only the first ':' separates the
// two, the body may contain further colons.
constexpr char TAG_DELIMITER = ':';

// Message tags (lower-case words on the wire)
namespace tags {
// Epidemic dissemination
constexpr const char *GOSSIP = "gossip";

// Peer discovery
constexpr const char *DISCOVER = "discover";
constexpr const char *PEERS = "peers";

// Keep-alive
constexpr const char *PING = "ping";
constexpr const char *PONG = "pong";

// Generic request/response and one-to-many patterns
constexpr const char *REQUEST = "request";
constexpr const char *RESPONSE = "response";
constexpr const char *BROADCAST = "broadcast";
} // namespace tags

// Simulated address space
namespace ports {
// Node i of a generated network listens on BASE + i
constexpr uint16_t BASE = 8000;
} // namespace ports

constexpr const char *LOOPBACK_HOST = "127.0.0.1";

// Default capacity of every listener's inbound queue
constexpr size_t DEFAULT_QUEUE_CAPACITY = 256;

// Hop budget given to a freshly originated gossip message
constexpr int DEFAULT_MAX_TTL = 20;

// Message id length in bytes before hex encoding
constexpr size_t MESSAGE_ID_BYTES = 16;

} // namespace protocol
} // namespace gossipnet
