#include "network/message.hpp"
#include <algorithm>

namespace gossipnet {
namespace network {

namespace {

struct KindTag {
  MessageKind kind;
  const char *tag;
};

constexpr KindTag kWireKinds[] = {
    {MessageKind::Gossip, protocol::tags::GOSSIP},
    {MessageKind::Discover, protocol::tags::DISCOVER},
    {MessageKind::Peers, protocol::tags::PEERS},
    {MessageKind::Ping, protocol::tags::PING},
    {MessageKind::Pong, protocol::tags::PONG},
    {MessageKind::Request, protocol::tags::REQUEST},
    {MessageKind::Response, protocol::tags::RESPONSE},
    {MessageKind::Broadcast, protocol::tags::BROADCAST},
};

} // namespace

const char *KindToTag(MessageKind kind) {
  for (const auto &entry : kWireKinds) {
    if (entry.kind == kind) {
      return entry.tag;
    }
  }
  return "";
}

MessageKind KindFromTag(std::string_view tag) {
  for (const auto &entry : kWireKinds) {
    if (tag == entry.tag) {
      return entry.kind;
    }
  }
  return MessageKind::Unknown;
}

bool IsWireKind(MessageKind kind) {
  return kind != MessageKind::Unknown && kind != MessageKind::Default;
}

std::string ToString(MessageKind kind) {
  switch (kind) {
  case MessageKind::Unknown:
    return "unknown";
  case MessageKind::Default:
    return "default";
  default:
    return KindToTag(kind);
  }
}

std::string Message::Tag() const {
  std::string tag;
  std::string body;
  message::SplitPayload(payload, tag, body);
  return tag;
}

MessageKind Message::Kind() const {
  auto delim = std::find(payload.begin(), payload.end(),
                         static_cast<uint8_t>(protocol::TAG_DELIMITER));
  std::string_view tag(reinterpret_cast<const char *>(payload.data()),
                       static_cast<size_t>(delim - payload.begin()));
  return KindFromTag(tag);
}

std::string Message::Body() const {
  std::string tag;
  std::string body;
  message::SplitPayload(payload, tag, body);
  return body;
}

namespace message {

std::vector<uint8_t> EncodePayload(MessageKind kind, const std::vector<uint8_t> &body) {
  const std::string_view tag = KindToTag(kind);
  std::vector<uint8_t> payload;
  payload.reserve(tag.size() + 1 + body.size());
  payload.insert(payload.end(), tag.begin(), tag.end());
  payload.push_back(static_cast<uint8_t>(protocol::TAG_DELIMITER));
  payload.insert(payload.end(), body.begin(), body.end());
  return payload;
}

std::vector<uint8_t> EncodePayload(MessageKind kind, std::string_view body) {
  return EncodePayload(kind, std::vector<uint8_t>(body.begin(), body.end()));
}

void SplitPayload(const std::vector<uint8_t> &payload, std::string &tag, std::string &body) {
  auto delim = std::find(payload.begin(), payload.end(),
                         static_cast<uint8_t>(protocol::TAG_DELIMITER));
  tag.assign(payload.begin(), delim);
  if (delim == payload.end()) {
    body.clear();
    return;
  }
  body.assign(delim + 1, payload.end());
}

} // namespace message

} // namespace network
} // namespace gossipnet
