#include "gossip/gossip_message.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include <array>
#include <limits>
#include <nlohmann/json.hpp>
#include <random>

namespace gossipnet {
namespace gossip {

using json = nlohmann::json;

json GossipMessage::ToJson() const {
  json j;
  j["id"] = id;
  j["content"] = content;
  j["sender"] = sender;
  j["timestamp"] = timestamp;
  j["ttl"] = ttl;
  return j;
}

std::string GossipMessage::Serialize() const {
  // Invalid UTF-8 in content becomes U+FFFD instead of throwing
  return ToJson().dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<GossipMessage> GossipMessage::Deserialize(std::string_view body) {
  json root = json::parse(body.begin(), body.end(), nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    LOG_GOSSIP_DEBUG("Gossip body is not a JSON object");
    return std::nullopt;
  }

  if (!root.contains("id") || !root.contains("content") ||
      !root.contains("sender") || !root.contains("ttl")) {
    LOG_GOSSIP_DEBUG("Gossip body missing required fields");
    return std::nullopt;
  }

  const auto &id = root["id"];
  const auto &content = root["content"];
  const auto &sender = root["sender"];
  const auto &ttl = root["ttl"];
  if (!id.is_string() || id.get_ref<const std::string &>().empty() ||
      !content.is_string() || !sender.is_number_integer() ||
      !ttl.is_number_integer()) {
    LOG_GOSSIP_DEBUG("Gossip body has invalid field types");
    return std::nullopt;
  }

  if (ttl.get<int64_t>() < 0 || ttl.get<int64_t>() > std::numeric_limits<int>::max() ||
      sender.get<int64_t>() < std::numeric_limits<int>::min() ||
      sender.get<int64_t>() > std::numeric_limits<int>::max()) {
    LOG_GOSSIP_DEBUG("Gossip body has out-of-range sender/ttl");
    return std::nullopt;
  }

  GossipMessage msg;
  msg.id = id.get<std::string>();
  msg.content = content.get<std::string>();
  msg.sender = sender.get<int>();
  msg.ttl = ttl.get<int>();
  if (root.contains("timestamp") && root["timestamp"].is_string()) {
    msg.timestamp = root["timestamp"].get<std::string>();
  }
  return msg;
}

std::string ToValidUtf8(const std::string &text) {
  const std::string quoted =
      json(text).dump(-1, ' ', false, json::error_handler_t::replace);
  return json::parse(quoted).get<std::string>();
}

std::string GenerateMessageId() {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());

  std::array<uint8_t, protocol::MESSAGE_ID_BYTES> bytes;
  std::uniform_int_distribution<int> dist(0, 255);
  for (auto &b : bytes) {
    b = static_cast<uint8_t>(dist(gen));
  }

  std::string id;
  id.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    id.push_back(kHexDigits[b >> 4]);
    id.push_back(kHexDigits[b & 0x0f]);
  }
  return id;
}

} // namespace gossip
} // namespace gossipnet
