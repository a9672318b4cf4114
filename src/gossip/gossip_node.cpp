#include "gossip/gossip_node.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <mutex>
#include <nlohmann/json.hpp>

namespace gossipnet {
namespace gossip {

using network::Address;
using network::Message;
using network::MessageKind;
using network::TransportResult;

GossipNode::GossipNode(network::Transport &transport, int id, Address address,
                       const Config &config, TraceLog *trace_log)
    : id_(id), config_(config), trace_log_(trace_log),
      node_(transport, std::move(address)),
      fanout_pool_(std::max<size_t>(1, config.fanout_threads),
                   config.max_pending_fanouts, "fanout-" + std::to_string(id)) {
  SetupHandlers();
}

GossipNode::~GossipNode() { Close(); }

void GossipNode::SetupHandlers() {
  node_.Handle(MessageKind::Gossip,
               [this](const Message &msg) { return HandleGossip(msg); });
  node_.Handle(MessageKind::Discover,
               [this](const Message &msg) { return HandleDiscover(msg); });
  node_.Handle(MessageKind::Peers,
               [this](const Message &msg) { return HandlePeers(msg); });
}

TransportResult GossipNode::Listen() { return node_.Listen(); }

bool GossipNode::Start() { return node_.Start(); }

void GossipNode::Close() {
  // No new fan-outs once the receive loop has stopped
  node_.Close();
  fanout_pool_.shutdown();
  fanout_pool_.wait_for_completion();
}

bool GossipNode::AddPeer(const Address &peer) {
  if (peer == node_.address()) {
    return false;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (std::find(peers_.begin(), peers_.end(), peer) != peers_.end()) {
    return false;
  }
  peers_.push_back(peer);
  return true;
}

std::string GossipNode::Gossip(const std::string &content) {
  GossipMessage msg;
  msg.id = GenerateMessageId();
  // The logged copy must match what peers decode
  msg.content = ToValidUtf8(content);
  msg.sender = id_;
  msg.timestamp = util::FormatRFC3339(util::Now());
  msg.ttl = config_.max_ttl;

  // Encode before any state changes
  auto body = std::make_shared<const std::string>(msg.Serialize());

  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    seen_.insert(msg.id);
    received_.push_back(msg);
  }

  LOG_GOSSIP_INFO("Node {} starting gossip {}: '{}'", id_, msg.id, msg.content);
  SpreadGossip(std::move(body));
  return msg.id;
}

bool GossipNode::HandleGossipMessage(GossipMessage msg, int immediate_forwarder) {
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!seen_.insert(msg.id).second) {
      return false;
    }
    received_.push_back(msg);
    ++messages_received_;
  }

  const bool is_direct = msg.sender == immediate_forwarder;
  if (trace_log_) {
    MessageTrace trace;
    trace.timestamp = util::Now();
    trace.message_id = msg.id;
    trace.original_sender = msg.sender;
    trace.immediate_forwarder = immediate_forwarder;
    trace.receiver = id_;
    trace.content = msg.content;
    trace.ttl = msg.ttl;
    trace.is_direct = is_direct;
    trace_log_->Record(std::move(trace));
  }

  if (is_direct) {
    LOG_GOSSIP_DEBUG("Node {} received gossip from node {}: '{}'", id_,
                     msg.sender, msg.content);
  } else {
    LOG_GOSSIP_DEBUG("Node {} received gossip from node {} (via node {}): '{}'",
                     id_, msg.sender, immediate_forwarder, msg.content);
  }

  if (msg.ttl > 0) {
    --msg.ttl;
    SpreadGossip(std::make_shared<const std::string>(msg.Serialize()));
  }
  return true;
}

void GossipNode::SpreadGossip(std::shared_ptr<const std::string> body) {
  std::vector<Address> peers;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    peers = peers_;
  }

  for (const auto &peer : peers) {
    bool queued = fanout_pool_.post([this, peer, body]() {
      TransportResult result = node_.SendString(peer, MessageKind::Gossip, *body);
      if (result != TransportResult::Success) {
        // Partitioned or unreachable peers are expected; no retry
        LOG_GOSSIP_TRACE("Node {} could not forward to {}: {}", id_,
                         peer.ToString(), network::ToString(result));
        return;
      }
      std::unique_lock<std::shared_mutex> lock(mutex_);
      ++messages_sent_;
    });
    if (!queued) {
      LOG_GOSSIP_TRACE("Node {} dropped forward to {}: fan-out pool rejected task",
                       id_, peer.ToString());
    }
  }
}

bool GossipNode::HandleGossip(const Message &msg) {
  auto gossip = GossipMessage::Deserialize(msg.Body());
  if (!gossip) {
    LOG_GOSSIP_WARN("Node {} received malformed gossip from {}", id_,
                    msg.from.ToString());
    return false;
  }

  const int forwarder = static_cast<int>(msg.from.port) - static_cast<int>(config_.base_port);
  HandleGossipMessage(std::move(*gossip), forwarder);
  return true;
}

bool GossipNode::HandleDiscover(const Message &msg) {
  nlohmann::json peers = nlohmann::json::array();
  for (const auto &peer : GetPeers()) {
    peers.push_back(peer.ToString());
  }

  TransportResult result = node_.Reply(msg, MessageKind::Peers, peers.dump());
  if (result != TransportResult::Success) {
    LOG_GOSSIP_DEBUG("Node {} could not answer discover from {}: {}", id_,
                     msg.from.ToString(), network::ToString(result));
    return false;
  }
  return true;
}

bool GossipNode::HandlePeers(const Message &msg) {
  const std::string body = msg.Body();
  auto list = nlohmann::json::parse(body, nullptr, false);
  if (list.is_discarded() || !list.is_array()) {
    LOG_GOSSIP_WARN("Node {} received malformed peer list from {}", id_,
                    msg.from.ToString());
    return false;
  }

  size_t added = 0;
  for (const auto &entry : list) {
    if (!entry.is_string()) {
      continue;
    }
    auto addr = Address::Parse(entry.get<std::string>());
    if (addr && AddPeer(*addr)) {
      ++added;
    }
  }

  LOG_GOSSIP_DEBUG("Node {} learned {} new peers from {}", id_, added,
                   msg.from.ToString());
  return true;
}

TransportResult GossipNode::RequestPeers(const Address &peer) {
  return node_.SendString(peer, MessageKind::Discover, "");
}

std::vector<GossipMessage> GossipNode::GetReceivedMessages() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return received_;
}

std::vector<Address> GossipNode::GetPeers() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return peers_;
}

bool GossipNode::HasSeen(const std::string &message_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return seen_.count(message_id) > 0;
}

GossipNode::Stats GossipNode::GetStats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  Stats stats;
  stats.peer_count = peers_.size();
  stats.received_log_size = received_.size();
  stats.messages_sent = messages_sent_;
  stats.messages_received = messages_received_;
  return stats;
}

} // namespace gossip
} // namespace gossipnet
