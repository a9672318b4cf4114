#include "gossip/network_builder.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <thread>

namespace gossipnet {
namespace gossip {

namespace {

uint64_t ResolveSeed(uint64_t seed) {
  if (seed != 0) {
    return seed;
  }
  static std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) | rd();
}

} // namespace

NetworkBuilder::NetworkBuilder(network::SimulatedTransport &transport,
                               const Config &config)
    : transport_(transport), config_(config), rng_(ResolveSeed(config.seed)) {}

NetworkBuilder::~NetworkBuilder() { CloseAllNodes(); }

bool NetworkBuilder::CreateNodes(size_t count) {
  LOG_GOSSIP_INFO("Creating {} gossip nodes", count);

  GossipNode::Config node_config = config_.node_config;
  node_config.base_port = config_.base_port;

  nodes_.reserve(nodes_.size() + count);
  for (size_t i = 0; i < count; ++i) {
    const int id = static_cast<int>(nodes_.size());
    if (static_cast<size_t>(config_.base_port) + id > 65535) {
      LOG_GOSSIP_ERROR("Out of ports creating node {}", id);
      return false;
    }

    auto node = std::make_unique<GossipNode>(transport_, id, AddressFor(id),
                                             node_config, &trace_log_);
    network::TransportResult result = node->Listen();
    if (result != network::TransportResult::Success) {
      LOG_GOSSIP_ERROR("Failed to create node {}: {}", id, network::ToString(result));
      return false;
    }
    nodes_.push_back(std::move(node));
  }
  return true;
}

void NetworkBuilder::BuildRandomTopology(size_t peers_per_node) {
  LOG_GOSSIP_INFO("Building random topology ({} peers per node)", peers_per_node);

  for (const auto &node : nodes_) {
    for (int peer : SelectRandomPeers(node->GetID(), peers_per_node)) {
      node->AddPeer(AddressFor(peer));
    }
  }
}

std::vector<int> NetworkBuilder::SelectRandomPeers(int node_id, size_t count) {
  std::vector<int> peers;
  if (nodes_.empty()) {
    return peers;
  }

  std::uniform_int_distribution<int> pick(0, static_cast<int>(nodes_.size()) - 1);
  size_t attempts = count * 3;
  while (peers.size() < count && attempts > 0) {
    --attempts;
    const int candidate = pick(rng_);
    if (candidate == node_id) {
      continue;
    }
    if (std::find(peers.begin(), peers.end(), candidate) == peers.end()) {
      peers.push_back(candidate);
    }
  }
  return peers;
}

void NetworkBuilder::StartAllNodes() {
  LOG_GOSSIP_INFO("Starting {} nodes", nodes_.size());
  for (const auto &node : nodes_) {
    if (!node->Start()) {
      LOG_GOSSIP_WARN("Node {} did not start", node->GetID());
    }
  }
}

std::optional<int> NetworkBuilder::InitiateGossip(const std::string &content) {
  if (nodes_.empty()) {
    return std::nullopt;
  }
  std::uniform_int_distribution<size_t> pick(0, nodes_.size() - 1);
  const size_t starter = pick(rng_);
  nodes_[starter]->Gossip(content);
  return static_cast<int>(starter);
}

std::optional<std::string> NetworkBuilder::InitiateGossipFrom(size_t index,
                                                              const std::string &content) {
  if (index >= nodes_.size()) {
    return std::nullopt;
  }
  return nodes_[index]->Gossip(content);
}

bool NetworkBuilder::WaitUntilQuiescent(std::chrono::milliseconds timeout,
                                        std::chrono::milliseconds quiet_period) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  const auto poll = std::chrono::milliseconds(10);

  auto activity = [this]() {
    uint64_t total = transport_.GetStats().messages_sent;
    for (const auto &node : nodes_) {
      auto stats = node->GetStats();
      total += stats.messages_sent + stats.messages_received;
    }
    return total;
  };
  auto idle = [this]() {
    if (transport_.PendingMessages() != 0) {
      return false;
    }
    return std::all_of(nodes_.begin(), nodes_.end(),
                       [](const auto &node) { return node->IsIdle(); });
  };

  uint64_t last = activity();
  auto quiet_since = std::chrono::steady_clock::now();
  while (std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(poll);
    const uint64_t now_activity = activity();
    const auto now = std::chrono::steady_clock::now();
    if (now_activity != last || !idle()) {
      last = now_activity;
      quiet_since = now;
      continue;
    }
    if (now - quiet_since >= quiet_period) {
      return true;
    }
  }
  LOG_GOSSIP_WARN("Network did not settle within {} ms", timeout.count());
  return false;
}

void NetworkBuilder::CloseAllNodes() {
  for (const auto &node : nodes_) {
    node->Close();
  }
}

GossipNode *NetworkBuilder::GetNode(size_t index) const {
  return index < nodes_.size() ? nodes_[index].get() : nullptr;
}

std::optional<int> NetworkBuilder::NodeIdFor(const network::Address &addr) const {
  if (addr.host != config_.host || addr.port < config_.base_port) {
    return std::nullopt;
  }
  const int id = static_cast<int>(addr.port) - static_cast<int>(config_.base_port);
  if (id >= static_cast<int>(nodes_.size())) {
    return std::nullopt;
  }
  return id;
}

network::Address NetworkBuilder::AddressFor(int id) const {
  return network::Address(config_.host, static_cast<uint16_t>(config_.base_port + id));
}

analysis::DirectedGraph NetworkBuilder::BuildPeerGraph() const {
  analysis::DirectedGraph graph(nodes_.size());
  for (const auto &node : nodes_) {
    for (const auto &peer : node->GetPeers()) {
      if (auto peer_id = NodeIdFor(peer)) {
        graph.AddEdge(node->GetID(), *peer_id);
      }
    }
  }
  return graph;
}

analysis::NetworkTopology NetworkBuilder::GenerateTopology() {
  std::vector<std::string> addresses;
  addresses.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    addresses.push_back(node->GetAddress().ToString());
  }

  // Layout has its own RNG; rng_ is not advanced here
  analysis::ConnectivityAnalyzer analyzer(BuildPeerGraph(), std::move(addresses),
                                          config_.layout, config_.seed);
  return analyzer.Analyze();
}

analysis::VisualizationData NetworkBuilder::BuildVisualizationData() {
  analysis::VisualizationData data;
  data.topology = GenerateTopology();
  data.traces = trace_log_.Snapshot();
  data.start_time = trace_log_.start_time();
  return data;
}

bool NetworkBuilder::ExportVisualizationData(const std::filesystem::path &output_dir) {
  return analysis::WriteVisualizationFile(BuildVisualizationData(), output_dir);
}

PropagationReport NetworkBuilder::ComputeReport() const {
  PropagationReport report;
  report.network_size = nodes_.size();
  for (const auto &node : nodes_) {
    auto stats = node->GetStats();
    if (stats.received_log_size > 0) {
      ++report.nodes_reached;
    }
    report.total_sent += stats.messages_sent;
  }
  if (report.network_size > 0) {
    const double n = static_cast<double>(report.network_size);
    report.reach_percent = static_cast<double>(report.nodes_reached) / n * 100.0;
    report.avg_sent_per_node = static_cast<double>(report.total_sent) / n;
  }
  return report;
}

} // namespace gossip
} // namespace gossipnet
