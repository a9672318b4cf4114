#pragma once

#include "analysis/connectivity_analyzer.hpp"
#include "analysis/visualization_export.hpp"
#include "gossip/gossip_node.hpp"
#include "gossip/trace_log.hpp"
#include "network/simulated_transport.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace gossipnet {
namespace gossip {

// Reach summary after a dissemination run
struct PropagationReport {
  size_t network_size = 0;
  size_t nodes_reached = 0;  // nodes with a non-empty received log
  double reach_percent = 0.0;
  uint64_t total_sent = 0;
  double avg_sent_per_node = 0.0;
};

/**
 * NetworkBuilder - builds and drives a simulated gossip network
 *
 * Node i listens on host:(base_port + i). The transport is owned by the
 * caller and must outlive the builder.
 *
 * Usage:
 *   network::SimulatedTransport transport;
 *   NetworkBuilder builder(transport);
 *   builder.CreateNodes(100);
 *   builder.BuildRandomTopology(2);
 *   builder.StartAllNodes();
 *   builder.InitiateGossip("hello");
 *   builder.WaitUntilQuiescent(std::chrono::seconds(5));
 *   builder.CloseAllNodes();
 *   builder.ExportVisualizationData("out");
 */
class NetworkBuilder {
public:
  struct Config {
    std::string host;
    uint16_t base_port;
    uint64_t seed;  // Topology/originator/layout RNG (0 = random)
    GossipNode::Config node_config;
    analysis::LayoutParams layout;

    Config()
        : host(protocol::LOOPBACK_HOST), base_port(protocol::ports::BASE),
          seed(0) {}
  };

  explicit NetworkBuilder(network::SimulatedTransport &transport,
                          const Config &config = Config{});

  // Closes every node
  ~NetworkBuilder();

  NetworkBuilder(const NetworkBuilder &) = delete;
  NetworkBuilder &operator=(const NetworkBuilder &) = delete;

  /**
   * Create `count` more nodes at sequential addresses and register them
   *
   * @return false if a node could not listen (already created nodes stay)
   */
  bool CreateNodes(size_t count);

  // Give every node up to peers_per_node random distinct peers
  void BuildRandomTopology(size_t peers_per_node);

  /**
   * Up to `count` distinct ids other than node_id
   *
   * At most 3 * count draws are made, so the result can be short when count
   * approaches the network size.
   */
  std::vector<int> SelectRandomPeers(int node_id, size_t count);

  void StartAllNodes();

  // Originate from a uniformly random node; returns its id
  std::optional<int> InitiateGossip(const std::string &content);

  // Originate from a given node; returns the message id
  std::optional<std::string> InitiateGossipFrom(size_t index, const std::string &content);

  /**
   * Wait until the network has gone quiet
   *
   * Quiet means: no queued inbound messages, every fan-out pool idle and no
   * counter change for `quiet_period`. There is no protocol-level
   * convergence signal; this is an external observation.
   *
   * @return false if `timeout` expired first
   */
  bool WaitUntilQuiescent(std::chrono::milliseconds timeout,
                          std::chrono::milliseconds quiet_period = std::chrono::milliseconds(50));

  void CloseAllNodes();

  const std::vector<std::unique_ptr<GossipNode>> &GetNodes() const { return nodes_; }
  GossipNode *GetNode(size_t index) const;

  // Node id for an address of this network (std::nullopt if foreign)
  std::optional<int> NodeIdFor(const network::Address &addr) const;
  network::Address AddressFor(int id) const;

  // Peer relation as a directed graph over node ids
  analysis::DirectedGraph BuildPeerGraph() const;

  analysis::NetworkTopology GenerateTopology();
  analysis::VisualizationData BuildVisualizationData();
  bool ExportVisualizationData(const std::filesystem::path &output_dir);

  PropagationReport ComputeReport() const;
  std::vector<MessageTrace> GetTraces() const { return trace_log_.Snapshot(); }

  const Config &config() const { return config_; }

private:
  network::SimulatedTransport &transport_;
  const Config config_;
  TraceLog trace_log_;
  std::mt19937_64 rng_;
  std::vector<std::unique_ptr<GossipNode>> nodes_;
};

} // namespace gossip
} // namespace gossipnet
