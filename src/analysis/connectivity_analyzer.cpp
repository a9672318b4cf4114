#include "analysis/connectivity_analyzer.hpp"
#include "util/logging.hpp"

namespace gossipnet {
namespace analysis {

ConnectivityAnalyzer::ConnectivityAnalyzer(DirectedGraph graph,
                                           std::vector<std::string> addresses,
                                           const LayoutParams &params, uint64_t seed)
    : graph_(std::move(graph)), addresses_(std::move(addresses)),
      adjacency_(graph_.SymmetrizedAdjacency()),
      components_(FindConnectedComponents(adjacency_)),
      membership_(ComponentMembership(components_, graph_.node_count())),
      largest_(LargestComponentIndex(components_)), layout_(params, seed) {
  addresses_.resize(graph_.node_count());
}

int ConnectivityAnalyzer::ComponentOf(int node) const {
  if (node < 0 || static_cast<size_t>(node) >= membership_.size()) {
    return -1;
  }
  return membership_[node];
}

std::vector<int> ConnectivityAnalyzer::ReachableFrom(int source) const {
  return analysis::ReachableFrom(graph_, source);
}

NetworkTopology ConnectivityAnalyzer::Analyze() {
  NetworkTopology topology;
  const auto positions = layout_.LayoutWithIslands(adjacency_, components_);

  topology.nodes.reserve(graph_.node_count());
  for (size_t i = 0; i < graph_.node_count(); ++i) {
    NodeInfo node;
    node.id = static_cast<int>(i);
    node.addr = addresses_[i];
    node.x = static_cast<int>(positions[i].x);
    node.y = static_cast<int>(positions[i].y);
    node.cluster_id = membership_[i];
    topology.nodes.push_back(std::move(node));
  }

  for (const auto &[from, to] : graph_.Edges()) {
    topology.edges.push_back(EdgeInfo{from, to});
  }

  topology.clusters.reserve(components_.size());
  for (size_t c = 0; c < components_.size(); ++c) {
    const Component &members = components_[c];
    double total_x = 0.0;
    double total_y = 0.0;
    for (int v : members) {
      total_x += positions[v].x;
      total_y += positions[v].y;
    }

    ClusterInfo cluster;
    cluster.id = static_cast<int>(c);
    cluster.node_ids = members;
    cluster.size = members.size();
    cluster.center_x = static_cast<int>(total_x / static_cast<double>(members.size()));
    cluster.center_y = static_cast<int>(total_y / static_cast<double>(members.size()));
    cluster.is_isolated = static_cast<int>(c) != largest_;
    topology.clusters.push_back(std::move(cluster));
  }

  LOG_ANALYSIS_INFO("Topology: {} nodes, {} edges, {} clusters (largest {} nodes)",
                    topology.nodes.size(), topology.edges.size(),
                    topology.clusters.size(),
                    largest_ >= 0 ? components_[largest_].size() : 0);
  return topology;
}

} // namespace analysis
} // namespace gossipnet
