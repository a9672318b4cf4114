#pragma once

#include "analysis/graph.hpp"
#include "analysis/layout.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace gossipnet {
namespace analysis {

struct NodeInfo {
  int id = 0;
  std::string addr;
  int x = 0;
  int y = 0;
  int cluster_id = -1;
};

// Directed: mirrors the peer relation
struct EdgeInfo {
  int from = 0;
  int to = 0;
};

struct ClusterInfo {
  int id = 0;
  std::vector<int> node_ids;
  size_t size = 0;
  int center_x = 0;
  int center_y = 0;
  bool is_isolated = false;  // every cluster except the largest
};

struct NetworkTopology {
  std::vector<NodeInfo> nodes;
  std::vector<EdgeInfo> edges;
  std::vector<ClusterInfo> clusters;
};

/**
 * ConnectivityAnalyzer - clustering and layout of a peer graph
 *
 * Keeps both views of the network:
 * - directed_graph(): who forwards to whom
 * - symmetrized_adjacency(): who is connected at all, used for clustering
 * A component of the symmetrized graph can contain nodes that a message
 * originated inside it will never reach; ReachableFrom() answers that.
 */
class ConnectivityAnalyzer {
public:
  /**
   * @param graph Peer relation over node ids 0..n-1
   * @param addresses addresses[i] is the printable address of node i
   */
  ConnectivityAnalyzer(DirectedGraph graph, std::vector<std::string> addresses,
                       const LayoutParams &params = LayoutParams{}, uint64_t seed = 0);

  const DirectedGraph &directed_graph() const { return graph_; }
  const std::vector<std::vector<int>> &symmetrized_adjacency() const { return adjacency_; }
  const std::vector<Component> &components() const { return components_; }

  // Component index of node (-1 if out of range)
  int ComponentOf(int node) const;

  // Index of the largest component (-1 for an empty graph)
  int largest_component() const { return largest_; }

  std::vector<int> ReachableFrom(int source) const;

  // Run the layout and assemble the exportable topology
  NetworkTopology Analyze();

private:
  DirectedGraph graph_;
  std::vector<std::string> addresses_;
  std::vector<std::vector<int>> adjacency_;
  std::vector<Component> components_;
  std::vector<int> membership_;
  int largest_;
  ForceDirectedLayout layout_;
};

} // namespace analysis
} // namespace gossipnet
