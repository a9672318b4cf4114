#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace gossipnet {
namespace analysis {

/**
 * DirectedGraph - the peer relation of a network
 *
 * Vertices are node ids 0..n-1. An edge a->b means "a lists b as a peer",
 * i.e. a forwards to b. The relation is not symmetric.
 */
class DirectedGraph {
public:
  explicit DirectedGraph(size_t node_count = 0);

  // Ignored if either endpoint is out of range
  void AddEdge(int from, int to);

  size_t node_count() const { return out_edges_.size(); }
  size_t edge_count() const { return edge_count_; }

  const std::vector<int> &OutEdges(int node) const;

  // All edges in insertion order per source, sources ascending
  std::vector<std::pair<int, int>> Edges() const;

  // Every edge made bidirectional, neighbours deduplicated (first-seen order)
  std::vector<std::vector<int>> SymmetrizedAdjacency() const;

private:
  std::vector<std::vector<int>> out_edges_;
  size_t edge_count_ = 0;
};

using Component = std::vector<int>;

/**
 * Connected components of an undirected adjacency list
 *
 * Every vertex lands in exactly one component (isolated vertices form
 * singletons). Components are ordered by their lowest-numbered vertex, and
 * members appear in depth-first preorder. The traversal uses an explicit
 * stack, so deep graphs cannot overflow the call stack.
 */
std::vector<Component> FindConnectedComponents(const std::vector<std::vector<int>> &adjacency);

// membership[v] = index of the component containing v
std::vector<int> ComponentMembership(const std::vector<Component> &components,
                                     size_t node_count);

// Index of the largest component (first one on ties); -1 if there are none
int LargestComponentIndex(const std::vector<Component> &components);

// Vertices reachable from source along directed edges, including source, sorted
std::vector<int> ReachableFrom(const DirectedGraph &graph, int source);

} // namespace analysis
} // namespace gossipnet
