#include "analysis/graph.hpp"
#include <algorithm>

namespace gossipnet {
namespace analysis {

DirectedGraph::DirectedGraph(size_t node_count) : out_edges_(node_count) {}

void DirectedGraph::AddEdge(int from, int to) {
  const int n = static_cast<int>(out_edges_.size());
  if (from < 0 || from >= n || to < 0 || to >= n) {
    return;
  }
  out_edges_[from].push_back(to);
  ++edge_count_;
}

const std::vector<int> &DirectedGraph::OutEdges(int node) const {
  static const std::vector<int> kEmpty;
  if (node < 0 || node >= static_cast<int>(out_edges_.size())) {
    return kEmpty;
  }
  return out_edges_[node];
}

std::vector<std::pair<int, int>> DirectedGraph::Edges() const {
  std::vector<std::pair<int, int>> edges;
  edges.reserve(edge_count_);
  for (size_t from = 0; from < out_edges_.size(); ++from) {
    for (int to : out_edges_[from]) {
      edges.emplace_back(static_cast<int>(from), to);
    }
  }
  return edges;
}

std::vector<std::vector<int>> DirectedGraph::SymmetrizedAdjacency() const {
  const size_t n = out_edges_.size();
  std::vector<std::vector<int>> adjacency(n);
  for (size_t from = 0; from < n; ++from) {
    for (int to : out_edges_[from]) {
      adjacency[from].push_back(to);
      adjacency[to].push_back(static_cast<int>(from));
    }
  }

  // Dedup, keeping first occurrence
  std::vector<char> mark(n, 0);
  for (auto &neighbours : adjacency) {
    std::vector<int> unique;
    unique.reserve(neighbours.size());
    for (int v : neighbours) {
      if (!mark[v]) {
        mark[v] = 1;
        unique.push_back(v);
      }
    }
    for (int v : unique) {
      mark[v] = 0;
    }
    neighbours = std::move(unique);
  }
  return adjacency;
}

std::vector<Component> FindConnectedComponents(const std::vector<std::vector<int>> &adjacency) {
  const size_t n = adjacency.size();
  std::vector<char> visited(n, 0);
  std::vector<Component> components;
  std::vector<int> stack;

  for (size_t start = 0; start < n; ++start) {
    if (visited[start]) {
      continue;
    }

    Component component;
    stack.push_back(static_cast<int>(start));
    while (!stack.empty()) {
      const int v = stack.back();
      stack.pop_back();
      if (visited[v]) {
        continue;
      }
      visited[v] = 1;
      component.push_back(v);

      // Reverse push so neighbours are visited in adjacency order
      const auto &neighbours = adjacency[v];
      for (auto it = neighbours.rbegin(); it != neighbours.rend(); ++it) {
        if (*it >= 0 && static_cast<size_t>(*it) < n && !visited[*it]) {
          stack.push_back(*it);
        }
      }
    }
    components.push_back(std::move(component));
  }
  return components;
}

std::vector<int> ComponentMembership(const std::vector<Component> &components,
                                     size_t node_count) {
  std::vector<int> membership(node_count, -1);
  for (size_t c = 0; c < components.size(); ++c) {
    for (int v : components[c]) {
      if (v >= 0 && static_cast<size_t>(v) < node_count) {
        membership[v] = static_cast<int>(c);
      }
    }
  }
  return membership;
}

int LargestComponentIndex(const std::vector<Component> &components) {
  int largest = -1;
  size_t largest_size = 0;
  for (size_t i = 0; i < components.size(); ++i) {
    if (components[i].size() > largest_size) {
      largest_size = components[i].size();
      largest = static_cast<int>(i);
    }
  }
  return largest;
}

std::vector<int> ReachableFrom(const DirectedGraph &graph, int source) {
  const size_t n = graph.node_count();
  if (source < 0 || static_cast<size_t>(source) >= n) {
    return {};
  }

  std::vector<char> visited(n, 0);
  std::vector<int> stack{source};
  visited[source] = 1;
  std::vector<int> result;
  while (!stack.empty()) {
    const int v = stack.back();
    stack.pop_back();
    result.push_back(v);
    for (int w : graph.OutEdges(v)) {
      if (!visited[w]) {
        visited[w] = 1;
        stack.push_back(w);
      }
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

} // namespace analysis
} // namespace gossipnet
