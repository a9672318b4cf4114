#pragma once

#include "analysis/graph.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace gossipnet {
namespace analysis {

struct Position {
  double x = 0.0;
  double y = 0.0;
};

// Force-directed layout parameters (canvas in pixels)
struct LayoutParams {
  double width = 1200.0;
  double height = 800.0;
  int iterations = 200;
  double repulsion = 500.0;    // force = repulsion / d^2 between cluster members
  double attraction = 0.1;     // force = attraction * d along an edge
  double damping = 0.9;        // velocity multiplier per iteration
  double step = 0.01;          // force-to-velocity factor
  double margin = 10.0;        // minimum distance from the box edge
  double main_share = 0.6;     // width fraction given to the largest component
  int isolated_columns = 4;    // grid columns for the other components
  double cell_padding = 25.0;  // padding around each isolated grid cell
  double min_cell_size = 20.0; // lower bound for a crowded grid cell
};

/**
 * ForceDirectedLayout - positions nodes for the visualization document
 *
 * The largest component is laid out in the right-hand main_share of the
 * canvas. Every other component gets a cell of a grid in the remaining left
 * strip; singletons sit in the middle of their cell. Positions have no effect
 * on the protocol.
 *
 * Deterministic for a given seed (0 picks a random seed).
 */
class ForceDirectedLayout {
public:
  explicit ForceDirectedLayout(const LayoutParams &params = LayoutParams{},
                               uint64_t seed = 0);

  /**
   * Lay out one cluster inside a width x height box at the origin
   *
   * @param cluster Member node ids
   * @param adjacency Symmetrized adjacency over all nodes; only edges with
   *        both ends in the cluster attract
   * @return positions[i] belongs to cluster[i]
   */
  std::vector<Position> LayoutCluster(const Component &cluster,
                                      const std::vector<std::vector<int>> &adjacency,
                                      double width, double height);

  // Positions indexed by node id, for every node of every component
  std::vector<Position> LayoutWithIslands(const std::vector<std::vector<int>> &adjacency,
                                          const std::vector<Component> &components);

  const LayoutParams &params() const { return params_; }

private:
  LayoutParams params_;
  std::mt19937_64 rng_;
};

} // namespace analysis
} // namespace gossipnet
