#include "analysis/layout.hpp"
#include <algorithm>
#include <cmath>

namespace gossipnet {
namespace analysis {

namespace {

uint64_t ResolveSeed(uint64_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) | rd();
}

double Clamp(double v, double lo, double hi) {
  // Same order as a two-sided bounds check: hi wins if the box is degenerate
  if (v < lo) {
    v = lo;
  }
  if (v > hi) {
    v = hi;
  }
  return v;
}

} // namespace

ForceDirectedLayout::ForceDirectedLayout(const LayoutParams &params, uint64_t seed)
    : params_(params), rng_(ResolveSeed(seed)) {}

std::vector<Position> ForceDirectedLayout::LayoutCluster(
    const Component &cluster, const std::vector<std::vector<int>> &adjacency,
    double width, double height) {
  const size_t count = cluster.size();
  std::vector<Position> pos(count);
  std::vector<Position> vel(count);
  if (count == 0) {
    return pos;
  }

  // node id -> index into cluster
  std::vector<int> local(adjacency.size(), -1);
  for (size_t i = 0; i < count; ++i) {
    if (cluster[i] >= 0 && static_cast<size_t>(cluster[i]) < local.size()) {
      local[cluster[i]] = static_cast<int>(i);
    }
  }

  std::uniform_real_distribution<double> ux(0.0, std::max(width, 1.0));
  std::uniform_real_distribution<double> uy(0.0, std::max(height, 1.0));
  for (auto &p : pos) {
    p.x = ux(rng_);
    p.y = uy(rng_);
  }

  std::vector<Position> force(count);
  for (int iter = 0; iter < params_.iterations; ++iter) {
    std::fill(force.begin(), force.end(), Position{});

    // Repulsion between every pair
    for (size_t i = 0; i < count; ++i) {
      for (size_t j = i + 1; j < count; ++j) {
        const double dx = pos[i].x - pos[j].x;
        const double dy = pos[i].y - pos[j].y;
        double dist = std::sqrt(dx * dx + dy * dy);
        if (dist < 1.0) {
          dist = 1.0;
        }
        const double f = params_.repulsion / (dist * dist);
        const double fx = (dx / dist) * f;
        const double fy = (dy / dist) * f;
        force[i].x += fx;
        force[i].y += fy;
        force[j].x -= fx;
        force[j].y -= fy;
      }
    }

    // Attraction along edges inside the cluster
    for (size_t i = 0; i < count; ++i) {
      const int node = cluster[i];
      if (node < 0 || static_cast<size_t>(node) >= adjacency.size()) {
        continue;
      }
      for (int neighbour : adjacency[node]) {
        if (neighbour < 0 || static_cast<size_t>(neighbour) >= local.size() ||
            local[neighbour] < 0) {
          continue;
        }
        const Position &other = pos[local[neighbour]];
        const double dx = other.x - pos[i].x;
        const double dy = other.y - pos[i].y;
        const double dist = std::sqrt(dx * dx + dy * dy);
        if (dist > 0.0) {
          const double f = params_.attraction * dist;
          force[i].x += (dx / dist) * f;
          force[i].y += (dy / dist) * f;
        }
      }
    }

    for (size_t i = 0; i < count; ++i) {
      vel[i].x = vel[i].x * params_.damping + force[i].x * params_.step;
      vel[i].y = vel[i].y * params_.damping + force[i].y * params_.step;
      pos[i].x = Clamp(pos[i].x + vel[i].x, params_.margin, width - params_.margin);
      pos[i].y = Clamp(pos[i].y + vel[i].y, params_.margin, height - params_.margin);
    }
  }

  return pos;
}

std::vector<Position> ForceDirectedLayout::LayoutWithIslands(
    const std::vector<std::vector<int>> &adjacency,
    const std::vector<Component> &components) {
  std::vector<Position> positions(adjacency.size());
  const int largest = LargestComponentIndex(components);
  if (largest < 0) {
    return positions;
  }

  auto place = [&positions](int node, Position p) {
    if (node >= 0 && static_cast<size_t>(node) < positions.size()) {
      positions[node] = p;
    }
  };

  // Main component on the right
  const double main_width = std::floor(params_.width * params_.main_share);
  const double main_x = params_.width - main_width;
  const Component &main = components[largest];
  auto main_pos = LayoutCluster(main, adjacency, main_width, params_.height);
  for (size_t i = 0; i < main.size(); ++i) {
    place(main[i], Position{main_pos[i].x + main_x, main_pos[i].y});
  }

  // Everything else in a grid on the left
  std::vector<const Component *> isolated;
  for (size_t c = 0; c < components.size(); ++c) {
    if (static_cast<int>(c) != largest) {
      isolated.push_back(&components[c]);
    }
  }
  if (isolated.empty()) {
    return positions;
  }

  const int cols = std::max(1, params_.isolated_columns);
  const int rows = static_cast<int>((isolated.size() + cols - 1) / cols);
  const double strip_width = params_.width - main_width - 2 * params_.cell_padding;
  const double cell_width = std::floor(strip_width / cols);
  const double cell_height = std::floor(params_.height / rows);
  const double inner_width = std::max(params_.min_cell_size, cell_width - 2 * params_.cell_padding);
  const double inner_height = std::max(params_.min_cell_size, cell_height - 2 * params_.cell_padding);

  for (size_t k = 0; k < isolated.size(); ++k) {
    const Component &cluster = *isolated[k];
    const double cell_x = static_cast<double>(k % cols) * cell_width + params_.cell_padding;
    const double cell_y = static_cast<double>(k / cols) * cell_height + params_.cell_padding;

    if (cluster.size() == 1) {
      place(cluster[0], Position{cell_x + inner_width / 2, cell_y + inner_height / 2});
      continue;
    }

    auto local = LayoutCluster(cluster, adjacency, inner_width, inner_height);
    for (size_t i = 0; i < cluster.size(); ++i) {
      place(cluster[i], Position{local[i].x + cell_x, local[i].y + cell_y});
    }
  }

  return positions;
}

} // namespace analysis
} // namespace gossipnet
