#pragma once

#include "gossip/network_builder.hpp"
#include "network/simulated_transport.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace gossipnet {
namespace app {

// Simulation run configuration (filled from gossipsim flags)
struct SimulationConfig {
  size_t node_count = 1000;
  size_t peers_per_node = 4;
  std::string content = "Hello from the gossip network!";
  int max_ttl = protocol::DEFAULT_MAX_TTL;
  uint64_t seed = 0;  // 0 = random
  std::chrono::milliseconds settle_time{2000};
  size_t queue_capacity = protocol::DEFAULT_QUEUE_CAPACITY;

  // Export directory; empty disables the export
  std::filesystem::path output_dir = "output";
};

// Simulation - one end-to-end dissemination run
//
// initialize() builds the network, run() starts it, originates one message,
// waits for it to settle, shuts the nodes down, prints the reach summary
// and writes the visualization document.
class Simulation {
public:
  explicit Simulation(const SimulationConfig &config = SimulationConfig{});
  ~Simulation();

  bool initialize();
  bool run();
  void stop();

  const std::optional<gossip::PropagationReport> &report() const { return report_; }
  gossip::NetworkBuilder *builder() { return builder_.get(); }

private:
  void print_report(const gossip::PropagationReport &report) const;

  SimulationConfig config_;
  std::unique_ptr<network::SimulatedTransport> transport_;
  std::unique_ptr<gossip::NetworkBuilder> builder_;
  std::optional<int> originator_;
  std::optional<gossip::PropagationReport> report_;
};

} // namespace app
} // namespace gossipnet
