#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iomanip>
#include <iostream>

namespace gossipnet {
namespace app {

Simulation::Simulation(const SimulationConfig &config) : config_(config) {}

Simulation::~Simulation() { stop(); }

bool Simulation::initialize() {
  // Print startup banner (std::cout for immediate visibility)
  std::cout << GetStartupBanner(config_.node_count, config_.peers_per_node)
            << std::flush;

  LOG_APP_INFO("Initializing simulation: {} nodes, {} peers each, ttl {}",
               config_.node_count, config_.peers_per_node, config_.max_ttl);

  network::SimulatedTransport::Config transport_config;
  transport_config.queue_capacity = config_.queue_capacity;
  transport_ = std::make_unique<network::SimulatedTransport>(transport_config);

  gossip::NetworkBuilder::Config builder_config;
  builder_config.seed = config_.seed;
  builder_config.node_config.max_ttl = config_.max_ttl;
  builder_ = std::make_unique<gossip::NetworkBuilder>(*transport_, builder_config);

  if (!builder_->CreateNodes(config_.node_count)) {
    LOG_APP_ERROR("Failed to create nodes");
    return false;
  }
  builder_->BuildRandomTopology(config_.peers_per_node);
  return true;
}

bool Simulation::run() {
  if (!builder_) {
    LOG_APP_ERROR("Simulation not initialized");
    return false;
  }

  builder_->StartAllNodes();

  originator_ = builder_->InitiateGossip(config_.content);
  if (!originator_) {
    LOG_APP_ERROR("Empty network, nothing to gossip");
    return false;
  }
  LOG_APP_INFO("Node {} originated the message", *originator_);

  if (!builder_->WaitUntilQuiescent(config_.settle_time)) {
    LOG_APP_WARN("Reporting partial propagation after {} ms",
                 config_.settle_time.count());
  }
  builder_->CloseAllNodes();

  report_ = builder_->ComputeReport();
  print_report(*report_);

  if (!config_.output_dir.empty() &&
      !builder_->ExportVisualizationData(config_.output_dir)) {
    LOG_APP_ERROR("Failed to export visualization data");
    return false;
  }
  return true;
}

void Simulation::stop() {
  if (builder_) {
    builder_->CloseAllNodes();
  }
}

void Simulation::print_report(const gossip::PropagationReport &report) const {
  std::cout << "\nGossip Results:\n"
            << "- Network size: " << report.network_size << " nodes\n"
            << "- Nodes reached: " << report.nodes_reached << " ("
            << std::fixed << std::setprecision(1) << report.reach_percent << "%)\n"
            << "- Total messages sent: " << report.total_sent << "\n"
            << "- Average messages per node: "
            << report.avg_sent_per_node << "\n"
            << std::flush;

  LOG_APP_INFO("Reached {}/{} nodes ({:.1f}%), {} messages sent",
               report.nodes_reached, report.network_size, report.reach_percent,
               report.total_sent);
}

} // namespace app
} // namespace gossipnet
