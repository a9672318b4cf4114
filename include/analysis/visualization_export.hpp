#pragma once

#include "analysis/connectivity_analyzer.hpp"
#include "gossip/trace_log.hpp"
#include "util/time.hpp"
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <vector>

namespace gossipnet {
namespace analysis {

// File name written inside the export directory
constexpr const char *VISUALIZATION_FILE_NAME = "network_visualization.json";

// Everything the replay front-end needs
struct VisualizationData {
  NetworkTopology topology;
  std::vector<gossip::MessageTrace> traces;  // time-ordered
  util::TimePoint start_time;
};

nlohmann::json ToJson(const NodeInfo &node);
nlohmann::json ToJson(const EdgeInfo &edge);
nlohmann::json ToJson(const ClusterInfo &cluster);
nlohmann::json ToJson(const NetworkTopology &topology);
nlohmann::json ToJson(const gossip::MessageTrace &trace);

/**
 * Build the export document
 *
 * {"topology": {"nodes": [...], "edges": [...], "clusters": [...]},
 *  "traces": [...], "startTime": "<RFC 3339>"}
 */
nlohmann::json ToJson(const VisualizationData &data);

/**
 * Write <dir>/network_visualization.json (2-space indent, atomic replace)
 *
 * Creates dir if needed. Returns false (and logs) on any I/O failure.
 */
bool WriteVisualizationFile(const VisualizationData &data,
                            const std::filesystem::path &dir);

} // namespace analysis
} // namespace gossipnet
