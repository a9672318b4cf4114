#include "analysis/visualization_export.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>

namespace gossipnet {
namespace analysis {

using json = nlohmann::json;

json ToJson(const NodeInfo &node) {
  return json{{"id", node.id},
              {"addr", node.addr},
              {"x", node.x},
              {"y", node.y},
              {"clusterId", node.cluster_id}};
}

json ToJson(const EdgeInfo &edge) {
  return json{{"from", edge.from}, {"to", edge.to}};
}

json ToJson(const ClusterInfo &cluster) {
  return json{{"id", cluster.id},
              {"nodeIds", cluster.node_ids},
              {"size", cluster.size},
              {"centerX", cluster.center_x},
              {"centerY", cluster.center_y},
              {"isIsolated", cluster.is_isolated}};
}

json ToJson(const NetworkTopology &topology) {
  json nodes = json::array();
  for (const auto &node : topology.nodes) {
    nodes.push_back(ToJson(node));
  }
  json edges = json::array();
  for (const auto &edge : topology.edges) {
    edges.push_back(ToJson(edge));
  }
  json clusters = json::array();
  for (const auto &cluster : topology.clusters) {
    clusters.push_back(ToJson(cluster));
  }

  json root;
  root["nodes"] = std::move(nodes);
  root["edges"] = std::move(edges);
  root["clusters"] = std::move(clusters);
  return root;
}

json ToJson(const gossip::MessageTrace &trace) {
  return json{{"timestamp", util::FormatRFC3339(trace.timestamp)},
              {"messageId", trace.message_id},
              {"originalSender", trace.original_sender},
              {"immediateForwarder", trace.immediate_forwarder},
              {"receiver", trace.receiver},
              {"content", trace.content},
              {"ttl", trace.ttl},
              {"isDirect", trace.is_direct}};
}

json ToJson(const VisualizationData &data) {
  json traces = json::array();
  for (const auto &trace : data.traces) {
    traces.push_back(ToJson(trace));
  }

  json root;
  root["topology"] = ToJson(data.topology);
  root["traces"] = std::move(traces);
  root["startTime"] = util::FormatRFC3339(data.start_time);
  return root;
}

bool WriteVisualizationFile(const VisualizationData &data,
                            const std::filesystem::path &dir) {
  try {
    if (!util::ensure_directory(dir)) {
      LOG_ANALYSIS_ERROR("Failed to create output directory {}", dir.string());
      return false;
    }

    const std::filesystem::path file = dir / VISUALIZATION_FILE_NAME;
    const std::string document =
        ToJson(data).dump(2, ' ', false, json::error_handler_t::replace);
    if (!util::atomic_write_file(file, document, 0644)) {
      LOG_ANALYSIS_ERROR("Failed to write visualization file {}", file.string());
      return false;
    }

    LOG_ANALYSIS_INFO("Exported visualization data to {}", file.string());
    LOG_ANALYSIS_INFO("Total nodes: {}, total message traces: {}",
                      data.topology.nodes.size(), data.traces.size());
    return true;
  } catch (const std::exception &e) {
    LOG_ANALYSIS_ERROR("Exception during visualization export: {}", e.what());
    return false;
  }
}

} // namespace analysis
} // namespace gossipnet
