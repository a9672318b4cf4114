// Unit tests for the topology analysis and the exported document
#include <catch2/catch_test_macros.hpp>
#include "analysis/connectivity_analyzer.hpp"
#include "analysis/visualization_export.hpp"
#include "util/files.hpp"
#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <random>

using namespace gossipnet;
using namespace gossipnet::analysis;
using json = nlohmann::json;

namespace {

std::filesystem::path UniqueTempDir() {
    std::random_device rd;
    return std::filesystem::temp_directory_path() /
           ("gossipnet_export_" + std::to_string(rd()) + std::to_string(rd()));
}

// 0 -> 1 -> 2 (main), 3 -> 4, 5 alone
ConnectivityAnalyzer SampleAnalyzer() {
    DirectedGraph g(6);
    g.AddEdge(0, 1);
    g.AddEdge(1, 2);
    g.AddEdge(3, 4);
    std::vector<std::string> addrs;
    for (int i = 0; i < 6; ++i) {
        addrs.push_back("127.0.0.1:" + std::to_string(8000 + i));
    }
    return ConnectivityAnalyzer(std::move(g), std::move(addrs), LayoutParams{}, 11);
}

gossip::MessageTrace Trace(int64_t millis, int receiver) {
    gossip::MessageTrace t;
    t.timestamp = util::FromUnixMillis(millis);
    t.message_id = "abc";
    t.original_sender = 0;
    t.immediate_forwarder = receiver - 1;
    t.receiver = receiver;
    t.content = "x";
    t.ttl = 20 - receiver;
    t.is_direct = t.immediate_forwarder == 0;
    return t;
}

} // namespace

TEST_CASE("ConnectivityAnalyzer - clusters and isolation flags", "[analysis][export]") {
    auto analyzer = SampleAnalyzer();

    REQUIRE(analyzer.components().size() == 3);
    REQUIRE(analyzer.largest_component() == 0);
    REQUIRE(analyzer.ComponentOf(2) == 0);
    REQUIRE(analyzer.ComponentOf(4) == 1);
    REQUIRE(analyzer.ComponentOf(5) == 2);
    REQUIRE(analyzer.ComponentOf(6) == -1);

    // Directed view differs from the symmetrized one
    REQUIRE(analyzer.ReachableFrom(2) == std::vector<int>{2});
    REQUIRE(analyzer.ReachableFrom(0) == std::vector<int>{0, 1, 2});
    REQUIRE(analyzer.symmetrized_adjacency()[2] == std::vector<int>{1});
    REQUIRE(analyzer.directed_graph().OutEdges(2).empty());

    auto topology = analyzer.Analyze();
    REQUIRE(topology.nodes.size() == 6);
    REQUIRE(topology.edges.size() == 3);
    REQUIRE(topology.clusters.size() == 3);

    REQUIRE_FALSE(topology.clusters[0].is_isolated);
    REQUIRE(topology.clusters[1].is_isolated);
    REQUIRE(topology.clusters[2].is_isolated);
    REQUIRE(topology.clusters[0].size == 3);
    REQUIRE(topology.clusters[2].node_ids == std::vector<int>{5});

    for (const auto& node : topology.nodes) {
        REQUIRE(node.cluster_id == analyzer.ComponentOf(node.id));
        REQUIRE(node.addr == "127.0.0.1:" + std::to_string(8000 + node.id));
    }

    // A singleton's center is its own position
    REQUIRE(topology.clusters[2].center_x == topology.nodes[5].x);
    REQUIRE(topology.clusters[2].center_y == topology.nodes[5].y);
}

TEST_CASE("VisualizationData - document layout", "[analysis][export]") {
    auto analyzer = SampleAnalyzer();
    VisualizationData data;
    data.topology = analyzer.Analyze();
    data.traces = {Trace(1000, 1), Trace(1005, 2)};
    data.start_time = util::FromUnixMillis(0);

    json doc = ToJson(data);

    REQUIRE(doc.contains("topology"));
    REQUIRE(doc.contains("traces"));
    REQUIRE(doc["startTime"] == "1970-01-01T00:00:00.000Z");

    const auto& node = doc["topology"]["nodes"][0];
    for (const char* key : {"id", "addr", "x", "y", "clusterId"}) {
        REQUIRE(node.contains(key));
    }

    const auto& edge = doc["topology"]["edges"][0];
    REQUIRE(edge["from"] == 0);
    REQUIRE(edge["to"] == 1);

    const auto& cluster = doc["topology"]["clusters"][1];
    for (const char* key : {"id", "nodeIds", "size", "centerX", "centerY", "isIsolated"}) {
        REQUIRE(cluster.contains(key));
    }
    REQUIRE(cluster["isIsolated"] == true);

    const auto& trace = doc["traces"][1];
    REQUIRE(trace["timestamp"] == "1970-01-01T00:00:01.005Z");
    REQUIRE(trace["messageId"] == "abc");
    REQUIRE(trace["originalSender"] == 0);
    REQUIRE(trace["immediateForwarder"] == 1);
    REQUIRE(trace["receiver"] == 2);
    REQUIRE(trace["ttl"] == 18);
    REQUIRE(trace["isDirect"] == false);
    REQUIRE(doc["traces"][0]["isDirect"] == true);
}

TEST_CASE("WriteVisualizationFile - writes network_visualization.json", "[analysis][export]") {
    const auto dir = UniqueTempDir() / "nested";

    auto analyzer = SampleAnalyzer();
    VisualizationData data;
    data.topology = analyzer.Analyze();
    data.start_time = util::Now();

    REQUIRE(WriteVisualizationFile(data, dir));

    const auto file = dir / VISUALIZATION_FILE_NAME;
    REQUIRE(std::filesystem::exists(file));

    std::string text = util::read_file_string(file);
    REQUIRE(text.find("\n  \"topology\"") != std::string::npos);  // 2-space indent

    json doc = json::parse(text);
    REQUIRE(doc["topology"]["nodes"].size() == 6);
    REQUIRE(doc["traces"].is_array());
    REQUIRE(doc["traces"].empty());

    std::error_code ec;
    std::filesystem::remove_all(dir.parent_path(), ec);
}

TEST_CASE("WriteVisualizationFile - invalid UTF-8 trace content", "[analysis][export]") {
    const auto dir = UniqueTempDir();

    auto analyzer = SampleAnalyzer();
    VisualizationData data;
    data.topology = analyzer.Analyze();
    data.start_time = util::Now();
    data.traces = {Trace(1000, 1)};
    data.traces[0].content = "bad\xff bytes";

    REQUIRE(WriteVisualizationFile(data, dir));

    json doc = json::parse(util::read_file_string(dir / VISUALIZATION_FILE_NAME));
    REQUIRE(doc["traces"].size() == 1);
    REQUIRE(doc["traces"][0]["content"] == "bad\xEF\xBF\xBD bytes");

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
