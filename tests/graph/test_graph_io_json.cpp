// tests/graph/test_graph_io_json.cpp
// Tests for JSON service graphs and JSON result documents.
//
// Validates:
//   1. Service graph loading and its error paths
//   2. Field names and null handling of every result document

#include "gtopo/graph/graph_io_json.h"
#include "gtopo/graph/graph_io_parse.h"
#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

namespace gg = gtopo::graph;
namespace io = gtopo::graph::io;
using nlohmann::json;

namespace {

constexpr auto k_services = R"({
  "nodes": ["api", "auth", "db", "cache"],
  "edges": [
    { "from": "api",   "to": "auth",  "latency_ms": 5 },
    { "from": "auth",  "to": "db",    "latency_ms": 3 },
    { "from": "api",   "to": "cache", "latency_ms": 7 },
    { "from": "cache", "to": "db",    "latency_ms": 2.5 }
  ]
})";

gg::service_graph load(std::string const& text) {
    std::istringstream in(text);
    return io::read_service_json(in);
}

} // namespace

// =============================================================================
// 1. Reading
// =============================================================================

TEST(GraphIOJson, ReadsServiceGraph) {
    auto const g = load(k_services);
    EXPECT_TRUE(g.is_directed());
    EXPECT_EQ(g.node_count(), 4u);
    EXPECT_EQ(g.edge_count(), 4u);
    EXPECT_EQ(g.label(gg::node_id{3}), "cache");
    EXPECT_DOUBLE_EQ(g.edges()[3].weight, 2.5);
}

TEST(GraphIOJson, DuplicateNodeRejected) {
    try {
        (void)load(R"({"nodes": ["a", "a"], "edges": []})");
        FAIL() << "expected graph_error";
    } catch (gg::graph_error const& e) {
        EXPECT_EQ(e.kind(), gg::error_kind::duplicate_node);
    }
}

TEST(GraphIOJson, GraphErrorsPassThrough) {
    EXPECT_THROW((void)load(R"({"nodes": ["a"], "edges": [{"from": "a", "to": "b", "latency_ms": 1}]})"),
                 gg::graph_error);
    EXPECT_THROW((void)load(R"({"nodes": ["a", "b"], "edges": [{"from": "a", "to": "b", "latency_ms": -1}]})"),
                 gg::graph_error);
}

TEST(GraphIOJson, MalformedDocumentsAreRuntimeErrors) {
    EXPECT_THROW((void)load("{ not json"), std::runtime_error);
    EXPECT_THROW((void)load(R"({"nodes": ["a"]})"), std::runtime_error);
    EXPECT_THROW((void)load(R"({"nodes": [1, 2], "edges": []})"), std::runtime_error);
    EXPECT_THROW((void)load(R"({"nodes": ["a", "b"], "edges": [{"from": "a", "to": "b"}]})"),
                 std::runtime_error);
    EXPECT_THROW((void)load(R"({"nodes": ["a", "b"], "edges": [{"from": "a", "to": "b", "latency_ms": "5"}]})"),
                 std::runtime_error);
}

// =============================================================================
// 2. Result documents
// =============================================================================

TEST(GraphIOJson, PathFields) {
    auto const g = load(k_services);
    auto const j = io::as_json(g, gg::shortest_path(g, "api", "db"));
    EXPECT_EQ(j.at("from"), "api");
    EXPECT_EQ(j.at("to"), "db");
    EXPECT_EQ(j.at("path"), json::array({"api", "auth", "db"}));
    EXPECT_DOUBLE_EQ(j.at("total_latency_ms").get<double>(), 8.0);
    EXPECT_EQ(j.at("bottleneck").at("from"), "api");
    EXPECT_EQ(j.at("bottleneck").at("to"), "auth");
    EXPECT_DOUBLE_EQ(j.at("bottleneck").at("latency_ms").get<double>(), 5.0);
}

TEST(GraphIOJson, SameNodeHasNullBottleneck) {
    auto const g = load(k_services);
    auto const j = io::as_json(g, gg::shortest_path(g, "db", "db"));
    EXPECT_EQ(j.at("path"), json::array({"db"}));
    EXPECT_DOUBLE_EQ(j.at("total_latency_ms").get<double>(), 0.0);
    EXPECT_TRUE(j.at("bottleneck").is_null());
}

TEST(GraphIOJson, NoPathHasNullLatency) {
    auto const g = load(k_services);
    auto const j = io::as_json(g, gg::shortest_path(g, "db", "api"));
    EXPECT_TRUE(j.at("path").empty());
    EXPECT_TRUE(j.at("total_latency_ms").is_null());
    EXPECT_TRUE(j.at("bottleneck").is_null());
}

TEST(GraphIOJson, SloFields) {
    auto const g = load(k_services);
    auto const j = io::as_json(g, gg::check_slo(g, "api", "db", 7.0));
    EXPECT_FALSE(j.at("slo_met").get<bool>());
    EXPECT_EQ(j.at("status"), "FAIL");
    EXPECT_DOUBLE_EQ(j.at("max_latency_ms").get<double>(), 7.0);
    EXPECT_DOUBLE_EQ(j.at("actual_latency_ms").get<double>(), 8.0);
    EXPECT_EQ(j.at("path").at("path").size(), 3u);

    auto const none = io::as_json(g, gg::check_slo(g, "db", "api", 7.0));
    EXPECT_EQ(none.at("status"), "NO PATH");
    EXPECT_TRUE(none.at("actual_latency_ms").is_null());
}

TEST(GraphIOJson, SimulationFields) {
    auto const g = load(k_services);
    auto const j = io::as_json(g,
        gg::simulate(g, "api", "db", {}, io::parse_drops("api:auth")));
    EXPECT_EQ(j.at("original").at("path"), json::array({"api", "auth", "db"}));
    EXPECT_EQ(j.at("modified").at("path"), json::array({"api", "cache", "db"}));
    EXPECT_DOUBLE_EQ(j.at("latency_change_ms").get<double>(), 1.5);

    auto const lost = io::as_json(g,
        gg::simulate(g, "api", "db", {}, io::parse_drops("auth:db,cache:db")));
    EXPECT_EQ(lost.at("status"), "path no longer exists");
    EXPECT_TRUE(lost.at("latency_change_ms").is_null());
    EXPECT_TRUE(lost.at("modified").at("path").empty());
}

TEST(GraphIOJson, ConnectivityFields) {
    auto const g = gg::make_connectivity_graph(
        {{0, 1, 1.0}, {1, 2, 2.0}, {2, 0, 3.0}, {2, 3, 4.0}});
    auto const j = io::as_json(g, gg::analyze_connectivity(g));

    auto const& mst = j.at("mst");
    EXPECT_EQ(mst.at("algorithm"), "kruskal");
    EXPECT_DOUBLE_EQ(mst.at("total_weight").get<double>(), 7.0);
    EXPECT_EQ(mst.at("num_edges"), 3);
    EXPECT_EQ(mst.at("edges").at(0), json({{"u", 0}, {"v", 1}, {"weight", 1.0}}));

    auto const& crit = j.at("critical");
    EXPECT_EQ(crit.at("num_bridges"), 1);
    EXPECT_EQ(crit.at("num_articulation_points"), 1);
    EXPECT_EQ(crit.at("bridges"), json::parse("[[2, 3]]"));
    EXPECT_EQ(crit.at("articulation_points"), json::parse("[2]"));
}

TEST(GraphIOJson, WriteJsonEndsWithNewline) {
    auto const g = load(k_services);
    std::ostringstream os;
    io::write_json(os, g, gg::shortest_path(g, "api", "db"));
    auto const text = os.str();
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.back(), '\n');
    EXPECT_EQ(json::parse(text).at("total_latency_ms"), 8.0);
}
