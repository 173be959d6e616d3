// tests/graph/test_critical_components.cpp
// Tests for bridge and articulation point detection, and the combined
// connectivity analysis.

#include "gtopo/graph/critical_components.h"
#include "gtopo/graph/connectivity_analysis.h"
#include "gtopo/graph/graph_adapters.h"
#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace gg = gtopo::graph;
using gg::node_id;

namespace {

gg::edge_record rec(std::uint32_t u, std::uint32_t v, double w) {
    return gg::edge_record{node_id{u}, node_id{v}, w};
}

std::vector<node_id> nodes(std::initializer_list<std::uint32_t> ids) {
    std::vector<node_id> out;
    for (auto i : ids) out.push_back(node_id{i});
    return out;
}

} // namespace

TEST(CriticalComponents, TriangleHasNone) {
    auto const g = gg::make_connectivity_graph({{0, 1, 1.0}, {1, 2, 1.0}, {2, 0, 1.0}});
    auto const r = gg::find_critical(g);
    EXPECT_EQ(r.num_bridges(), 0u);
    EXPECT_EQ(r.num_articulation_points(), 0u);
}

TEST(CriticalComponents, PathGraph) {
    auto const g = gg::make_connectivity_graph({{0, 1, 1.0}, {1, 2, 2.0}, {2, 3, 3.0}});
    auto const r = gg::find_critical(g);
    EXPECT_EQ(r.bridges,
              (std::vector<gg::edge_record>{rec(0, 1, 1.0), rec(1, 2, 2.0), rec(2, 3, 3.0)}));
    EXPECT_EQ(r.articulation_points, nodes({1, 2}));
}

TEST(CriticalComponents, TriangleWithTail) {
    // 0-1-2 triangle, 2-3 tail.
    auto const g = gg::make_connectivity_graph(
        {{0, 1, 1.0}, {1, 2, 1.0}, {2, 0, 1.0}, {3, 2, 4.0}});
    auto const r = gg::find_critical(g);
    ASSERT_EQ(r.num_bridges(), 1u);
    EXPECT_EQ(r.bridges[0], rec(2, 3, 4.0));
    EXPECT_EQ(r.articulation_points, nodes({2}));
}

TEST(CriticalComponents, StarCentreIsArticulation) {
    auto const g = gg::make_connectivity_graph({{0, 1, 1.0}, {0, 2, 1.0}, {0, 3, 1.0}});
    auto const r = gg::find_critical(g);
    EXPECT_EQ(r.num_bridges(), 3u);
    EXPECT_EQ(r.articulation_points, nodes({0}));
}

TEST(CriticalComponents, ParallelEdgeIsNotABridge) {
    auto const g = gg::make_connectivity_graph(
        {{0, 1, 1.0}, {0, 1, 2.0}, {1, 2, 1.0}}, gg::parallel_edges::allow);
    auto const r = gg::find_critical(g);
    ASSERT_EQ(r.num_bridges(), 1u);
    EXPECT_EQ(r.bridges[0], rec(1, 2, 1.0));
    EXPECT_EQ(r.articulation_points, nodes({1}));
}

TEST(CriticalComponents, DisconnectedGraph) {
    // Two separate paths: 0-1-2 and 3-4.
    auto const g = gg::make_connectivity_graph(
        {{0, 1, 1.0}, {1, 2, 1.0}, {3, 4, 1.0}});
    auto const r = gg::find_critical(g);
    EXPECT_EQ(r.num_bridges(), 3u);
    EXPECT_EQ(r.articulation_points, nodes({1}));
}

TEST(CriticalComponents, TwoCyclesJoinedAtNode) {
    // Bowtie: triangles 0-1-2 and 2-3-4 share node 2.
    auto const g = gg::make_connectivity_graph({
        {0, 1, 1.0}, {1, 2, 1.0}, {2, 0, 1.0},
        {2, 3, 1.0}, {3, 4, 1.0}, {4, 2, 1.0}});
    auto const r = gg::find_critical(g);
    EXPECT_EQ(r.num_bridges(), 0u);
    EXPECT_EQ(r.articulation_points, nodes({2}));
}

TEST(CriticalComponents, LongPathDoesNotOverflowStack) {
    constexpr std::uint32_t n = 100000;
    std::vector<gg::connectivity_edge> edges;
    edges.reserve(n - 1);
    for (std::uint32_t i = 0; i + 1 < n; ++i) {
        edges.push_back({i, i + 1, 1.0});
    }
    auto const g = gg::make_connectivity_graph(edges);
    auto const r = gg::find_critical(g);
    EXPECT_EQ(r.num_bridges(), n - 1);
    EXPECT_EQ(r.num_articulation_points(), n - 2);
}

TEST(CriticalComponents, DirectedGraphRejected) {
    auto const g = gg::make_service_graph({"a", "b"}, {{"a", "b", 1.0}});
    try {
        (void)gg::find_critical(g);
        FAIL() << "expected graph_error";
    } catch (gg::graph_error const& e) {
        EXPECT_EQ(e.kind(), gg::error_kind::requires_undirected);
    }
}

TEST(ConnectivityAnalysis, CombinesTreeAndCriticalParts) {
    auto const g = gg::make_connectivity_graph(
        {{0, 1, 1.0}, {1, 2, 2.0}, {2, 0, 3.0}, {2, 3, 4.0}});
    auto const report = gg::analyze_connectivity(g);
    EXPECT_TRUE(report.mst.spanning);
    EXPECT_DOUBLE_EQ(report.mst.total_weight, 7.0);
    EXPECT_EQ(report.critical.num_bridges(), 1u);
    EXPECT_EQ(report.critical.articulation_points, nodes({2}));
}
