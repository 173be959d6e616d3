// tests/graph/test_graph_io.cpp
// Tests for the I/O layer: CSV edge lists, override/drop specs, reports.
//
// Validates:
//   1. CSV with and without header, blank lines, CRLF
//   2. Malformed CSV rows and invalid edges
//   3. Override and drop spec parsing, including errors
//   4. Text reports contain the expected lines

#include "gtopo/graph/graph_io.h"
#include "gtopo/graph/graph.h"
#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

namespace gg = gtopo::graph;
namespace io = gtopo::graph::io;
using gg::node_id;

namespace {

bool contains(std::string const& haystack, std::string const& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// =============================================================================
// 1. CSV reading
// =============================================================================

TEST(GraphIO, CsvWithHeader) {
    std::istringstream in("u,v,weight\n0,1,1.5\n1,2,2\n");
    auto const g = io::read_connectivity_csv(in);
    EXPECT_FALSE(g.is_directed());
    EXPECT_EQ(g.node_count(), 3u);
    EXPECT_EQ(g.edge_count(), 2u);
    EXPECT_DOUBLE_EQ(g.edges()[0].weight, 1.5);
}

TEST(GraphIO, CsvHeaderVariants) {
    for (auto const* text : {"From,To,W\n0,1,1\n", "SOURCE,target,cost\n0,1,1\n"}) {
        std::istringstream in(text);
        EXPECT_EQ(io::read_connectivity_csv(in).edge_count(), 1u) << text;
    }
}

TEST(GraphIO, CsvWithoutHeader) {
    std::istringstream in("0,1,1\n\n  1 , 3 , 0.25 \r\n");
    auto const g = io::read_connectivity_csv(in);
    EXPECT_EQ(g.node_count(), 4u);
    EXPECT_EQ(g.edge_count(), 2u);
    EXPECT_DOUBLE_EQ(g.edges()[1].weight, 0.25);
}

TEST(GraphIO, EmptyCsvGivesEmptyGraph) {
    std::istringstream in("u,v,weight\n");
    auto const g = io::read_connectivity_csv(in);
    EXPECT_TRUE(g.empty());
}

// =============================================================================
// 2. Malformed CSV
// =============================================================================

TEST(GraphIO, CsvTooFewFields) {
    std::istringstream in("0,1,1\n2,3\n");
    try {
        (void)io::read_connectivity_csv(in);
        FAIL() << "expected runtime_error";
    } catch (std::runtime_error const& e) {
        EXPECT_TRUE(contains(e.what(), "line 2"));
    }
}

TEST(GraphIO, CsvBadNumbers) {
    std::istringstream bad_id("a,1,1\n");
    EXPECT_THROW((void)io::read_connectivity_csv(bad_id), std::runtime_error);
    std::istringstream negative_id("-1,1,1\n");
    EXPECT_THROW((void)io::read_connectivity_csv(negative_id), std::runtime_error);
    std::istringstream bad_weight("0,1,fast\n");
    EXPECT_THROW((void)io::read_connectivity_csv(bad_weight), std::runtime_error);
}

TEST(GraphIO, CsvHugeNodeIdExceedsCapacity) {
    std::istringstream in("0,4000000000,1\n");
    EXPECT_THROW((void)io::read_connectivity_csv(in), std::length_error);
}

TEST(GraphIO, CsvInvalidEdgesRejectedByBuilder) {
    std::istringstream loop("0,0,1\n");
    try {
        (void)io::read_connectivity_csv(loop);
        FAIL() << "expected graph_error";
    } catch (gg::graph_error const& e) {
        EXPECT_EQ(e.kind(), gg::error_kind::self_loop);
    }

    std::istringstream dup("0,1,1\n1,0,2\n");
    EXPECT_THROW((void)io::read_connectivity_csv(dup), gg::graph_error);

    std::istringstream dup_allowed("0,1,1\n1,0,2\n");
    EXPECT_EQ(io::read_connectivity_csv(dup_allowed, gg::parallel_edges::allow).edge_count(), 2u);

    std::istringstream negative("0,1,-3\n");
    EXPECT_THROW((void)io::read_connectivity_csv(negative), gg::graph_error);
}

// =============================================================================
// 3. Spec parsing
// =============================================================================

TEST(GraphIO, ParseOverrides) {
    auto const ov = io::parse_overrides("api:auth:100, auth:db:2.5");
    ASSERT_EQ(ov.size(), 2u);
    EXPECT_EQ(ov[0].source, "api");
    EXPECT_EQ(ov[0].target, "auth");
    EXPECT_DOUBLE_EQ(ov[0].weight, 100.0);
    EXPECT_DOUBLE_EQ(ov[1].weight, 2.5);
    EXPECT_TRUE(io::parse_overrides("").empty());
}

TEST(GraphIO, ParseOverridesRejectsMalformed) {
    EXPECT_THROW((void)io::parse_overrides("api:auth"), std::runtime_error);
    EXPECT_THROW((void)io::parse_overrides("api:auth:1:2"), std::runtime_error);
    EXPECT_THROW((void)io::parse_overrides("api:auth:slow"), std::runtime_error);
    EXPECT_THROW((void)io::parse_overrides(":auth:1"), std::runtime_error);
    EXPECT_THROW((void)io::parse_overrides("a:b:1,,c:d:2"), std::runtime_error);

    try {
        (void)io::parse_overrides("api-auth-5");
        FAIL() << "expected runtime_error";
    } catch (std::runtime_error const& e) {
        EXPECT_TRUE(contains(e.what(), "Expected 'from:to:weight'"));
    }
}

TEST(GraphIO, ParseDrops) {
    auto const d = io::parse_drops("api:auth,cache:db");
    ASSERT_EQ(d.size(), 2u);
    EXPECT_EQ(d[1].source, "cache");
    EXPECT_EQ(d[1].target, "db");
    EXPECT_THROW((void)io::parse_drops("api:auth:5"), std::runtime_error);
    EXPECT_THROW((void)io::parse_drops("api"), std::runtime_error);
}

TEST(GraphIO, RepeatedFlagsConcatenate) {
    auto const ov = io::parse_overrides(std::vector<std::string>{"a:b:1", "c:d:2,e:f:3"});
    EXPECT_EQ(ov.size(), 3u);
    auto const d = io::parse_drops(std::vector<std::string>{"a:b", "c:d"});
    EXPECT_EQ(d.size(), 2u);
}

TEST(GraphIO, NegativeOverrideParsesButSimulationRejects) {
    auto const g = gg::make_service_graph({"a", "b"}, {{"a", "b", 1.0}});
    auto const ov = io::parse_overrides("a:b:-4");
    ASSERT_EQ(ov.size(), 1u);
    EXPECT_THROW((void)gg::simulate(g, "a", "b", ov, {}), gg::graph_error);
}

// =============================================================================
// 4. Text reports
// =============================================================================

TEST(GraphIO, PathReport) {
    auto const g = gg::make_service_graph({"api", "auth", "db"},
        {{"api", "auth", 5.0}, {"auth", "db", 3.0}});
    std::ostringstream os;
    io::write(os, g, gg::shortest_path(g, "api", "db"));
    auto const text = os.str();
    EXPECT_TRUE(contains(text, "Shortest Path:"));
    EXPECT_TRUE(contains(text, "Route: api -> auth -> db"));
    EXPECT_TRUE(contains(text, "Total Cost: 8ms"));
    EXPECT_TRUE(contains(text, "Bottleneck: api -> auth (5ms)"));

    std::ostringstream none;
    io::write(none, g, gg::shortest_path(g, "db", "api"));
    EXPECT_TRUE(contains(none.str(), "No path from db to api"));
}

TEST(GraphIO, SloReport) {
    auto const g = gg::make_service_graph({"a", "b"}, {{"a", "b", 10.0}});
    std::ostringstream os;
    io::write(os, g, gg::check_slo(g, "a", "b", 5.0));
    EXPECT_TRUE(contains(os.str(), "Status: FAIL"));
    EXPECT_TRUE(contains(os.str(), "Actual Latency: 10ms"));
}

TEST(GraphIO, SimulationReport) {
    auto const g = gg::make_service_graph({"a", "b", "c"},
        {{"a", "b", 1.0}, {"b", "c", 1.0}, {"a", "c", 5.0}});
    std::ostringstream os;
    io::write(os, g, gg::simulate(g, "a", "c", {}, io::parse_drops("b:c")));
    EXPECT_TRUE(contains(os.str(), "Impact: +3ms (slower)"));

    std::ostringstream lost;
    io::write(lost, g, gg::simulate(g, "a", "c", {}, io::parse_drops("b:c,a:c")));
    EXPECT_TRUE(contains(lost.str(), "path no longer exists"));
}

TEST(GraphIO, ConnectivityReport) {
    std::istringstream in("u,v,weight\n0,1,1\n1,2,2\n0,2,3\n2,3,4\n");
    auto const g = io::read_connectivity_csv(in);
    std::ostringstream os;
    io::write(os, g, gg::analyze_connectivity(g));
    auto const text = os.str();
    EXPECT_TRUE(contains(text, "Minimum Spanning Tree (kruskal)"));
    EXPECT_TRUE(contains(text, "Total Weight: 7.00"));
    EXPECT_TRUE(contains(text, "Critical Components Analysis"));
    EXPECT_TRUE(contains(text, "  2 -- 3\n"));
    EXPECT_TRUE(contains(text, "Articulation Points: 1"));
}

TEST(GraphIO, ForestReportNamesComponents) {
    auto const g = gg::make_connectivity_graph(4, {{0, 1, 1.0}, {2, 3, 1.0}});
    std::ostringstream os;
    io::write(os, g, gg::minimum_spanning_tree(g));
    EXPECT_TRUE(contains(os.str(), "Minimum Spanning Forest"));
    EXPECT_TRUE(contains(os.str(), "Components: 2"));
}
