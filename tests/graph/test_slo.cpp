// tests/graph/test_slo.cpp
// Tests for check_slo and exit_status_for.

#include "gtopo/graph/slo.h"
#include "gtopo/graph/exit_status.h"
#include "gtopo/graph/graph_adapters.h"
#include <gtest/gtest.h>

namespace gg = gtopo::graph;

namespace {

gg::service_graph api_topology() {
    return gg::make_service_graph(
        {"api", "auth", "db", "cache", "island"},
        {{"api", "auth", 5.0},
         {"auth", "db", 3.0},
         {"api", "cache", 2.0},
         {"cache", "db", 10.0}});
}

} // namespace

TEST(Slo, EqualToThresholdPasses) {
    auto const g = api_topology();
    auto const r = gg::check_slo(g, "api", "db", 8.0);
    EXPECT_EQ(r.status, gg::slo_status::met);
    EXPECT_TRUE(r.met());
    EXPECT_DOUBLE_EQ(r.measured, 8.0);
    EXPECT_DOUBLE_EQ(r.threshold, 8.0);
    EXPECT_TRUE(r.path.found);
    EXPECT_EQ(gg::exit_status_for(r), gg::exit_status::success);
}

TEST(Slo, AboveThresholdFails) {
    auto const g = api_topology();
    auto const r = gg::check_slo(g, "api", "db", 7.0);
    EXPECT_EQ(r.status, gg::slo_status::violated);
    EXPECT_FALSE(r.met());
    EXPECT_DOUBLE_EQ(r.measured, 8.0);
    EXPECT_EQ(r.path.nodes.size(), 3u);
    EXPECT_EQ(gg::exit_status_for(r), gg::exit_status::slo_violated);
    EXPECT_EQ(gg::to_int(gg::exit_status_for(r)), 3);
}

TEST(Slo, NoPathIsDistinctFromViolation) {
    auto const g = api_topology();
    auto const r = gg::check_slo(g, "api", "island", 1000.0);
    EXPECT_EQ(r.status, gg::slo_status::no_path);
    EXPECT_FALSE(r.met());
    EXPECT_FALSE(r.path.found);
    EXPECT_EQ(gg::exit_status_for(r), gg::exit_status::no_path);
    EXPECT_EQ(gg::to_int(gg::exit_status_for(r)), 2);
}

TEST(Slo, LengthOverflowIsNotReportedAsNoPath) {
    auto const g = gg::make_service_graph({"a", "b", "c"},
        {{"a", "b", 1e308}, {"b", "c", 1e308}});
    try {
        (void)gg::check_slo(g, "a", "c", 10.0);
        FAIL() << "expected graph_error";
    } catch (gg::graph_error const& e) {
        EXPECT_EQ(e.kind(), gg::error_kind::invalid_weight);
    }
}

TEST(Slo, StatusText) {
    EXPECT_EQ(gg::to_string(gg::slo_status::met), "PASS");
    EXPECT_EQ(gg::to_string(gg::slo_status::violated), "FAIL");
    EXPECT_EQ(gg::to_string(gg::slo_status::no_path), "NO PATH");
}

TEST(Slo, UnknownNodeThrows) {
    auto const g = api_topology();
    EXPECT_THROW((void)gg::check_slo(g, "api", "ghost", 10.0), gg::graph_error);
}

TEST(ExitStatus, PathMapping) {
    auto const g = api_topology();
    EXPECT_EQ(gg::exit_status_for(gg::shortest_path(g, "api", "db")),
              gg::exit_status::success);
    EXPECT_EQ(gg::exit_status_for(gg::shortest_path(g, "db", "api")),
              gg::exit_status::no_path);
    EXPECT_EQ(gg::to_int(gg::exit_status::invalid_input), 4);
}
