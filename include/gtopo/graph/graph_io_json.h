// graph/graph_io_json.h - JSON service graphs and JSON reports
// Part of the gtopo graph toolkit (C++20)
//
// Reading: directed service graphs
//
//   {
//     "nodes": ["api", "auth", "db"],
//     "edges": [ { "from": "api", "to": "auth", "latency_ms": 5.2 } ]
//   }
//
// Writing: one JSON document per result type.  Node handles are
// rendered through the graph's labels; a missing value (no path, no
// bottleneck, no latency change) is null.
//
// Built on nlohmann::json.  Parse and schema errors surface as
// std::runtime_error, graph errors as graph_error.

#ifndef GTOPO_GRAPH_IO_JSON_H
#define GTOPO_GRAPH_IO_JSON_H

#include "connectivity_analysis.h"
#include "critical_components.h"
#include "graph_adapters.h"
#include "minimum_spanning_tree.h"
#include "shortest_path.h"
#include "simulation.h"
#include "slo.h"
#include "weighted_graph.h"

#include <nlohmann/json.hpp>

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace gtopo::graph::io {

// =============================================================================
// Reading
// =============================================================================

/// Read a service graph.  Throws std::runtime_error for malformed JSON or
/// a missing/mistyped field, graph_error for invalid graph content
/// (duplicate node, unknown endpoint, self loop, bad latency).
[[nodiscard]] inline service_graph read_service_json(std::istream& is) {
    std::vector<std::string> nodes;
    std::vector<service_edge> edges;
    try {
        auto const doc = nlohmann::json::parse(is);
        nodes = doc.at("nodes").get<std::vector<std::string>>();
        for (auto const& e : doc.at("edges")) {
            edges.push_back(service_edge{
                e.at("from").get<std::string>(),
                e.at("to").get<std::string>(),
                e.at("latency_ms").get<double>()});
        }
    } catch (nlohmann::json::exception const& e) {
        throw std::runtime_error(std::string("read_service_json: ") + e.what());
    }
    return make_service_graph(nodes, edges);
}

// =============================================================================
// Result documents
// =============================================================================

/// {"from", "to", "path", "total_latency_ms", "bottleneck"}
template<typename Label>
[[nodiscard]] nlohmann::json
as_json(weighted_graph<Label> const& g, path_result const& p) {
    nlohmann::json j;
    j["from"] = g.label(p.source);
    j["to"] = g.label(p.target);

    auto route = nlohmann::json::array();
    for (auto const n : p.nodes) {
        route.push_back(g.label(n));
    }
    j["path"] = std::move(route);
    j["total_latency_ms"] = p.found ? nlohmann::json(p.total_weight) : nlohmann::json();

    if (p.bottleneck) {
        j["bottleneck"] = {
            {"from", g.label(p.bottleneck->source)},
            {"to", g.label(p.bottleneck->target)},
            {"latency_ms", p.bottleneck->weight},
        };
    } else {
        j["bottleneck"] = nullptr;
    }
    return j;
}

template<typename Label>
[[nodiscard]] nlohmann::json
as_json(weighted_graph<Label> const& g, slo_result const& r) {
    return {
        {"slo_met", r.met()},
        {"status", std::string(to_string(r.status))},
        {"max_latency_ms", r.threshold},
        {"actual_latency_ms",
            r.status == slo_status::no_path ? nlohmann::json() : nlohmann::json(r.measured)},
        {"path", as_json(g, r.path)},
    };
}

/// The modified path is labelled with g; simulation keeps node handles.
template<typename Label>
[[nodiscard]] nlohmann::json
as_json(weighted_graph<Label> const& g, simulation_result const& r) {
    auto const compared = r.status == simulation_status::compared;
    return {
        {"status", std::string(to_string(r.status))},
        {"original", as_json(g, r.original)},
        {"modified", r.status == simulation_status::original_unreachable
            ? nlohmann::json() : as_json(g, r.modified)},
        {"latency_change_ms", compared ? nlohmann::json(r.latency_change) : nlohmann::json()},
    };
}

template<typename Label>
[[nodiscard]] nlohmann::json
as_json(weighted_graph<Label> const& g, mst_result const& r) {
    auto edges = nlohmann::json::array();
    for (auto const& e : r.edges) {
        edges.push_back({
            {"u", g.label(e.source)},
            {"v", g.label(e.target)},
            {"weight", e.weight},
        });
    }
    return {
        {"algorithm", r.algorithm},
        {"total_weight", r.total_weight},
        {"num_edges", r.num_edges()},
        {"spanning", r.spanning},
        {"component_count", r.component_count},
        {"edges", std::move(edges)},
    };
}

template<typename Label>
[[nodiscard]] nlohmann::json
as_json(weighted_graph<Label> const& g, critical_result const& r) {
    auto bridges = nlohmann::json::array();
    for (auto const& e : r.bridges) {
        bridges.push_back(nlohmann::json::array({g.label(e.source), g.label(e.target)}));
    }
    auto points = nlohmann::json::array();
    for (auto const n : r.articulation_points) {
        points.push_back(g.label(n));
    }
    return {
        {"num_bridges", r.num_bridges()},
        {"num_articulation_points", r.num_articulation_points()},
        {"bridges", std::move(bridges)},
        {"articulation_points", std::move(points)},
    };
}

template<typename Label>
[[nodiscard]] nlohmann::json
as_json(weighted_graph<Label> const& g, connectivity_report const& r) {
    return {
        {"mst", as_json(g, r.mst)},
        {"critical", as_json(g, r.critical)},
    };
}

/// Pretty-print any result as JSON, followed by a newline.
template<typename Label, typename Result>
void write_json(std::ostream& os, weighted_graph<Label> const& g, Result const& r) {
    os << as_json(g, r).dump(2) << '\n';
}

} // namespace gtopo::graph::io

#endif // GTOPO_GRAPH_IO_JSON_H
