// graph/graph_io_stream.h - Runtime stream-based input and text reports
// Part of the gtopo graph toolkit (C++20)
//
// Reading: undirected edge lists in CSV form
//
//   u,v,weight          (optional header; first field u/from/source)
//   0,1,1.5
//   1,2,2.0
//
// Writing: human-readable reports for every result type.  Node handles
// are rendered through the graph's labels.
//
// Only <istream> and <ostream> are included, never <iostream>.

#ifndef GTOPO_GRAPH_IO_STREAM_H
#define GTOPO_GRAPH_IO_STREAM_H

#include "graph_io_detail.h"
#include "connectivity_analysis.h"
#include "critical_components.h"
#include "graph_adapters.h"
#include "graph_builder.h"
#include "minimum_spanning_tree.h"
#include "shortest_path.h"
#include "simulation.h"
#include "slo.h"
#include "weighted_graph.h"

#include <cstddef>
#include <ios>
#include <iomanip>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gtopo::graph::io {

// =============================================================================
// Runtime I/O: reading
// =============================================================================

/// Read "u,v,weight" rows.  Blank lines are ignored; a header row is
/// detected when the first non-blank row starts with u, from or source
/// (case-insensitive).  Extra columns are ignored.
[[nodiscard]] inline std::vector<connectivity_edge>
read_connectivity_edges(std::istream& is) {
    std::vector<connectivity_edge> edges;
    std::string line;
    std::size_t line_no = 0;
    bool first_row = true;

    while (std::getline(is, line)) {
        ++line_no;
        auto const sv = detail::trim(line);
        if (sv.empty()) continue;

        auto const fields = detail::split(sv, ',');
        if (first_row) {
            first_row = false;
            auto const head = detail::trim(fields[0]);
            if (detail::iequals(head, "u") || detail::iequals(head, "from") ||
                detail::iequals(head, "source")) {
                continue;
            }
        }
        if (fields.size() < 3) {
            throw std::runtime_error("read_connectivity_edges: line " +
                std::to_string(line_no) + ": expected u,v,weight");
        }
        edges.push_back(connectivity_edge{
            detail::parse_uint(fields[0], "read_connectivity_edges"),
            detail::parse_uint(fields[1], "read_connectivity_edges"),
            detail::parse_double(fields[2], "read_connectivity_edges")});
    }
    return edges;
}

/// Read a connectivity graph.  Node set is 0..max id referenced.
/// Throws std::runtime_error on malformed rows, graph_error on invalid
/// edges (self loop, negative weight, duplicate under reject).
[[nodiscard]] inline connectivity_graph
read_connectivity_csv(std::istream& is,
                      parallel_edges parallel = parallel_edges::reject) {
    return make_connectivity_graph(read_connectivity_edges(is), parallel);
}

// =============================================================================
// Runtime I/O: text reports
// =============================================================================

namespace detail {

template<typename Label>
void write_route(std::ostream& os, weighted_graph<Label> const& g,
                 path_result const& p) {
    for (std::size_t i = 0; i < p.nodes.size(); ++i) {
        if (i > 0) os << " -> ";
        os << gtopo::graph::detail::label_text(g.label(p.nodes[i]));
    }
}

template<typename Label>
void write_bottleneck(std::ostream& os, weighted_graph<Label> const& g,
                      path_result const& p) {
    if (!p.bottleneck) return;
    os << "  Bottleneck: "
       << gtopo::graph::detail::label_text(g.label(p.bottleneck->source)) << " -> "
       << gtopo::graph::detail::label_text(g.label(p.bottleneck->target))
       << " (" << p.bottleneck->weight << "ms)\n";
}

template<typename Label>
void write_edge(std::ostream& os, weighted_graph<Label> const& g,
                edge_record const& e) {
    os << gtopo::graph::detail::label_text(g.label(e.source)) << " -- "
       << gtopo::graph::detail::label_text(g.label(e.target));
}

} // namespace detail

/// Shortest path report.
template<typename Label>
void write(std::ostream& os, weighted_graph<Label> const& g, path_result const& p) {
    if (!p.found) {
        os << "No path from "
           << gtopo::graph::detail::label_text(g.label(p.source)) << " to "
           << gtopo::graph::detail::label_text(g.label(p.target)) << '\n';
        return;
    }
    os << "Shortest Path:\n  Route: ";
    detail::write_route(os, g, p);
    os << "\n  Total Cost: " << p.total_weight << "ms\n";
    detail::write_bottleneck(os, g, p);
}

/// SLO report.
template<typename Label>
void write(std::ostream& os, weighted_graph<Label> const& g, slo_result const& r) {
    os << "SLO Check:\n";
    if (r.status == slo_status::no_path) {
        os << "  Route: none\n"
           << "  Max Allowed: " << r.threshold << "ms\n"
           << "  Status: " << to_string(r.status) << '\n';
        return;
    }
    os << "  Route: ";
    detail::write_route(os, g, r.path);
    os << "\n  Actual Latency: " << r.measured << "ms\n"
       << "  Max Allowed: " << r.threshold << "ms\n"
       << "  Status: " << to_string(r.status) << '\n';
    detail::write_bottleneck(os, g, r.path);
}

/// Simulation report.  Both paths are labelled with g; simulation keeps
/// node handles stable, so this is valid for the modified path too.
template<typename Label>
void write(std::ostream& os, weighted_graph<Label> const& g,
           simulation_result const& r) {
    os << "Simulation Results:\n\nOriginal Path:\n";
    if (!r.original.found) {
        os << "  " << to_string(r.status) << '\n';
        return;
    }
    os << "  Route: ";
    detail::write_route(os, g, r.original);
    os << "\n  Latency: " << r.original.total_weight << "ms\n";
    detail::write_bottleneck(os, g, r.original);

    os << "\nModified Path:\n";
    if (!r.modified.found) {
        os << "  " << to_string(r.status) << '\n';
        return;
    }
    os << "  Route: ";
    detail::write_route(os, g, r.modified);
    os << "\n  Latency: " << r.modified.total_weight << "ms\n";
    detail::write_bottleneck(os, g, r.modified);

    os << "\nImpact: ";
    if (r.latency_change > 0.0) {
        os << '+' << r.latency_change << "ms (slower)\n";
    } else if (r.latency_change < 0.0) {
        os << r.latency_change << "ms (faster)\n";
    } else {
        os << "no change\n";
    }
}

/// Spanning tree report.
template<typename Label>
void write(std::ostream& os, weighted_graph<Label> const& g, mst_result const& r) {
    auto const flags = os.flags();
    auto const precision = os.precision();
    os << std::fixed << std::setprecision(2);

    os << (r.spanning ? "Minimum Spanning Tree (" : "Minimum Spanning Forest (")
       << r.algorithm << ")\n"
       << "  Total Weight: " << r.total_weight << '\n'
       << "  Edges: " << r.num_edges() << '\n';
    if (!r.spanning) {
        os << "  Components: " << r.component_count << " (graph is not connected)\n";
    }
    os << "\nEdges:\n";
    for (auto const& e : r.edges) {
        os << "  ";
        detail::write_edge(os, g, e);
        os << " (weight: " << e.weight << ")\n";
    }

    os.flags(flags);
    os.precision(precision);
}

/// Critical components report.
template<typename Label>
void write(std::ostream& os, weighted_graph<Label> const& g,
           critical_result const& r) {
    os << "Critical Components Analysis\n"
       << "  Bridges: " << r.num_bridges() << '\n'
       << "  Articulation Points: " << r.num_articulation_points() << '\n';

    if (!r.bridges.empty()) {
        os << "\nBridges (critical edges):\n";
        for (auto const& e : r.bridges) {
            os << "  ";
            detail::write_edge(os, g, e);
            os << '\n';
        }
    }
    if (!r.articulation_points.empty()) {
        os << "\nArticulation Points (critical nodes):\n";
        for (auto const n : r.articulation_points) {
            os << "  " << gtopo::graph::detail::label_text(g.label(n)) << '\n';
        }
    }
}

/// Full connectivity report.
template<typename Label>
void write(std::ostream& os, weighted_graph<Label> const& g,
           connectivity_report const& r) {
    os << "=== Full Connectivity Analysis ===\n\n";
    write(os, g, r.mst);
    os << '\n';
    write(os, g, r.critical);
}

} // namespace gtopo::graph::io

#endif // GTOPO_GRAPH_IO_STREAM_H
