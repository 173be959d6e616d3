// graph/construction/graph_adapters.h - The two tool-facing graph shapes
// Part of the gtopo graph toolkit (C++20)
//
// Both shapes are the same generic weighted_graph; they differ only in
// label type and build options:
//
//   service_graph       std::string labels, directed, multi-edges allowed
//                       (service maps: edges carry latency_ms)
//   connectivity_graph  std::uint32_t labels, undirected, multi-edges
//                       rejected by default (edges carry weight)
//
// Parsers below the core boundary produce the plain edge structs and
// call these factories; validation errors surface as graph_error.

#ifndef GTOPO_GRAPH_ADAPTERS_H
#define GTOPO_GRAPH_ADAPTERS_H

#include "capacity_guard.h"
#include "capacity_types.h"
#include "graph_builder.h"
#include "graph_concepts.h"
#include "weighted_graph.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gtopo::graph {

using service_graph = weighted_graph<std::string>;
using connectivity_graph = weighted_graph<std::uint32_t>;

/// Directed service dependency with its latency.
struct service_edge {
    std::string from;
    std::string to;
    double      latency_ms = 0.0;
};

/// Undirected link between integer-labelled nodes.
struct connectivity_edge {
    std::uint32_t u = 0;
    std::uint32_t v = 0;
    double        weight = 0.0;
};

/// Build a service graph from a node list and directed edges.
///
/// Throws graph_error: duplicate_node, unknown_node, self_loop,
/// invalid_weight.
template<typename Cap = cap::network>
[[nodiscard]] service_graph
make_service_graph(std::vector<std::string> const& nodes,
                   std::vector<service_edge> const& edges)
{
    weighted_graph_builder<std::string, Cap> b(directed_options);
    for (auto const& n : nodes) {
        (void)b.add_node(n);
    }
    for (auto const& e : edges) {
        b.add_edge(e.from, e.to, e.latency_ms);
    }
    return b.finalise();
}

/// Build a connectivity graph over nodes 0..node_count-1.
///
/// Throws std::length_error if node_count exceeds Cap::max_v, before any
/// node is created.  Edges naming a node >= node_count are unknown_node
/// errors.
template<typename Cap = cap::network>
[[nodiscard]] connectivity_graph
make_connectivity_graph(std::size_t node_count,
                        std::vector<connectivity_edge> const& edges,
                        parallel_edges parallel = parallel_edges::reject)
{
    require_capacity(node_count, Cap::max_v,
        "make_connectivity_graph: node count exceeds MaxV");
    weighted_graph_builder<std::uint32_t, Cap> b(
        build_options{directedness::undirected, parallel});
    for (std::size_t i = 0; i < node_count; ++i) {
        (void)b.add_node(static_cast<std::uint32_t>(i));
    }
    for (auto const& e : edges) {
        b.add_edge(e.u, e.v, e.weight);
    }
    return b.finalise();
}

/// Build a connectivity graph sized to the largest node id referenced,
/// so the node set is 0..max_id (ids need not be contiguous).
template<typename Cap = cap::network>
[[nodiscard]] connectivity_graph
make_connectivity_graph(std::vector<connectivity_edge> const& edges,
                        parallel_edges parallel = parallel_edges::reject)
{
    std::size_t node_count = 0;
    for (auto const& e : edges) {
        node_count = std::max(node_count,
            static_cast<std::size_t>(std::max(e.u, e.v)) + 1);
    }
    return make_connectivity_graph<Cap>(node_count, edges, parallel);
}

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_ADAPTERS_H
