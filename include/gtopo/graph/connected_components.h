// graph/algorithms/connected_components.h - Connected components
// Part of the gtopo graph toolkit (C++20)
//
// ALGORITHM: Union-Find with path compression and union by rank.
// Complexity: O(V + E · alpha(V)) ~ O(V + E) (amortised)
//
// SEMANTICS: Weakly connected components -- edge direction is ignored.
//
// Union-Find (not BFS/DFS) because it works straight off the logical
// edge list, needs no recursion or stack management, and the same
// disjoint_set drives Kruskal.
//
// The filtered overload excludes edges and/or nodes without building a
// new graph.  It is the independent check used to confirm bridges and
// articulation points: remove the candidate, count components.

#ifndef GTOPO_GRAPH_CONNECTED_COMPONENTS_H
#define GTOPO_GRAPH_CONNECTED_COMPONENTS_H

#include "graph_concepts.h"
#include "union_find.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace gtopo::graph {

/// Result of connected components analysis.
///
/// - component_of[n]: component id for node n (0-based, dense), or
///   no_component for an excluded node
/// - component_count: total number of connected components
///
/// Component ids are assigned in ascending order of the smallest
/// node_id in each component.
struct components_result {
    static constexpr std::uint32_t no_component =
        std::numeric_limits<std::uint32_t>::max();

    std::vector<std::uint32_t> component_of;
    std::size_t component_count = 0;
};

/// Connected components, skipping edges where skip_edge(edge_id) and
/// nodes where skip_node(node_id) return true.  A skipped node also
/// removes its incident edges.
template<edge_listed_graph G, typename EdgeFilter, typename NodeFilter>
[[nodiscard]] components_result
connected_components(G const& g, EdgeFilter skip_edge, NodeFilter skip_node) {
    components_result result;
    auto const V = g.node_count();
    result.component_of.assign(V, components_result::no_component);

    disjoint_set ds(V);
    for (std::size_t i = 0; i < g.edge_count(); ++i) {
        auto const eid = edge_id{i};
        if (skip_edge(eid)) continue;
        auto const& e = g.edge(eid);
        if (skip_node(e.source) || skip_node(e.target)) continue;
        ds.unite(to_index(e.source), to_index(e.target));
    }

    // Renumber components to dense [0, component_count).
    constexpr auto UNASSIGNED = components_result::no_component;
    std::vector<std::uint32_t> root_to_comp(V, UNASSIGNED);

    std::uint32_t next_comp = 0;
    for (std::size_t i = 0; i < V; ++i) {
        if (skip_node(node_id{static_cast<std::uint32_t>(i)})) continue;
        auto const root = ds.find(i);
        if (root_to_comp[root] == UNASSIGNED) {
            root_to_comp[root] = next_comp;
            next_comp++;
        }
        result.component_of[i] = root_to_comp[root];
    }

    result.component_count = static_cast<std::size_t>(next_comp);
    return result;
}

/// Connected components of the whole graph.
///
/// Example:
/// ```cpp
/// auto g = make_connectivity_graph({{0, 1, 1.0}, {2, 3, 1.0}});
/// auto cc = connected_components(g);
/// assert(cc.component_count == 2);
/// ```
template<edge_listed_graph G>
[[nodiscard]] components_result connected_components(G const& g) {
    return connected_components(g,
        [](edge_id) { return false; },
        [](node_id) { return false; });
}

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_CONNECTED_COMPONENTS_H
