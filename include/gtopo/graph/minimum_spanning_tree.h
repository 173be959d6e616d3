// graph/algorithms/minimum_spanning_tree.h - Kruskal minimum spanning tree
// Part of the gtopo graph toolkit (C++20)
//
// ALGORITHM: Kruskal over a disjoint_set.
// Complexity: O(E log E)
//
// ORDERING:
// Edges are sorted by (weight, min endpoint, max endpoint, edge_id).
// Endpoints are compared as node_id, i.e. in node insertion order, which
// for connectivity graphs is numeric label order.  The full key makes
// the selected edge sequence reproducible for any input order.
//
// DISCONNECTED INPUT:
// The result is then a minimum spanning forest.  spanning is false and
// component_count > 1; num_edges() == node_count - component_count.
// Callers decide whether a forest is acceptable.

#ifndef GTOPO_GRAPH_MINIMUM_SPANNING_TREE_H
#define GTOPO_GRAPH_MINIMUM_SPANNING_TREE_H

#include "graph_concepts.h"
#include "graph_error.h"
#include "union_find.h"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <tuple>
#include <string>
#include <utility>
#include <vector>

namespace gtopo::graph {

/// Result of a spanning tree computation.
///
/// - edges: selected edges, in acceptance order (ascending weight)
/// - spanning: true iff the graph is connected (edges form one tree)
/// - component_count: number of trees in the forest
struct mst_result {
    std::string algorithm = "kruskal";
    std::vector<edge_record> edges;
    double total_weight = 0.0;
    std::size_t component_count = 0;
    bool spanning = false;

    [[nodiscard]] std::size_t num_edges() const noexcept { return edges.size(); }
};

/// Minimum spanning tree (or forest) via Kruskal's algorithm.
///
/// Throws graph_error(requires_undirected) for a directed graph.
///
/// Example:
/// ```cpp
/// auto g = make_connectivity_graph({{0, 1, 1.0}, {1, 2, 2.0}, {2, 0, 3.0}});
/// auto mst = minimum_spanning_tree(g);
/// assert(mst.spanning && mst.total_weight == 3.0);
/// ```
template<edge_listed_graph G>
[[nodiscard]] mst_result minimum_spanning_tree(G const& g) {
    if (g.is_directed())
        throw graph_error(error_kind::requires_undirected,
            "minimum_spanning_tree: graph is directed");

    mst_result result;
    auto const V = g.node_count();
    auto const E = g.edge_count();

    std::vector<std::size_t> order(E);
    std::iota(order.begin(), order.end(), std::size_t{0});

    auto key = [&](std::size_t i) {
        auto const& e = g.edge(edge_id{i});
        auto const lo = std::min(e.source, e.target);
        auto const hi = std::max(e.source, e.target);
        return std::make_tuple(e.weight, lo, hi, i);
    };
    std::sort(order.begin(), order.end(),
        [&](std::size_t a, std::size_t b) { return key(a) < key(b); });

    disjoint_set ds(V);
    auto const wanted = V == 0 ? std::size_t{0} : V - 1;
    for (auto const i : order) {
        if (result.edges.size() == wanted) break;
        auto const& e = g.edge(edge_id{i});
        if (ds.unite(to_index(e.source), to_index(e.target))) {
            result.edges.push_back(e);
            result.total_weight += e.weight;
        }
    }

    result.component_count = ds.set_count();
    result.spanning = result.component_count <= 1;
    return result;
}

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_MINIMUM_SPANNING_TREE_H
