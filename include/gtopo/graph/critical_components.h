// graph/algorithms/critical_components.h - Bridges and articulation points
// Part of the gtopo graph toolkit (C++20)
//
// ALGORITHM: Iterative Tarjan low-link DFS.
// Complexity: O(V + E)
// Determinism: roots taken in node_id order, neighbours in adjacency
// order, so discovery indices are reproducible.
//
// DESIGN RATIONALE:
// Iterative (not recursive) because DFS depth equals the longest tree
// path, and a path-shaped input of 10^5 nodes would overflow the native
// call stack.  An explicit stack of frames (node, edge used to enter it,
// next adjacency position, child count) reproduces the recursive
// discovery order and low-link updates exactly.
//
// RULES:
//   low[u] = min(disc[u], disc[w] for back edges u-w, low[c] for children c)
//   tree edge (p, c) is a bridge        iff low[c] >  disc[p]
//   non-root p is an articulation point iff some child c has low[c] >= disc[p]
//   a DFS root is an articulation point iff it has more than one child
//
// PARALLEL EDGES:
// Only the exact edge used to enter a node (matched by edge_id) is
// ignored when scanning its neighbours.  A second edge to the parent is
// a genuine back edge, so a doubled link is correctly NOT a bridge.
//
// Disconnected graphs are handled by restarting the DFS from every
// unvisited node (a DFS forest).

#ifndef GTOPO_GRAPH_CRITICAL_COMPONENTS_H
#define GTOPO_GRAPH_CRITICAL_COMPONENTS_H

#include "graph_concepts.h"
#include "graph_error.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <utility>
#include <vector>

namespace gtopo::graph {

/// Result of critical component detection.
///
/// - bridges: critical edges, oriented source < target, sorted
/// - articulation_points: critical nodes, ascending
struct critical_result {
    std::vector<edge_record> bridges;
    std::vector<node_id> articulation_points;

    [[nodiscard]] std::size_t num_bridges() const noexcept { return bridges.size(); }
    [[nodiscard]] std::size_t num_articulation_points() const noexcept {
        return articulation_points.size();
    }
};

/// Bridges and articulation points of an undirected graph.
///
/// Throws graph_error(requires_undirected) for a directed graph.
///
/// Example:
/// ```cpp
/// // 0 - 1 - 2 : both edges are bridges, node 1 is an articulation point
/// auto g = make_connectivity_graph({{0, 1, 1.0}, {1, 2, 1.0}});
/// auto crit = find_critical(g);
/// assert(crit.num_bridges() == 2);
/// assert(crit.articulation_points == std::vector{node_id{1}});
/// ```
template<edge_listed_graph G>
[[nodiscard]] critical_result find_critical(G const& g) {
    if (g.is_directed())
        throw graph_error(error_kind::requires_undirected,
            "find_critical: graph is directed");

    constexpr std::size_t UNVISITED = std::numeric_limits<std::size_t>::max();

    auto const V = g.node_count();
    std::vector<std::size_t> disc(V, UNVISITED);
    std::vector<std::size_t> low(V, 0);
    std::vector<bool> articulation(V, false);
    std::vector<edge_id> bridge_ids;

    // DFS call stack frame.
    struct frame {
        std::size_t node;
        edge_id     entry_edge;   // edge from the DFS parent (invalid_edge for roots)
        std::size_t next;         // next adjacency position to scan
        std::size_t children;     // DFS children discovered so far
    };
    std::vector<frame> call_stack;

    std::size_t next_index = 0;

    for (std::size_t start = 0; start < V; ++start) {
        if (disc[start] != UNVISITED) {
            continue;
        }

        disc[start] = next_index;
        low[start] = next_index;
        next_index++;
        call_stack.push_back(frame{start, invalid_edge, 0, 0});

        while (!call_stack.empty()) {
            auto& top = call_stack.back();
            auto const u = top.node;
            auto const range = g.out_edges(node_id{static_cast<std::uint32_t>(u)});

            if (top.next < range.size()) {
                auto const e = *std::next(range.begin(),
                    static_cast<std::ptrdiff_t>(top.next));
                top.next++;

                if (e.eid == top.entry_edge) {
                    continue;  // the tree edge back to the parent
                }

                auto const w = to_index(e.target);
                if (disc[w] == UNVISITED) {
                    // Tree edge: "recurse" into w.
                    top.children++;
                    disc[w] = next_index;
                    low[w] = next_index;
                    next_index++;
                    call_stack.push_back(frame{w, e.eid, 0, 0});
                } else if (disc[w] < low[u]) {
                    // Back edge.
                    low[u] = disc[w];
                }
            } else {
                // All neighbours processed: fold into the parent.
                auto const done = top;
                call_stack.pop_back();

                if (call_stack.empty()) {
                    if (done.children > 1) {
                        articulation[done.node] = true;
                    }
                    continue;
                }

                auto const p = call_stack.back().node;
                if (low[done.node] < low[p]) {
                    low[p] = low[done.node];
                }
                if (low[done.node] > disc[p]) {
                    bridge_ids.push_back(done.entry_edge);
                }
                auto const parent_is_root = call_stack.size() == 1;
                if (!parent_is_root && low[done.node] >= disc[p]) {
                    articulation[p] = true;
                }
            }
        }
    }

    critical_result result;
    result.bridges.reserve(bridge_ids.size());
    for (auto const eid : bridge_ids) {
        auto e = g.edge(eid);
        if (e.target < e.source) {
            std::swap(e.source, e.target);
        }
        result.bridges.push_back(e);
    }
    std::sort(result.bridges.begin(), result.bridges.end(),
        [](edge_record const& a, edge_record const& b) {
            if (a.source != b.source) return a.source < b.source;
            return a.target < b.target;
        });

    for (std::size_t i = 0; i < V; ++i) {
        if (articulation[i]) {
            result.articulation_points.push_back(node_id{static_cast<std::uint32_t>(i)});
        }
    }
    return result;
}

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_CRITICAL_COMPONENTS_H
