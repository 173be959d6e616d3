// graph/algorithms/shortest_path.h - Dijkstra shortest path with bottleneck
// Part of the gtopo graph toolkit (C++20)
//
// ALGORITHM: Dijkstra with an index-based binary min-heap.
// Complexity: O((V + E) log V)
//
// DESIGN RATIONALE:
// The binary heap is index-based: a position array tracks where each
// node sits in the heap, enabling O(log V) decrease-key via sift-up.
// The heap key is (dist, discovery order): among equal tentative
// distances the node discovered first is settled first, so results are
// deterministic for a fixed adjacency order.
//
// Relaxation is strict (<): the first predecessor edge that achieves a
// distance is kept.  The predecessor is recorded as an edge_id rather
// than a node so that, with parallel edges, the edge actually used is
// known when reconstructing the path and its bottleneck.
//
// All working state (dist, pred, heap, position, order) is local to the
// call.  Weights must be non-negative; weighted_graph_builder guarantees
// this for every graph it produces.

#ifndef GTOPO_GRAPH_SHORTEST_PATH_H
#define GTOPO_GRAPH_SHORTEST_PATH_H

#include "graph_concepts.h"
#include "graph_error.h"
#include "weighted_graph.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace gtopo::graph {

// =========================================================================
// Result types
// =========================================================================

/// Single-source shortest-path tree.
///
/// - dist[n]: shortest distance from source to n (INFINITY if unreachable)
/// - pred[n]: predecessor node of n (invalid_node if source or unreachable)
/// - pred_edge[n]: edge used to reach n (invalid_edge if source or unreachable)
/// - verified: true if verify_shortest_path has confirmed optimality
struct shortest_path_tree {
    std::vector<double>  dist;
    std::vector<node_id> pred;
    std::vector<edge_id> pred_edge;
    node_id source = invalid_node;
    bool verified = false;

    [[nodiscard]] bool reachable(node_id n) const noexcept {
        return n == source || pred[to_index(n)] != invalid_node;
    }
};

/// One hop of a path, with the weight of the edge actually taken.
struct path_edge {
    node_id source = invalid_node;
    node_id target = invalid_node;
    double  weight = 0.0;
    edge_id eid = invalid_edge;

    friend constexpr bool operator==(path_edge const&, path_edge const&) = default;
};

/// Result of a source-to-target query.
///
/// found == false means the target is unreachable from the source; that
/// is a normal outcome, not an error.  When found:
/// - nodes runs from source to target inclusive
/// - total_weight is the sum of the hop weights
/// - bottleneck is the heaviest hop (first on ties); empty when
///   source == target
struct path_result {
    bool found = false;
    node_id source = invalid_node;
    node_id target = invalid_node;
    std::vector<node_id> nodes;
    std::vector<path_edge> hops;
    double total_weight = 0.0;
    std::optional<path_edge> bottleneck;
};

// =========================================================================
// Verification
// =========================================================================

/// O(E) verification of shortest-path optimality.
///
/// Checks the triangle inequality: for every edge u->v with weight w,
///   dist[v] <= dist[u] + w
/// Also checks that dist[source] == 0 and predecessor consistency.
template<graph_queryable G>
[[nodiscard]] bool verify_shortest_path(G const& g, shortest_path_tree& tree) {
    constexpr double inf = std::numeric_limits<double>::infinity();
    auto const V = g.node_count();

    if (tree.dist[to_index(tree.source)] != 0.0) {
        tree.verified = false;
        return false;
    }

    for (std::size_t u = 0; u < V; ++u) {
        auto const uid = node_id{static_cast<std::uint32_t>(u)};
        auto const du = tree.dist[u];
        if (du == inf) continue;

        for (auto const& e : g.out_edges(uid)) {
            if (du + e.weight < tree.dist[to_index(e.target)] - 1e-12) {
                tree.verified = false;
                return false;
            }
        }
    }

    // pred[v] == u implies dist[v] == dist[u] + w(pred_edge[v]).
    for (std::size_t v = 0; v < V; ++v) {
        auto const p = tree.pred[v];
        if (p == invalid_node) continue;
        double w = inf;
        for (auto const& e : g.out_edges(p)) {
            if (e.eid == tree.pred_edge[v] && to_index(e.target) == v) {
                w = e.weight;
                break;
            }
        }
        auto const diff = tree.dist[v] - (tree.dist[to_index(p)] + w);
        if (diff < -1e-12 || diff > 1e-12) {
            tree.verified = false;
            return false;
        }
    }

    tree.verified = true;
    return true;
}

// =========================================================================
// Dijkstra's algorithm
// =========================================================================

/// Dijkstra's shortest path tree from a single source.
///
/// Throws graph_error(unknown_node) if source is not a node of g, and
/// graph_error(invalid_weight) if a path length overflows to infinity.
///
/// Example:
/// ```cpp
/// auto tree = dijkstra(g, g.node_of("api"));
/// double d = tree.dist[to_index(g.node_of("db"))];
/// ```
template<graph_queryable G>
[[nodiscard]] shortest_path_tree dijkstra(G const& g, node_id source) {
    constexpr double inf = std::numeric_limits<double>::infinity();
    constexpr std::size_t NOT_IN_HEAP = std::numeric_limits<std::size_t>::max();
    constexpr std::size_t UNDISCOVERED = std::numeric_limits<std::size_t>::max();

    if (!g.has_node(source))
        throw graph_error(error_kind::unknown_node,
            "dijkstra: source node_id not in graph");

    auto const V = g.node_count();
    shortest_path_tree tree;
    tree.source = source;
    tree.dist.assign(V, inf);
    tree.pred.assign(V, invalid_node);
    tree.pred_edge.assign(V, invalid_edge);
    tree.dist[to_index(source)] = 0.0;

    // =====================================================================
    // Index-based binary min-heap
    // =====================================================================
    //
    // heap[0..heap_size): node indices ordered by (dist, order).
    // pos[node]: index into heap[] where this node sits.
    // order[node]: discovery sequence number (first finite distance).

    std::vector<std::size_t> heap(V);
    std::vector<std::size_t> pos(V);
    std::vector<std::size_t> order(V, UNDISCOVERED);
    std::size_t heap_size = V;
    std::size_t next_order = 0;

    for (std::size_t i = 0; i < V; ++i) {
        heap[i] = i;
        pos[i] = i;
    }
    order[to_index(source)] = next_order++;

    auto less = [&](std::size_t a, std::size_t b) {
        if (tree.dist[a] != tree.dist[b]) return tree.dist[a] < tree.dist[b];
        return order[a] < order[b];
    };

    auto heap_swap = [&](std::size_t a, std::size_t b) {
        auto const na = heap[a];
        auto const nb = heap[b];
        heap[a] = nb;
        heap[b] = na;
        pos[na] = b;
        pos[nb] = a;
    };

    auto sift_up = [&](std::size_t i) {
        while (i > 0) {
            std::size_t parent = (i - 1) / 2;
            if (less(heap[i], heap[parent])) {
                heap_swap(i, parent);
                i = parent;
            } else {
                break;
            }
        }
    };

    auto sift_down = [&](std::size_t i) {
        while (true) {
            std::size_t smallest = i;
            std::size_t left = 2 * i + 1;
            std::size_t right = 2 * i + 2;
            if (left < heap_size && less(heap[left], heap[smallest])) {
                smallest = left;
            }
            if (right < heap_size && less(heap[right], heap[smallest])) {
                smallest = right;
            }
            if (smallest != i) {
                heap_swap(i, smallest);
                i = smallest;
            } else {
                break;
            }
        }
    };

    // Only the source has a finite key; a single sift_up builds the heap.
    sift_up(pos[to_index(source)]);

    while (heap_size > 0) {
        auto const u = heap[0];
        heap_swap(0, heap_size - 1);
        pos[u] = NOT_IN_HEAP;
        heap_size--;
        if (heap_size > 0) {
            sift_down(0);
        }

        auto const du = tree.dist[u];
        if (du == inf) {
            break;  // remaining nodes unreachable
        }

        auto const uid = node_id{static_cast<std::uint32_t>(u)};
        for (auto const& e : g.out_edges(uid)) {
            auto const v = to_index(e.target);
            if (pos[v] == NOT_IN_HEAP) continue;  // already settled
            auto const new_dist = du + e.weight;
            if (new_dist == inf)
                throw graph_error(error_kind::invalid_weight,
                    "dijkstra: path length overflows double");
            if (new_dist < tree.dist[v]) {
                tree.dist[v] = new_dist;
                tree.pred[v] = uid;
                tree.pred_edge[v] = e.eid;
                if (order[v] == UNDISCOVERED) {
                    order[v] = next_order++;
                }
                sift_up(pos[v]);
            }
        }
    }

    (void)verify_shortest_path(g, tree);
    return tree;
}

// =========================================================================
// Path reconstruction
// =========================================================================

/// Walk the predecessor edges back from target and assemble the path.
///
/// The bottleneck is the heaviest hop; on ties the hop closest to the
/// source wins.
template<graph_queryable G>
[[nodiscard]] path_result
extract_path(G const& g, shortest_path_tree const& tree, node_id target) {
    if (!g.has_node(target))
        throw graph_error(error_kind::unknown_node,
            "extract_path: target node_id not in graph");

    path_result r;
    r.source = tree.source;
    r.target = target;
    if (!tree.reachable(target)) {
        return r;
    }

    r.found = true;
    for (auto n = target; n != tree.source; n = tree.pred[to_index(n)]) {
        auto const p = tree.pred[to_index(n)];
        auto const eid = tree.pred_edge[to_index(n)];
        double w = 0.0;
        for (auto const& e : g.out_edges(p)) {
            if (e.eid == eid && e.target == n) {
                w = e.weight;
                break;
            }
        }
        r.hops.push_back(path_edge{p, n, w, eid});
    }
    std::reverse(r.hops.begin(), r.hops.end());

    r.nodes.reserve(r.hops.size() + 1);
    r.nodes.push_back(tree.source);
    for (auto const& h : r.hops) {
        r.nodes.push_back(h.target);
        r.total_weight += h.weight;
        if (!r.bottleneck || h.weight > r.bottleneck->weight) {
            r.bottleneck = h;
        }
    }
    return r;
}

/// Shortest path from source to target.
///
/// Throws graph_error(unknown_node) for a handle not in g.  An
/// unreachable target yields found == false.
template<graph_queryable G>
[[nodiscard]] path_result
shortest_path(G const& g, node_id source, node_id target) {
    if (!g.has_node(target))
        throw graph_error(error_kind::unknown_node,
            "shortest_path: target node_id not in graph");
    auto const tree = dijkstra(g, source);
    return extract_path(g, tree, target);
}

/// Label-level overload: resolves labels, then runs shortest_path.
template<typename Label>
[[nodiscard]] path_result
shortest_path(weighted_graph<Label> const& g,
              std::type_identity_t<Label> const& from,
              std::type_identity_t<Label> const& to)
{
    auto const s = g.node_of(from);
    auto const t = g.node_of(to);
    return shortest_path(g, s, t);
}

/// Labels along a path, source first.
template<typename Label>
[[nodiscard]] std::vector<Label>
path_labels(weighted_graph<Label> const& g, path_result const& p) {
    std::vector<Label> out;
    out.reserve(p.nodes.size());
    for (auto n : p.nodes) {
        out.push_back(g.label(n));
    }
    return out;
}

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_SHORTEST_PATH_H
