// graph/representation/graph_concepts.h - Descriptor types and graph concepts
// Part of the gtopo graph toolkit (C++20)
//
// DESIGN RATIONALE:
// Descriptors communicate intent and enforce separation between node
// identity (the caller's label) and topology (dense indices).  node_id is
// an opaque handle assigned once at build time; labels live in the graph's
// label table and are only consulted at the API boundary.
//
// All algorithms are free functions over graph_queryable.  They never
// mutate the graph and keep their working state local to the call, so
// independent queries over the same graph are safe to run concurrently.
//
// DESIGN LIMIT: uint32_t node handles.  invalid_node (0xFFFFFFFF) is
// reserved as the sentinel.

#ifndef GTOPO_GRAPH_CONCEPTS_H
#define GTOPO_GRAPH_CONCEPTS_H

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>

namespace gtopo::graph {

// =============================================================================
// Descriptor Types
// =============================================================================

/// Opaque node identifier.
///
/// Valid only for the specific graph instance that produced it.
/// weighted_graph::rebuild keeps the node set, so handles stay valid
/// across a rebuild of the same graph.
struct node_id {
    std::uint32_t value{};

    friend constexpr bool operator==(node_id, node_id) = default;
    friend constexpr auto operator<=>(node_id, node_id) = default;
};

/// Convert node_id to index for array access.
[[nodiscard]] constexpr std::size_t to_index(node_id n) noexcept {
    return static_cast<std::size_t>(n.value);
}

/// Sentinel value for invalid/unassigned node references.
inline constexpr node_id invalid_node{std::uint32_t{0xFFFFFFFF}};

/// Opaque edge identifier (position in the graph's logical edge list).
///
/// For undirected graphs both adjacency entries of one logical edge carry
/// the same edge_id.  Edge IDs are NOT stable across rebuilds.
struct edge_id {
    std::size_t value{};

    friend constexpr bool operator==(edge_id, edge_id) = default;
    friend constexpr auto operator<=>(edge_id, edge_id) = default;
};

/// Convert edge_id to index for array access.
[[nodiscard]] constexpr std::size_t to_index(edge_id e) noexcept {
    return e.value;
}

/// Sentinel value for invalid/unassigned edge references.
inline constexpr edge_id invalid_edge{~std::size_t{0}};

/// Directed graphs store (a->b) and (b->a) as distinct edges.  Undirected
/// graphs store each edge once and expose it from both endpoints.
enum class directedness : std::uint8_t {
    directed,
    undirected,
};

// =============================================================================
// Edge records
// =============================================================================

/// A logical edge: endpoints plus weight.
///
/// For undirected graphs source/target keep the orientation the edge was
/// added with; algorithms treat them as an unordered pair.
struct edge_record {
    node_id source;
    node_id target;
    double  weight = 0.0;

    friend constexpr bool operator==(edge_record const&, edge_record const&) = default;
};

/// One adjacency entry: the neighbour reached, the weight, and the
/// logical edge it belongs to.
struct weighted_edge {
    node_id target;
    double  weight = 0.0;
    edge_id eid;

    friend constexpr bool operator==(weighted_edge const&, weighted_edge const&) = default;
};

// =============================================================================
// Graph Concepts
// =============================================================================

/// A graph_queryable provides immutable adjacency queries.
///
/// Requirements:
/// - node_count(): number of nodes in the graph
/// - out_edges(u): range of weighted_edge leaving u (both directions for
///   undirected graphs)
/// - has_node(u): handle validity check
template<typename G>
concept graph_queryable =
    requires(G const& g, node_id u) {
        { g.node_count() } -> std::convertible_to<std::size_t>;
        { g.has_node(u) } -> std::convertible_to<bool>;
        { g.out_edges(u) };
    };

/// An edge_listed_graph additionally exposes its logical edge list and
/// directedness.  Needed by algorithms that work edge-by-edge (Kruskal,
/// component labelling) or that require undirected input.
template<typename G>
concept edge_listed_graph =
    graph_queryable<G> &&
    requires(G const& g, edge_id e) {
        { g.edge_count() } -> std::convertible_to<std::size_t>;
        { g.edge(e) } -> std::convertible_to<edge_record>;
        { g.is_directed() } -> std::convertible_to<bool>;
    };

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_CONCEPTS_H
