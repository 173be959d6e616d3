// graph/representation/weighted_graph.h - Immutable labelled CSR graph
// Part of the gtopo graph toolkit (C++20)
//
// DESIGN RATIONALE:
// One generic representation serves both tool variants: string-labelled
// directed service maps and integer-labelled undirected connectivity
// graphs.  The label type is a template parameter; directedness is a
// runtime tag fixed at construction.  Algorithms only ever see dense
// node_id handles.
//
// STORAGE:
//   labels_    node_id -> Label
//   index_     Label -> node_id
//   edges_     logical edge list, in insertion order (edge_id = position)
//   offsets_   CSR offsets, size V + 1
//   adjacency_ CSR entries (target, weight, edge_id)
//
// A directed edge u->v contributes one adjacency entry at u.  An
// undirected edge {u, v} contributes an entry at u AND at v, both carrying
// the same edge_id.  Within a node, entries follow edge insertion order,
// so every traversal is deterministic for a given input.
//
// CONSTRUCTION:
//   weighted_graph_builder<Label, Cap> validates input, then finalise()
//   produces an immutable weighted_graph.  rebuild() derives a new graph
//   on the same node set from a replacement edge list (used by the
//   simulation engine); the original is never modified.

#ifndef GTOPO_GRAPH_WEIGHTED_GRAPH_H
#define GTOPO_GRAPH_WEIGHTED_GRAPH_H

#include "graph_concepts.h"
#include "graph_error.h"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gtopo::graph {

// Forward declaration for friend access.
template<typename, typename>
class weighted_graph_builder;

// =============================================================================
// weighted_graph<Label>
// =============================================================================

/// Runtime-constructed, immutable, CSR-format weighted graph.
///
/// Template parameter:
/// - Label: node identifier supplied by the caller (hashable, comparable)
///
/// Constructed via weighted_graph_builder<Label, Cap>::finalise().
///
/// Example:
/// ```cpp
/// weighted_graph_builder<std::string> b;
/// (void)b.add_node("api");
/// (void)b.add_node("db");
/// b.add_edge("api", "db", 4.0);
/// auto g = b.finalise();
/// auto p = shortest_path(g, "api", "db");
/// ```
template<typename Label>
class weighted_graph {
public:
    using label_type = Label;

    weighted_graph() = default;

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return labels_.size(); }

    /// Number of logical edges (an undirected edge counts once).
    [[nodiscard]] std::size_t edge_count() const noexcept { return edges_.size(); }

    [[nodiscard]] bool empty() const noexcept { return labels_.empty(); }

    [[nodiscard]] directedness kind() const noexcept { return kind_; }

    [[nodiscard]] bool is_directed() const noexcept {
        return kind_ == directedness::directed;
    }

    // =========================================================================
    // Adjacency access
    // =========================================================================

    struct adjacency_range {
        weighted_edge const* begin_;
        weighted_edge const* end_;

        [[nodiscard]] weighted_edge const* begin() const noexcept { return begin_; }
        [[nodiscard]] weighted_edge const* end() const noexcept { return end_; }
        [[nodiscard]] std::size_t size() const noexcept {
            return static_cast<std::size_t>(end_ - begin_);
        }
        [[nodiscard]] bool empty() const noexcept { return begin_ == end_; }
    };

    /// Edges leaving u.  For undirected graphs: every incident edge.
    /// Precondition: has_node(u).
    [[nodiscard]] adjacency_range out_edges(node_id u) const noexcept {
        auto const idx = to_index(u);
        return {adjacency_.data() + offsets_[idx],
                adjacency_.data() + offsets_[idx + 1]};
    }

    [[nodiscard]] std::size_t out_degree(node_id u) const noexcept {
        auto const idx = to_index(u);
        return offsets_[idx + 1] - offsets_[idx];
    }

    [[nodiscard]] bool has_node(node_id u) const noexcept {
        return to_index(u) < labels_.size();
    }

    // =========================================================================
    // Edge list
    // =========================================================================

    [[nodiscard]] edge_record const& edge(edge_id e) const {
        if (to_index(e) >= edges_.size())
            throw std::out_of_range("weighted_graph::edge: edge_id not in graph");
        return edges_[to_index(e)];
    }

    [[nodiscard]] std::vector<edge_record> const& edges() const noexcept {
        return edges_;
    }

    // =========================================================================
    // Labels
    // =========================================================================

    [[nodiscard]] Label const& label(node_id u) const {
        if (!has_node(u))
            throw std::out_of_range("weighted_graph::label: node_id not in graph");
        return labels_[to_index(u)];
    }

    [[nodiscard]] std::vector<Label> const& labels() const noexcept {
        return labels_;
    }

    [[nodiscard]] bool contains(Label const& label) const {
        return index_.find(label) != index_.end();
    }

    /// Handle for label, or invalid_node when absent.
    [[nodiscard]] node_id find_node(Label const& label) const {
        auto const it = index_.find(label);
        return it == index_.end() ? invalid_node : it->second;
    }

    /// Handle for label.  Throws graph_error(unknown_node) when absent.
    [[nodiscard]] node_id node_of(Label const& label) const {
        auto const it = index_.find(label);
        if (it == index_.end())
            throw graph_error(error_kind::unknown_node,
                "node not found: " + detail::label_text(label));
        return it->second;
    }

    // =========================================================================
    // Derivation
    // =========================================================================

    /// New graph with the same nodes, directedness and labels but a
    /// replacement edge list.  Endpoints must be handles of this graph.
    /// Weights are taken as given; callers validate them.
    [[nodiscard]] weighted_graph rebuild(std::vector<edge_record> edges) const {
        for (auto const& e : edges) {
            if (!has_node(e.source) || !has_node(e.target))
                throw std::out_of_range("weighted_graph::rebuild: endpoint not in graph");
        }
        weighted_graph g;
        g.labels_ = labels_;
        g.index_ = index_;
        g.kind_ = kind_;
        g.edges_ = std::move(edges);
        g.build_adjacency();
        return g;
    }

private:
    void build_adjacency() {
        auto const V = labels_.size();
        auto const directed = is_directed();

        offsets_.assign(V + 1, 0);
        for (auto const& e : edges_) {
            offsets_[to_index(e.source) + 1]++;
            if (!directed) offsets_[to_index(e.target) + 1]++;
        }
        for (std::size_t i = 1; i <= V; ++i) {
            offsets_[i] += offsets_[i - 1];
        }

        adjacency_.resize(offsets_[V]);
        std::vector<std::size_t> cursor(offsets_.begin(), offsets_.end() - 1);
        for (std::size_t i = 0; i < edges_.size(); ++i) {
            auto const& e = edges_[i];
            adjacency_[cursor[to_index(e.source)]++] =
                weighted_edge{e.target, e.weight, edge_id{i}};
            if (!directed) {
                adjacency_[cursor[to_index(e.target)]++] =
                    weighted_edge{e.source, e.weight, edge_id{i}};
            }
        }
    }

    std::vector<Label> labels_;
    std::unordered_map<Label, node_id> index_;
    std::vector<edge_record> edges_;
    std::vector<std::size_t> offsets_{0};
    std::vector<weighted_edge> adjacency_;
    directedness kind_ = directedness::directed;

    template<typename, typename>
    friend class weighted_graph_builder;
};

static_assert(graph_queryable<weighted_graph<int>>);
static_assert(edge_listed_graph<weighted_graph<int>>);

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_WEIGHTED_GRAPH_H
