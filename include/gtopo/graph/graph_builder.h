// graph/construction/graph_builder.h - Validating incremental construction
// Part of the gtopo graph toolkit (C++20)
//
// DESIGN RATIONALE:
// weighted_graph_builder accumulates labelled nodes and edges, then
// finalise() produces an immutable weighted_graph in CSR format.  This
// separates the mutable construction phase from the immutable analysis
// phase: no algorithm ever runs on a graph that failed validation.
//
// VALIDATION (per edge, in input order; first failing check wins):
//   1. Both endpoint labels must be known nodes      -> unknown_node
//   2. Endpoints must differ                         -> self_loop
//   3. Weight must be finite and non-negative        -> invalid_weight
//   4. Under parallel_edges::reject, the endpoint
//      pair must not repeat an earlier edge          -> duplicate_edge
//      (ordered pair if directed, unordered if undirected)
//
// validate() reports every invalid edge.  finalise() throws a graph_error
// for the first one.  Duplicate node labels are rejected immediately by
// add_node().
//
// Nothing is silently dropped or reordered: edge_id == insertion position.

#ifndef GTOPO_GRAPH_BUILDER_H
#define GTOPO_GRAPH_BUILDER_H

#include "capacity_guard.h"
#include "capacity_types.h"
#include "graph_concepts.h"
#include "graph_error.h"
#include "weighted_graph.h"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace gtopo::graph {

// =============================================================================
// Build options
// =============================================================================

enum class parallel_edges : std::uint8_t {
    allow,   ///< multi-edges kept; Dijkstra relaxation prefers the cheaper
    reject,  ///< a repeated endpoint pair is a duplicate_edge error
};

struct build_options {
    directedness   kind = directedness::directed;
    parallel_edges parallel = parallel_edges::allow;
};

/// Path-analysis variant: directed, multi-edges permitted.
inline constexpr build_options directed_options{
    directedness::directed, parallel_edges::allow};

/// Connectivity variant: undirected, multi-edges rejected.
inline constexpr build_options undirected_options{
    directedness::undirected, parallel_edges::reject};

/// Is w usable as an edge weight (finite, >= 0)?
[[nodiscard]] inline bool valid_weight(double w) noexcept {
    return std::isfinite(w) && w >= 0.0;
}

// =============================================================================
// weighted_graph_builder<Label, Cap>
// =============================================================================

/// Incremental, validating builder for weighted_graph.
///
/// Usage:
/// ```cpp
/// weighted_graph_builder<std::uint32_t> b(undirected_options);
/// for (std::uint32_t i = 0; i < 3; ++i) (void)b.add_node(i);
/// b.add_edge(0, 1, 1.0);
/// b.add_edge(1, 2, 2.0);
/// auto g = b.finalise();
/// ```
///
/// Template parameters:
/// - Label: node identifier type
/// - Cap: capacity_policy bounding node and edge counts
template<typename Label, typename Cap = cap::network>
class weighted_graph_builder {
    static_assert(capacity_policy<Cap>,
        "weighted_graph_builder: Cap must model capacity_policy");
public:
    weighted_graph_builder() = default;

    explicit weighted_graph_builder(build_options opts) : opts_(opts) {}

    [[nodiscard]] build_options options() const noexcept { return opts_; }

    // =========================================================================
    // Construction API
    // =========================================================================

    /// Add a node.  Nodes are numbered sequentially from 0.
    /// Throws graph_error(duplicate_node) if the label already exists.
    [[nodiscard]] node_id add_node(Label label) {
        require_node_id_range<Cap::max_v>();
        require_capacity(labels_.size() + 1, Cap::max_v,
            "weighted_graph_builder::add_node: node count would exceed MaxV");
        if (index_.find(label) != index_.end())
            throw graph_error(error_kind::duplicate_node,
                "duplicate node name: " + detail::label_text(label));
        auto const id = node_id{static_cast<std::uint32_t>(labels_.size())};
        index_.emplace(label, id);
        labels_.push_back(std::move(label));
        return id;
    }

    /// Record an edge.  Endpoints may be added after the edge; every check
    /// is deferred to validate()/finalise().
    void add_edge(Label source, Label target, double weight) {
        require_capacity(pending_.size() + 1, Cap::max_e,
            "weighted_graph_builder::add_edge: edge count would exceed MaxE");
        pending_.push_back(pending_edge{std::move(source), std::move(target), weight});
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return labels_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return pending_.size(); }

    [[nodiscard]] bool contains(Label const& label) const {
        return index_.find(label) != index_.end();
    }

    // =========================================================================
    // Validation and finalisation
    // =========================================================================

    /// Every invalid edge, in input order.  Empty when the input is valid.
    [[nodiscard]] std::vector<validation_issue> validate() const {
        std::vector<validation_issue> issues;
        std::unordered_set<std::uint64_t> seen;

        for (std::size_t i = 0; i < pending_.size(); ++i) {
            auto const& e = pending_[i];
            auto report = [&](error_kind k) {
                issues.push_back(validation_issue{
                    k, i, detail::label_text(e.source),
                    detail::label_text(e.target), e.weight});
            };

            auto const u = lookup(e.source);
            auto const v = lookup(e.target);
            if (u == invalid_node || v == invalid_node) {
                report(error_kind::unknown_node);
                continue;
            }
            if (u == v) {
                report(error_kind::self_loop);
                continue;
            }
            if (!valid_weight(e.weight)) {
                report(error_kind::invalid_weight);
                continue;
            }
            if (opts_.parallel == parallel_edges::reject &&
                !seen.insert(pair_key(u, v)).second) {
                report(error_kind::duplicate_edge);
                continue;
            }
        }
        return issues;
    }

    /// Build the immutable graph.  Throws graph_error for the first
    /// validation issue.
    [[nodiscard]] weighted_graph<Label> finalise() const {
        auto const issues = validate();
        if (!issues.empty()) {
            throw issues.front().to_error();
        }

        weighted_graph<Label> g;
        g.labels_ = labels_;
        g.index_ = index_;
        g.kind_ = opts_.kind;
        g.edges_.reserve(pending_.size());
        for (auto const& e : pending_) {
            g.edges_.push_back(edge_record{lookup(e.source), lookup(e.target), e.weight});
        }
        g.build_adjacency();
        return g;
    }

private:
    struct pending_edge {
        Label  source;
        Label  target;
        double weight;
    };

    [[nodiscard]] node_id lookup(Label const& label) const {
        auto const it = index_.find(label);
        return it == index_.end() ? invalid_node : it->second;
    }

    [[nodiscard]] std::uint64_t pair_key(node_id u, node_id v) const noexcept {
        auto a = u.value;
        auto b = v.value;
        if (opts_.kind == directedness::undirected && b < a) {
            std::swap(a, b);
        }
        return (static_cast<std::uint64_t>(a) << 32) | b;
    }

    build_options opts_{};
    std::vector<Label> labels_;
    std::unordered_map<Label, node_id> index_;
    std::vector<pending_edge> pending_;
};

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_BUILDER_H
