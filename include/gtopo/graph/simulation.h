// graph/algorithms/simulation.h - What-if topology simulation
// Part of the gtopo graph toolkit (C++20)
//
// A simulation derives a new graph from the original by removing edges
// ("drops") and replacing edge weights ("overrides"), then runs the
// shortest-path engine on both and reports the difference.
//
// SEMANTICS:
// - An edge is identified by its endpoint pair.  Directed graphs match
//   the ordered pair; undirected graphs match either orientation.
// - A drop removes every edge between the pair (parallel edges included).
// - An override sets the weight of every remaining edge between the pair.
//   Overrides never insert edges: a pair with no edge is a no-op.  When
//   several overrides name the same pair, the last one wins.
// - Drops are applied before overrides, so an edge that is both dropped
//   and overridden is absent regardless of the order the specs were given.
// - An unknown label in any spec is graph_error(unknown_node); an
//   override weight that is negative or non-finite is
//   graph_error(invalid_weight).  Both are raised before any search runs.
//
// The original graph is never modified: apply_changes() returns a new
// graph built with weighted_graph::rebuild().  Node handles are shared
// between the two, so a modified path can be labelled with either graph.

#ifndef GTOPO_GRAPH_SIMULATION_H
#define GTOPO_GRAPH_SIMULATION_H

#include "graph_builder.h"
#include "graph_concepts.h"
#include "graph_error.h"
#include "shortest_path.h"
#include "weighted_graph.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace gtopo::graph {

// =========================================================================
// Change specifications
// =========================================================================

template<typename Label>
struct edge_override {
    Label  source;
    Label  target;
    double weight = 0.0;
};

template<typename Label>
struct edge_drop {
    Label source;
    Label target;
};

// =========================================================================
// Derived graph
// =========================================================================

namespace detail {

[[nodiscard]] inline std::uint64_t
endpoint_key(node_id a, node_id b, bool directed) noexcept {
    if (!directed && b < a) {
        std::swap(a, b);
    }
    return (static_cast<std::uint64_t>(a.value) << 32) | b.value;
}

} // namespace detail

/// Graph with drops removed and overrides applied.  g is left untouched.
template<typename Label>
[[nodiscard]] weighted_graph<Label>
apply_changes(weighted_graph<Label> const& g,
              std::vector<edge_override<Label>> const& overrides,
              std::vector<edge_drop<Label>> const& drops)
{
    auto const directed = g.is_directed();

    std::unordered_set<std::uint64_t> dropped;
    for (auto const& d : drops) {
        dropped.insert(detail::endpoint_key(
            g.node_of(d.source), g.node_of(d.target), directed));
    }

    std::unordered_map<std::uint64_t, double> reweighted;
    for (auto const& o : overrides) {
        auto const key = detail::endpoint_key(
            g.node_of(o.source), g.node_of(o.target), directed);
        if (!valid_weight(o.weight))
            throw graph_error(error_kind::invalid_weight,
                "invalid override weight on " + detail::label_text(o.source) +
                " -> " + detail::label_text(o.target));
        reweighted[key] = o.weight;
    }

    std::vector<edge_record> kept;
    kept.reserve(g.edge_count());
    for (auto const& e : g.edges()) {
        auto const key = detail::endpoint_key(e.source, e.target, directed);
        if (dropped.count(key) != 0) continue;
        auto rec = e;
        if (auto it = reweighted.find(key); it != reweighted.end()) {
            rec.weight = it->second;
        }
        kept.push_back(rec);
    }
    return g.rebuild(std::move(kept));
}

// =========================================================================
// Simulation
// =========================================================================

enum class simulation_status : std::uint8_t {
    compared,              ///< both paths exist; latency_change is valid
    original_unreachable,  ///< no path even before the changes
    modified_unreachable,  ///< the changes disconnected source from target
};

[[nodiscard]] constexpr std::string_view to_string(simulation_status s) noexcept {
    switch (s) {
        case simulation_status::compared:             return "compared";
        case simulation_status::original_unreachable: return "original path not found";
        case simulation_status::modified_unreachable: return "path no longer exists";
    }
    return "unknown";
}

struct simulation_result {
    simulation_status status = simulation_status::original_unreachable;
    path_result original;
    path_result modified;
    double latency_change = 0.0;  ///< modified - original; 0 unless compared

    [[nodiscard]] bool path_lost() const noexcept {
        return status == simulation_status::modified_unreachable;
    }
};

/// Run source->target on g and on apply_changes(g, overrides, drops).
template<typename Label>
[[nodiscard]] simulation_result
simulate(weighted_graph<Label> const& g,
         std::type_identity_t<Label> const& from,
         std::type_identity_t<Label> const& to,
         std::vector<edge_override<Label>> const& overrides,
         std::vector<edge_drop<Label>> const& drops)
{
    auto const s = g.node_of(from);
    auto const t = g.node_of(to);
    auto const modified_graph = apply_changes(g, overrides, drops);

    simulation_result r;
    r.original = shortest_path(g, s, t);
    if (!r.original.found) {
        r.status = simulation_status::original_unreachable;
        return r;
    }

    r.modified = shortest_path(modified_graph, s, t);
    if (!r.modified.found) {
        r.status = simulation_status::modified_unreachable;
        return r;
    }

    r.status = simulation_status::compared;
    r.latency_change = r.modified.total_weight - r.original.total_weight;
    return r;
}

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_SIMULATION_H
