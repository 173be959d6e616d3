// graph/algorithms/slo.h - Service-level-objective check on a shortest path
// Part of the gtopo graph toolkit (C++20)
//
// A path meets its objective when total_weight <= max_latency.  The
// boundary is inclusive: a path costing exactly the threshold passes.
//
// The three outcomes (met, violated, no path) are distinct values of
// slo_status so a caller can map each to its own exit code.

#ifndef GTOPO_GRAPH_SLO_H
#define GTOPO_GRAPH_SLO_H

#include "graph_concepts.h"
#include "shortest_path.h"
#include "weighted_graph.h"

#include <cstdint>
#include <string_view>
#include <type_traits>

namespace gtopo::graph {

enum class slo_status : std::uint8_t {
    met,
    violated,
    no_path,
};

[[nodiscard]] constexpr std::string_view to_string(slo_status s) noexcept {
    switch (s) {
        case slo_status::met:      return "PASS";
        case slo_status::violated: return "FAIL";
        case slo_status::no_path:  return "NO PATH";
    }
    return "UNKNOWN";
}

struct slo_result {
    slo_status  status = slo_status::no_path;
    double      measured = 0.0;    ///< total_weight of the path (0 if no path)
    double      threshold = 0.0;
    path_result path;

    [[nodiscard]] bool met() const noexcept { return status == slo_status::met; }
};

/// Compare the shortest source->target cost against max_latency.
template<graph_queryable G>
[[nodiscard]] slo_result
check_slo(G const& g, node_id source, node_id target, double max_latency) {
    slo_result r;
    r.threshold = max_latency;
    r.path = shortest_path(g, source, target);
    if (!r.path.found) {
        r.status = slo_status::no_path;
        return r;
    }
    r.measured = r.path.total_weight;
    r.status = r.measured <= max_latency ? slo_status::met : slo_status::violated;
    return r;
}

template<typename Label>
[[nodiscard]] slo_result
check_slo(weighted_graph<Label> const& g,
          std::type_identity_t<Label> const& from,
          std::type_identity_t<Label> const& to,
          double max_latency)
{
    return check_slo(g, g.node_of(from), g.node_of(to), max_latency);
}

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_SLO_H
