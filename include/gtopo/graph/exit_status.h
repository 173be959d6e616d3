// graph/exit_status.h - Process exit codes for analysis outcomes
// Part of the gtopo graph toolkit (C++20)
//
// Command-line drivers map each outcome to a stable exit code so that
// scripts can branch on the result without parsing output:
//
//   0  success (path found, SLO met, simulation compared)
//   2  no path between the requested endpoints
//   3  SLO violated
//   4  invalid input (bad file, unknown node, malformed spec)

#ifndef GTOPO_GRAPH_EXIT_STATUS_H
#define GTOPO_GRAPH_EXIT_STATUS_H

#include "shortest_path.h"
#include "simulation.h"
#include "slo.h"

namespace gtopo::graph {

enum class exit_status : int {
    success       = 0,
    no_path       = 2,
    slo_violated  = 3,
    invalid_input = 4,
};

[[nodiscard]] constexpr int to_int(exit_status s) noexcept {
    return static_cast<int>(s);
}

[[nodiscard]] inline exit_status exit_status_for(path_result const& p) noexcept {
    return p.found ? exit_status::success : exit_status::no_path;
}

[[nodiscard]] inline exit_status exit_status_for(slo_result const& r) noexcept {
    switch (r.status) {
        case slo_status::met:      return exit_status::success;
        case slo_status::violated: return exit_status::slo_violated;
        case slo_status::no_path:  return exit_status::no_path;
    }
    return exit_status::invalid_input;
}

/// A simulation that loses the path still succeeds: the loss is the
/// reported finding.  Only a missing original path is an error.
[[nodiscard]] inline exit_status exit_status_for(simulation_result const& r) noexcept {
    return r.status == simulation_status::original_unreachable
        ? exit_status::no_path : exit_status::success;
}

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_EXIT_STATUS_H
