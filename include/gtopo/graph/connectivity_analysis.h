// graph/algorithms/connectivity_analysis.h - MST + critical components
// Part of the gtopo graph toolkit (C++20)
//
// Full connectivity report for an undirected graph: the spanning
// tree/forest and the critical edges and nodes, computed on the same
// immutable snapshot.

#ifndef GTOPO_GRAPH_CONNECTIVITY_ANALYSIS_H
#define GTOPO_GRAPH_CONNECTIVITY_ANALYSIS_H

#include "critical_components.h"
#include "graph_concepts.h"
#include "minimum_spanning_tree.h"

namespace gtopo::graph {

struct connectivity_report {
    mst_result      mst;
    critical_result critical;
};

/// Throws graph_error(requires_undirected) for a directed graph.
template<edge_listed_graph G>
[[nodiscard]] connectivity_report analyze_connectivity(G const& g) {
    return connectivity_report{minimum_spanning_tree(g), find_critical(g)};
}

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_CONNECTIVITY_ANALYSIS_H
