// graph/graph.h - Umbrella header for the gtopo graph toolkit
// Part of the gtopo graph toolkit (C++20)
//
// Single-include convenience header.  Pulls in representation,
// construction, path analysis and connectivity analysis.  The I/O
// layer is separate: include <gtopo/graph/graph_io.h> for it.
//
// Usage:
//   #include <gtopo/graph/graph.h>
//
// For compilation-time-sensitive translation units, prefer including
// individual headers.

#ifndef GTOPO_GRAPH_GRAPH_H
#define GTOPO_GRAPH_GRAPH_H

// --- Core types & concepts ---
#include "graph_concepts.h"
#include "capacity_types.h"
#include "capacity_guard.h"
#include "graph_error.h"

// --- Representation & construction ---
#include "weighted_graph.h"
#include "graph_builder.h"
#include "graph_adapters.h"

// --- Path analysis ---
#include "shortest_path.h"
#include "slo.h"
#include "simulation.h"

// --- Connectivity analysis ---
#include "union_find.h"
#include "connected_components.h"
#include "minimum_spanning_tree.h"
#include "critical_components.h"
#include "connectivity_analysis.h"

// --- Outcomes ---
#include "exit_status.h"

#endif // GTOPO_GRAPH_GRAPH_H
