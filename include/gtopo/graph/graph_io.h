// graph/graph_io.h - I/O layer: change-list parsing, CSV/JSON input, text/JSON reports
// Part of the gtopo graph toolkit (C++20)
//
// Umbrella header.  For compilation-time-sensitive translation units,
// prefer including individual headers:
//
//   graph_io_detail.h  - field trimming, splitting, numeric parsing
//   graph_io_parse.h   - override/drop parsing
//   graph_io_stream.h  - CSV reading, text reports
//   graph_io_json.h    - JSON service graphs, JSON reports (nlohmann::json)

#ifndef GTOPO_GRAPH_IO_H
#define GTOPO_GRAPH_IO_H

#include "graph_io_detail.h"
#include "graph_io_parse.h"
#include "graph_io_stream.h"
#include "graph_io_json.h"

#endif // GTOPO_GRAPH_IO_H
