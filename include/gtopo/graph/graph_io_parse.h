// graph/graph_io_parse.h - Override and drop spec parsing
// Part of the gtopo graph toolkit (C++20)
//
// Textual what-if specs as given on a command line:
//
//   override   FROM:TO:WEIGHT     e.g. "api:auth:100"
//   drop       FROM:TO            e.g. "api:cache"
//
// Several entries may be joined with commas ("a:b:5,c:d:7").  Fields are
// trimmed.  An empty spec yields no entries; an empty entry, a wrong
// field count, an empty node name or a non-numeric weight throws
// std::runtime_error naming the offending entry.
//
// Parsing happens before any graph is touched: unknown node names are
// reported later by the simulation engine, which knows the node set.

#ifndef GTOPO_GRAPH_IO_PARSE_H
#define GTOPO_GRAPH_IO_PARSE_H

#include "graph_io_detail.h"
#include "simulation.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gtopo::graph::io {

namespace detail {

inline std::vector<std::string_view> spec_entries(std::string_view spec) {
    std::vector<std::string_view> out;
    if (trim(spec).empty()) return out;
    for (auto entry : split(spec, ',')) {
        entry = trim(entry);
        if (entry.empty()) {
            throw std::runtime_error("empty entry in spec '" + std::string(spec) + "'");
        }
        out.push_back(entry);
    }
    return out;
}

inline std::string node_field(std::string_view field, std::string_view entry) {
    auto const name = trim(field);
    if (name.empty()) {
        throw std::runtime_error("empty node name in '" + std::string(entry) + "'");
    }
    return std::string(name);
}

} // namespace detail

/// Parse "FROM:TO:WEIGHT[,FROM:TO:WEIGHT...]".
///
/// Example:
/// ```cpp
/// auto ov = io::parse_overrides("api:auth:100, auth:db:2.5");
/// // ov[0] == {"api", "auth", 100.0}
/// ```
[[nodiscard]] inline std::vector<edge_override<std::string>>
parse_overrides(std::string_view spec) {
    std::vector<edge_override<std::string>> out;
    for (auto const entry : detail::spec_entries(spec)) {
        auto const parts = detail::split(entry, ':');
        if (parts.size() != 3) {
            throw std::runtime_error("invalid override format '" + std::string(entry) +
                                     "'. Expected 'from:to:weight'");
        }
        out.push_back(edge_override<std::string>{
            detail::node_field(parts[0], entry),
            detail::node_field(parts[1], entry),
            detail::parse_double(parts[2], "parse_overrides")});
    }
    return out;
}

/// Parse "FROM:TO[,FROM:TO...]".
[[nodiscard]] inline std::vector<edge_drop<std::string>>
parse_drops(std::string_view spec) {
    std::vector<edge_drop<std::string>> out;
    for (auto const entry : detail::spec_entries(spec)) {
        auto const parts = detail::split(entry, ':');
        if (parts.size() != 2) {
            throw std::runtime_error("invalid drop format '" + std::string(entry) +
                                     "'. Expected 'from:to'");
        }
        out.push_back(edge_drop<std::string>{
            detail::node_field(parts[0], entry),
            detail::node_field(parts[1], entry)});
    }
    return out;
}

/// Repeated-flag form: each argument may itself hold comma-joined entries.
[[nodiscard]] inline std::vector<edge_override<std::string>>
parse_overrides(std::vector<std::string> const& specs) {
    std::vector<edge_override<std::string>> out;
    for (auto const& s : specs) {
        auto part = parse_overrides(std::string_view(s));
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

[[nodiscard]] inline std::vector<edge_drop<std::string>>
parse_drops(std::vector<std::string> const& specs) {
    std::vector<edge_drop<std::string>> out;
    for (auto const& s : specs) {
        auto part = parse_drops(std::string_view(s));
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

} // namespace gtopo::graph::io

#endif // GTOPO_GRAPH_IO_PARSE_H
