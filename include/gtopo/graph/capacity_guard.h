// graph/capacity_guard.h - Uniform capacity checks for graph construction
// Part of the gtopo graph toolkit (C++20)
//
// Single enforcement point for capacity bounds:
//
//   require_capacity(actual, limit, "weighted_graph_builder: V exceeds MaxV");
//
// Throws std::length_error with the message when actual > limit.
//
// Also codifies the uint32_t design limit of node_id: a capacity policy
// whose max_v does not leave room for the invalid_node sentinel is
// rejected at template instantiation.

#ifndef GTOPO_GRAPH_CAPACITY_GUARD_H
#define GTOPO_GRAPH_CAPACITY_GUARD_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace gtopo::graph {

/// Check that an actual count does not exceed the configured capacity.
///
/// Usage:
///   require_capacity(labels_.size() + 1, Cap::max_v, "add_node: V > MaxV");
constexpr void require_capacity(std::size_t actual,
                                std::size_t limit,
                                char const* msg)
{
    if (actual > limit) {
        throw std::length_error(msg);
    }
}

/// Codify the node_id design limit: MaxV must fit below the sentinel.
/// Call as: require_node_id_range<Cap::max_v>();
template<std::size_t MaxV>
constexpr void require_node_id_range() {
    static_assert(MaxV < std::size_t{0xFFFFFFFF},
        "MaxV exceeds uint32_t node_id range. "
        "0xFFFFFFFF is reserved for invalid_node.");
}

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_CAPACITY_GUARD_H
