// graph/capacity_types.h - Capacity policy types for graph construction
// Part of the gtopo graph toolkit (C++20)
//
// DESIGN RATIONALE:
// Builders take a SINGLE capacity struct instead of two numeric limits.
// The struct travels as one token through template arguments and
// namespace aliases:
//
//   weighted_graph_builder<std::string, cap::small>   b;   // named tier
//   weighted_graph_builder<std::string>               b2;  // cap::network
//   weighted_graph_builder<int, cap_from<8>>          b3;  // MaxE = 4*8
//
//   namespace my_tool {
//       using Cap = cap::large;                      // scope override
//   }
//
// Storage is runtime-sized; the policy bounds what input a builder
// accepts, so an oversized topology file fails fast with a clear error
// instead of exhausting memory half-way through construction.

#ifndef GTOPO_GRAPH_CAPACITY_TYPES_H
#define GTOPO_GRAPH_CAPACITY_TYPES_H

#include <concepts>
#include <cstddef>

namespace gtopo::graph {

// =============================================================================
// capacity_policy concept
// =============================================================================

/// A type satisfies capacity_policy if it provides positive max_v and max_e.
template<typename C>
concept capacity_policy = requires {
    { C::max_v } -> std::convertible_to<std::size_t>;
    { C::max_e } -> std::convertible_to<std::size_t>;
} && (C::max_v > 0) && (C::max_e > 0);

// =============================================================================
// Named capacity tiers
// =============================================================================

namespace cap {

/// 8 vertices, 24 edges - unit tests, tiny examples.
struct tiny {
    static constexpr std::size_t max_v = 8;
    static constexpr std::size_t max_e = 24;
};

/// 64 vertices, 256 edges - small service maps.
struct small {
    static constexpr std::size_t max_v = 64;
    static constexpr std::size_t max_e = 256;
};

/// 4096 vertices, 32768 edges - typical data-centre topologies.
struct medium {
    static constexpr std::size_t max_v = 4096;
    static constexpr std::size_t max_e = 32768;
};

/// 262144 vertices, 2^21 edges - large generated topologies.
struct large {
    static constexpr std::size_t max_v = 262144;
    static constexpr std::size_t max_e = 2097152;
};

/// 2^24 vertices, 2^26 edges - default ceiling for file input.
struct network {
    static constexpr std::size_t max_v = 16777216;
    static constexpr std::size_t max_e = 67108864;
};

} // namespace cap

// =============================================================================
// cap_from<V, E> - inline capacity from raw numbers
// =============================================================================
//
//   weighted_graph_builder<int, cap_from<8, 16>>   b;   // explicit V and E
//   weighted_graph_builder<int, cap_from<8>>       b;   // E defaults to 4*V

template<std::size_t MaxV, std::size_t MaxE = 4 * MaxV>
struct cap_from {
    static constexpr std::size_t max_v = MaxV;
    static constexpr std::size_t max_e = MaxE;
};

static_assert(capacity_policy<cap::tiny>);
static_assert(capacity_policy<cap::network>);
static_assert(capacity_policy<cap_from<8, 16>>);

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_CAPACITY_TYPES_H
