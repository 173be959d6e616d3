// graph/graph_error.h - Error kinds and the graph_error exception
// Part of the gtopo graph toolkit (C++20)
//
// Construction and query errors are reported as graph_error, a
// std::runtime_error carrying an error_kind so callers can map failures
// to exit codes or messages without parsing what().
//
// Outcomes that are not defects (unreachable target, violated SLO,
// disconnected input to Kruskal) are NOT exceptions: they are fields of
// the algorithm result types.
//
// Capacity and handle-range violations keep the standard library types
// (std::length_error, std::out_of_range).

#ifndef GTOPO_GRAPH_ERROR_H
#define GTOPO_GRAPH_ERROR_H

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace gtopo::graph {

enum class error_kind : std::uint8_t {
    unknown_node,         ///< label or handle not present in the node set
    duplicate_node,       ///< same label added twice
    self_loop,            ///< edge whose endpoints are equal
    invalid_weight,       ///< negative, NaN or infinite weight
    duplicate_edge,       ///< parallel edge where the build policy rejects them
    requires_undirected,  ///< algorithm defined only on undirected graphs
};

[[nodiscard]] constexpr std::string_view to_string(error_kind k) noexcept {
    switch (k) {
        case error_kind::unknown_node:        return "unknown node";
        case error_kind::duplicate_node:      return "duplicate node";
        case error_kind::self_loop:           return "self loop";
        case error_kind::invalid_weight:      return "invalid weight";
        case error_kind::duplicate_edge:      return "duplicate edge";
        case error_kind::requires_undirected: return "requires undirected graph";
    }
    return "unknown error";
}

/// Exception thrown for invalid graph input or invalid queries.
class graph_error : public std::runtime_error {
public:
    graph_error(error_kind kind, std::string const& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

namespace detail {

/// Render a node label for diagnostics.
template<typename Label>
[[nodiscard]] std::string label_text(Label const& label) {
    if constexpr (std::is_convertible_v<Label const&, std::string_view>) {
        return std::string(std::string_view(label));
    } else if constexpr (std::is_arithmetic_v<Label>) {
        return std::to_string(label);
    } else {
        std::ostringstream os;
        os << label;
        return os.str();
    }
}

} // namespace detail

/// One rejected edge found by weighted_graph_builder::validate().
///
/// Endpoint labels are kept as text so the issue outlives the builder
/// and can be reported without knowing the label type.
struct validation_issue {
    error_kind  kind = error_kind::unknown_node;
    std::size_t edge_index = 0;
    std::string source;
    std::string target;
    double      weight = 0.0;

    [[nodiscard]] std::string message() const {
        std::ostringstream os;
        os << to_string(kind) << " on edge #" << edge_index
           << " (" << source << " -> " << target << ", weight " << weight << ")";
        return os.str();
    }

    [[nodiscard]] graph_error to_error() const {
        return graph_error(kind, message());
    }
};

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_ERROR_H
