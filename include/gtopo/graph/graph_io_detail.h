// graph/graph_io_detail.h - Field-level parsing primitives
// Part of the gtopo graph toolkit (C++20)
//
// Whitespace trimming, delimiter splitting, and strict numeric field
// parsing over string_view.  No graph type dependencies, no iostream.
//
// "Strict" means the whole field must be consumed: "12abc" is an error,
// not 12.  Errors are std::runtime_error carrying the offending text.

#ifndef GTOPO_GRAPH_IO_DETAIL_H
#define GTOPO_GRAPH_IO_DETAIL_H

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace gtopo::graph::io {
namespace detail {

/// Strip leading and trailing spaces, tabs and carriage returns.
constexpr std::string_view trim(std::string_view sv) noexcept {
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    std::size_t b = 0;
    while (b < sv.size() && is_space(sv[b])) ++b;
    std::size_t e = sv.size();
    while (e > b && is_space(sv[e - 1])) --e;
    return sv.substr(b, e - b);
}

/// Split on every occurrence of delim.  "a,,b" -> {"a", "", "b"}.
inline std::vector<std::string_view> split(std::string_view sv, char delim) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        auto const pos = sv.find(delim, start);
        if (pos == std::string_view::npos) {
            out.push_back(sv.substr(start));
            return out;
        }
        out.push_back(sv.substr(start, pos - start));
        start = pos + 1;
    }
}

/// Case-insensitive ASCII equality.
constexpr bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    auto lower = [](char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; };
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (lower(a[i]) != lower(b[i])) return false;
    }
    return true;
}

/// Parse a whole field as an unsigned 32-bit integer.
inline std::uint32_t parse_uint(std::string_view field, char const* what) {
    auto const sv = trim(field);
    std::uint32_t value = 0;
    auto const [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw std::runtime_error(std::string(what) + ": invalid node id '" +
                                 std::string(sv) + "'");
    }
    return value;
}

/// Parse a whole field as a double.  Sign and range are NOT checked
/// here; weight validity is the graph builder's concern.
inline double parse_double(std::string_view field, char const* what) {
    auto const sv = trim(field);
    double value = 0.0;
    auto const [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw std::runtime_error(std::string(what) + ": invalid weight '" +
                                 std::string(sv) + "'");
    }
    return value;
}

} // namespace detail
} // namespace gtopo::graph::io

#endif // GTOPO_GRAPH_IO_DETAIL_H
