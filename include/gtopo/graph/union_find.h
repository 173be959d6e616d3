// graph/union_find.h - Disjoint-set forest over dense indices
// Part of the gtopo graph toolkit (C++20)
//
// ALGORITHM: Union-Find with path compression and union by rank.
// Complexity: O(alpha(n)) amortised per operation.
//
// DESIGN RATIONALE:
// Elements are dense indices (node_id values), so the forest is two
// contiguous arrays (parent, rank) rather than a graph of pointers.
// find() is iterative: two passes, one to locate the root and one to
// compress, so no recursion depth concerns on degenerate chains.

#ifndef GTOPO_GRAPH_UNION_FIND_H
#define GTOPO_GRAPH_UNION_FIND_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace gtopo::graph {

/// Partition of {0, ..., n-1} into disjoint sets.
///
/// Example:
/// ```cpp
/// disjoint_set ds(4);
/// ds.unite(0, 1);
/// ds.unite(2, 3);
/// assert(ds.connected(0, 1) && !ds.connected(1, 2));
/// assert(ds.set_count() == 2);
/// ```
class disjoint_set {
public:
    disjoint_set() = default;

    explicit disjoint_set(std::size_t n)
        : parent_(n), rank_(n, 0), sets_(n)
    {
        for (std::size_t i = 0; i < n; ++i) {
            parent_[i] = i;
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return parent_.size(); }

    /// Number of disjoint sets currently in the partition.
    [[nodiscard]] std::size_t set_count() const noexcept { return sets_; }

    /// Representative of x's set.  Throws std::out_of_range if x >= size().
    [[nodiscard]] std::size_t find(std::size_t x) {
        check(x, "disjoint_set::find: element out of range");
        auto root = x;
        while (parent_[root] != root) {
            root = parent_[root];
        }
        while (parent_[x] != root) {
            auto next = parent_[x];
            parent_[x] = root;
            x = next;
        }
        return root;
    }

    /// Merge the sets of a and b (union by rank).
    /// Returns true if they were distinct and are now merged.
    bool unite(std::size_t a, std::size_t b) {
        auto ra = find(a);
        auto rb = find(b);
        if (ra == rb) return false;
        if (rank_[ra] < rank_[rb]) {
            parent_[ra] = rb;
        } else if (rank_[ra] > rank_[rb]) {
            parent_[rb] = ra;
        } else {
            parent_[rb] = ra;
            rank_[ra]++;
        }
        --sets_;
        return true;
    }

    [[nodiscard]] bool connected(std::size_t a, std::size_t b) {
        return find(a) == find(b);
    }

private:
    void check(std::size_t x, char const* msg) const {
        if (x >= parent_.size()) throw std::out_of_range(msg);
    }

    std::vector<std::size_t> parent_;
    std::vector<std::uint8_t> rank_;
    std::size_t sets_ = 0;
};

} // namespace gtopo::graph

#endif // GTOPO_GRAPH_UNION_FIND_H
