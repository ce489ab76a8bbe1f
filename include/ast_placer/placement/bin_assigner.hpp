#pragma once

#include "ast_placer/core/types.hpp"

#include <vector>

namespace ast_placer::placement {

// Linear partition of a tile metric into bins.
// edges has n_bins + 1 entries; labels are 1-based (label b covers
// [edges[b-1], edges[b]) ), one per tile.
struct BinAssignment {
    VectorXd edges;
    VectorXi labels;

    int n_bins() const { return static_cast<int>(edges.size()) - 1; }
};

// n_bins + 1 equally spaced boundaries over
// [min - 0.01|min|, max + 0.01|max|].
// Throws InvalidRangeError for n_bins < 1, empty or non-finite input,
// or a degenerate range (min == max).
VectorXd compute_bin_edges(const VectorXd& values, int n_bins);

// numpy.digitize semantics for increasing edges: index of the first
// edge strictly greater than the value.
VectorXi digitize(const VectorXd& values, const VectorXd& edges);

// Labels in [1, n_bins] for every value.
BinAssignment assign_bins(const VectorXd& values, int n_bins);

} // namespace ast_placer::placement
