#pragma once

#include "ast_placer/core/types.hpp"

#include <vector>

namespace ast_placer::placement {

// Tiles that share a bin. `bin` is the 0-based bin of the full partition;
// the group's position in the grouped list is the output bin index.
struct TileGroup {
    int bin = 0;
    std::vector<int> tiles;
};

// One group per non-empty bin, in increasing bin order.
// labels are 1-based as produced by assign_bins.
std::vector<TileGroup> group_tiles_by_bin(const VectorXi& labels, int n_bins);

} // namespace ast_placer::placement
