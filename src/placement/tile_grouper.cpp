#include "ast_placer/placement/tile_grouper.hpp"

#include <algorithm>
#include <utility>

namespace ast_placer::placement {

std::vector<TileGroup> group_tiles_by_bin(const VectorXi& labels, int n_bins) {
    std::vector<TileGroup> all(static_cast<size_t>(std::max(n_bins, 0)));
    for (int b = 0; b < n_bins; ++b) {
        all[static_cast<size_t>(b)].bin = b;
    }

    for (Eigen::Index i = 0; i < labels.size(); ++i) {
        int b = labels[i] - 1;
        if (b < 0 || b >= n_bins) continue;
        all[static_cast<size_t>(b)].tiles.push_back(static_cast<int>(i));
    }

    std::vector<TileGroup> groups;
    for (auto& g : all) {
        if (!g.tiles.empty()) {
            groups.push_back(std::move(g));
        }
    }
    return groups;
}

} // namespace ast_placer::placement
