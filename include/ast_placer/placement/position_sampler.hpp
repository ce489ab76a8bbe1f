#pragma once

#include "ast_placer/core/random.hpp"
#include "ast_placer/core/types.hpp"
#include "ast_placer/placement/sky_transform.hpp"
#include "ast_placer/placement/tile_grouper.hpp"

#include <cstddef>
#include <ostream>
#include <vector>

namespace ast_placer::placement {

struct SamplerOptions {
    // Redraw until both pixel coordinates are >= 0 (only with a pixel transform)
    bool reject_negative = false;
    // Draws allowed per row before PositionSamplingExhausted
    int max_attempts = 10000;
};

// One entry per output row, grouped by tile group in group order
struct SampledPositions {
    CoordFrame frame = CoordFrame::SKY;
    std::vector<double> x;            // RA or pixel X
    std::vector<double> y;            // DEC or pixel Y
    std::vector<long long> bin_index; // position of the row's group in the group list
    std::vector<int> tile;            // map tile the accepted draw came from
    long long attempts = 0;           // total draws, accepted and rejected

    size_t size() const { return x.size(); }
};

// Uniform point inside a random tile of each group, rows_per_group rows per
// group. With `to_pixel` the sky draw is converted to 0-indexed pixels.
SampledPositions sample_tile_positions(const TileMap& map,
                                       const std::vector<TileGroup>& groups,
                                       size_t rows_per_group,
                                       const SkyToPixel* to_pixel,
                                       core::RandomSource& rng,
                                       const SamplerOptions& options,
                                       std::ostream* log_out = nullptr);

} // namespace ast_placer::placement
