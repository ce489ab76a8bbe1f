#pragma once

#include "ast_placer/core/random.hpp"
#include "ast_placer/core/types.hpp"
#include "ast_placer/io/table.hpp"
#include "ast_placer/placement/bin_assigner.hpp"
#include "ast_placer/placement/neighbor_sampler.hpp"
#include "ast_placer/placement/position_sampler.hpp"
#include "ast_placer/placement/sky_transform.hpp"
#include "ast_placer/placement/tile_grouper.hpp"

#include <optional>
#include <ostream>
#include <vector>

namespace ast_placer::placement {

struct MapPlacementOptions {
    int n_bins = 5;
    int n_realize = 1;
    // Unset: the routine's own default (background rejects, density does not)
    std::optional<bool> reject_negative;
    int max_attempts = 10000;
    // Written (overwritten) when set
    std::optional<fs::path> output_path;
    int precision = 5;
};

struct MapPlacementReport {
    BinAssignment bins;
    std::vector<TileGroup> groups;
    size_t rows_per_group = 0;
    long long attempts = 0;
    CoordFrame frame = CoordFrame::SKY;
};

// Spreads `stars` over regions of similar metric value: the map's tiles
// are binned by metric, and every non-empty bin receives n_realize copies
// of every star at random positions inside the bin's tiles.
// Output columns: zeros, ones, RA/DEC or X/Y, bin_index, star columns.
// options.reject_negative, when set, overrides default_reject_negative.
io::Table place_by_map(const io::Table& stars,
                       const TileMap& map,
                       const MapPlacementOptions& options,
                       bool default_reject_negative,
                       const SkyToPixel* to_pixel,
                       core::RandomSource& rng,
                       MapPlacementReport* report = nullptr,
                       std::ostream* log_out = nullptr);

// Background-driven placement; pixel draws with a negative coordinate are
// redrawn unless options.reject_negative says otherwise.
io::Table pick_positions_per_background(const io::Table& stars,
                                        const TileMap& map,
                                        const MapPlacementOptions& options,
                                        const SkyToPixel* to_pixel,
                                        core::RandomSource& rng,
                                        MapPlacementReport* report = nullptr,
                                        std::ostream* log_out = nullptr);

// Density-driven placement; the first draw is kept unless
// options.reject_negative says otherwise.
io::Table pick_positions_per_density(const io::Table& stars,
                                     const TileMap& map,
                                     const MapPlacementOptions& options,
                                     const SkyToPixel* to_pixel,
                                     core::RandomSource& rng,
                                     MapPlacementReport* report = nullptr,
                                     std::ostream* log_out = nullptr);

struct NeighborPlacementOptions {
    double separation = 5.0;
    double noise = kDefaultAnnulusWidth;
};

struct NeighborPlacementReport {
    AnchorPositions anchors;
    std::vector<size_t> kept;
    NeighborOffsets offsets;
};

// ASTs scattered in an annulus around random interior catalog stars.
// Returns `asts` with zeros, ones, X, Y prepended.
io::Table pick_positions_near_stars(const io::Table& catalog,
                                    const io::Table& asts,
                                    const NeighborPlacementOptions& options,
                                    const SkyToPixel* to_pixel,
                                    core::RandomSource& rng,
                                    NeighborPlacementReport* report = nullptr,
                                    std::ostream* log_out = nullptr);

// Reads the AST list at `ast_path`, places it and rewrites the file in place.
// Original AST cells are written back exactly as read.
io::Table pick_positions_near_stars_file(const io::Table& catalog,
                                         const fs::path& ast_path,
                                         const NeighborPlacementOptions& options,
                                         const SkyToPixel* to_pixel,
                                         core::RandomSource& rng,
                                         NeighborPlacementReport* report = nullptr,
                                         std::ostream* log_out = nullptr);

} // namespace ast_placer::placement
