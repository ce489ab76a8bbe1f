#pragma once

#include "ast_placer/core/random.hpp"
#include "ast_placer/io/table.hpp"
#include "ast_placer/placement/sky_transform.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace ast_placer::placement {

// Annulus width around each anchor star (pixels)
constexpr double kDefaultAnnulusWidth = 3.0;

// Pixel positions of real catalog stars
struct AnchorPositions {
    std::vector<double> x;
    std::vector<double> y;
    std::string source;  // columns the positions came from, e.g. "X,Y" or "RA,DEC"

    size_t size() const { return x.size(); }
};

// Pixel positions from X/Y, x/y, RA/DEC or ra/dec, checked in that order.
// Sky columns are converted with `to_pixel`.
// Throws MissingCoordinatesError / MissingReferenceImageError.
AnchorPositions extract_anchor_positions(const io::Table& catalog, const SkyToPixel* to_pixel);

// Open interval the anchors must lie in, per axis
struct InteriorBounds {
    double x_lo = 0.0;
    double x_hi = 0.0;
    double y_lo = 0.0;
    double y_hi = 0.0;
};

// Margin of separation + noise inside the anchors' own coordinate extent
InteriorBounds interior_bounds(const AnchorPositions& anchors, double separation, double noise);

// Indices of anchors strictly inside interior_bounds.
// Throws EmptyFilteredCatalogError when none remain.
std::vector<size_t> filter_interior_anchors(const AnchorPositions& anchors,
                                            double separation, double noise);

struct NeighborOffsets {
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> radius;
    std::vector<double> theta;
    std::vector<size_t> anchor;  // index into AnchorPositions

    size_t size() const { return x.size(); }
};

// For each of n_asts rows: random anchor from `kept`, radius in
// [separation, separation + noise), angle in [0, 2pi).
NeighborOffsets sample_neighbor_offsets(const AnchorPositions& anchors,
                                        const std::vector<size_t>& kept,
                                        size_t n_asts,
                                        double separation,
                                        double noise,
                                        core::RandomSource& rng,
                                        std::ostream* log_out = nullptr);

} // namespace ast_placer::placement
