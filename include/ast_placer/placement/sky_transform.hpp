#pragma once

#include "ast_placer/astrometry/wcs.hpp"

#include <functional>

namespace ast_placer::placement {

// Sky (RA, Dec in degrees) -> 0-indexed pixel.
// Returns false when the position cannot be projected.
using SkyToPixel = std::function<bool(double ra, double dec, double& x, double& y)>;

inline SkyToPixel make_sky_to_pixel(const astrometry::WCS& wcs) {
    return [wcs](double ra, double dec, double& x, double& y) {
        return wcs.sky_to_pixel(ra, dec, x, y);
    };
}

} // namespace ast_placer::placement
