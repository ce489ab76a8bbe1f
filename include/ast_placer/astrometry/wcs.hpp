#pragma once

#include "ast_placer/io/fits_io.hpp"

#include <cmath>
#include <string>

namespace ast_placer::astrometry {

// Simple WCS (World Coordinate System) for TAN projection
// Supports sky (RA/Dec) -> pixel coordinate conversion
struct WCS {
    // Reference pixel (1-indexed, FITS convention)
    double crpix1 = 0.0;
    double crpix2 = 0.0;

    // Reference sky coordinates (degrees)
    double crval1 = 0.0;  // RA
    double crval2 = 0.0;  // Dec

    // CD matrix (degrees/pixel), scale + rotation
    double cd1_1 = 0.0;
    double cd1_2 = 0.0;
    double cd2_1 = 0.0;
    double cd2_2 = 0.0;

    // Image dimensions (0 if unknown)
    int naxis1 = 0;
    int naxis2 = 0;

    double pixel_scale_arcsec() const {
        double s1 = std::sqrt(cd1_1 * cd1_1 + cd2_1 * cd2_1);
        double s2 = std::sqrt(cd1_2 * cd1_2 + cd2_2 * cd2_2);
        return 0.5 * (s1 + s2) * 3600.0;
    }

    // Sky (RA, Dec in degrees) -> pixel (0-indexed)
    // Returns false if point is behind the projection
    bool sky_to_pixel(double ra_deg, double dec_deg, double &px, double &py) const {
        constexpr double D2R = M_PI / 180.0;
        double ra_r   = ra_deg * D2R;
        double dec_r  = dec_deg * D2R;
        double ra0_r  = crval1 * D2R;
        double dec0_r = crval2 * D2R;

        double sin_dec  = std::sin(dec_r);
        double cos_dec  = std::cos(dec_r);
        double sin_dec0 = std::sin(dec0_r);
        double cos_dec0 = std::cos(dec0_r);
        double delta_ra = ra_r - ra0_r;
        double cos_dra  = std::cos(delta_ra);

        double denom = sin_dec * sin_dec0 + cos_dec * cos_dec0 * cos_dra;
        if (denom <= 0.0) return false;  // behind projection

        double xi_r  = (cos_dec * std::sin(delta_ra)) / denom;
        double eta_r = (sin_dec * cos_dec0 - cos_dec * sin_dec0 * cos_dra) / denom;

        double xi  = xi_r / D2R;
        double eta = eta_r / D2R;

        // Invert CD matrix: [dx, dy] = CD^-1 * [xi, eta]
        double det = cd1_1 * cd2_2 - cd1_2 * cd2_1;
        if (std::abs(det) < 1e-30) return false;

        double dx = ( cd2_2 * xi - cd1_2 * eta) / det;
        double dy = (-cd2_1 * xi + cd1_1 * eta) / det;

        px = dx + crpix1 - 1.0;
        py = dy + crpix2 - 1.0;
        return true;
    }

    bool valid() const {
        return std::abs(cd1_1 * cd2_2 - cd1_2 * cd2_1) > 1e-30;
    }
};

// Parse an ASTAP .wcs file (FITS-like keyword=value format)
WCS parse_wcs_file(const std::string &path);

// Build WCS from CDELT+CROTA (older convention) if CD matrix not present
WCS wcs_from_cdelt_crota(double crval1, double crval2,
                         double crpix1, double crpix2,
                         double cdelt1, double cdelt2,
                         double crota2, int naxis1, int naxis2);

// Build WCS from header keywords: CD matrix, else CDELT with PC matrix,
// else CDELT with CROTA2
WCS wcs_from_header(const io::FitsHeader &header);

// WCS of a reference image. `.wcs` files are parsed as ASTAP output,
// anything else is read as FITS from HDU `hdu`.
// Throws FitsError if no usable transform is found.
WCS load_reference_wcs(const std::string &path, int hdu = 1);

} // namespace ast_placer::astrometry
