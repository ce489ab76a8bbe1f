#include "ast_placer/astrometry/wcs.hpp"
#include "ast_placer/core/errors.hpp"
#include "ast_placer/core/utils.hpp"

#include <cmath>
#include <fstream>
#include <locale>
#include <sstream>
#include <string>

namespace ast_placer::astrometry {

WCS wcs_from_cdelt_crota(double crval1, double crval2,
                         double crpix1, double crpix2,
                         double cdelt1, double cdelt2,
                         double crota2, int naxis1, int naxis2) {
    WCS w;
    w.crval1 = crval1;
    w.crval2 = crval2;
    w.crpix1 = crpix1;
    w.crpix2 = crpix2;
    w.naxis1 = naxis1;
    w.naxis2 = naxis2;

    constexpr double D2R = M_PI / 180.0;
    double cos_r = std::cos(crota2 * D2R);
    double sin_r = std::sin(crota2 * D2R);

    w.cd1_1 =  cdelt1 * cos_r;
    w.cd1_2 = -cdelt2 * sin_r;
    w.cd2_1 =  cdelt1 * sin_r;
    w.cd2_2 =  cdelt2 * cos_r;

    return w;
}

static double parse_fits_double(const std::string &val_str) {
    std::string s = val_str;
    // Remove trailing comment (after /)
    auto slash = s.find('/');
    if (slash != std::string::npos) s = s.substr(0, slash);
    s = core::trim(s);
    if (s.size() >= 2 && s.front() == '\'' && s.back() == '\'') {
        s = core::trim(s.substr(1, s.size() - 2));
    }

    std::stringstream ss(s);
    ss.imbue(std::locale::classic());
    double result = 0.0;
    ss >> result;
    if (ss.fail()) return 0.0;
    return result;
}

WCS parse_wcs_file(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw IOError("Cannot open WCS file: " + path);
    }

    io::FitsHeader header;
    std::string line;
    while (std::getline(f, line)) {
        // FITS keyword = value / comment
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = core::trim(line.substr(0, eq));
        header.set(key, parse_fits_double(line.substr(eq + 1)));
    }

    return wcs_from_header(header);
}

WCS wcs_from_header(const io::FitsHeader &header) {
    auto num = [&header](const std::string &key, double fallback) {
        auto v = header.get_number(key);
        return v ? *v : fallback;
    };

    WCS w;
    w.crval1 = num("CRVAL1", 0.0);
    w.crval2 = num("CRVAL2", 0.0);
    w.crpix1 = num("CRPIX1", 0.0);
    w.crpix2 = num("CRPIX2", 0.0);
    w.naxis1 = static_cast<int>(num("NAXIS1", 0.0));
    w.naxis2 = static_cast<int>(num("NAXIS2", 0.0));

    bool have_cd = header.get_number("CD1_1") || header.get_number("CD1_2") ||
                   header.get_number("CD2_1") || header.get_number("CD2_2");
    if (have_cd) {
        w.cd1_1 = num("CD1_1", 0.0);
        w.cd1_2 = num("CD1_2", 0.0);
        w.cd2_1 = num("CD2_1", 0.0);
        w.cd2_2 = num("CD2_2", 0.0);
        return w;
    }

    double cdelt1 = num("CDELT1", 0.0);
    double cdelt2 = num("CDELT2", 0.0);
    if (std::abs(cdelt1) == 0.0 && std::abs(cdelt2) == 0.0) {
        return w;
    }

    bool have_pc = header.get_number("PC1_1") || header.get_number("PC1_2") ||
                   header.get_number("PC2_1") || header.get_number("PC2_2");
    if (have_pc) {
        w.cd1_1 = cdelt1 * num("PC1_1", 1.0);
        w.cd1_2 = cdelt1 * num("PC1_2", 0.0);
        w.cd2_1 = cdelt2 * num("PC2_1", 0.0);
        w.cd2_2 = cdelt2 * num("PC2_2", 1.0);
        return w;
    }

    double crota1 = num("CROTA1", 0.0);
    double crota2 = num("CROTA2", 0.0);
    double rot = (std::abs(crota2) > 0) ? crota2 : crota1;
    return wcs_from_cdelt_crota(w.crval1, w.crval2, w.crpix1, w.crpix2,
                                cdelt1, cdelt2, rot, w.naxis1, w.naxis2);
}

WCS load_reference_wcs(const std::string &path, int hdu) {
    WCS w;
    if (core::to_lower(fs::path(path).extension().string()) == ".wcs") {
        w = parse_wcs_file(path);
    } else {
        w = wcs_from_header(io::read_fits_header(path, hdu));
    }

    if (!w.valid()) {
        throw FitsError("No usable WCS in reference image: " + path);
    }
    return w;
}

} // namespace ast_placer::astrometry
