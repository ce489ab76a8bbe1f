#include "ast_placer/placement/neighbor_sampler.hpp"
#include "ast_placer/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace ast_placer::placement {

namespace {

std::vector<double> numeric_values(const io::Table& catalog, const std::string& name) {
    const io::Column& c = catalog.column(name);
    std::vector<double> out;
    out.reserve(catalog.num_rows());
    for (size_t i = 0; i < catalog.num_rows(); ++i) {
        out.push_back(c.as_double(i));
    }
    return out;
}

void require_pair(const io::Table& catalog, const std::string& a, const std::string& b) {
    if (!catalog.has_column(b)) {
        throw MissingCoordinatesError("catalog has column '" + a + "' but no '" + b + "'");
    }
}

} // namespace

AnchorPositions extract_anchor_positions(const io::Table& catalog, const SkyToPixel* to_pixel) {
    AnchorPositions out;

    for (const auto& [xn, yn] : {std::pair<std::string, std::string>{"X", "Y"},
                                 std::pair<std::string, std::string>{"x", "y"}}) {
        if (catalog.has_column(xn)) {
            require_pair(catalog, xn, yn);
            out.x = numeric_values(catalog, xn);
            out.y = numeric_values(catalog, yn);
            out.source = xn + "," + yn;
            return out;
        }
    }

    std::string ra_name;
    std::string dec_name;
    if (catalog.has_column("RA")) {
        ra_name = "RA";
        dec_name = "DEC";
    } else if (catalog.has_column("ra")) {
        ra_name = "ra";
        dec_name = "dec";
    } else {
        throw MissingCoordinatesError(
            "catalog does not supply X, Y or RA, DEC columns for spatial AST distribution");
    }
    require_pair(catalog, ra_name, dec_name);

    if (!to_pixel) {
        throw MissingReferenceImageError(
            "a reference image is required to convert catalog " + ra_name + ", " + dec_name +
            " to pixel positions");
    }

    std::vector<double> ra = numeric_values(catalog, ra_name);
    std::vector<double> dec = numeric_values(catalog, dec_name);
    out.x.resize(ra.size());
    out.y.resize(ra.size());
    for (size_t i = 0; i < ra.size(); ++i) {
        if (!(*to_pixel)(ra[i], dec[i], out.x[i], out.y[i])) {
            std::ostringstream oss;
            oss << "catalog star " << i << " at (" << ra[i] << ", " << dec[i]
                << ") cannot be projected onto the reference image";
            throw ValidationError(oss.str());
        }
    }
    out.source = ra_name + "," + dec_name;
    return out;
}

InteriorBounds interior_bounds(const AnchorPositions& anchors, double separation, double noise) {
    if (anchors.size() == 0) {
        throw EmptyFilteredCatalogError("catalog has no stars");
    }
    const auto [xmin, xmax] = std::minmax_element(anchors.x.begin(), anchors.x.end());
    const auto [ymin, ymax] = std::minmax_element(anchors.y.begin(), anchors.y.end());
    const double margin = separation + noise;

    InteriorBounds b;
    b.x_lo = *xmin + margin;
    b.x_hi = *xmax - margin;
    b.y_lo = *ymin + margin;
    b.y_hi = *ymax - margin;
    return b;
}

std::vector<size_t> filter_interior_anchors(const AnchorPositions& anchors,
                                            double separation, double noise) {
    const InteriorBounds b = interior_bounds(anchors, separation, noise);

    std::vector<size_t> kept;
    for (size_t i = 0; i < anchors.size(); ++i) {
        const double x = anchors.x[i];
        const double y = anchors.y[i];
        if (x > b.x_lo && x < b.x_hi && y > b.y_lo && y < b.y_hi) {
            kept.push_back(i);
        }
    }

    if (kept.empty()) {
        std::ostringstream oss;
        oss << "no catalog star lies inside x in (" << b.x_lo << ", " << b.x_hi
            << "), y in (" << b.y_lo << ", " << b.y_hi << ")";
        throw EmptyFilteredCatalogError(oss.str());
    }
    return kept;
}

NeighborOffsets sample_neighbor_offsets(const AnchorPositions& anchors,
                                        const std::vector<size_t>& kept,
                                        size_t n_asts,
                                        double separation,
                                        double noise,
                                        core::RandomSource& rng,
                                        std::ostream* log_out) {
    if (kept.empty()) {
        throw EmptyFilteredCatalogError("no anchor stars to place ASTs around");
    }

    NeighborOffsets out;
    out.x.reserve(n_asts);
    out.y.reserve(n_asts);
    out.radius.reserve(n_asts);
    out.theta.reserve(n_asts);
    out.anchor.reserve(n_asts);

    const int n_kept = static_cast<int>(kept.size());
    for (size_t i = 0; i < n_asts; ++i) {
        const size_t a = kept[static_cast<size_t>(rng.index(n_kept))];
        const double r = separation + rng.uniform() * noise;
        const double theta = rng.uniform() * 2.0 * M_PI;

        out.anchor.push_back(a);
        out.radius.push_back(r);
        out.theta.push_back(theta);
        out.x.push_back(anchors.x[a] + r * std::cos(theta));
        out.y.push_back(anchors.y[a] + r * std::sin(theta));
    }

    if (log_out) {
        *log_out << "[NEIGHBOR] " << n_asts << " ASTs around " << kept.size() << " of "
                 << anchors.size() << " catalog stars (" << anchors.source << ")" << std::endl;
    }
    return out;
}

} // namespace ast_placer::placement
