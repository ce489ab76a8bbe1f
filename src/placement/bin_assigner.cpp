#include "ast_placer/placement/bin_assigner.hpp"
#include "ast_placer/core/errors.hpp"
#include "ast_placer/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace ast_placer::placement {

VectorXd compute_bin_edges(const VectorXd& values, int n_bins) {
    if (n_bins < 1) {
        throw InvalidRangeError("number of bins must be >= 1, got " + std::to_string(n_bins));
    }
    if (values.size() == 0) {
        throw InvalidRangeError("no metric values to bin");
    }
    if (!core::all_finite(values)) {
        throw InvalidRangeError("metric values must be finite");
    }

    const double vmin = values.minCoeff();
    const double vmax = values.maxCoeff();
    if (vmin == vmax) {
        std::ostringstream oss;
        oss << "degenerate metric range, all values equal " << vmin;
        throw InvalidRangeError(oss.str());
    }

    const double lo = vmin - 0.01 * std::abs(vmin);
    const double hi = vmax + 0.01 * std::abs(vmax);

    VectorXd edges(n_bins + 1);
    const double step = (hi - lo) / n_bins;
    for (int i = 0; i < n_bins; ++i) {
        edges[i] = lo + i * step;
    }
    edges[n_bins] = hi;
    return edges;
}

VectorXi digitize(const VectorXd& values, const VectorXd& edges) {
    VectorXi out(values.size());
    const double* first = edges.data();
    const double* last = edges.data() + edges.size();
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        out[i] = static_cast<int>(std::upper_bound(first, last, values[i]) - first);
    }
    return out;
}

BinAssignment assign_bins(const VectorXd& values, int n_bins) {
    BinAssignment result;
    result.edges = compute_bin_edges(values, n_bins);
    result.labels = digitize(values, result.edges);

    const double hi = result.edges[n_bins];
    for (Eigen::Index i = 0; i < result.labels.size(); ++i) {
        // Zero padding (max == 0) leaves the maximum on the upper edge;
        // the last bin is closed there.
        if (result.labels[i] == n_bins + 1 && values[i] == hi) {
            result.labels[i] = n_bins;
        }
        if (result.labels[i] < 1 || result.labels[i] > n_bins) {
            std::ostringstream oss;
            oss << "tile " << i << " with value " << values[i] << " fell outside ["
                << result.edges[0] << ", " << hi << "] (label " << result.labels[i] << ")";
            throw ValidationError(oss.str());
        }
    }
    return result;
}

} // namespace ast_placer::placement
