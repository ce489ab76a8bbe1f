#include "ast_placer/placement/star_replicator.hpp"
#include "ast_placer/core/errors.hpp"

#include <string>

namespace ast_placer::placement {

std::vector<size_t> replication_order(size_t n_stars, int n_realize, int n_groups) {
    if (n_realize < 1) {
        throw ValidationError("number of realizations must be >= 1, got " +
                              std::to_string(n_realize));
    }
    if (n_groups < 1) {
        throw ValidationError("number of tile groups must be >= 1, got " +
                              std::to_string(n_groups));
    }

    std::vector<size_t> order;
    order.reserve(n_stars * static_cast<size_t>(n_realize) * static_cast<size_t>(n_groups));
    for (int g = 0; g < n_groups; ++g) {
        for (size_t s = 0; s < n_stars; ++s) {
            for (int r = 0; r < n_realize; ++r) {
                order.push_back(s);
            }
        }
    }
    return order;
}

io::Table replicate_stars(const io::Table& stars, int n_realize, int n_groups) {
    return stars.take_rows(replication_order(stars.num_rows(), n_realize, n_groups));
}

} // namespace ast_placer::placement
