#pragma once

#include "ast_placer/io/table.hpp"

#include <cstddef>
#include <vector>

namespace ast_placer::placement {

// Source row for every output row: n_groups consecutive blocks, each
// holding every star n_realize times in a row (s0 s0 s1 s1 ... for n_realize = 2).
std::vector<size_t> replication_order(size_t n_stars, int n_realize, int n_groups);

// stars.num_rows() * n_realize * n_groups rows in replication_order.
// Throws ValidationError if n_realize < 1 or n_groups < 1.
io::Table replicate_stars(const io::Table& stars, int n_realize, int n_groups);

} // namespace ast_placer::placement
