#pragma once

#include "ast_placer/core/types.hpp"
#include "ast_placer/io/table.hpp"

#include <ostream>

namespace ast_placer::placement {

// Map tiles from a table with min_ra, max_ra, min_dec, max_dec and the
// metric column (median_bg or sourcedens).
// Throws TableFormatError for missing or non-numeric columns.
TileMap tile_map_from_table(const io::Table& table, MapMetric metric);

TileMap load_tile_map(const fs::path& path, MapMetric metric, int hdu = 0,
                      std::ostream* log_out = nullptr);

} // namespace ast_placer::placement
