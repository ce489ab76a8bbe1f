#include "ast_placer/placement/tile_map.hpp"
#include "ast_placer/core/errors.hpp"
#include "ast_placer/io/fits_io.hpp"

#include <string>
#include <vector>

namespace ast_placer::placement {

TileMap tile_map_from_table(const io::Table& table, MapMetric metric) {
    const std::string value_col = map_metric_column(metric);
    for (const std::string& name : {std::string("min_ra"), std::string("max_ra"),
                                    std::string("min_dec"), std::string("max_dec"), value_col}) {
        if (!table.has_column(name)) {
            throw TableFormatError("tile map is missing column '" + name + "'");
        }
    }

    TileMap map;
    map.metric = metric;
    map.ra_min = table.numeric_column("min_ra");
    map.ra_max = table.numeric_column("max_ra");
    map.dec_min = table.numeric_column("min_dec");
    map.dec_max = table.numeric_column("max_dec");
    map.values = table.numeric_column(value_col);
    return map;
}

TileMap load_tile_map(const fs::path& path, MapMetric metric, int hdu, std::ostream* log_out) {
    io::Table table = io::read_table(path, hdu, log_out);
    TileMap map = tile_map_from_table(table, metric);
    if (log_out) {
        *log_out << "[MAP] " << map.size() << " tiles from " << path.string() << " ("
                 << map_metric_to_string(metric) << ")" << std::endl;
    }
    return map;
}

} // namespace ast_placer::placement
