#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

namespace ast_placer {

namespace fs = std::filesystem;

// Vector types (NumPy equivalents)
using VectorXd = Eigen::VectorXd;
using VectorXi = Eigen::VectorXi;

// Scalar property a tile map carries
enum class MapMetric {
    BACKGROUND,      // median sky background per tile
    SOURCE_DENSITY   // stellar source density per tile
};

inline std::string map_metric_to_string(MapMetric metric) {
    switch (metric) {
        case MapMetric::BACKGROUND: return "background";
        case MapMetric::SOURCE_DENSITY: return "source_density";
        default: return "unknown";
    }
}

// Column holding the metric in a map table
inline std::string map_metric_column(MapMetric metric) {
    switch (metric) {
        case MapMetric::BACKGROUND: return "median_bg";
        case MapMetric::SOURCE_DENSITY: return "sourcedens";
        default: return "";
    }
}

// Sky tile of a background / source density map
struct SkyTile {
    double ra_min;
    double ra_max;
    double dec_min;
    double dec_max;
    double value;   // metric (background or source density)
};

// Tile map, column layout as read from the map table
struct TileMap {
    MapMetric metric = MapMetric::BACKGROUND;
    VectorXd ra_min;
    VectorXd ra_max;
    VectorXd dec_min;
    VectorXd dec_max;
    VectorXd values;

    int size() const { return static_cast<int>(values.size()); }

    SkyTile tile(int i) const {
        return {ra_min[i], ra_max[i], dec_min[i], dec_max[i], values[i]};
    }
};

// Output coordinate frame
enum class CoordFrame {
    SKY,    // RA, DEC
    PIXEL   // X, Y
};

inline std::string coord_frame_to_string(CoordFrame frame) {
    switch (frame) {
        case CoordFrame::SKY: return "SKY";
        case CoordFrame::PIXEL: return "PIXEL";
        default: return "UNKNOWN";
    }
}

// Run stages reported in events
enum class Stage {
    LOAD_INPUTS = 0,
    MAP_PLACEMENT = 1,
    NEIGHBOR_PLACEMENT = 2
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::LOAD_INPUTS: return "LOAD_INPUTS";
        case Stage::MAP_PLACEMENT: return "MAP_PLACEMENT";
        case Stage::NEIGHBOR_PLACEMENT: return "NEIGHBOR_PLACEMENT";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

} // namespace ast_placer
