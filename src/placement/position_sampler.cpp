#include "ast_placer/placement/position_sampler.hpp"
#include "ast_placer/core/errors.hpp"

#include <sstream>
#include <string>

namespace ast_placer::placement {

namespace {

struct Draw {
    int tile;
    double ra;
    double dec;
};

Draw draw_in_group(const TileMap& map, const TileGroup& group, core::RandomSource& rng) {
    Draw d;
    d.tile = group.tiles[static_cast<size_t>(rng.index(static_cast<int>(group.tiles.size())))];
    const SkyTile box = map.tile(d.tile);
    d.ra = box.ra_min + rng.uniform() * (box.ra_max - box.ra_min);
    d.dec = box.dec_min + rng.uniform() * (box.dec_max - box.dec_min);
    return d;
}

} // namespace

SampledPositions sample_tile_positions(const TileMap& map,
                                       const std::vector<TileGroup>& groups,
                                       size_t rows_per_group,
                                       const SkyToPixel* to_pixel,
                                       core::RandomSource& rng,
                                       const SamplerOptions& options,
                                       std::ostream* log_out) {
    if (options.max_attempts < 1) {
        throw ValidationError("max_attempts must be >= 1");
    }
    for (const auto& g : groups) {
        if (g.tiles.empty()) {
            throw ValidationError("tile group for bin " + std::to_string(g.bin) + " is empty");
        }
        for (int t : g.tiles) {
            if (t < 0 || t >= map.size()) {
                throw ValidationError("tile index " + std::to_string(t) + " out of range");
            }
        }
    }

    SampledPositions out;
    out.frame = to_pixel ? CoordFrame::PIXEL : CoordFrame::SKY;
    const size_t total = rows_per_group * groups.size();
    out.x.reserve(total);
    out.y.reserve(total);
    out.bin_index.reserve(total);
    out.tile.reserve(total);

    const bool rejecting = options.reject_negative && to_pixel != nullptr;

    for (size_t gi = 0; gi < groups.size(); ++gi) {
        const TileGroup& group = groups[gi];
        long long group_rejected = 0;

        for (size_t i = 0; i < rows_per_group; ++i) {
            Draw d{};
            double x = -1.0;
            double y = -1.0;
            int attempts = 0;

            while (true) {
                if (attempts >= options.max_attempts) {
                    std::ostringstream oss;
                    oss << "no valid pixel position after " << attempts
                        << " draws in bin " << gi << " (" << group.tiles.size() << " tiles)";
                    throw PositionSamplingExhausted(oss.str());
                }
                ++attempts;
                d = draw_in_group(map, group, rng);

                if (!to_pixel) {
                    x = d.ra;
                    y = d.dec;
                    break;
                }

                bool projected = (*to_pixel)(d.ra, d.dec, x, y);
                if (!rejecting) {
                    if (!projected) {
                        std::ostringstream oss;
                        oss << "sky position (" << d.ra << ", " << d.dec
                            << ") cannot be projected onto the reference image";
                        throw ValidationError(oss.str());
                    }
                    break;
                }
                if (projected && x >= 0.0 && y >= 0.0) break;
                ++group_rejected;
            }

            out.attempts += attempts;
            out.x.push_back(x);
            out.y.push_back(y);
            out.bin_index.push_back(static_cast<long long>(gi));
            out.tile.push_back(d.tile);
        }

        if (log_out) {
            *log_out << "[SAMPLE] bin " << gi << ": " << rows_per_group << " positions over "
                     << group.tiles.size() << " tiles";
            if (rejecting) {
                *log_out << ", " << group_rejected << " draws rejected";
            }
            *log_out << std::endl;
        }
    }

    return out;
}

} // namespace ast_placer::placement
