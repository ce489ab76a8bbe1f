#include "ast_placer/placement/placement.hpp"
#include "ast_placer/core/errors.hpp"
#include "ast_placer/io/ascii_table.hpp"
#include "ast_placer/placement/output_assembler.hpp"
#include "ast_placer/placement/star_replicator.hpp"

#include <sstream>
#include <string>
#include <utility>

namespace ast_placer::placement {

io::Table place_by_map(const io::Table& stars,
                       const TileMap& map,
                       const MapPlacementOptions& options,
                       bool default_reject_negative,
                       const SkyToPixel* to_pixel,
                       core::RandomSource& rng,
                       MapPlacementReport* report,
                       std::ostream* log_out) {
    if (options.n_realize < 1) {
        throw ValidationError("n_realize must be >= 1, got " + std::to_string(options.n_realize));
    }
    if (options.precision < 0) {
        throw ValidationError("precision must be >= 0");
    }

    BinAssignment bins = assign_bins(map.values, options.n_bins);
    std::vector<TileGroup> groups = group_tiles_by_bin(bins.labels, bins.n_bins());

    if (log_out) {
        *log_out << "[BINS] " << map_metric_to_string(map.metric) << " range ["
                 << bins.edges[0] << ", " << bins.edges[bins.n_bins()] << "], "
                 << bins.n_bins() << " bins, " << groups.size() << " non-empty" << std::endl;
        for (size_t gi = 0; gi < groups.size(); ++gi) {
            const int b = groups[gi].bin;
            *log_out << "[BINS]   region " << gi << ": [" << bins.edges[b] << ", "
                     << bins.edges[b + 1] << ") " << groups[gi].tiles.size() << " tiles"
                     << std::endl;
        }
    }

    const int n_groups = static_cast<int>(groups.size());
    io::Table repeated = replicate_stars(stars, options.n_realize, n_groups);
    const size_t rows_per_group = stars.num_rows() * static_cast<size_t>(options.n_realize);

    SamplerOptions sampler;
    sampler.reject_negative = options.reject_negative.value_or(default_reject_negative);
    sampler.max_attempts = options.max_attempts;

    SampledPositions pos = sample_tile_positions(map, groups, rows_per_group, to_pixel, rng,
                                                 sampler, log_out);

    io::Table out = assemble_output(repeated, pos.frame, std::move(pos.x), std::move(pos.y),
                                    &pos.bin_index);

    if (options.output_path) {
        io::write_ascii_table(*options.output_path, out,
                              fixed_point_formats(out, options.precision, 2));
        if (log_out) {
            *log_out << "[OUTPUT] " << out.num_rows() << " rows written to "
                     << options.output_path->string() << std::endl;
        }
    }

    if (report) {
        report->bins = std::move(bins);
        report->groups = std::move(groups);
        report->rows_per_group = rows_per_group;
        report->attempts = pos.attempts;
        report->frame = pos.frame;
    }
    return out;
}

io::Table pick_positions_per_background(const io::Table& stars,
                                        const TileMap& map,
                                        const MapPlacementOptions& options,
                                        const SkyToPixel* to_pixel,
                                        core::RandomSource& rng,
                                        MapPlacementReport* report,
                                        std::ostream* log_out) {
    return place_by_map(stars, map, options, true, to_pixel, rng, report, log_out);
}

io::Table pick_positions_per_density(const io::Table& stars,
                                     const TileMap& map,
                                     const MapPlacementOptions& options,
                                     const SkyToPixel* to_pixel,
                                     core::RandomSource& rng,
                                     MapPlacementReport* report,
                                     std::ostream* log_out) {
    return place_by_map(stars, map, options, false, to_pixel, rng, report, log_out);
}

io::Table pick_positions_near_stars(const io::Table& catalog,
                                    const io::Table& asts,
                                    const NeighborPlacementOptions& options,
                                    const SkyToPixel* to_pixel,
                                    core::RandomSource& rng,
                                    NeighborPlacementReport* report,
                                    std::ostream* log_out) {
    if (!(options.separation >= 0.0)) {
        throw ValidationError("separation must be >= 0");
    }
    if (!(options.noise >= 0.0)) {
        throw ValidationError("noise must be >= 0");
    }

    AnchorPositions anchors = extract_anchor_positions(catalog, to_pixel);
    std::vector<size_t> kept = filter_interior_anchors(anchors, options.separation, options.noise);
    NeighborOffsets offsets = sample_neighbor_offsets(anchors, kept, asts.num_rows(),
                                                      options.separation, options.noise, rng,
                                                      log_out);

    io::Table out = assemble_output(asts, CoordFrame::PIXEL, offsets.x, offsets.y, nullptr, "%.2f");

    if (report) {
        report->anchors = std::move(anchors);
        report->kept = std::move(kept);
        report->offsets = std::move(offsets);
    }
    return out;
}

io::Table pick_positions_near_stars_file(const io::Table& catalog,
                                         const fs::path& ast_path,
                                         const NeighborPlacementOptions& options,
                                         const SkyToPixel* to_pixel,
                                         core::RandomSource& rng,
                                         NeighborPlacementReport* report,
                                         std::ostream* log_out) {
    io::Table asts = io::read_ascii_table(ast_path);
    io::Table out = pick_positions_near_stars(catalog, asts, options, to_pixel, rng, report,
                                              log_out);
    io::write_ascii_table(ast_path, out);
    if (log_out) {
        *log_out << "[OUTPUT] " << out.num_rows() << " ASTs rewritten in " << ast_path.string()
                 << std::endl;
    }
    return out;
}

} // namespace ast_placer::placement
