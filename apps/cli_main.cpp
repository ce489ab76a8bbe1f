#include "ast_placer/astrometry/wcs.hpp"
#include "ast_placer/config/configuration.hpp"
#include "ast_placer/core/errors.hpp"
#include "ast_placer/core/events.hpp"
#include "ast_placer/core/random.hpp"
#include "ast_placer/core/utils.hpp"
#include "ast_placer/io/fits_io.hpp"
#include "ast_placer/placement/placement.hpp"
#include "ast_placer/placement/tile_map.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using json = nlohmann::json;
using namespace ast_placer;

namespace {

struct MapArgs {
    std::string config_path;
    std::string stars;
    std::string map;
    std::string refimage;
    std::string out;
    std::string log_file;
    int n_bins = 5;
    int n_realize = 1;
    int max_attempts = 10000;
    uint64_t seed = 0;
};

struct NeighborArgs {
    std::string config_path;
    std::string catalog;
    std::string asts;
    std::string refimage;
    std::string log_file;
    double separation = 0.0;
    double noise = 3.0;
    uint64_t seed = 0;
};

config::Config load_config(const std::string& path) {
    if (path.empty()) return config::Config{};
    return config::Config::load(path);
}

std::unique_ptr<std::ofstream> open_log_file(const std::string& path) {
    if (path.empty()) return nullptr;
    auto f = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!*f) {
        throw IOError("Cannot open log file: " + path);
    }
    return f;
}

std::string sha256_or_empty(const std::string& path) {
    if (path.empty() || !fs::exists(path)) return "";
    return core::sha256_file(path);
}

std::optional<placement::SkyToPixel> reference_transform(const config::ReferenceConfig& ref) {
    if (ref.image.empty()) return std::nullopt;
    astrometry::WCS wcs = astrometry::load_reference_wcs(ref.image, ref.hdu);
    std::cerr << "[WCS] " << ref.image << ": CRVAL=(" << wcs.crval1 << ", " << wcs.crval2
              << "), scale " << wcs.pixel_scale_arcsec() << " arcsec/px" << std::endl;
    return placement::make_sky_to_pixel(wcs);
}

int run_map_command(MapMetric metric, const MapArgs& args, const CLI::App& cmd) {
    const std::string run_id = core::get_run_id();
    auto log_file = open_log_file(args.log_file);
    core::EventEmitter emitter(log_file.get());
    Stage stage = Stage::LOAD_INPUTS;

    try {
        config::Config cfg = load_config(args.config_path);
        if (cmd.count("--map")) cfg.map.path = args.map;
        if (cmd.count("--bins")) cfg.placement.n_bins = args.n_bins;
        if (cmd.count("--realize")) cfg.placement.n_realize = args.n_realize;
        if (cmd.count("--max-attempts")) cfg.placement.max_attempts = args.max_attempts;
        if (cmd.count("--refimage")) cfg.reference.image = args.refimage;
        if (cmd.count("--out")) cfg.output.path = args.out;
        if (cmd.count("--seed")) cfg.random.seed = args.seed;
        if (cfg.map.path.empty()) {
            throw ValidationError("no tile map given (--map or map.path)");
        }
        cfg.validate();

        emitter.run_start(run_id,
                          {{"command", map_metric_to_string(metric)},
                           {"config", args.config_path},
                           {"stars", args.stars},
                           {"stars_sha256", sha256_or_empty(args.stars)},
                           {"map", cfg.map.path},
                           {"map_sha256", sha256_or_empty(cfg.map.path)},
                           {"reference", cfg.reference.image},
                           {"n_bins", cfg.placement.n_bins},
                           {"n_realize", cfg.placement.n_realize},
                           {"seed", cfg.random.seed ? json(*cfg.random.seed) : json(nullptr)}},
                          std::cout);

        emitter.stage_start(run_id, Stage::LOAD_INPUTS, std::cout);
        io::Table stars = io::read_table(args.stars, 0, &std::cerr);
        TileMap map = placement::load_tile_map(cfg.map.path, metric, cfg.map.hdu, &std::cerr);
        std::optional<placement::SkyToPixel> to_pixel = reference_transform(cfg.reference);
        emitter.stage_end(run_id, Stage::LOAD_INPUTS, "ok",
                          {{"stars", stars.num_rows()},
                           {"tiles", map.size()},
                           {"frame", coord_frame_to_string(to_pixel ? CoordFrame::PIXEL
                                                                    : CoordFrame::SKY)}},
                          std::cout);

        placement::MapPlacementOptions opts;
        opts.n_bins = cfg.placement.n_bins;
        opts.n_realize = cfg.placement.n_realize;
        opts.reject_negative = cfg.placement.reject_negative;
        opts.max_attempts = cfg.placement.max_attempts;
        opts.precision = cfg.output.precision;
        if (!cfg.output.path.empty()) opts.output_path = fs::path(cfg.output.path);

        core::RandomSource rng = core::RandomSource::from_optional_seed(cfg.random.seed);
        placement::MapPlacementReport report;

        stage = Stage::MAP_PLACEMENT;
        emitter.stage_start(run_id, Stage::MAP_PLACEMENT, std::cout);
        io::Table out = metric == MapMetric::BACKGROUND
                            ? placement::pick_positions_per_background(
                                  stars, map, opts, to_pixel ? &*to_pixel : nullptr, rng,
                                  &report, &std::cerr)
                            : placement::pick_positions_per_density(
                                  stars, map, opts, to_pixel ? &*to_pixel : nullptr, rng,
                                  &report, &std::cerr);
        json summary = {{"bins", report.bins.n_bins()},
                        {"regions", report.groups.size()},
                        {"rows_per_region", report.rows_per_group},
                        {"attempts", report.attempts},
                        {"rows", out.num_rows()}};
        if (opts.output_path) {
            summary["path"] = cfg.output.path;
            summary["sha256"] = sha256_or_empty(cfg.output.path);
        }
        emitter.stage_end(run_id, Stage::MAP_PLACEMENT, "ok", summary, std::cout);
        if (!opts.output_path) {
            emitter.warning(run_id, "no output path given, table not written", std::cout);
        }

        emitter.run_end(run_id, true, "ok", std::cout);
        return 0;
    } catch (const AstPlacerError& e) {
        std::cerr << "Error during " << stage_to_string(stage) << ": " << e.what() << std::endl;
        emitter.error(run_id, e.what(), std::cout);
        emitter.run_end(run_id, false, "error", std::cout);
        return 1;
    }
}

int run_neighbor_command(const NeighborArgs& args, const CLI::App& cmd) {
    const std::string run_id = core::get_run_id();
    auto log_file = open_log_file(args.log_file);
    core::EventEmitter emitter(log_file.get());
    Stage stage = Stage::LOAD_INPUTS;

    try {
        config::Config cfg = load_config(args.config_path);
        if (cmd.count("--separation")) cfg.neighbor.separation = args.separation;
        if (cmd.count("--noise")) cfg.neighbor.noise = args.noise;
        if (cmd.count("--refimage")) cfg.reference.image = args.refimage;
        if (cmd.count("--seed")) cfg.random.seed = args.seed;
        if (!cfg.neighbor.separation) {
            throw ValidationError("no separation given (--separation or neighbor.separation)");
        }
        cfg.validate();

        emitter.run_start(run_id,
                          {{"command", "neighbor"},
                           {"catalog", args.catalog},
                           {"catalog_sha256", sha256_or_empty(args.catalog)},
                           {"asts", args.asts},
                           {"asts_sha256", sha256_or_empty(args.asts)},
                           {"reference", cfg.reference.image},
                           {"separation", *cfg.neighbor.separation},
                           {"noise", cfg.neighbor.noise},
                           {"seed", cfg.random.seed ? json(*cfg.random.seed) : json(nullptr)}},
                          std::cout);

        emitter.stage_start(run_id, Stage::LOAD_INPUTS, std::cout);
        io::Table catalog = io::read_table(args.catalog, 0, &std::cerr);
        std::optional<placement::SkyToPixel> to_pixel = reference_transform(cfg.reference);
        emitter.stage_end(run_id, Stage::LOAD_INPUTS, "ok",
                          {{"catalog", catalog.num_rows()}}, std::cout);

        placement::NeighborPlacementOptions opts;
        opts.separation = *cfg.neighbor.separation;
        opts.noise = cfg.neighbor.noise;

        core::RandomSource rng = core::RandomSource::from_optional_seed(cfg.random.seed);
        placement::NeighborPlacementReport report;

        stage = Stage::NEIGHBOR_PLACEMENT;
        emitter.stage_start(run_id, Stage::NEIGHBOR_PLACEMENT, std::cout);
        // Reads, places and rewrites --asts
        io::Table out = placement::pick_positions_near_stars_file(
            catalog, args.asts, opts, to_pixel ? &*to_pixel : nullptr, rng, &report, &std::cerr);
        emitter.stage_end(run_id, Stage::NEIGHBOR_PLACEMENT, "ok",
                          {{"anchors", report.anchors.x.size()},
                           {"interior", report.kept.size()},
                           {"asts", out.num_rows()},
                           {"path", args.asts},
                           {"sha256", sha256_or_empty(args.asts)}},
                          std::cout);

        emitter.run_end(run_id, true, "ok", std::cout);
        return 0;
    } catch (const AstPlacerError& e) {
        std::cerr << "Error during " << stage_to_string(stage) << ": " << e.what() << std::endl;
        emitter.error(run_id, e.what(), std::cout);
        emitter.run_end(run_id, false, "error", std::cout);
        return 1;
    }
}

void add_map_options(CLI::App* cmd, MapArgs& args) {
    cmd->add_option("--stars", args.stars, "Synthetic star table")->required();
    cmd->add_option("--map", args.map, "Tile map table (min_ra, max_ra, min_dec, max_dec, metric)");
    cmd->add_option("--bins", args.n_bins, "Number of metric bins");
    cmd->add_option("--realize", args.n_realize, "Realizations per star and region");
    cmd->add_option("--refimage", args.refimage, "Reference image or .wcs file for X/Y output");
    cmd->add_option("--out", args.out, "Output table (overwritten)");
    cmd->add_option("--seed", args.seed, "Random seed");
    cmd->add_option("--config", args.config_path, "Path to config.yaml");
    cmd->add_option("--max-attempts", args.max_attempts, "Draws per row before giving up");
    cmd->add_option("--log-file", args.log_file, "Append JSON events to this file");
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"AST placer: positions for artificial star tests"};
    app.require_subcommand(1);

    MapArgs bg_args;
    MapArgs dens_args;
    NeighborArgs nb_args;

    auto bg_cmd = app.add_subcommand("background", "Place stars across regions of similar sky background");
    add_map_options(bg_cmd, bg_args);

    auto dens_cmd = app.add_subcommand("density", "Place stars across regions of similar source density");
    add_map_options(dens_cmd, dens_args);

    auto nb_cmd = app.add_subcommand("neighbor", "Place ASTs in an annulus around catalog stars");
    nb_cmd->add_option("--catalog", nb_args.catalog, "Observed star catalog")->required();
    nb_cmd->add_option("--asts", nb_args.asts, "AST list, rewritten in place")->required();
    nb_cmd->add_option("--separation", nb_args.separation,
                       "Inner annulus radius (pixels); required unless neighbor.separation is set");
    nb_cmd->add_option("--noise", nb_args.noise, "Annulus width (pixels)");
    nb_cmd->add_option("--refimage", nb_args.refimage, "Reference image or .wcs file");
    nb_cmd->add_option("--seed", nb_args.seed, "Random seed");
    nb_cmd->add_option("--config", nb_args.config_path, "Path to config.yaml");
    nb_cmd->add_option("--log-file", nb_args.log_file, "Append JSON events to this file");

    CLI11_PARSE(app, argc, argv);

    try {
        if (bg_cmd->parsed()) {
            return run_map_command(MapMetric::BACKGROUND, bg_args, *bg_cmd);
        }
        if (dens_cmd->parsed()) {
            return run_map_command(MapMetric::SOURCE_DENSITY, dens_args, *dens_cmd);
        }
        if (nb_cmd->parsed()) {
            return run_neighbor_command(nb_args, *nb_cmd);
        }
    } catch (const AstPlacerError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << app.help() << std::endl;
    return 1;
}
