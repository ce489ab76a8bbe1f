#include "ast_placer/config/configuration.hpp"
#include "ast_placer/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using ast_placer::config::Config;

TEST_CASE("config_defaults_are_valid") {
    Config cfg;

    REQUIRE(cfg.placement.n_bins == 5);
    REQUIRE(cfg.placement.n_realize == 1);
    REQUIRE(cfg.placement.max_attempts == 10000);
    REQUIRE_FALSE(cfg.placement.reject_negative.has_value());
    REQUIRE_FALSE(cfg.neighbor.separation.has_value());
    REQUIRE(cfg.neighbor.noise == Catch::Approx(3.0));
    REQUIRE(cfg.reference.hdu == 1);
    REQUIRE(cfg.output.precision == 5);
    REQUIRE_FALSE(cfg.random.seed.has_value());
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_reads_yaml_sections") {
    YAML::Node node = YAML::Load(R"(
map:
  path: maps/bg_map.fits
  hdu: 2
placement:
  n_bins: 8
  n_realize: 3
  reject_negative: true
  max_attempts: 50
neighbor:
  separation: 4.5
  noise: 2.0
reference:
  image: ref.fits
  hdu: 0
output:
  path: out/asts.txt
  precision: 3
random:
  seed: 12345
)");

    Config cfg = Config::from_yaml(node);

    REQUIRE(cfg.map.path == "maps/bg_map.fits");
    REQUIRE(cfg.map.hdu == 2);
    REQUIRE(cfg.placement.n_bins == 8);
    REQUIRE(cfg.placement.n_realize == 3);
    REQUIRE(cfg.placement.reject_negative == std::optional<bool>(true));
    REQUIRE(cfg.placement.max_attempts == 50);
    REQUIRE(cfg.neighbor.separation == std::optional<double>(4.5));
    REQUIRE(cfg.neighbor.noise == Catch::Approx(2.0));
    REQUIRE(cfg.reference.image == "ref.fits");
    REQUIRE(cfg.reference.hdu == 0);
    REQUIRE(cfg.output.path == "out/asts.txt");
    REQUIRE(cfg.output.precision == 3);
    REQUIRE(cfg.random.seed == std::optional<uint64_t>(12345));
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_to_yaml_round_trips_through_from_yaml") {
    Config cfg;
    cfg.neighbor.separation = 6.5;
    cfg.placement.reject_negative = false;
    cfg.random.seed = 7;

    Config back = Config::from_yaml(YAML::Load(YAML::Dump(cfg.to_yaml())));

    REQUIRE(back.neighbor.separation == std::optional<double>(6.5));
    REQUIRE(back.placement.reject_negative == std::optional<bool>(false));
    REQUIRE(back.random.seed == std::optional<uint64_t>(7));
}

TEST_CASE("config_without_separation_omits_it_from_yaml") {
    Config cfg;

    YAML::Node node = cfg.to_yaml();

    REQUIRE_FALSE(node["neighbor"]["separation"].IsDefined());
    REQUIRE_FALSE(Config::from_yaml(node).neighbor.separation.has_value());
}

TEST_CASE("config_null_seed_means_unseeded") {
    Config cfg = Config::from_yaml(YAML::Load("random:\n  seed: ~\n"));

    REQUIRE_FALSE(cfg.random.seed.has_value());
}

TEST_CASE("config_validate_rejects_out_of_range_values") {
    Config bins;
    bins.placement.n_bins = 0;
    REQUIRE_THROWS_AS(bins.validate(), ast_placer::ValidationError);

    Config realize;
    realize.placement.n_realize = 0;
    REQUIRE_THROWS_AS(realize.validate(), ast_placer::ValidationError);

    Config sep;
    sep.neighbor.separation = 0.0;
    REQUIRE_THROWS_AS(sep.validate(), ast_placer::ValidationError);

    Config noise;
    noise.neighbor.noise = -0.5;
    REQUIRE_THROWS_AS(noise.validate(), ast_placer::ValidationError);

    Config hdu;
    hdu.map.hdu = -1;
    REQUIRE_THROWS_AS(hdu.validate(), ast_placer::ValidationError);
}

TEST_CASE("config_type_errors_are_config_errors") {
    REQUIRE_THROWS_AS(Config::from_yaml(YAML::Load("placement:\n  n_bins: many\n")),
                      ast_placer::ConfigError);
}

TEST_CASE("config_load_reports_missing_file") {
    REQUIRE_THROWS_AS(Config::load("/nonexistent/ast_placer/config.yaml"),
                      ast_placer::ConfigError);
}
