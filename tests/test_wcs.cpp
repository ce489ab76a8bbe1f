#include "ast_placer/astrometry/wcs.hpp"
#include "ast_placer/core/errors.hpp"
#include "ast_placer/core/utils.hpp"
#include "ast_placer/placement/sky_transform.hpp"

#include <filesystem>
#include <string>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
namespace astro = ast_placer::astrometry;
namespace io = ast_placer::io;

namespace {

io::FitsHeader tan_header() {
    io::FitsHeader h;
    h.set("CRVAL1", 10.684);
    h.set("CRVAL2", 41.269);
    h.set("CRPIX1", 512.5);
    h.set("CRPIX2", 512.5);
    h.set("CD1_1", -1.0e-4);
    h.set("CD1_2", 0.0);
    h.set("CD2_1", 0.0);
    h.set("CD2_2", 1.0e-4);
    h.set("NAXIS1", 1024);
    h.set("NAXIS2", 1024);
    return h;
}

fs::path temp_file(const std::string& name) {
    return fs::temp_directory_path() / ("ast_placer_" + ast_placer::core::get_run_id() + "_" + name);
}

} // namespace

TEST_CASE("wcs_from_cd_matrix_header") {
    astro::WCS w = astro::wcs_from_header(tan_header());

    REQUIRE(w.valid());
    REQUIRE(w.naxis1 == 1024);
    REQUIRE(w.pixel_scale_arcsec() == Catch::Approx(0.36));

    double x = 0.0;
    double y = 0.0;
    REQUIRE(w.sky_to_pixel(10.684, 41.269, x, y));
    REQUIRE(x == Catch::Approx(511.5));
    REQUIRE(y == Catch::Approx(511.5));
}

TEST_CASE("wcs_offsets_follow_cd_matrix_near_reference") {
    astro::WCS w = astro::wcs_from_header(tan_header());
    double x = 0.0;
    double y = 0.0;

    // 0.01 deg north of the reference point is 100 px up
    REQUIRE(w.sky_to_pixel(10.684, 41.279, x, y));
    REQUIRE(x == Catch::Approx(511.5).margin(1e-6));
    REQUIRE(y == Catch::Approx(611.5).margin(1e-2));

    // East (increasing RA) runs towards smaller x with a negative CD1_1
    REQUIRE(w.sky_to_pixel(10.694, 41.269, x, y));
    REQUIRE(x < 511.5);
}

TEST_CASE("wcs_from_cdelt_and_crota") {
    io::FitsHeader h;
    h.set("CRVAL1", 150.0);
    h.set("CRVAL2", 2.0);
    h.set("CRPIX1", 100.0);
    h.set("CRPIX2", 100.0);
    h.set("CDELT1", -2.0e-4);
    h.set("CDELT2", 2.0e-4);
    h.set("CROTA2", 90.0);

    astro::WCS w = astro::wcs_from_header(h);

    REQUIRE(w.valid());
    REQUIRE(w.cd1_1 == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(w.cd1_2 == Catch::Approx(-2.0e-4));
    REQUIRE(w.cd2_1 == Catch::Approx(-2.0e-4));
}

TEST_CASE("header_without_scale_gives_invalid_wcs") {
    io::FitsHeader h;
    h.set("CRVAL1", 1.0);
    h.set("CRVAL2", 2.0);

    REQUIRE_FALSE(astro::wcs_from_header(h).valid());
}

TEST_CASE("position_behind_projection_is_not_converted") {
    astro::WCS w = astro::wcs_from_header(tan_header());
    double x = 0.0;
    double y = 0.0;

    REQUIRE_FALSE(w.sky_to_pixel(190.684, -41.269, x, y));

    auto to_pixel = ast_placer::placement::make_sky_to_pixel(w);
    REQUIRE_FALSE(to_pixel(190.684, -41.269, x, y));
    REQUIRE(to_pixel(10.684, 41.269, x, y));
}

TEST_CASE("reference_wcs_from_astap_file") {
    const fs::path path = temp_file("ref.wcs");
    ast_placer::core::write_text(path,
                                 "CRVAL1  =             10.684 / RA of reference pixel\n"
                                 "CRVAL2  =             41.269 / DEC of reference pixel\n"
                                 "CRPIX1  =              512.5\n"
                                 "CRPIX2  =              512.5\n"
                                 "CD1_1   =            -0.0001\n"
                                 "CD1_2   =                0.0\n"
                                 "CD2_1   =                0.0\n"
                                 "CD2_2   =             0.0001\n"
                                 "END\n");

    astro::WCS w = astro::load_reference_wcs(path.string());
    fs::remove(path);

    REQUIRE(w.crval1 == Catch::Approx(10.684));
    REQUIRE(w.cd2_2 == Catch::Approx(1.0e-4));
}

TEST_CASE("reference_wcs_without_solution_fails") {
    const fs::path path = temp_file("empty.wcs");
    ast_placer::core::write_text(path, "CRVAL1  = 10.0\nEND\n");

    REQUIRE_THROWS_AS(astro::load_reference_wcs(path.string()), ast_placer::FitsError);
    fs::remove(path);

    REQUIRE_THROWS_AS(astro::load_reference_wcs("/nonexistent/ast_placer/ref.wcs"),
                      ast_placer::IOError);
}
