#include "ast_placer/astrometry/wcs.hpp"
#include "ast_placer/core/errors.hpp"
#include "ast_placer/core/utils.hpp"
#include "ast_placer/io/fits_io.hpp"
#include "ast_placer/placement/bin_assigner.hpp"
#include "ast_placer/placement/tile_map.hpp"

#include <cmath>
#include <filesystem>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include <fitsio.h>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
namespace io = ast_placer::io;
namespace pl = ast_placer::placement;
using ast_placer::io::ColumnType;

namespace {

struct TempDir {
    fs::path path;
    explicit TempDir(const std::string& name) {
        path = fs::temp_directory_path() /
               ("ast_placer_" + name + "_" + ast_placer::core::get_run_id());
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

// Empty primary HDU followed by a binary table "TILES" with scalar, string,
// vector (4D) and integer columns. tile_id declares TNULL = -99.
void write_map_fits(const fs::path& path, const std::vector<double>& median_bg,
                    std::vector<long> tile_ids) {
    const long n = static_cast<long>(median_bg.size());
    std::vector<double> min_ra, max_ra, min_dec, max_dec, corners;
    std::vector<std::string> names;
    for (long i = 0; i < n; ++i) {
        min_ra.push_back(10.0 + i);
        max_ra.push_back(10.5 + i);
        min_dec.push_back(-5.0);
        max_dec.push_back(-4.5);
        for (int k = 0; k < 4; ++k) corners.push_back(static_cast<double>(4 * i + k));
        names.push_back("tile_" + std::to_string(i));
    }
    std::vector<double> bg = median_bg;

    std::vector<std::string> ttype = {"min_ra", "max_ra", "min_dec", "max_dec",
                                      "median_bg", "name", "corners", "tile_id"};
    std::vector<std::string> tform = {"1D", "1D", "1D", "1D", "1D", "8A", "4D", "1J"};
    std::vector<char*> ttype_ptrs;
    std::vector<char*> tform_ptrs;
    for (auto& s : ttype) ttype_ptrs.push_back(&s[0]);
    for (auto& s : tform) tform_ptrs.push_back(&s[0]);
    std::vector<char*> name_ptrs;
    for (auto& s : names) name_ptrs.push_back(&s[0]);

    fitsfile* fptr = nullptr;
    int status = 0;
    const std::string filepath = "!" + path.string();
    fits_create_file(&fptr, filepath.c_str(), &status);
    fits_create_img(fptr, BYTE_IMG, 0, nullptr, &status);
    fits_create_tbl(fptr, BINARY_TBL, n, static_cast<int>(ttype.size()), ttype_ptrs.data(),
                    tform_ptrs.data(), nullptr, "TILES", &status);
    long tnull = -99;
    fits_write_key(fptr, TLONG, "TNULL8", &tnull, "undefined tile id", &status);
    fits_write_col(fptr, TDOUBLE, 1, 1, 1, n, min_ra.data(), &status);
    fits_write_col(fptr, TDOUBLE, 2, 1, 1, n, max_ra.data(), &status);
    fits_write_col(fptr, TDOUBLE, 3, 1, 1, n, min_dec.data(), &status);
    fits_write_col(fptr, TDOUBLE, 4, 1, 1, n, max_dec.data(), &status);
    fits_write_col(fptr, TDOUBLE, 5, 1, 1, n, bg.data(), &status);
    fits_write_col(fptr, TSTRING, 6, 1, 1, n, name_ptrs.data(), &status);
    fits_write_col(fptr, TDOUBLE, 7, 1, 1, 4 * n, corners.data(), &status);
    fits_write_col(fptr, TLONG, 8, 1, 1, n, tile_ids.data(), &status);
    fits_close_file(fptr, &status);
    REQUIRE(status == 0);
}

// Single primary HDU carrying a TAN solution
void write_reference_image(const fs::path& path) {
    double crval1 = 10.684;
    double crval2 = 41.269;
    double crpix = 512.5;
    double cd11 = -1.0e-4;
    double cd22 = 1.0e-4;
    double zero = 0.0;

    fitsfile* fptr = nullptr;
    int status = 0;
    const std::string filepath = "!" + path.string();
    fits_create_file(&fptr, filepath.c_str(), &status);
    fits_create_img(fptr, BYTE_IMG, 0, nullptr, &status);
    fits_write_key(fptr, TDOUBLE, "CRVAL1", &crval1, "Reference RA (degrees)", &status);
    fits_write_key(fptr, TDOUBLE, "CRVAL2", &crval2, "Reference Dec (degrees)", &status);
    fits_write_key(fptr, TDOUBLE, "CRPIX1", &crpix, "Reference pixel X", &status);
    fits_write_key(fptr, TDOUBLE, "CRPIX2", &crpix, "Reference pixel Y", &status);
    fits_write_key(fptr, TDOUBLE, "CD1_1", &cd11, "", &status);
    fits_write_key(fptr, TDOUBLE, "CD1_2", &zero, "", &status);
    fits_write_key(fptr, TDOUBLE, "CD2_1", &zero, "", &status);
    fits_write_key(fptr, TDOUBLE, "CD2_2", &cd22, "", &status);
    fits_close_file(fptr, &status);
    REQUIRE(status == 0);
}

} // namespace

TEST_CASE("fits_table_reads_first_table_hdu_and_skips_vector_columns") {
    TempDir dir("fits_table");
    const fs::path path = dir.path / "bg_map.fits";
    write_map_fits(path, {1.5, 2.5, 4.0}, {7, 8, 9});

    std::ostringstream log;
    io::Table t = io::read_fits_table(path, 0, &log);

    REQUIRE(t.num_rows() == 3);
    REQUIRE(t.column_names() == std::vector<std::string>{"min_ra", "max_ra", "min_dec", "max_dec",
                                                         "median_bg", "name", "tile_id"});
    REQUIRE(log.str().find("Skipping vector column 'corners'") != std::string::npos);

    REQUIRE(t.column("median_bg").type == ColumnType::FLOAT);
    REQUIRE(t.column("median_bg").floats == std::vector<double>{1.5, 2.5, 4.0});
    REQUIRE(t.column("max_ra").floats[2] == Catch::Approx(12.5));
    REQUIRE(t.column("name").type == ColumnType::TEXT);
    REQUIRE(t.column("name").texts[1] == "tile_1");
    REQUIRE(t.column("tile_id").type == ColumnType::INT);
    REQUIRE(t.column("tile_id").ints == std::vector<long long>{7, 8, 9});

    io::Table explicit_hdu = io::read_fits_table(path, 1);
    REQUIRE(explicit_hdu.column_names() == t.column_names());
}

TEST_CASE("fits_table_missing_hdu_is_a_fits_error") {
    TempDir dir("fits_missing_hdu");
    const fs::path map_path = dir.path / "bg_map.fits";
    const fs::path image_path = dir.path / "ref.fits";
    write_map_fits(map_path, {1.0, 2.0}, {1, 2});
    write_reference_image(image_path);

    REQUIRE_THROWS_AS(io::read_fits_table(map_path, 5), ast_placer::FitsError);
    REQUIRE_THROWS_AS(io::read_fits_table(image_path, 0), ast_placer::FitsError);
    REQUIRE_THROWS_AS(io::read_fits_table(dir.path / "absent.fits"), ast_placer::FitsError);
}

TEST_CASE("tile_map_loads_from_fits_table") {
    TempDir dir("fits_tile_map");
    const fs::path path = dir.path / "bg_map.fits";
    write_map_fits(path, {1.5, 2.5, 4.0}, {7, 8, 9});

    ast_placer::TileMap map = pl::load_tile_map(path, ast_placer::MapMetric::BACKGROUND);

    REQUIRE(map.size() == 3);
    REQUIRE(map.ra_min[1] == Catch::Approx(11.0));
    REQUIRE(map.dec_max[0] == Catch::Approx(-4.5));
    REQUIRE(map.values[2] == Catch::Approx(4.0));
}

TEST_CASE("undefined_float_cells_read_as_nan_and_fail_binning") {
    TempDir dir("fits_null_float");
    const fs::path path = dir.path / "bg_map.fits";
    write_map_fits(path, {1.5, std::numeric_limits<double>::quiet_NaN(), 4.0}, {7, 8, 9});

    io::Table t = io::read_fits_table(path);
    REQUIRE(std::isnan(t.column("median_bg").floats[1]));

    ast_placer::TileMap map = pl::load_tile_map(path, ast_placer::MapMetric::BACKGROUND);
    REQUIRE_THROWS_AS(pl::assign_bins(map.values, 2), ast_placer::InvalidRangeError);
}

TEST_CASE("undefined_integer_cells_are_a_table_format_error") {
    TempDir dir("fits_null_int");
    const fs::path path = dir.path / "bg_map.fits";
    write_map_fits(path, {1.5, 2.5, 4.0}, {7, -99, 9});

    REQUIRE_THROWS_AS(io::read_fits_table(path), ast_placer::TableFormatError);
}

TEST_CASE("fits_header_reads_requested_hdu") {
    TempDir dir("fits_header");
    const fs::path path = dir.path / "bg_map.fits";
    write_map_fits(path, {1.0, 2.0}, {1, 2});

    io::FitsHeader primary = io::read_fits_header(path, 0);
    io::FitsHeader table = io::read_fits_header(path, 1);

    REQUIRE_FALSE(primary.get_string("EXTNAME").has_value());
    REQUIRE(table.get_string("EXTNAME") == std::optional<std::string>("TILES"));
    REQUIRE(table.get_int("NAXIS2") == std::optional<int>(2));
}

TEST_CASE("reference_header_falls_back_to_primary_hdu") {
    TempDir dir("fits_reference");
    const fs::path path = dir.path / "ref.fits";
    write_reference_image(path);

    io::FitsHeader header = io::read_fits_header(path, 1);
    REQUIRE(header.get_number("CRVAL1").has_value());
    REQUIRE(*header.get_number("CRVAL1") == Catch::Approx(10.684));

    ast_placer::astrometry::WCS w = ast_placer::astrometry::load_reference_wcs(path.string());
    REQUIRE(w.valid());
    REQUIRE(w.crval2 == Catch::Approx(41.269));
    REQUIRE(w.cd2_2 == Catch::Approx(1.0e-4));
}
