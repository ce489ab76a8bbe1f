#include "ast_placer/core/errors.hpp"
#include "ast_placer/placement/bin_assigner.hpp"
#include "ast_placer/placement/tile_grouper.hpp"

#include <limits>
#include <set>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using ast_placer::VectorXd;
using ast_placer::VectorXi;
namespace pl = ast_placer::placement;

TEST_CASE("bin_edges_pad_range_by_one_percent") {
    VectorXd v(3);
    v << 10.0, 20.0, 30.0;

    VectorXd edges = pl::compute_bin_edges(v, 4);

    REQUIRE(edges.size() == 5);
    REQUIRE(edges[0] == Catch::Approx(9.9));
    REQUIRE(edges[4] == Catch::Approx(30.3));
    REQUIRE(edges[2] == Catch::Approx((9.9 + 30.3) / 2.0));
}

TEST_CASE("every_tile_gets_a_label_in_range") {
    VectorXd v(7);
    v << -3.5, 0.0, 1.2, 7.7, 7.7, 12.0, 40.0;

    for (int n : {1, 2, 3, 5, 10}) {
        auto bins = pl::assign_bins(v, n);
        REQUIRE(bins.n_bins() == n);
        REQUIRE(bins.labels.size() == v.size());
        for (Eigen::Index i = 0; i < bins.labels.size(); ++i) {
            REQUIRE(bins.labels[i] >= 1);
            REQUIRE(bins.labels[i] <= n);
        }
    }
}

TEST_CASE("two_value_map_splits_into_two_bins") {
    VectorXd v(2);
    v << 0.0, 10.0;

    auto bins = pl::assign_bins(v, 2);

    REQUIRE(bins.labels[0] == 1);
    REQUIRE(bins.labels[1] == 2);
}

TEST_CASE("maximum_of_zero_stays_in_last_bin") {
    VectorXd v(3);
    v << -10.0, -5.0, 0.0;

    auto bins = pl::assign_bins(v, 2);

    REQUIRE(bins.edges[2] == 0.0);
    REQUIRE(bins.labels[2] == 2);
    REQUIRE(bins.labels[0] == 1);
}

TEST_CASE("degenerate_metric_range_is_rejected") {
    VectorXd v(3);
    v << 4.0, 4.0, 4.0;
    REQUIRE_THROWS_AS(pl::assign_bins(v, 3), ast_placer::InvalidRangeError);

    VectorXd zeros = VectorXd::Zero(4);
    REQUIRE_THROWS_AS(pl::assign_bins(zeros, 2), ast_placer::InvalidRangeError);
}

TEST_CASE("invalid_bin_inputs_are_rejected") {
    VectorXd v(2);
    v << 1.0, 2.0;
    REQUIRE_THROWS_AS(pl::assign_bins(v, 0), ast_placer::InvalidRangeError);
    REQUIRE_THROWS_AS(pl::assign_bins(VectorXd(), 3), ast_placer::InvalidRangeError);

    VectorXd bad(2);
    bad << 1.0, std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(pl::assign_bins(bad, 3), ast_placer::InvalidRangeError);
}

TEST_CASE("digitize_returns_index_of_first_greater_edge") {
    VectorXd edges(3);
    edges << 0.0, 1.0, 2.0;
    VectorXd v(5);
    v << -0.5, 0.0, 0.5, 1.0, 2.0;

    VectorXi idx = pl::digitize(v, edges);

    REQUIRE(idx[0] == 0);
    REQUIRE(idx[1] == 1);
    REQUIRE(idx[2] == 1);
    REQUIRE(idx[3] == 2);
    REQUIRE(idx[4] == 3);
}

TEST_CASE("empty_bins_are_dropped_from_groups") {
    VectorXd v(4);
    v << 0.0, 0.1, 9.9, 10.0;

    auto bins = pl::assign_bins(v, 5);
    auto groups = pl::group_tiles_by_bin(bins.labels, bins.n_bins());

    std::set<int> distinct(bins.labels.data(), bins.labels.data() + bins.labels.size());
    REQUIRE(groups.size() == distinct.size());
    REQUIRE(groups.size() == 2);
    REQUIRE(groups[0].bin == 0);
    REQUIRE(groups[0].tiles == std::vector<int>{0, 1});
    REQUIRE(groups[1].bin == 4);
    REQUIRE(groups[1].tiles == std::vector<int>{2, 3});
}

TEST_CASE("groups_follow_increasing_bin_order") {
    VectorXi labels(6);
    labels << 3, 1, 3, 2, 1, 3;

    auto groups = pl::group_tiles_by_bin(labels, 3);

    REQUIRE(groups.size() == 3);
    REQUIRE(groups[0].tiles == std::vector<int>{1, 4});
    REQUIRE(groups[1].tiles == std::vector<int>{3});
    REQUIRE(groups[2].tiles == std::vector<int>{0, 2, 5});
}
