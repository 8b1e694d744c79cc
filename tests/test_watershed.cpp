#include "gas_deblend/core/errors.hpp"
#include "gas_deblend/segmentation/labels.hpp"
#include "gas_deblend/segmentation/watershed.hpp"

#include <catch2/catch_test_macros.hpp>

namespace seg = gas_deblend::segmentation;
using gas_deblend::Cube3Df;
using gas_deblend::LabelVolume;
using gas_deblend::Mask2D;
using gas_deblend::MaskVolume;
using gas_deblend::Matrix2Df;
using gas_deblend::Matrix2Di;

TEST_CASE("neighbour_offsets_counts_per_connectivity") {
    REQUIRE(seg::neighbour_offsets(2, 1).size() == 4);
    REQUIRE(seg::neighbour_offsets(2, 2).size() == 8);
    REQUIRE(seg::neighbour_offsets(3, 1).size() == 6);
    REQUIRE(seg::neighbour_offsets(3, 2).size() == 18);
    REQUIRE(seg::neighbour_offsets(3, 3).size() == 26);

    REQUIRE_THROWS_AS(seg::neighbour_offsets(2, 3), gas_deblend::ValidationError);
    REQUIRE_THROWS_AS(seg::neighbour_offsets(4, 1), gas_deblend::InvalidDimensionError);
}

TEST_CASE("single_seed_fills_its_connected_valid_region") {
    Matrix2Df cost = Matrix2Df::Zero(4, 5);
    Matrix2Di markers = Matrix2Di::Zero(4, 5);
    markers(1, 1) = 6;
    Mask2D mask = Mask2D::Ones(4, 5);

    auto out = seg::watershed(cost, markers, mask);

    REQUIRE((out.array() == 6).all());
}

TEST_CASE("flood_never_crosses_an_invalid_gap") {
    Matrix2Df cost = Matrix2Df::Zero(3, 5);
    Matrix2Di markers = Matrix2Di::Zero(3, 5);
    markers(1, 0) = 1;
    Mask2D mask = Mask2D::Ones(3, 5);
    mask.col(2).setZero();

    auto out = seg::watershed(cost, markers, mask);

    for (int y = 0; y < 3; ++y) {
        REQUIRE(out(y, 0) == 1);
        REQUIRE(out(y, 1) == 1);
        REQUIRE(out(y, 2) == 0);
        REQUIRE(out(y, 3) == 0);
        REQUIRE(out(y, 4) == 0);
    }
}

TEST_CASE("diagonal_step_needs_full_connectivity") {
    Matrix2Df cost = Matrix2Df::Zero(2, 2);
    Matrix2Di markers = Matrix2Di::Zero(2, 2);
    markers(0, 0) = 2;
    Mask2D mask(2, 2);
    mask << 1, 0,
            0, 1;

    seg::WatershedOptions four;
    four.connectivity = 1;
    REQUIRE(seg::watershed(cost, markers, mask, four)(1, 1) == 0);

    seg::WatershedOptions eight;
    eight.connectivity = 2;
    REQUIRE(seg::watershed(cost, markers, mask, eight)(1, 1) == 2);
}

TEST_CASE("two_seeds_split_along_the_cost_ridge") {
    // Two bright lumps separated by a dim column; the flood runs on -flux.
    Matrix2Df flux(1, 7);
    flux << 5.0f, 4.0f, 3.0f, 0.5f, 2.0f, 4.0f, 6.0f;
    Matrix2Di markers = Matrix2Di::Zero(1, 7);
    markers(0, 0) = 1;
    markers(0, 6) = 2;
    Mask2D mask = Mask2D::Ones(1, 7);

    auto out = seg::watershed(seg::cost_from_flux(flux), markers, mask);

    REQUIRE(out(0, 2) == 1);
    REQUIRE(out(0, 4) == 2);
    REQUIRE(out(0, 3) != 0);
}

TEST_CASE("result_labels_are_a_subset_of_seed_labels") {
    Cube3Df cost(3, 4, 4);
    for (size_t i = 0; i < cost.size(); ++i) {
        cost.data[i] = static_cast<float>((i * 7) % 11);
    }
    LabelVolume markers(3, 4, 4);
    markers(0, 0, 0) = 4;
    markers(2, 3, 3) = 9;
    MaskVolume mask(3, 4, 4, 1);
    mask(1, 1, 1) = 0;

    auto out = seg::watershed(cost, markers, mask);

    auto counts = seg::label_counts(out);
    REQUIRE(counts.size() == 2);
    REQUIRE(counts.count(4) == 1);
    REQUIRE(counts.count(9) == 1);
    REQUIRE(out(1, 1, 1) == 0);
    REQUIRE(out(0, 0, 0) == 4);
    REQUIRE(out(2, 3, 3) == 9);
}

TEST_CASE("seeds_outside_the_mask_are_ignored") {
    Cube3Df cost(1, 2, 2);
    LabelVolume markers(1, 2, 2);
    markers(0, 0, 0) = 3;
    MaskVolume mask(1, 2, 2, 1);
    mask(0, 0, 0) = 0;

    auto out = seg::watershed(cost, markers, mask);
    REQUIRE(seg::label_counts(out).empty());

    seg::WatershedOptions strict;
    strict.require_seed = true;
    REQUIRE_THROWS_AS(seg::watershed(cost, markers, mask, strict),
                      gas_deblend::EmptySeedSetError);
}

TEST_CASE("watershed_rejects_mismatched_shapes") {
    Cube3Df cost(2, 2, 2);
    LabelVolume markers(2, 2, 3);
    MaskVolume mask(2, 2, 2, 1);
    REQUIRE_THROWS_AS(seg::watershed(cost, markers, mask), gas_deblend::InvalidShapeError);
}
