#include "gas_deblend/core/errors.hpp"
#include "gas_deblend/segmentation/labels.hpp"
#include "gas_deblend/segmentation/markers.hpp"

#include <catch2/catch_test_macros.hpp>

namespace seg = gas_deblend::segmentation;
using gas_deblend::Cube3Df;
using gas_deblend::LabelVolume;
using gas_deblend::MaskVolume;
using gas_deblend::Matrix2Df;
using gas_deblend::Matrix2Di;
using gas_deblend::Peak;

namespace {

Matrix2Di two_segment_prior() {
    Matrix2Di prior(1, 6);
    prior << 1, 1, 1, 2, 2, 2;
    return prior;
}

} // namespace

TEST_CASE("markers_2d_marks_pixels_above_mean_plus_sigma") {
    Matrix2Df flux(1, 6);
    flux << 1.0f, 2.0f, 9.0f, 4.0f, 4.0f, 4.0f;

    auto markers = seg::build_markers_2d(two_segment_prior(), flux, 1.0f, 2);

    // Segment 2 has zero spread and gets no seed.
    Matrix2Di expected(1, 6);
    expected << 0, 0, 1, 0, 0, 0;
    REQUIRE(markers == expected);
}

TEST_CASE("markers_2d_statistics_stay_inside_each_segment") {
    Matrix2Df flux(1, 6);
    flux << 1.0f, 1.0f, 3.0f, 100.0f, 100.0f, 300.0f;

    auto markers = seg::build_markers_2d(two_segment_prior(), flux, 1.0f);

    REQUIRE(markers(0, 2) == 1);
    REQUIRE(markers(0, 5) == 2);
    REQUIRE(seg::label_counts(markers).at(1) == 1);
    REQUIRE(seg::label_counts(markers).at(2) == 1);
}

TEST_CASE("markers_2d_rejects_mismatched_flux") {
    Matrix2Df flux = Matrix2Df::Zero(2, 6);
    REQUIRE_THROWS_AS(seg::build_markers_2d(two_segment_prior(), flux),
                      gas_deblend::InvalidShapeError);
}

TEST_CASE("broadcast_markers_repeats_the_seed_image_in_every_slice") {
    Matrix2Di m(2, 2);
    m << 0, 3,
         4, 0;

    auto v = seg::broadcast_markers(m, 3);

    REQUIRE(v.depth() == 3);
    for (int z = 0; z < 3; ++z) {
        REQUIRE(v(z, 0, 1) == 3);
        REQUIRE(v(z, 1, 0) == 4);
        REQUIRE(v(z, 0, 0) == 0);
    }
}

TEST_CASE("fixed_3d_floods_broadcast_seeds_through_the_cube") {
    Cube3Df cost(2, 1, 6);
    Matrix2Di markers(1, 6);
    markers << 0, 0, 1, 0, 0, 0;
    MaskVolume mask(cost.shape, 1);

    auto r = seg::build_fixed_3d(cost, markers, mask, {}, 1.0f);

    REQUIRE(r.report.removed_ids.empty());
    REQUIRE(seg::label_counts(r.result).at(1) == 12);

    Matrix2Di wrong = Matrix2Di::Zero(2, 6);
    REQUIRE_THROWS_AS(seg::build_fixed_3d(cost, wrong, mask, {}, 1.0f),
                      gas_deblend::InvalidShapeError);
}

TEST_CASE("reseed_copies_existing_labels_inside_clipped_boxes") {
    LabelVolume fixed(5, 5, 5);
    for (int z = 0; z < 5; ++z) {
        for (int y = 0; y < 5; ++y) {
            for (int x = 0; x < 3; ++x) {
                fixed(z, y, x) = 4;
            }
        }
    }
    const std::vector<Peak> peaks = {{2, 2, 3, 1.0f}, {0, 0, 0, 1.0f}};

    auto markers = seg::reseed_from_peaks(fixed, peaks, 1, 1);

    // Corner box is clipped to 2x2x2; the other box only overlaps x == 2.
    REQUIRE(seg::label_counts(markers).at(4) == 8 + 9);
    REQUIRE(markers(0, 0, 0) == 4);
    REQUIRE(markers(2, 2, 2) == 4);
    REQUIRE(markers(2, 2, 3) == 0);
    REQUIRE(markers(4, 4, 0) == 0);
}

TEST_CASE("peak_3d_floods_reseeded_labels_over_the_loose_mask") {
    LabelVolume fixed(3, 3, 3);
    fixed(1, 1, 1) = 6;
    Cube3Df cost(fixed.shape);
    MaskVolume loose(fixed.shape, 1);
    loose(0, 0, 0) = 0;

    seg::PeakReseedOptions opts;
    opts.half_spectral = 0;
    opts.half_spatial = 0;
    auto stage = seg::build_peak_3d(cost, fixed, {{1, 1, 1, 2.0f}}, loose, opts);

    REQUIRE(seg::label_counts(stage.markers).at(6) == 1);
    REQUIRE(seg::label_counts(stage.result).at(6) == 26);
    REQUIRE(stage.result(0, 0, 0) == 0);

    auto none = seg::build_peak_3d(cost, fixed, {}, loose, opts);
    REQUIRE(seg::label_counts(none.result).empty());
}
