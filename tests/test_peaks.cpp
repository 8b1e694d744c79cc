#include "gas_deblend/core/errors.hpp"
#include "gas_deblend/segmentation/peaks.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace seg = gas_deblend::segmentation;
using gas_deblend::Cube3Df;
using gas_deblend::MaskVolume;
using gas_deblend::PeakCapPolicy;

namespace {

Cube3Df three_peak_cube() {
    Cube3Df cube(5, 5, 5);
    cube(0, 0, 0) = 5.0f;
    cube(0, 0, 4) = 7.0f;
    cube(4, 4, 4) = 9.0f;
    return cube;
}

} // namespace

TEST_CASE("peak_on_the_array_corner_is_found") {
    Cube3Df cube(3, 5, 5);
    cube(0, 0, 0) = 10.0f;
    Cube3Df threshold(cube.shape);

    auto peaks = seg::find_peaks_3d(cube, threshold, MaskVolume(), {});

    REQUIRE(peaks.size() == 1);
    REQUIRE(peaks[0].z == 0);
    REQUIRE(peaks[0].y == 0);
    REQUIRE(peaks[0].x == 0);
    REQUIRE(peaks[0].value == 10.0f);
}

TEST_CASE("excluded_and_border_voxels_are_not_peaks") {
    Cube3Df cube(3, 5, 5);
    cube(0, 0, 0) = 10.0f;
    cube(1, 2, 2) = 4.0f;
    Cube3Df threshold(cube.shape);

    MaskVolume exclude(cube.shape);
    exclude(1, 2, 2) = 1;
    auto peaks = seg::find_peaks_3d(cube, threshold, exclude, {});
    REQUIRE(peaks.size() == 1);
    REQUIRE(peaks[0].value == 10.0f);

    seg::PeakFinderOptions opts;
    opts.border_width = 1;
    peaks = seg::find_peaks_3d(cube, threshold, MaskVolume(), opts);
    REQUIRE(peaks.size() == 1);
    REQUIRE(peaks[0].z == 1);
    REQUIRE(peaks[0].y == 2);
    REQUIRE(peaks[0].x == 2);
}

TEST_CASE("threshold_is_strict") {
    Cube3Df cube(1, 3, 3);
    cube(0, 1, 1) = 2.0f;
    Cube3Df threshold(cube.shape, 2.0f);

    REQUIRE(seg::find_peaks_3d(cube, threshold, MaskVolume(), {}).empty());

    threshold = Cube3Df(cube.shape, 1.9f);
    REQUIRE(seg::find_peaks_3d(cube, threshold, MaskVolume(), {}).size() == 1);
}

TEST_CASE("every_voxel_of_a_flat_maximum_is_reported") {
    Cube3Df cube(1, 1, 6);
    cube(0, 0, 2) = 3.0f;
    cube(0, 0, 3) = 3.0f;
    Cube3Df threshold(cube.shape);

    auto peaks = seg::find_peaks_3d(cube, threshold, MaskVolume(), {});

    REQUIRE(peaks.size() == 2);
    REQUIRE(peaks[0].x == 2);
    REQUIRE(peaks[1].x == 3);
}

TEST_CASE("peaks_are_sorted_brightest_first") {
    Cube3Df cube = three_peak_cube();
    auto peaks = seg::find_peaks_3d(cube, Cube3Df(cube.shape), MaskVolume(), {});

    REQUIRE(peaks.size() == 3);
    REQUIRE(peaks[0].value == 9.0f);
    REQUIRE(peaks[1].value == 7.0f);
    REQUIRE(peaks[2].value == 5.0f);
}

TEST_CASE("global_cap_keeps_the_brightest_peaks_overall") {
    Cube3Df cube = three_peak_cube();
    seg::PeakFinderOptions opts;
    opts.max_peaks = 1;
    opts.cap_policy = PeakCapPolicy::GLOBAL;

    auto peaks = seg::find_peaks_3d(cube, Cube3Df(cube.shape), MaskVolume(), opts);

    REQUIRE(peaks.size() == 1);
    REQUIRE(peaks[0].value == 9.0f);
}

TEST_CASE("per_channel_cap_keeps_the_brightest_peaks_of_each_slice") {
    Cube3Df cube = three_peak_cube();
    seg::PeakFinderOptions opts;
    opts.max_peaks = 1;
    opts.cap_policy = PeakCapPolicy::PER_CHANNEL;
    opts.workers = 2;

    auto peaks = seg::find_peaks_3d(cube, Cube3Df(cube.shape), MaskVolume(), opts);

    REQUIRE(peaks.size() == 2);
    REQUIRE(peaks[0].value == 9.0f);
    REQUIRE(peaks[1].value == 7.0f);
    REQUIRE(peaks[1].z == 0);
}

TEST_CASE("cap_policy_names_parse_and_unknown_names_raise") {
    REQUIRE(gas_deblend::string_to_peak_cap_policy("global") == PeakCapPolicy::GLOBAL);
    REQUIRE(gas_deblend::string_to_peak_cap_policy("Per_Channel") == PeakCapPolicy::PER_CHANNEL);
    REQUIRE_THROWS_AS(gas_deblend::string_to_peak_cap_policy("random"),
                      gas_deblend::ValidationError);
    REQUIRE_THROWS_AS(gas_deblend::string_to_peak_cap_policy(""), gas_deblend::ValidationError);
}

TEST_CASE("find_peaks_rejects_even_boxes") {
    Cube3Df cube(1, 3, 3);
    seg::PeakFinderOptions opts;
    opts.box_size = 4;
    REQUIRE_THROWS_AS(seg::find_peaks_3d(cube, Cube3Df(cube.shape), MaskVolume(), opts),
                      gas_deblend::ValidationError);
}

TEST_CASE("threshold_field_uses_median_and_robust_sigma_of_valid_voxels") {
    Cube3Df cube(1, 2, 2);
    cube(0, 0, 0) = 1.0f;
    cube(0, 0, 1) = 2.0f;
    cube(0, 1, 0) = 3.0f;
    cube(0, 1, 1) = 400.0f;
    MaskVolume valid(cube.shape, 1);
    valid(0, 1, 1) = 0;

    auto median_only = seg::make_threshold_field(cube, valid, 0.0f);
    REQUIRE(median_only(0, 1, 1) == Catch::Approx(2.0f));

    auto field = seg::make_threshold_field(cube, valid, 1.0f);
    REQUIRE(field(0, 0, 0) == Catch::Approx(2.0f + 1.4826f).epsilon(1e-5));

    auto unmasked = seg::make_threshold_field(cube, MaskVolume(), 0.0f);
    REQUIRE(unmasked(0, 0, 0) == Catch::Approx(2.5f));
}
