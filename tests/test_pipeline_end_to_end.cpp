#include "gas_deblend/config/configuration.hpp"
#include "gas_deblend/core/errors.hpp"
#include "gas_deblend/core/events.hpp"
#include "gas_deblend/pipeline/pipeline.hpp"
#include "gas_deblend/segmentation/labels.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

namespace pl = gas_deblend::pipeline;
namespace seg = gas_deblend::segmentation;

namespace {

constexpr int kFactor = 2;
constexpr float kCloudSigma = 1.5f;

float line_profile(int z) {
    return std::exp(-0.5f * static_cast<float>((z - 2) * (z - 2)));
}

float cloud_profile(int y, int x, int cx) {
    const float dy = static_cast<float>(y - 4);
    const float dx = static_cast<float>(x - cx);
    return std::exp(-(dy * dy + dx * dx) / (2.0f * kCloudSigma * kCloudSigma));
}

// Fine-grid voxels of a cloud centred on coarse column `cx` whose emission is
// at least half the cloud's peak.
std::vector<std::array<int, 3>> cloud_core(const gas_deblend::CubeShape& coarse, int cx) {
    std::vector<std::array<int, 3>> core;
    for (int z = 0; z < coarse.depth; ++z) {
        for (int y = 0; y < coarse.rows; ++y) {
            for (int x = 0; x < coarse.cols; ++x) {
                if (line_profile(z) * cloud_profile(y, x, cx) < 0.5f) continue;
                for (int fy = y * kFactor; fy < (y + 1) * kFactor; ++fy) {
                    for (int fx = x * kFactor; fx < (x + 1) * kFactor; ++fx) {
                        core.push_back({z, fy, fx});
                    }
                }
            }
        }
    }
    return core;
}

// Two Gaussian clouds on an 8x16 coarse grid, centred on (4, 4) and (4, 12),
// both emitting around channel 2 of 5.
pl::DeblendInputs two_cloud_inputs() {
    pl::DeblendInputs in;
    in.cube = gas_deblend::Cube3Df(5, 8, 16);
    for (int z = 0; z < 5; ++z) {
        for (int y = 0; y < 8; ++y) {
            for (int x = 0; x < 16; ++x) {
                in.cube(z, y, x) =
                    10.0f * line_profile(z) * (cloud_profile(y, x, 4) + cloud_profile(y, x, 12));
            }
        }
    }

    in.prior = gas_deblend::Matrix2Di::Zero(8 * kFactor, 16 * kFactor);
    in.prior.leftCols(16).setConstant(3);
    in.prior.rightCols(16).setConstant(7);
    return in;
}

gas_deblend::config::Config test_config() {
    gas_deblend::config::Config cfg;
    cfg.data.upsample_factor = kFactor;
    cfg.peaks.threshold_sigma = 0.0f;
    cfg.runtime.parallel_workers = 1;
    return cfg;
}

int count_events(const std::string& log, const std::string& type) {
    std::istringstream in(log);
    std::string line;
    int n = 0;
    while (std::getline(in, line)) {
        if (nlohmann::json::parse(line)["type"].get<std::string>() == type) ++n;
    }
    return n;
}

} // namespace

TEST_CASE("two_separated_clouds_get_two_disjoint_labels") {
    gas_deblend::core::EventEmitter emitter("e2e");
    std::ostringstream log;

    auto result = pl::run_deblend(two_cloud_inputs(), test_config(), emitter, log);

    REQUIRE(result.shape == gas_deblend::CubeShape{5, 16, 32});

    // 2D and fixed-3D keep the prior ids.
    REQUIRE(result.labels_2d(8, 8) == 3);
    REQUIRE(result.labels_2d(8, 24) == 7);
    REQUIRE(result.fixed_3d(2, 8, 8) == 3);
    REQUIRE(result.fixed_3d(2, 8, 24) == 7);
    REQUIRE(result.prune_2d.removed_ids.empty());

    REQUIRE(result.peaks.size() >= 2);

    // Final labels are compacted to 1..N.
    REQUIRE(result.label_map.size() == 2);
    REQUIRE(result.label_map.at(3) == 1);
    REQUIRE(result.label_map.at(7) == 2);
    auto counts = seg::label_counts(result.peak_3d);
    REQUIRE(counts.size() == 2);
    REQUIRE(counts.count(1) == 1);
    REQUIRE(counts.count(2) == 1);
    REQUIRE(result.peak_3d(2, 8, 8) == 1);
    REQUIRE(result.peak_3d(2, 8, 24) == 2);

    // Each label holds the whole core of one cloud and none of the other.
    const gas_deblend::CubeShape coarse{5, 8, 16};
    const auto left_core = cloud_core(coarse, 4);
    const auto right_core = cloud_core(coarse, 12);
    // 3x3 coarse pixels in the line centre, the cloud centre alone one
    // channel either side.
    REQUIRE(left_core.size() == static_cast<size_t>((9 + 2) * kFactor * kFactor));
    REQUIRE(right_core.size() == left_core.size());
    for (const auto& v : left_core) {
        INFO("left core voxel " << v[0] << "," << v[1] << "," << v[2]);
        REQUIRE(result.peak_3d(v[0], v[1], v[2]) == 1);
    }
    for (const auto& v : right_core) {
        INFO("right core voxel " << v[0] << "," << v[1] << "," << v[2]);
        REQUIRE(result.peak_3d(v[0], v[1], v[2]) == 2);
    }

    REQUIRE(count_events(log.str(), "stage_start") == 8);
    REQUIRE(count_events(log.str(), "stage_end") == 8);
    REQUIRE(count_events(log.str(), "run_end") == 0);
}

TEST_CASE("prior_on_the_wrong_grid_fails_in_prepare_input") {
    auto inputs = two_cloud_inputs();
    inputs.prior = gas_deblend::Matrix2Di::Zero(8, 16);
    gas_deblend::core::EventEmitter emitter("bad-prior");
    std::ostringstream log;

    REQUIRE_THROWS_AS(pl::run_deblend(inputs, test_config(), emitter, log),
                      gas_deblend::InvalidShapeError);

    const std::string text = log.str();
    REQUIRE(text.find("\"status\":\"error\"") != std::string::npos);
    REQUIRE(count_events(text, "run_end") == 1);
    REQUIRE(count_events(text, "stage_start") == 1);
}

TEST_CASE("crop_margin_shrinks_every_output_grid") {
    auto cfg = test_config();
    cfg.data.crop_margin = 1;
    gas_deblend::core::EventEmitter emitter("crop");
    std::ostringstream log;

    auto result = pl::run_deblend(two_cloud_inputs(), cfg, emitter, log);

    REQUIRE(result.shape == gas_deblend::CubeShape{5, 12, 28});
    REQUIRE(result.labels_2d.rows() == 12);
    REQUIRE(result.labels_2d.cols() == 28);
    REQUIRE(result.label_map.size() == 2);
}

TEST_CASE("flat_flux_gives_no_seed_and_aborts_unless_told_otherwise") {
    pl::DeblendInputs inputs;
    inputs.cube = gas_deblend::Cube3Df(3, 4, 4, 1.0f);
    inputs.prior = gas_deblend::Matrix2Di::Constant(4 * kFactor, 4 * kFactor, 1);
    auto cfg = test_config();
    cfg.resample.smooth = false;

    gas_deblend::core::EventEmitter emitter("flat");
    std::ostringstream log;
    REQUIRE_THROWS_AS(pl::run_deblend(inputs, cfg, emitter, log), gas_deblend::PipelineError);

    cfg.pipeline.abort_on_fail = false;
    std::ostringstream log2;
    auto result = pl::run_deblend(inputs, cfg, emitter, log2);
    REQUIRE(result.label_map.empty());
    REQUIRE(seg::label_counts(result.peak_3d).empty());
    REQUIRE(count_events(log2.str(), "warning") >= 1);
}
