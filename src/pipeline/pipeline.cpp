#include "gas_deblend/pipeline/pipeline.hpp"
#include "gas_deblend/core/errors.hpp"
#include "gas_deblend/core/utils.hpp"
#include "gas_deblend/image/resampling.hpp"
#include "gas_deblend/segmentation/labels.hpp"
#include "gas_deblend/segmentation/markers.hpp"
#include "gas_deblend/segmentation/peaks.hpp"
#include "gas_deblend/segmentation/watershed.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <utility>

namespace gas_deblend::pipeline {

using json = nlohmann::json;

namespace {

// Emits stage_start / stage_end around `body`. On failure the stage is closed
// with status "error" and the run is ended before the exception propagates.
void run_stage(Stage stage, core::EventEmitter& emitter, std::ostream& log,
               const std::function<json()>& body) {
    emitter.stage_start(stage, log);
    json extra;
    try {
        extra = body();
    } catch (const std::exception& e) {
        emitter.stage_end(stage, "error", {{"error", e.what()}}, log);
        emitter.error(stage_to_string(stage) + ": " + e.what(), log);
        emitter.run_end(false, "error", log);
        throw;
    }
    emitter.stage_end(stage, "ok", extra, log);
}

json prune_report_to_json(const segmentation::PruneReport& r) {
    json j;
    j["ids_examined"] = r.ids_examined;
    j["removed_ids"] = r.removed_ids;
    j["removed_seed_voxels"] = r.removed_seed_voxels;
    j["removed_result_voxels"] = r.removed_result_voxels;
    return j;
}

json counts_to_json(const std::map<int32_t, int64_t>& counts) {
    json j = json::object();
    for (const auto& [id, n] : counts) {
        j[std::to_string(id)] = n;
    }
    return j;
}

void check_inputs(const DeblendInputs& in, int factor) {
    if (in.cube.empty()) {
        throw InvalidShapeError("input cube is empty");
    }
    if (!in.mask.empty() && in.mask.shape != in.cube.shape) {
        throw InvalidShapeError("mask " + shape_to_string(in.mask.shape) + " vs cube " +
                                shape_to_string(in.cube.shape));
    }
    if (in.prior.rows() != static_cast<Eigen::Index>(in.cube.rows()) * factor ||
        in.prior.cols() != static_cast<Eigen::Index>(in.cube.cols()) * factor) {
        throw InvalidShapeError("prior " + std::to_string(in.prior.rows()) + "x" +
                                std::to_string(in.prior.cols()) + " is not cube " +
                                std::to_string(in.cube.rows()) + "x" +
                                std::to_string(in.cube.cols()) + " times upsample factor " +
                                std::to_string(factor));
    }
    if (in.prior_image.size() > 0 &&
        (in.prior_image.rows() != in.prior.rows() || in.prior_image.cols() != in.prior.cols())) {
        throw InvalidShapeError("prior image must have the prior's shape");
    }
}

} // namespace

DeblendResult run_deblend(const DeblendInputs& inputs, const config::Config& cfg,
                          core::EventEmitter& emitter, std::ostream& log) {
    const int k = cfg.data.upsample_factor;
    const int workers = core::resolve_workers(cfg.runtime.parallel_workers);

    segmentation::WatershedOptions ws2d;
    ws2d.connectivity = cfg.watershed.connectivity_2d;
    segmentation::WatershedOptions ws3d;
    ws3d.connectivity = cfg.watershed.connectivity_3d;

    DeblendResult result;

    Cube3Df cube;
    Matrix2Di prior;
    Matrix2Df prior_image;

    run_stage(Stage::PREPARE_INPUT, emitter, log, [&]() {
        cfg.validate();
        check_inputs(inputs, k);

        const int margin = cfg.data.crop_margin;
        cube = margin > 0 ? image::crop_spatial(inputs.cube, margin) : inputs.cube;
        MaskVolume mask;
        if (!inputs.mask.empty()) {
            mask = margin > 0 ? image::crop_spatial(inputs.mask, margin) : inputs.mask;
        } else {
            mask = image::validity_mask(cube, cfg.data.input_epsilon);
        }
        prior = margin > 0 ? image::crop_spatial(inputs.prior, margin * k) : inputs.prior;
        if (inputs.prior_image.size() > 0) {
            prior_image = margin > 0 ? image::crop_spatial(inputs.prior_image, margin * k)
                                     : inputs.prior_image;
        }
        emitter.stage_progress(Stage::PREPARE_INPUT, 1, 3, "crop", log);

        cube = image::apply_mask(cube, mask);
        emitter.stage_progress(Stage::PREPARE_INPUT, 2, 3, "mask", log);
        if (cfg.data.spectral_bin > 1) {
            cube = image::spectral_bin(cube, cfg.data.spectral_bin);
        } else if (cfg.data.spectral_smooth_sigma > 0.0f) {
            cube = image::spectral_smooth(cube, cfg.data.spectral_smooth_sigma);
        }
        if (cube.depth() < 1) {
            throw InvalidShapeError("no spectral channel left after binning");
        }
        emitter.stage_progress(Stage::PREPARE_INPUT, 3, 3, "spectral", log);

        return json{{"input_shape", shape_to_string(inputs.cube.shape)},
                    {"prepared_shape", shape_to_string(cube.shape)},
                    {"crop_margin", margin},
                    {"spectral_bin", cfg.data.spectral_bin},
                    {"spectral_smooth_sigma", cfg.data.spectral_smooth_sigma}};
    });

    Cube3Df smoothed;
    Cube3Df cost;
    MaskVolume strict_mask;
    MaskVolume loose_mask;

    run_stage(Stage::RESAMPLE, emitter, log, [&]() {
        smoothed = image::upsample(cube, k, cfg.resample.smooth, workers);
        cost = segmentation::cost_from_flux(smoothed);
        strict_mask = image::validity_mask(smoothed, cfg.masks.strict_epsilon);
        loose_mask = image::validity_mask(smoothed, cfg.masks.loose_epsilon);
        result.shape = smoothed.shape;

        int64_t n_strict = 0;
        int64_t n_loose = 0;
        for (size_t i = 0; i < strict_mask.size(); ++i) {
            n_strict += strict_mask.data[i];
            n_loose += loose_mask.data[i];
        }
        return json{{"upsample_factor", k},
                    {"smooth", cfg.resample.smooth},
                    {"shape", shape_to_string(smoothed.shape)},
                    {"strict_valid_voxels", n_strict},
                    {"loose_valid_voxels", n_loose}};
    });

    Matrix2Df m0;
    Mask2D mask_2d;
    Matrix2Di seeds_2d;

    run_stage(Stage::MARKERS_2D, emitter, log, [&]() {
        if (prior.rows() != smoothed.rows() || prior.cols() != smoothed.cols()) {
            throw InvalidShapeError("prior does not match the resampled cube grid");
        }
        m0 = image::moment0(smoothed, strict_mask);
        mask_2d = image::validity_mask(m0, cfg.masks.strict_epsilon);
        const Matrix2Df& flux = prior_image.size() > 0 ? prior_image : m0;
        seeds_2d = segmentation::build_markers_2d(prior, flux, cfg.markers.seed_sigma, workers);

        const auto prior_ids = segmentation::label_counts(prior);
        const auto seed_ids = segmentation::label_counts(seeds_2d);
        for (const auto& entry : prior_ids) {
            if (!seed_ids.count(entry.first)) {
                emitter.warning("prior segment " + std::to_string(entry.first) +
                                " produced no seed", log);
            }
        }
        if (seed_ids.empty()) {
            if (cfg.pipeline.abort_on_fail) {
                throw PipelineError("no prior segment produced a seed");
            }
            emitter.warning("no seed at all, every label volume will be empty", log);
        }
        return json{{"prior_segments", prior_ids.size()},
                    {"seeded_segments", seed_ids.size()},
                    {"seed_pixels", counts_to_json(seed_ids)},
                    {"flux_source", prior_image.size() > 0 ? "prior_image" : "moment0"}};
    });

    run_stage(Stage::WATERSHED_2D, emitter, log, [&]() {
        const float threshold = segmentation::growth_threshold_2d(k, cfg.growth.factor_2d);
        auto refined = segmentation::refine_with_pruning(segmentation::cost_from_flux(m0),
                                                         seeds_2d, mask_2d, ws2d, threshold);
        result.markers_2d = std::move(refined.markers);
        result.labels_2d = std::move(refined.result);
        result.prune_2d = refined.report;
        return json{{"growth_threshold", threshold},
                    {"prune", prune_report_to_json(result.prune_2d)},
                    {"labels", counts_to_json(segmentation::label_counts(result.labels_2d))}};
    });

    run_stage(Stage::FIXED_3D, emitter, log, [&]() {
        const float threshold =
            segmentation::growth_threshold_3d(k, smoothed.depth(), cfg.growth.factor_3d);
        auto refined =
            segmentation::build_fixed_3d(cost, result.markers_2d, strict_mask, ws3d, threshold);
        result.fixed_3d = std::move(refined.result);
        result.prune_3d = refined.report;
        return json{{"growth_threshold", threshold},
                    {"prune", prune_report_to_json(result.prune_3d)},
                    {"labels", counts_to_json(segmentation::label_counts(result.fixed_3d))}};
    });

    run_stage(Stage::PEAK_FINDING, emitter, log, [&]() {
        segmentation::PeakFinderOptions opts;
        opts.box_size = cfg.peaks.box_size;
        opts.max_peaks = cfg.peaks.max_peaks;
        opts.cap_policy = string_to_peak_cap_policy(cfg.peaks.cap_policy);
        opts.border_width = cfg.peaks.border_width;
        opts.workers = workers;

        MaskVolume exclude(strict_mask.shape);
        for (size_t i = 0; i < exclude.size(); ++i) {
            exclude.data[i] = strict_mask.data[i] ? 0 : 1;
        }
        const Cube3Df threshold = segmentation::make_threshold_field(
            smoothed, strict_mask, cfg.peaks.threshold_sigma, workers);
        result.peaks = segmentation::find_peaks_3d(smoothed, threshold, exclude, opts);
        if (result.peaks.empty()) {
            emitter.warning("no peak above threshold, peak-3D result will be empty", log);
        }
        return json{{"peaks", result.peaks.size()},
                    {"cap_policy", peak_cap_policy_to_string(opts.cap_policy)},
                    {"max_peaks", opts.max_peaks}};
    });

    LabelVolume peak_labels;

    run_stage(Stage::PEAK_3D, emitter, log, [&]() {
        segmentation::PeakReseedOptions opts;
        opts.half_spectral = cfg.peaks.reseed_half_spectral;
        opts.half_spatial = cfg.peaks.reseed_half_spatial;
        opts.watershed = ws3d;
        auto stage = segmentation::build_peak_3d(cost, result.fixed_3d, result.peaks, loose_mask,
                                                 opts);
        peak_labels = std::move(stage.result);
        return json{{"seed_voxels", counts_to_json(segmentation::label_counts(stage.markers))},
                    {"labels", counts_to_json(segmentation::label_counts(peak_labels))}};
    });

    run_stage(Stage::COMPACT_LABELS, emitter, log, [&]() {
        result.peak_3d = segmentation::compact_labels(peak_labels);
        for (size_t i = 0; i < peak_labels.size(); ++i) {
            if (peak_labels.data[i] > 0) {
                result.label_map[peak_labels.data[i]] = result.peak_3d.data[i];
            }
        }
        json mapping = json::object();
        for (const auto& [from, to] : result.label_map) {
            mapping[std::to_string(from)] = to;
        }
        return json{{"n_labels", result.label_map.size()}, {"label_map", mapping}};
    });

    return result;
}

} // namespace gas_deblend::pipeline
