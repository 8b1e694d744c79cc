#include "gas_deblend/segmentation/markers.hpp"
#include "gas_deblend/core/errors.hpp"
#include "gas_deblend/core/utils.hpp"

#include <cmath>
#include <map>

namespace gas_deblend::segmentation {

Matrix2Di build_markers_2d(const Matrix2Di& prior, const Matrix2Df& flux, float seed_sigma,
                           int workers) {
    if (prior.rows() != flux.rows() || prior.cols() != flux.cols()) {
        throw InvalidShapeError("prior " + std::to_string(prior.rows()) + "x" +
                                std::to_string(prior.cols()) + " vs flux image " +
                                std::to_string(flux.rows()) + "x" + std::to_string(flux.cols()));
    }

    std::map<int32_t, std::vector<Eigen::Index>> footprints;
    for (Eigen::Index i = 0; i < prior.size(); ++i) {
        const int32_t id = prior.data()[i];
        if (id > 0) footprints[id].push_back(i);
    }

    std::vector<const std::pair<const int32_t, std::vector<Eigen::Index>>*> segments;
    segments.reserve(footprints.size());
    for (const auto& entry : footprints) segments.push_back(&entry);

    Matrix2Di markers = Matrix2Di::Zero(prior.rows(), prior.cols());

    // Footprints are disjoint, so every worker writes its own pixels.
    core::parallel_for(segments.size(), workers, [&](size_t si) {
        const int32_t id = segments[si]->first;
        const auto& pixels = segments[si]->second;

        double sum = 0.0;
        for (auto i : pixels) sum += flux.data()[i];
        const double mean = sum / static_cast<double>(pixels.size());
        double var = 0.0;
        for (auto i : pixels) {
            const double d = flux.data()[i] - mean;
            var += d * d;
        }
        const double stddev = std::sqrt(var / static_cast<double>(pixels.size()));
        if (!(stddev > 0.0)) return;

        const double cut = mean + static_cast<double>(seed_sigma) * stddev;
        for (auto i : pixels) {
            if (static_cast<double>(flux.data()[i]) > cut) markers.data()[i] = id;
        }
    });

    return markers;
}

LabelVolume broadcast_markers(const Matrix2Di& markers, int depth) {
    LabelVolume out(depth, static_cast<int>(markers.rows()), static_cast<int>(markers.cols()));
    for (int z = 0; z < depth; ++z) {
        out.plane(z) = markers;
    }
    return out;
}

Refinement3D build_fixed_3d(const Cube3Df& cost, const Matrix2Di& markers_2d,
                            const MaskVolume& strict_mask, const WatershedOptions& options,
                            float threshold) {
    if (markers_2d.rows() != cost.rows() || markers_2d.cols() != cost.cols()) {
        throw InvalidShapeError("2D markers " + std::to_string(markers_2d.rows()) + "x" +
                                std::to_string(markers_2d.cols()) + " vs cube " +
                                shape_to_string(cost.shape));
    }
    return refine_with_pruning(cost, broadcast_markers(markers_2d, cost.depth()), strict_mask,
                               options, threshold);
}

LabelVolume reseed_from_peaks(const LabelVolume& fixed, const std::vector<Peak>& peaks,
                              int half_spectral, int half_spatial) {
    LabelVolume markers(fixed.shape);
    for (const Peak& p : peaks) {
        const core::IndexRange zr = core::clip_box(p.z, half_spectral, fixed.depth());
        const core::IndexRange yr = core::clip_box(p.y, half_spatial, fixed.rows());
        const core::IndexRange xr = core::clip_box(p.x, half_spatial, fixed.cols());
        if (zr.empty() || yr.empty() || xr.empty()) continue;
        for (int z = zr.begin; z < zr.end; ++z) {
            markers.plane(z).block(yr.begin, xr.begin, yr.size(), xr.size()) =
                fixed.plane(z).block(yr.begin, xr.begin, yr.size(), xr.size());
        }
    }
    return markers;
}

PeakStage3D build_peak_3d(const Cube3Df& cost, const LabelVolume& fixed,
                          const std::vector<Peak>& peaks, const MaskVolume& loose_mask,
                          const PeakReseedOptions& options) {
    if (fixed.shape != cost.shape) {
        throw InvalidShapeError("fixed-3D labels " + shape_to_string(fixed.shape) + " vs cube " +
                                shape_to_string(cost.shape));
    }
    PeakStage3D stage;
    stage.markers = reseed_from_peaks(fixed, peaks, options.half_spectral, options.half_spatial);
    stage.result = watershed(cost, stage.markers, loose_mask, options.watershed);
    return stage;
}

} // namespace gas_deblend::segmentation
