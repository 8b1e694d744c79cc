#include "gas_deblend/segmentation/growth_pruner.hpp"
#include "gas_deblend/segmentation/labels.hpp"
#include "gas_deblend/core/errors.hpp"

#include <set>

namespace gas_deblend::segmentation {

namespace {

PruneReport prune_flat(int32_t* markers, int32_t* result, size_t n, float threshold) {
    const auto seeds = label_counts(markers, n);
    const auto grown = label_counts(result, n);

    PruneReport report;
    std::set<int32_t> doomed;
    for (const auto& [id, seed_count] : seeds) {
        ++report.ids_examined;
        auto it = grown.find(id);
        const int64_t total = it == grown.end() ? 0 : it->second;
        const double growth = static_cast<double>(total - seed_count);
        if (growth < static_cast<double>(threshold)) {
            doomed.insert(id);
        }
    }

    if (doomed.empty()) return report;

    for (size_t i = 0; i < n; ++i) {
        if (markers[i] > 0 && doomed.count(markers[i])) {
            markers[i] = 0;
            ++report.removed_seed_voxels;
        }
        if (result[i] > 0 && doomed.count(result[i])) {
            result[i] = 0;
            ++report.removed_result_voxels;
        }
    }
    report.removed_ids.assign(doomed.begin(), doomed.end());
    return report;
}

} // namespace

float growth_threshold_2d(int factor, float scale) {
    return scale * static_cast<float>(factor * factor);
}

float growth_threshold_3d(int factor, int depth, float scale) {
    return scale * static_cast<float>(factor * factor) * static_cast<float>(depth);
}

PruneReport prune_by_growth(LabelVolume& markers, LabelVolume& result, float threshold) {
    if (markers.shape != result.shape) {
        throw InvalidShapeError("markers " + shape_to_string(markers.shape) + " vs result " +
                                shape_to_string(result.shape));
    }
    return prune_flat(markers.data.data(), result.data.data(), markers.size(), threshold);
}

PruneReport prune_by_growth(Matrix2Di& markers, Matrix2Di& result, float threshold) {
    if (markers.rows() != result.rows() || markers.cols() != result.cols()) {
        throw InvalidShapeError("markers and result must share one 2D shape");
    }
    return prune_flat(markers.data(), result.data(), static_cast<size_t>(markers.size()),
                      threshold);
}

Refinement3D refine_with_pruning(const Cube3Df& cost, LabelVolume markers, const MaskVolume& mask,
                                 const WatershedOptions& options, float threshold) {
    Refinement3D r;
    r.initial = watershed(cost, markers, mask, options);
    LabelVolume pruned_result = r.initial;
    r.report = prune_by_growth(markers, pruned_result, threshold);
    r.result = watershed(cost, markers, mask, options);
    r.markers = std::move(markers);
    return r;
}

Refinement2D refine_with_pruning(const Matrix2Df& cost, Matrix2Di markers, const Mask2D& mask,
                                 const WatershedOptions& options, float threshold) {
    Refinement2D r;
    r.initial = watershed(cost, markers, mask, options);
    Matrix2Di pruned_result = r.initial;
    r.report = prune_by_growth(markers, pruned_result, threshold);
    r.result = watershed(cost, markers, mask, options);
    r.markers = std::move(markers);
    return r;
}

} // namespace gas_deblend::segmentation
