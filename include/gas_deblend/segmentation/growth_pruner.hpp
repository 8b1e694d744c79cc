#pragma once

#include "gas_deblend/core/types.hpp"
#include "gas_deblend/segmentation/watershed.hpp"
#include <cstdint>
#include <vector>

namespace gas_deblend::segmentation {

struct PruneReport {
    int ids_examined = 0;
    std::vector<int32_t> removed_ids;
    int64_t removed_seed_voxels = 0;
    int64_t removed_result_voxels = 0;
};

// Minimum growth of one 2D candidate: one coarse pixel, i.e. factor^2 fine
// pixels, times `scale`.
float growth_threshold_2d(int factor, float scale = 1.0f);

// 3D analogue: factor^2 per spectral slice over `depth` slices, times `scale`.
float growth_threshold_3d(int factor, int depth, float scale = 1.0f);

// For every id present in `markers`, growth = |result == id| - |markers == id|.
// Ids with growth < threshold are erased from both arrays. Every decision is
// taken from the state before any erasure.
PruneReport prune_by_growth(LabelVolume& markers, LabelVolume& result, float threshold);
PruneReport prune_by_growth(Matrix2Di& markers, Matrix2Di& result, float threshold);

struct Refinement3D {
    LabelVolume markers;   // pruned seeds
    LabelVolume initial;   // result before pruning
    LabelVolume result;    // result of the single re-run
    PruneReport report;
};

struct Refinement2D {
    Matrix2Di markers;
    Matrix2Di initial;
    Matrix2Di result;
    PruneReport report;
};

// watershed -> prune -> watershed, exactly once.
Refinement3D refine_with_pruning(const Cube3Df& cost, LabelVolume markers, const MaskVolume& mask,
                                 const WatershedOptions& options, float threshold);
Refinement2D refine_with_pruning(const Matrix2Df& cost, Matrix2Di markers, const Mask2D& mask,
                                 const WatershedOptions& options, float threshold);

} // namespace gas_deblend::segmentation
