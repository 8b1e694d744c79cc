#pragma once

#include "gas_deblend/core/types.hpp"
#include "gas_deblend/segmentation/growth_pruner.hpp"
#include "gas_deblend/segmentation/watershed.hpp"
#include <vector>

namespace gas_deblend::segmentation {

// Seeds of every prior segment: the pixels of the segment whose flux exceeds
// mean + seed_sigma * std of the flux over that segment. Segments with zero
// spread produce no seed. Statistics never cross segments.
Matrix2Di build_markers_2d(const Matrix2Di& prior, const Matrix2Df& flux, float seed_sigma = 1.0f,
                           int workers = 1);

// The same 2D seed image in every spectral slice.
LabelVolume broadcast_markers(const Matrix2Di& markers, int depth);

// Fixed-3D stage: broadcast seeds, flood, prune candidates that grew less
// than `threshold`, flood once more.
Refinement3D build_fixed_3d(const Cube3Df& cost, const Matrix2Di& markers_2d,
                            const MaskVolume& strict_mask, const WatershedOptions& options,
                            float threshold);

struct PeakReseedOptions {
    int half_spectral = 3;
    int half_spatial = 2;
    WatershedOptions watershed;
};

// Seeds copied from `fixed` in a box around every peak (clipped at the
// boundary). Only labels already present in `fixed` are transferred.
LabelVolume reseed_from_peaks(const LabelVolume& fixed, const std::vector<Peak>& peaks,
                              int half_spectral, int half_spatial);

struct PeakStage3D {
    LabelVolume markers;
    LabelVolume result;
};

// Peak-3D stage: reseed from `fixed` at the peaks, flood over `loose_mask`.
PeakStage3D build_peak_3d(const Cube3Df& cost, const LabelVolume& fixed,
                          const std::vector<Peak>& peaks, const MaskVolume& loose_mask,
                          const PeakReseedOptions& options);

} // namespace gas_deblend::segmentation
