#pragma once

#include "gas_deblend/core/types.hpp"
#include <vector>

namespace gas_deblend::segmentation {

struct PeakFinderOptions {
    int box_size = 3;                              // odd edge length of the local box
    int max_peaks = 0;                             // <= 0: unlimited
    PeakCapPolicy cap_policy = PeakCapPolicy::GLOBAL;
    int border_width = 0;                          // reject peaks this close to any face
    int workers = 1;
};

// Local maxima of `data`. A voxel is a peak when it equals the maximum of the
// box centred on it (box clipped at the array boundary), is strictly above
// `threshold` at the same voxel and is not flagged in `exclude`. An empty
// `exclude` volume disables exclusion. Every voxel of a flat maximum is
// reported. Result sorted by value descending, ties by flat index.
std::vector<Peak> find_peaks_3d(const Cube3Df& data, const Cube3Df& threshold,
                                const MaskVolume& exclude, const PeakFinderOptions& options);

// Per spectral slice: median + nsigma * robust sigma of the voxels flagged in
// `valid` (all voxels when `valid` is empty). Slices without valid voxels get 0.
Cube3Df make_threshold_field(const Cube3Df& cube, const MaskVolume& valid, float nsigma,
                             int workers = 1);

} // namespace gas_deblend::segmentation
