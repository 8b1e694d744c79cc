#pragma once

#include "gas_deblend/core/types.hpp"
#include <array>
#include <vector>

namespace gas_deblend::segmentation {

struct WatershedOptions {
    // Neighbours with squared offset length <= connectivity.
    // 2D: 1 = 4-neighbour, 2 = 8-neighbour. 3D: 1 = 6, 2 = 18, 3 = 26.
    int connectivity = 1;
    // Raise EmptySeedSetError instead of returning an all-zero result when no
    // seed lies inside the mask.
    bool require_seed = false;
};

using Offset3 = std::array<int, 3>;  // (dz, dy, dx)

// Neighbour offsets for rank 2 (dz == 0) or 3. ValidationError when
// connectivity is outside [1, rank].
std::vector<Offset3> neighbour_offsets(int rank, int connectivity);

// Seeded priority flood. Cells are processed in ascending cost; each popped
// cell hands its label to every unlabelled neighbour inside the mask. Ties in
// cost resolve by insertion order, with seeds inserted in ascending flat index,
// so the result is reproducible. Cells outside the mask stay 0.
LabelVolume watershed(const Cube3Df& cost, const LabelVolume& markers, const MaskVolume& mask,
                      const WatershedOptions& options = {});

Matrix2Di watershed(const Matrix2Df& cost, const Matrix2Di& markers, const Mask2D& mask,
                    const WatershedOptions& options = {});

// Flooding starts from bright seeds, so the cost surface is the negated flux.
Cube3Df cost_from_flux(const Cube3Df& flux);
Matrix2Df cost_from_flux(const Matrix2Df& flux);

} // namespace gas_deblend::segmentation
