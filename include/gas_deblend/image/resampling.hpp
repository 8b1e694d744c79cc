#pragma once

#include "gas_deblend/core/types.hpp"
#include <vector>

namespace gas_deblend::image {

// Array of runtime rank, row-major. Used where the rank is only known at
// runtime (e.g. straight from a FITS header).
struct ArrayND {
    std::vector<int> shape;
    std::vector<float> data;

    int rank() const { return static_cast<int>(shape.size()); }
};

// Nearest-neighbour upsampling of the two trailing axes by `factor`, each
// source cell becoming a factor x factor block. Rank must be 2 or 3
// (InvalidDimensionError otherwise). With `smooth`, every spatial plane is
// convolved with gaussian_kernel(factor).
ArrayND upsample(const ArrayND& array, int factor, bool smooth, int workers = 1);

Matrix2Df upsample(const Matrix2Df& img, int factor, bool smooth);
Cube3Df upsample(const Cube3Df& cube, int factor, bool smooth, int workers = 1);

// Normalised 2D Gaussian with FWHM = factor on a (4*factor+1)^2 support.
Matrix2Df gaussian_kernel(int factor);

// Sums groups of `bin` consecutive channels; incomplete trailing groups are
// dropped. bin <= 1 returns the input unchanged.
Cube3Df spectral_bin(const Cube3Df& cube, int bin);

// Gaussian smoothing of every spectrum (std `sigma` channels, support
// 8*sigma+1 rounded up to odd, zero padded). sigma <= 0 is a no-op.
Cube3Df spectral_smooth(const Cube3Df& cube, float sigma);

// Removes `margin` pixels from each spatial edge. BoundsError if nothing
// would remain.
Matrix2Df crop_spatial(const Matrix2Df& img, int margin);
Matrix2Di crop_spatial(const Matrix2Di& labels, int margin);
Cube3Df crop_spatial(const Cube3Df& cube, int margin);
MaskVolume crop_spatial(const MaskVolume& mask, int margin);

MaskVolume validity_mask(const Cube3Df& cube, float epsilon);
Mask2D validity_mask(const Matrix2Df& img, float epsilon);

// Voxels outside the mask set to 0. Shapes must match.
Cube3Df apply_mask(const Cube3Df& cube, const MaskVolume& mask);

// Sum over the spectral axis of flux * mask.
Matrix2Df moment0(const Cube3Df& cube, const MaskVolume& mask);

} // namespace gas_deblend::image
