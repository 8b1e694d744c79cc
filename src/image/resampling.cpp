#include "gas_deblend/image/resampling.hpp"
#include "gas_deblend/core/errors.hpp"
#include "gas_deblend/core/utils.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace gas_deblend::image {

namespace {

constexpr float kFwhmToSigma = 2.3548200450309493f;

void check_factor(int factor) {
    if (factor < 1) {
        throw ValidationError("upsample factor must be >= 1, got " + std::to_string(factor));
    }
}

cv::Mat gaussian_kernel_1d(int factor) {
    const int size = 4 * factor + 1;
    const double sigma = static_cast<double>(factor) / kFwhmToSigma;
    return cv::getGaussianKernel(size, sigma, CV_32F);
}

template <typename Scalar>
void replicate_plane(const Scalar* src, int rows, int cols, int factor, Scalar* dst) {
    const int out_cols = cols * factor;
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const Scalar v = src[static_cast<size_t>(y) * cols + x];
            for (int dy = 0; dy < factor; ++dy) {
                Scalar* row = dst + static_cast<size_t>(y * factor + dy) * out_cols;
                std::fill(row + x * factor, row + (x + 1) * factor, v);
            }
        }
    }
}

void smooth_plane_inplace(float* data, int rows, int cols, const cv::Mat& k1d) {
    cv::Mat src(rows, cols, CV_32F, data);
    cv::Mat tmp;
    cv::sepFilter2D(src, tmp, CV_32F, k1d, k1d, cv::Point(-1, -1), 0.0, cv::BORDER_CONSTANT);
    tmp.copyTo(src);
}

template <typename Matrix>
Matrix crop_matrix(const Matrix& m, int margin) {
    if (margin < 0) {
        throw BoundsError("crop margin must be >= 0");
    }
    const int rows = static_cast<int>(m.rows());
    const int cols = static_cast<int>(m.cols());
    if (2 * margin >= rows || 2 * margin >= cols) {
        throw BoundsError("crop margin " + std::to_string(margin) + " exceeds extent " +
                          std::to_string(rows) + "x" + std::to_string(cols));
    }
    return m.block(margin, margin, rows - 2 * margin, cols - 2 * margin);
}

template <typename Scalar>
Volume3D<Scalar> crop_volume(const Volume3D<Scalar>& v, int margin) {
    if (margin < 0) {
        throw BoundsError("crop margin must be >= 0");
    }
    if (2 * margin >= v.rows() || 2 * margin >= v.cols()) {
        throw BoundsError("crop margin " + std::to_string(margin) + " exceeds extent " +
                          std::to_string(v.rows()) + "x" + std::to_string(v.cols()));
    }
    Volume3D<Scalar> out(v.depth(), v.rows() - 2 * margin, v.cols() - 2 * margin);
    for (int z = 0; z < v.depth(); ++z) {
        out.plane(z) = v.plane(z).block(margin, margin, out.rows(), out.cols());
    }
    return out;
}

} // namespace

Matrix2Df gaussian_kernel(int factor) {
    check_factor(factor);
    cv::Mat k1d = gaussian_kernel_1d(factor);
    const int size = k1d.rows;
    Matrix2Df k(size, size);
    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            k(y, x) = k1d.at<float>(y) * k1d.at<float>(x);
        }
    }
    return k / k.sum();
}

Matrix2Df upsample(const Matrix2Df& img, int factor, bool smooth) {
    check_factor(factor);
    const int rows = static_cast<int>(img.rows());
    const int cols = static_cast<int>(img.cols());
    Matrix2Df out(rows * factor, cols * factor);
    replicate_plane(img.data(), rows, cols, factor, out.data());
    if (smooth && out.size() > 0) {
        smooth_plane_inplace(out.data(), rows * factor, cols * factor, gaussian_kernel_1d(factor));
    }
    return out;
}

Cube3Df upsample(const Cube3Df& cube, int factor, bool smooth, int workers) {
    check_factor(factor);
    Cube3Df out(cube.depth(), cube.rows() * factor, cube.cols() * factor);
    if (out.empty()) return out;

    const cv::Mat k1d = gaussian_kernel_1d(factor);
    const size_t in_plane = cube.shape.plane_size();
    const size_t out_plane = out.shape.plane_size();

    // Slices are independent and write disjoint output planes.
    core::parallel_for(static_cast<size_t>(cube.depth()), workers, [&](size_t z) {
        float* dst = out.data.data() + z * out_plane;
        replicate_plane(cube.data.data() + z * in_plane, cube.rows(), cube.cols(), factor, dst);
        if (smooth) {
            smooth_plane_inplace(dst, out.rows(), out.cols(), k1d);
        }
    });
    return out;
}

ArrayND upsample(const ArrayND& array, int factor, bool smooth, int workers) {
    check_factor(factor);
    const int rank = array.rank();
    if (rank != 2 && rank != 3) {
        throw InvalidDimensionError("upsample expects rank 2 or 3, got " + std::to_string(rank));
    }

    size_t expected = 1;
    for (int n : array.shape) expected *= static_cast<size_t>(std::max(n, 0));
    if (expected != array.data.size()) {
        throw InvalidShapeError("array data size does not match its shape");
    }

    ArrayND out;
    if (rank == 2) {
        Matrix2Df img = Eigen::Map<const Matrix2Df>(array.data.data(), array.shape[0], array.shape[1]);
        Matrix2Df up = upsample(img, factor, smooth);
        out.shape = {static_cast<int>(up.rows()), static_cast<int>(up.cols())};
        out.data.assign(up.data(), up.data() + up.size());
    } else {
        Cube3Df cube(array.shape[0], array.shape[1], array.shape[2]);
        cube.data = array.data;
        Cube3Df up = upsample(cube, factor, smooth, workers);
        out.shape = {up.depth(), up.rows(), up.cols()};
        out.data = std::move(up.data);
    }
    return out;
}

Cube3Df spectral_bin(const Cube3Df& cube, int bin) {
    if (bin <= 1) return cube;
    const int out_depth = cube.depth() / bin;
    Cube3Df out(out_depth, cube.rows(), cube.cols());
    for (int zo = 0; zo < out_depth; ++zo) {
        auto dst = out.plane(zo);
        for (int k = 0; k < bin; ++k) {
            dst += cube.plane(zo * bin + k);
        }
    }
    return out;
}

Cube3Df spectral_smooth(const Cube3Df& cube, float sigma) {
    if (sigma <= 0.0f || cube.empty()) return cube;

    int size = static_cast<int>(std::ceil(8.0f * sigma));
    if (size % 2 == 0) size += 1;
    cv::Mat k1d = cv::getGaussianKernel(size, static_cast<double>(sigma), CV_32F);
    cv::Mat identity = cv::Mat::ones(1, 1, CV_32F);

    // View the cube as depth x (rows*cols); each column is one spectrum.
    Cube3Df out = cube;
    const int n_spectra = static_cast<int>(cube.shape.plane_size());
    cv::Mat src(cube.depth(), n_spectra, CV_32F, const_cast<float*>(cube.data.data()));
    cv::Mat dst(out.depth(), n_spectra, CV_32F, out.data.data());
    cv::sepFilter2D(src, dst, CV_32F, identity, k1d, cv::Point(-1, -1), 0.0, cv::BORDER_CONSTANT);
    return out;
}

Matrix2Df crop_spatial(const Matrix2Df& img, int margin) {
    return crop_matrix(img, margin);
}

Matrix2Di crop_spatial(const Matrix2Di& labels, int margin) {
    return crop_matrix(labels, margin);
}

Cube3Df crop_spatial(const Cube3Df& cube, int margin) {
    return crop_volume(cube, margin);
}

MaskVolume crop_spatial(const MaskVolume& mask, int margin) {
    return crop_volume(mask, margin);
}

MaskVolume validity_mask(const Cube3Df& cube, float epsilon) {
    MaskVolume mask(cube.shape);
    for (size_t i = 0; i < cube.size(); ++i) {
        mask.data[i] = std::abs(cube.data[i]) > epsilon ? 1 : 0;
    }
    return mask;
}

Mask2D validity_mask(const Matrix2Df& img, float epsilon) {
    Mask2D mask(img.rows(), img.cols());
    for (Eigen::Index i = 0; i < img.size(); ++i) {
        mask.data()[i] = std::abs(img.data()[i]) > epsilon ? 1 : 0;
    }
    return mask;
}

Cube3Df apply_mask(const Cube3Df& cube, const MaskVolume& mask) {
    if (cube.shape != mask.shape) {
        throw InvalidShapeError("cube " + shape_to_string(cube.shape) + " vs mask " +
                                shape_to_string(mask.shape));
    }
    Cube3Df out = cube;
    for (size_t i = 0; i < out.size(); ++i) {
        if (!mask.data[i]) out.data[i] = 0.0f;
    }
    return out;
}

Matrix2Df moment0(const Cube3Df& cube, const MaskVolume& mask) {
    if (cube.shape != mask.shape) {
        throw InvalidShapeError("cube " + shape_to_string(cube.shape) + " vs mask " +
                                shape_to_string(mask.shape));
    }
    Matrix2Df m0 = Matrix2Df::Zero(cube.rows(), cube.cols());
    for (int z = 0; z < cube.depth(); ++z) {
        m0 += (cube.plane(z).array() * mask.plane(z).cast<float>().array()).matrix();
    }
    return m0;
}

} // namespace gas_deblend::image
