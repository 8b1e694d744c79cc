#pragma once

#include "gas_deblend/core/errors.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gas_deblend {

namespace fs = std::filesystem;

// Matrix types (NumPy equivalents)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Di = Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Mask2D = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;
using VectorXi = Eigen::VectorXi;

// Axis order is (spectral, y, x)
struct CubeShape {
    int depth = 0;
    int rows = 0;
    int cols = 0;

    size_t plane_size() const { return static_cast<size_t>(rows) * static_cast<size_t>(cols); }
    size_t size() const { return static_cast<size_t>(depth) * plane_size(); }

    bool operator==(const CubeShape& o) const {
        return depth == o.depth && rows == o.rows && cols == o.cols;
    }
    bool operator!=(const CubeShape& o) const { return !(*this == o); }
};

inline std::string shape_to_string(const CubeShape& s) {
    return "(" + std::to_string(s.depth) + ", " + std::to_string(s.rows) + ", " +
           std::to_string(s.cols) + ")";
}

// Dense 3D array in one contiguous row-major buffer.
template <typename Scalar>
struct Volume3D {
    using Plane = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    using PlaneMap = Eigen::Map<Plane>;
    using ConstPlaneMap = Eigen::Map<const Plane>;

    CubeShape shape;
    std::vector<Scalar> data;

    Volume3D() = default;
    Volume3D(int depth, int rows, int cols, Scalar fill = Scalar(0))
        : shape{depth, rows, cols}, data(static_cast<size_t>(depth) * rows * cols, fill) {}
    explicit Volume3D(const CubeShape& s, Scalar fill = Scalar(0))
        : Volume3D(s.depth, s.rows, s.cols, fill) {}

    int depth() const { return shape.depth; }
    int rows() const { return shape.rows; }
    int cols() const { return shape.cols; }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

    size_t index(int z, int y, int x) const {
        return (static_cast<size_t>(z) * shape.rows + static_cast<size_t>(y)) * shape.cols +
               static_cast<size_t>(x);
    }

    Scalar& operator()(int z, int y, int x) { return data[index(z, y, x)]; }
    const Scalar& operator()(int z, int y, int x) const { return data[index(z, y, x)]; }

    PlaneMap plane(int z) {
        return PlaneMap(data.data() + static_cast<size_t>(z) * shape.plane_size(), shape.rows,
                        shape.cols);
    }
    ConstPlaneMap plane(int z) const {
        return ConstPlaneMap(data.data() + static_cast<size_t>(z) * shape.plane_size(),
                             shape.rows, shape.cols);
    }
};

using Cube3Df = Volume3D<float>;
using LabelVolume = Volume3D<int32_t>;
using MaskVolume = Volume3D<uint8_t>;

// Local flux maximum found in a cube
struct Peak {
    int z;        // spectral index
    int y;
    int x;
    float value;
};

// Cap policy when more peaks are found than requested
enum class PeakCapPolicy {
    GLOBAL,       // top-N over the whole cube
    PER_CHANNEL   // top-N inside each spectral slice
};

inline std::string peak_cap_policy_to_string(PeakCapPolicy p) {
    switch (p) {
        case PeakCapPolicy::GLOBAL: return "global";
        case PeakCapPolicy::PER_CHANNEL: return "per_channel";
        default: return "unknown";
    }
}

inline PeakCapPolicy string_to_peak_cap_policy(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (norm == "global") return PeakCapPolicy::GLOBAL;
    if (norm == "per_channel") return PeakCapPolicy::PER_CHANNEL;
    throw ValidationError("unknown peak cap policy '" + s + "'");
}

// Pipeline stage enumeration
enum class Stage {
    PREPARE_INPUT = 0,
    RESAMPLE = 1,
    MARKERS_2D = 2,
    WATERSHED_2D = 3,
    FIXED_3D = 4,
    PEAK_FINDING = 5,
    PEAK_3D = 6,
    COMPACT_LABELS = 7,
    DONE = 8
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::PREPARE_INPUT: return "PREPARE_INPUT";
        case Stage::RESAMPLE: return "RESAMPLE";
        case Stage::MARKERS_2D: return "MARKERS_2D";
        case Stage::WATERSHED_2D: return "WATERSHED_2D";
        case Stage::FIXED_3D: return "FIXED_3D";
        case Stage::PEAK_FINDING: return "PEAK_FINDING";
        case Stage::PEAK_3D: return "PEAK_3D";
        case Stage::COMPACT_LABELS: return "COMPACT_LABELS";
        case Stage::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

} // namespace gas_deblend
