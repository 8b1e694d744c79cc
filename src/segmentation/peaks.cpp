#include "gas_deblend/segmentation/peaks.hpp"
#include "gas_deblend/core/errors.hpp"
#include "gas_deblend/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace gas_deblend::segmentation {

namespace {

bool peak_before(const Peak& a, size_t ia, const Peak& b, size_t ib) {
    if (a.value != b.value) return a.value > b.value;
    return ia < ib;
}

void sort_peaks(std::vector<Peak>& peaks, const CubeShape& shape) {
    auto flat = [&](const Peak& p) {
        return (static_cast<size_t>(p.z) * shape.rows + p.y) * shape.cols + p.x;
    };
    std::sort(peaks.begin(), peaks.end(), [&](const Peak& a, const Peak& b) {
        return peak_before(a, flat(a), b, flat(b));
    });
}

// Separable running maximum over a box of half width `half`, windows clipped
// at the array boundary.
Cube3Df box_maximum(const Cube3Df& data, int half, int workers) {
    const CubeShape s = data.shape;
    Cube3Df along_x(s);
    Cube3Df along_y(s);

    core::parallel_for(static_cast<size_t>(s.depth), workers, [&](size_t zi) {
        const int z = static_cast<int>(zi);
        for (int y = 0; y < s.rows; ++y) {
            for (int x = 0; x < s.cols; ++x) {
                const core::IndexRange r = core::clip_box(x, half, s.cols);
                float m = -std::numeric_limits<float>::infinity();
                for (int xx = r.begin; xx < r.end; ++xx) m = std::max(m, data(z, y, xx));
                along_x(z, y, x) = m;
            }
        }
        for (int y = 0; y < s.rows; ++y) {
            const core::IndexRange r = core::clip_box(y, half, s.rows);
            for (int x = 0; x < s.cols; ++x) {
                float m = -std::numeric_limits<float>::infinity();
                for (int yy = r.begin; yy < r.end; ++yy) m = std::max(m, along_x(z, yy, x));
                along_y(z, y, x) = m;
            }
        }
    });

    Cube3Df out(s);
    core::parallel_for(static_cast<size_t>(s.depth), workers, [&](size_t zi) {
        const int z = static_cast<int>(zi);
        const core::IndexRange r = core::clip_box(z, half, s.depth);
        auto dst = out.plane(z);
        dst = along_y.plane(r.begin);
        for (int zz = r.begin + 1; zz < r.end; ++zz) {
            dst = dst.cwiseMax(along_y.plane(zz));
        }
    });
    return out;
}

bool inside_border(int z, int y, int x, const CubeShape& s, int bw) {
    if (bw <= 0) return true;
    return z >= bw && z < s.depth - bw && y >= bw && y < s.rows - bw && x >= bw && x < s.cols - bw;
}

} // namespace

std::vector<Peak> find_peaks_3d(const Cube3Df& data, const Cube3Df& threshold,
                                const MaskVolume& exclude, const PeakFinderOptions& options) {
    if (options.box_size < 1 || options.box_size % 2 == 0) {
        throw ValidationError("peak box_size must be odd and >= 1");
    }
    if (threshold.shape != data.shape) {
        throw InvalidShapeError("data " + shape_to_string(data.shape) + " vs threshold " +
                                shape_to_string(threshold.shape));
    }
    if (!exclude.empty() && exclude.shape != data.shape) {
        throw InvalidShapeError("data " + shape_to_string(data.shape) + " vs exclusion mask " +
                                shape_to_string(exclude.shape));
    }
    if (data.empty()) return {};

    // NaNs take the smallest finite value so they never win a box.
    const Cube3Df* src = &data;
    Cube3Df cleaned;
    if (std::any_of(data.data.begin(), data.data.end(), [](float v) { return std::isnan(v); })) {
        float lo = std::numeric_limits<float>::infinity();
        for (float v : data.data) {
            if (!std::isnan(v)) lo = std::min(lo, v);
        }
        cleaned = data;
        for (float& v : cleaned.data) {
            if (std::isnan(v)) v = lo;
        }
        src = &cleaned;
    }

    const CubeShape s = data.shape;
    const Cube3Df dmax = box_maximum(*src, options.box_size / 2, options.workers);

    std::vector<std::vector<Peak>> per_slice(static_cast<size_t>(s.depth));
    core::parallel_for(static_cast<size_t>(s.depth), options.workers, [&](size_t zi) {
        const int z = static_cast<int>(zi);
        auto& found = per_slice[zi];
        for (int y = 0; y < s.rows; ++y) {
            for (int x = 0; x < s.cols; ++x) {
                const size_t i = src->index(z, y, x);
                const float v = src->data[i];
                if (v != dmax.data[i]) continue;
                if (!(v > threshold.data[i])) continue;
                if (!exclude.empty() && exclude.data[i]) continue;
                if (!inside_border(z, y, x, s, options.border_width)) continue;
                found.push_back({z, y, x, v});
            }
        }
        if (options.cap_policy == PeakCapPolicy::PER_CHANNEL && options.max_peaks > 0 &&
            found.size() > static_cast<size_t>(options.max_peaks)) {
            sort_peaks(found, s);
            found.resize(static_cast<size_t>(options.max_peaks));
        }
    });

    std::vector<Peak> peaks;
    for (auto& found : per_slice) {
        peaks.insert(peaks.end(), found.begin(), found.end());
    }
    sort_peaks(peaks, s);

    if (options.cap_policy == PeakCapPolicy::GLOBAL && options.max_peaks > 0 &&
        peaks.size() > static_cast<size_t>(options.max_peaks)) {
        peaks.resize(static_cast<size_t>(options.max_peaks));
    }
    return peaks;
}

Cube3Df make_threshold_field(const Cube3Df& cube, const MaskVolume& valid, float nsigma,
                             int workers) {
    if (!valid.empty() && valid.shape != cube.shape) {
        throw InvalidShapeError("cube " + shape_to_string(cube.shape) + " vs mask " +
                                shape_to_string(valid.shape));
    }

    Cube3Df field(cube.shape);
    core::parallel_for(static_cast<size_t>(cube.depth()), workers, [&](size_t zi) {
        const int z = static_cast<int>(zi);
        const size_t base = zi * cube.shape.plane_size();
        std::vector<float> values;
        values.reserve(cube.shape.plane_size());
        for (size_t k = 0; k < cube.shape.plane_size(); ++k) {
            if (valid.empty() || valid.data[base + k]) values.push_back(cube.data[base + k]);
        }
        float level = 0.0f;
        if (!values.empty()) {
            level = core::compute_median(values) + nsigma * core::compute_robust_sigma(values);
        }
        field.plane(z).setConstant(level);
    });
    return field;
}

} // namespace gas_deblend::segmentation
