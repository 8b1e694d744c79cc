#include "gas_deblend/segmentation/watershed.hpp"
#include "gas_deblend/core/errors.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <queue>

namespace gas_deblend::segmentation {

namespace {

// Heap entry: primary key cost, secondary key time of entry.
struct FloodEntry {
    float cost;
    uint64_t age;
    size_t index;

    bool operator>(const FloodEntry& other) const {
        if (cost != other.cost) return cost > other.cost;
        return age > other.age;
    }
};

void flood(const float* cost, const int32_t* markers, const uint8_t* mask,
           const CubeShape& shape, int rank, const WatershedOptions& options,
           int32_t* out) {
    const std::vector<Offset3> offsets = neighbour_offsets(rank, options.connectivity);
    const size_t n = shape.size();
    const size_t plane = shape.plane_size();

    std::priority_queue<FloodEntry, std::vector<FloodEntry>, std::greater<FloodEntry>> pq;
    uint64_t age_counter = 0;

    std::fill(out, out + n, 0);
    for (size_t i = 0; i < n; ++i) {
        if (markers[i] < 0) {
            throw ValidationError("marker ids must be non-negative");
        }
        if (markers[i] == 0 || !mask[i]) continue;
        out[i] = markers[i];
        pq.push({cost[i], age_counter++, i});
    }

    if (pq.empty() && options.require_seed) {
        throw EmptySeedSetError("no seed lies inside the validity mask");
    }

    while (!pq.empty()) {
        const FloodEntry cur = pq.top();
        pq.pop();

        const int z = static_cast<int>(cur.index / plane);
        const size_t rem = cur.index % plane;
        const int y = static_cast<int>(rem / shape.cols);
        const int x = static_cast<int>(rem % shape.cols);
        const int32_t label = out[cur.index];

        for (const auto& o : offsets) {
            const int nz = z + o[0];
            const int ny = y + o[1];
            const int nx = x + o[2];
            if (nz < 0 || nz >= shape.depth || ny < 0 || ny >= shape.rows ||
                nx < 0 || nx >= shape.cols) {
                continue;
            }
            const size_t ni = (static_cast<size_t>(nz) * shape.rows + ny) * shape.cols + nx;
            if (!mask[ni] || out[ni] != 0) continue;
            out[ni] = label;
            pq.push({cost[ni], age_counter++, ni});
        }
    }
}

} // namespace

std::vector<Offset3> neighbour_offsets(int rank, int connectivity) {
    if (rank != 2 && rank != 3) {
        throw InvalidDimensionError("watershed expects rank 2 or 3, got " + std::to_string(rank));
    }
    if (connectivity < 1 || connectivity > rank) {
        throw ValidationError("connectivity must be in [1, " + std::to_string(rank) +
                              "], got " + std::to_string(connectivity));
    }

    std::vector<Offset3> offsets;
    const int zr = rank == 3 ? 1 : 0;
    for (int dz = -zr; dz <= zr; ++dz) {
        for (int dy = -1; dy <= 1; ++dy) {
            for (int dx = -1; dx <= 1; ++dx) {
                const int d2 = dz * dz + dy * dy + dx * dx;
                if (d2 == 0 || d2 > connectivity) continue;
                offsets.push_back({dz, dy, dx});
            }
        }
    }
    return offsets;
}

LabelVolume watershed(const Cube3Df& cost, const LabelVolume& markers, const MaskVolume& mask,
                      const WatershedOptions& options) {
    if (cost.shape != markers.shape || cost.shape != mask.shape) {
        throw InvalidShapeError("cost " + shape_to_string(cost.shape) + ", markers " +
                                shape_to_string(markers.shape) + ", mask " +
                                shape_to_string(mask.shape));
    }
    LabelVolume out(cost.shape);
    flood(cost.data.data(), markers.data.data(), mask.data.data(), cost.shape, 3, options,
          out.data.data());
    return out;
}

Matrix2Di watershed(const Matrix2Df& cost, const Matrix2Di& markers, const Mask2D& mask,
                    const WatershedOptions& options) {
    if (cost.rows() != markers.rows() || cost.cols() != markers.cols() ||
        cost.rows() != mask.rows() || cost.cols() != mask.cols()) {
        throw InvalidShapeError("cost, markers and mask must share one 2D shape");
    }
    const CubeShape shape{1, static_cast<int>(cost.rows()), static_cast<int>(cost.cols())};
    Matrix2Di out(cost.rows(), cost.cols());
    flood(cost.data(), markers.data(), mask.data(), shape, 2, options, out.data());
    return out;
}

Cube3Df cost_from_flux(const Cube3Df& flux) {
    Cube3Df cost(flux.shape);
    for (size_t i = 0; i < flux.size(); ++i) {
        cost.data[i] = -flux.data[i];
    }
    return cost;
}

Matrix2Df cost_from_flux(const Matrix2Df& flux) {
    return -flux;
}

} // namespace gas_deblend::segmentation
