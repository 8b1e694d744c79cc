#include "gas_deblend/segmentation/labels.hpp"
#include "gas_deblend/core/errors.hpp"

#include <algorithm>
#include <unordered_map>

namespace gas_deblend::segmentation {

namespace {

void compact_into(const int32_t* in, size_t n, int32_t* out) {
    std::vector<int32_t> ids(in, in + n);
    ids.push_back(0);
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    if (ids.front() < 0) {
        throw ValidationError("label ids must be non-negative, found " +
                              std::to_string(ids.front()));
    }

    std::unordered_map<int32_t, int32_t> remap;
    remap.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        remap.emplace(ids[i], static_cast<int32_t>(i));
    }
    for (size_t i = 0; i < n; ++i) {
        out[i] = remap[in[i]];
    }
}

} // namespace

std::vector<int32_t> compact_labels(const std::vector<int32_t>& labels) {
    std::vector<int32_t> out(labels.size());
    compact_into(labels.data(), labels.size(), out.data());
    return out;
}

Matrix2Di compact_labels(const Matrix2Di& labels) {
    Matrix2Di out(labels.rows(), labels.cols());
    compact_into(labels.data(), static_cast<size_t>(labels.size()), out.data());
    return out;
}

LabelVolume compact_labels(const LabelVolume& labels) {
    LabelVolume out(labels.shape);
    compact_into(labels.data.data(), labels.size(), out.data.data());
    return out;
}

std::map<int32_t, int64_t> label_counts(const int32_t* labels, size_t n) {
    std::map<int32_t, int64_t> counts;
    for (size_t i = 0; i < n; ++i) {
        if (labels[i] > 0) ++counts[labels[i]];
    }
    return counts;
}

std::map<int32_t, int64_t> label_counts(const Matrix2Di& labels) {
    return label_counts(labels.data(), static_cast<size_t>(labels.size()));
}

std::map<int32_t, int64_t> label_counts(const LabelVolume& labels) {
    return label_counts(labels.data.data(), labels.size());
}

} // namespace gas_deblend::segmentation
