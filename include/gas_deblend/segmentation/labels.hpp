#pragma once

#include "gas_deblend/core/types.hpp"
#include <cstdint>
#include <map>
#include <vector>

namespace gas_deblend::segmentation {

// Renumbers labels so that the sorted set of ids {0} ∪ ids(labels) maps in
// ascending order onto 0..N-1. Background stays 0. Idempotent.
// ValidationError on negative ids.
std::vector<int32_t> compact_labels(const std::vector<int32_t>& labels);
Matrix2Di compact_labels(const Matrix2Di& labels);
LabelVolume compact_labels(const LabelVolume& labels);

// Voxel count per positive id.
std::map<int32_t, int64_t> label_counts(const int32_t* labels, size_t n);
std::map<int32_t, int64_t> label_counts(const Matrix2Di& labels);
std::map<int32_t, int64_t> label_counts(const LabelVolume& labels);

} // namespace gas_deblend::segmentation
