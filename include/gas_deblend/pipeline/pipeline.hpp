#pragma once

#include "gas_deblend/config/configuration.hpp"
#include "gas_deblend/core/events.hpp"
#include "gas_deblend/core/types.hpp"
#include "gas_deblend/segmentation/growth_pruner.hpp"

#include <map>
#include <ostream>
#include <vector>

namespace gas_deblend::pipeline {

struct DeblendInputs {
    Cube3Df cube;           // (spectral, y, x) on the coarse grid
    MaskVolume mask;        // optional source footprint, same shape as cube
    Matrix2Di prior;        // 2D prior labels on the fine grid (k x cube spatial)
    Matrix2Df prior_image;  // optional flux image on the prior grid for seeding
};

struct DeblendResult {
    CubeShape shape;                  // resampled cube shape
    LabelVolume peak_3d;              // final labels, compacted
    std::map<int32_t, int32_t> label_map;  // prior id -> final id
    LabelVolume fixed_3d;             // prior ids
    Matrix2Di labels_2d;              // prior ids
    Matrix2Di markers_2d;             // pruned 2D seeds
    std::vector<Peak> peaks;
    segmentation::PruneReport prune_2d;
    segmentation::PruneReport prune_3d;
};

// Runs every stage for one target. Events go to `log`; any stage failure is
// reported there and rethrown.
DeblendResult run_deblend(const DeblendInputs& inputs, const config::Config& cfg,
                          core::EventEmitter& emitter, std::ostream& log);

} // namespace gas_deblend::pipeline
