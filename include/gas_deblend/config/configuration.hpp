#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace gas_deblend::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  bool abort_on_fail = true;        // no seed at all is an error, not a warning
};

struct DataConfig {
  int upsample_factor = 3;          // prior grid / cube grid, integer
  int spectral_bin = 0;             // 0|1 = off, n = sum n channels
  float spectral_smooth_sigma = 0.0f; // channels, 0 = off (ignored when binning)
  int crop_margin = 0;              // cube pixels trimmed from each spatial edge
  float input_epsilon = 1.0e-6f;    // |flux| above which an input voxel is valid
};

struct ResampleConfig {
  bool smooth = true;               // Gaussian, FWHM = upsample_factor
};

struct MarkersConfig {
  float seed_sigma = 1.0f;          // seed if flux > mean + seed_sigma * std
};

struct WatershedConfig {
  int connectivity_2d = 1;          // 1 = 4-neighbour, 2 = 8-neighbour
  int connectivity_3d = 1;          // 1 = faces, 2 = +edges, 3 = +corners
};

struct GrowthConfig {
  float factor_2d = 1.0f;           // threshold = factor * k^2
  float factor_3d = 1.0f;           // threshold = factor * k^2 * depth
};

struct MasksConfig {
  float strict_epsilon = 1.0e-4f;   // fixed-3D stage validity
  float loose_epsilon = 1.0e-7f;    // peak-3D stage validity
};

struct PeaksConfig {
  int box_size = 3;
  float threshold_sigma = 3.0f;
  int max_peaks = 0;                // 0 = unlimited
  std::string cap_policy = "global"; // global | per_channel
  int border_width = 0;
  int reseed_half_spectral = 3;
  int reseed_half_spatial = 2;
};

struct RuntimeConfig {
  int parallel_workers = 4;
};

struct OutputConfig {
  bool write_fixed3d = true;
  bool write_2d = true;
  bool write_peaks = true;
};

struct Config {
  PipelineConfig pipeline;
  DataConfig data;
  ResampleConfig resample;
  MarkersConfig markers;
  WatershedConfig watershed;
  GrowthConfig growth;
  MasksConfig masks;
  PeaksConfig peaks;
  RuntimeConfig runtime;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace gas_deblend::config
