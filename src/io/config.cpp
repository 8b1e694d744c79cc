#include "gas_deblend/config/configuration.hpp"
#include "gas_deblend/core/errors.hpp"

#include <fstream>

namespace gas_deblend::config {

static bool is_odd(int v) {
    return (v % 2) != 0;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["pipeline"]) {
            auto p = node["pipeline"];
            if (p["abort_on_fail"]) cfg.pipeline.abort_on_fail = p["abort_on_fail"].as<bool>();
        }

        if (node["data"]) {
            auto d = node["data"];
            if (d["upsample_factor"]) cfg.data.upsample_factor = d["upsample_factor"].as<int>();
            if (d["spectral_bin"]) cfg.data.spectral_bin = d["spectral_bin"].as<int>();
            if (d["spectral_smooth_sigma"]) cfg.data.spectral_smooth_sigma = d["spectral_smooth_sigma"].as<float>();
            if (d["crop_margin"]) cfg.data.crop_margin = d["crop_margin"].as<int>();
            if (d["input_epsilon"]) cfg.data.input_epsilon = d["input_epsilon"].as<float>();
        }

        if (node["resample"]) {
            auto r = node["resample"];
            if (r["smooth"]) cfg.resample.smooth = r["smooth"].as<bool>();
        }

        if (node["markers"]) {
            auto m = node["markers"];
            if (m["seed_sigma"]) cfg.markers.seed_sigma = m["seed_sigma"].as<float>();
        }

        if (node["watershed"]) {
            auto w = node["watershed"];
            if (w["connectivity_2d"]) cfg.watershed.connectivity_2d = w["connectivity_2d"].as<int>();
            if (w["connectivity_3d"]) cfg.watershed.connectivity_3d = w["connectivity_3d"].as<int>();
        }

        if (node["growth"]) {
            auto g = node["growth"];
            if (g["factor_2d"]) cfg.growth.factor_2d = g["factor_2d"].as<float>();
            if (g["factor_3d"]) cfg.growth.factor_3d = g["factor_3d"].as<float>();
        }

        if (node["masks"]) {
            auto m = node["masks"];
            if (m["strict_epsilon"]) cfg.masks.strict_epsilon = m["strict_epsilon"].as<float>();
            if (m["loose_epsilon"]) cfg.masks.loose_epsilon = m["loose_epsilon"].as<float>();
        }

        if (node["peaks"]) {
            auto p = node["peaks"];
            if (p["box_size"]) cfg.peaks.box_size = p["box_size"].as<int>();
            if (p["threshold_sigma"]) cfg.peaks.threshold_sigma = p["threshold_sigma"].as<float>();
            if (p["max_peaks"]) cfg.peaks.max_peaks = p["max_peaks"].as<int>();
            if (p["cap_policy"]) cfg.peaks.cap_policy = p["cap_policy"].as<std::string>();
            if (p["border_width"]) cfg.peaks.border_width = p["border_width"].as<int>();
            if (p["reseed_half_spectral"]) cfg.peaks.reseed_half_spectral = p["reseed_half_spectral"].as<int>();
            if (p["reseed_half_spatial"]) cfg.peaks.reseed_half_spatial = p["reseed_half_spatial"].as<int>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["write_fixed3d"]) cfg.output.write_fixed3d = o["write_fixed3d"].as<bool>();
            if (o["write_2d"]) cfg.output.write_2d = o["write_2d"].as<bool>();
            if (o["write_peaks"]) cfg.output.write_peaks = o["write_peaks"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pipeline"]["abort_on_fail"] = pipeline.abort_on_fail;

    node["data"]["upsample_factor"] = data.upsample_factor;
    node["data"]["spectral_bin"] = data.spectral_bin;
    node["data"]["spectral_smooth_sigma"] = data.spectral_smooth_sigma;
    node["data"]["crop_margin"] = data.crop_margin;
    node["data"]["input_epsilon"] = data.input_epsilon;

    node["resample"]["smooth"] = resample.smooth;

    node["markers"]["seed_sigma"] = markers.seed_sigma;

    node["watershed"]["connectivity_2d"] = watershed.connectivity_2d;
    node["watershed"]["connectivity_3d"] = watershed.connectivity_3d;

    node["growth"]["factor_2d"] = growth.factor_2d;
    node["growth"]["factor_3d"] = growth.factor_3d;

    node["masks"]["strict_epsilon"] = masks.strict_epsilon;
    node["masks"]["loose_epsilon"] = masks.loose_epsilon;

    node["peaks"]["box_size"] = peaks.box_size;
    node["peaks"]["threshold_sigma"] = peaks.threshold_sigma;
    node["peaks"]["max_peaks"] = peaks.max_peaks;
    node["peaks"]["cap_policy"] = peaks.cap_policy;
    node["peaks"]["border_width"] = peaks.border_width;
    node["peaks"]["reseed_half_spectral"] = peaks.reseed_half_spectral;
    node["peaks"]["reseed_half_spatial"] = peaks.reseed_half_spatial;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;

    node["output"]["write_fixed3d"] = output.write_fixed3d;
    node["output"]["write_2d"] = output.write_2d;
    node["output"]["write_peaks"] = output.write_peaks;

    return node;
}

void Config::validate() const {
    if (data.upsample_factor < 1) {
        throw ValidationError("data.upsample_factor must be >= 1");
    }
    if (data.spectral_bin < 0) {
        throw ValidationError("data.spectral_bin must be >= 0");
    }
    if (data.spectral_smooth_sigma < 0.0f) {
        throw ValidationError("data.spectral_smooth_sigma must be >= 0");
    }
    if (data.crop_margin < 0) {
        throw ValidationError("data.crop_margin must be >= 0");
    }
    if (data.input_epsilon < 0.0f) {
        throw ValidationError("data.input_epsilon must be >= 0");
    }

    if (watershed.connectivity_2d < 1 || watershed.connectivity_2d > 2) {
        throw ValidationError("watershed.connectivity_2d must be 1 or 2");
    }
    if (watershed.connectivity_3d < 1 || watershed.connectivity_3d > 3) {
        throw ValidationError("watershed.connectivity_3d must be in [1,3]");
    }

    if (growth.factor_2d < 0.0f || growth.factor_3d < 0.0f) {
        throw ValidationError("growth.factor_2d/factor_3d must be >= 0");
    }

    if (masks.strict_epsilon < 0.0f || masks.loose_epsilon < 0.0f) {
        throw ValidationError("masks.strict_epsilon/loose_epsilon must be >= 0");
    }
    if (masks.loose_epsilon > masks.strict_epsilon) {
        throw ValidationError("masks.loose_epsilon must be <= masks.strict_epsilon");
    }

    if (peaks.box_size < 1 || !is_odd(peaks.box_size)) {
        throw ValidationError("peaks.box_size must be odd and >= 1");
    }
    if (peaks.max_peaks < 0) {
        throw ValidationError("peaks.max_peaks must be >= 0");
    }
    if (peaks.cap_policy != "global" && peaks.cap_policy != "per_channel") {
        throw ValidationError("peaks.cap_policy must be 'global' or 'per_channel'");
    }
    if (peaks.border_width < 0) {
        throw ValidationError("peaks.border_width must be >= 0");
    }
    if (peaks.reseed_half_spectral < 0 || peaks.reseed_half_spatial < 0) {
        throw ValidationError("peaks.reseed_half_spectral/spatial must be >= 0");
    }

    if (runtime.parallel_workers < 1) {
        throw ValidationError("runtime.parallel_workers must be >= 1");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "pipeline": {
      "type": "object",
      "properties": {
        "abort_on_fail": {"type": "boolean"}
      }
    },
    "data": {
      "type": "object",
      "properties": {
        "upsample_factor": {"type": "integer", "minimum": 1},
        "spectral_bin": {"type": "integer", "minimum": 0},
        "spectral_smooth_sigma": {"type": "number", "minimum": 0},
        "crop_margin": {"type": "integer", "minimum": 0},
        "input_epsilon": {"type": "number", "minimum": 0}
      }
    },
    "resample": {
      "type": "object",
      "properties": {
        "smooth": {"type": "boolean"}
      }
    },
    "markers": {
      "type": "object",
      "properties": {
        "seed_sigma": {"type": "number"}
      }
    },
    "watershed": {
      "type": "object",
      "properties": {
        "connectivity_2d": {"type": "integer", "minimum": 1, "maximum": 2},
        "connectivity_3d": {"type": "integer", "minimum": 1, "maximum": 3}
      }
    },
    "growth": {
      "type": "object",
      "properties": {
        "factor_2d": {"type": "number", "minimum": 0},
        "factor_3d": {"type": "number", "minimum": 0}
      }
    },
    "masks": {
      "type": "object",
      "properties": {
        "strict_epsilon": {"type": "number", "minimum": 0},
        "loose_epsilon": {"type": "number", "minimum": 0}
      }
    },
    "peaks": {
      "type": "object",
      "properties": {
        "box_size": {"type": "integer", "minimum": 1},
        "threshold_sigma": {"type": "number"},
        "max_peaks": {"type": "integer", "minimum": 0},
        "cap_policy": {"type": "string", "enum": ["global", "per_channel"]},
        "border_width": {"type": "integer", "minimum": 0},
        "reseed_half_spectral": {"type": "integer", "minimum": 0},
        "reseed_half_spatial": {"type": "integer", "minimum": 0}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "write_fixed3d": {"type": "boolean"},
        "write_2d": {"type": "boolean"},
        "write_peaks": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace gas_deblend::config
