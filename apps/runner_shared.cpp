#include "runner_shared.hpp"

#include "gas_deblend/core/utils.hpp"

namespace gas_deblend::runner {

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

MaskVolume mask_from_cube(const Cube3Df &values) {
  MaskVolume mask(values.shape);
  for (size_t i = 0; i < values.size(); ++i) {
    mask.data[i] = values.data[i] != 0.0f ? 1 : 0;
  }
  return mask;
}

nlohmann::json peaks_to_json(const pipeline::DeblendResult &result) {
  nlohmann::json peaks = nlohmann::json::array();
  for (const auto &p : result.peaks) {
    // Peaks carry the fixed-3D label they reseed.
    const int32_t label = result.fixed_3d.empty() ? 0 : result.fixed_3d(p.z, p.y, p.x);
    peaks.push_back({{"z", p.z},
                     {"y", p.y},
                     {"x", p.x},
                     {"value", p.value},
                     {"label", label}});
  }

  nlohmann::json label_map = nlohmann::json::object();
  for (const auto &[from, to] : result.label_map) {
    label_map[std::to_string(from)] = to;
  }

  return {{"shape",
           {result.shape.depth, result.shape.rows, result.shape.cols}},
          {"n_peaks", result.peaks.size()},
          {"peaks", peaks},
          {"label_map", label_map}};
}

void write_json_file(const std::filesystem::path &path,
                     const nlohmann::json &value) {
  core::write_text(path, value.dump(2) + "\n");
}

} // namespace gas_deblend::runner
