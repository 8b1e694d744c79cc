#pragma once

#include "gas_deblend/core/types.hpp"
#include "gas_deblend/pipeline/pipeline.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <streambuf>
#include <string>

namespace gas_deblend::runner {

// Writes every character to both buffers (stdout + run_events.jsonl).
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

// Nonzero voxels of a FITS mask cube.
MaskVolume mask_from_cube(const Cube3Df &values);

nlohmann::json peaks_to_json(const pipeline::DeblendResult &result);

void write_json_file(const std::filesystem::path &path,
                     const nlohmann::json &value);

} // namespace gas_deblend::runner
