#include "runner_shared.hpp"

#include "gas_deblend/config/configuration.hpp"
#include "gas_deblend/core/errors.hpp"
#include "gas_deblend/core/events.hpp"
#include "gas_deblend/core/utils.hpp"
#include "gas_deblend/io/fits_io.hpp"
#include "gas_deblend/pipeline/pipeline.hpp"
#include "gas_deblend/segmentation/labels.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;

namespace {

using namespace gas_deblend;

struct RunOptions {
  std::string config_path;
  std::string cube_path;
  std::string prior_path;
  std::string prior_image_path;
  std::string mask_path;
  std::string runs_dir;
  int upsample = 0;
  bool dry_run = false;
};

bool require_file(const std::string &path, const char *what) {
  if (!fs::exists(path)) {
    std::cerr << "Error: " << what << " not found: " << path << std::endl;
    return false;
  }
  if (!io::is_fits_image_path(path)) {
    std::cerr << "Warning: " << what << " has no FITS extension: " << path
              << std::endl;
  }
  return true;
}

// Compares axis lengths from the headers before any pixel is read. The prior
// must sit on the cube's spatial grid upsampled by `factor`.
bool check_input_grids(const RunOptions &opt, int factor) {
  const std::vector<long> cube = io::get_fits_dimensions(opt.cube_path);
  const std::vector<long> prior = io::get_fits_dimensions(opt.prior_path);
  if (cube.size() < 3 || prior.size() < 2) {
    std::cerr << "Error: expected a 3D cube and a 2D prior" << std::endl;
    return false;
  }
  if (prior[0] != cube[0] * factor || prior[1] != cube[1] * factor) {
    std::cerr << "Error: prior is " << prior[0] << "x" << prior[1]
              << " (NAXIS1xNAXIS2), expected " << cube[0] * factor << "x"
              << cube[1] * factor << " for upsample factor " << factor
              << std::endl;
    return false;
  }
  if (!opt.mask_path.empty()) {
    const std::vector<long> mask = io::get_fits_dimensions(opt.mask_path);
    if (mask.size() < 3 || mask[0] != cube[0] || mask[1] != cube[1] ||
        mask[2] != cube[2]) {
      std::cerr << "Error: mask does not have the cube's dimensions"
                << std::endl;
      return false;
    }
  }
  return true;
}

void print_summary(const pipeline::DeblendResult &result) {
  std::cout << "[summary] cube " << shape_to_string(result.shape) << std::endl;
  std::cout << "[summary] 2D labels: "
            << segmentation::label_counts(result.labels_2d).size()
            << " (pruned " << result.prune_2d.removed_ids.size() << ")"
            << std::endl;
  std::cout << "[summary] fixed-3D labels: "
            << segmentation::label_counts(result.fixed_3d).size()
            << " (pruned " << result.prune_3d.removed_ids.size() << ")"
            << std::endl;
  std::cout << "[summary] peaks: " << result.peaks.size() << std::endl;
  std::cout << "[summary] peak-3D labels: " << result.label_map.size()
            << std::endl;
}

int run_command(const RunOptions &opt) {
  if (!fs::exists(opt.config_path)) {
    std::cerr << "Error: Config file not found: " << opt.config_path
              << std::endl;
    return 1;
  }
  if (!require_file(opt.cube_path, "Cube") ||
      !require_file(opt.prior_path, "Prior")) {
    return 1;
  }
  if (!opt.prior_image_path.empty() &&
      !require_file(opt.prior_image_path, "Prior image")) {
    return 1;
  }
  if (!opt.mask_path.empty() && !require_file(opt.mask_path, "Mask")) {
    return 1;
  }

  config::Config cfg;
  try {
    cfg = config::Config::load(opt.config_path);
    if (opt.upsample > 0) {
      cfg.data.upsample_factor = opt.upsample;
    }
    cfg.validate();
    if (!check_input_grids(opt, cfg.data.upsample_factor)) {
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const std::string run_id = core::get_run_id();
  const fs::path run_dir = fs::path(opt.runs_dir) / run_id;
  const fs::path out_dir = run_dir / "outputs";
  fs::create_directories(run_dir / "logs");
  fs::create_directories(out_dir);
  cfg.save(run_dir / "config.yaml");

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl");
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter(run_id);
  emitter.run_start({{"config_path", opt.config_path},
                     {"config_sha256", core::sha256_file(run_dir / "config.yaml")},
                     {"cube", opt.cube_path},
                     {"prior", opt.prior_path},
                     {"prior_image", opt.prior_image_path},
                     {"mask", opt.mask_path},
                     {"run_dir", run_dir.string()},
                     {"upsample_factor", cfg.data.upsample_factor},
                     {"dry_run", opt.dry_run}},
                    log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Output: " << run_dir.string() << std::endl;

  pipeline::DeblendInputs inputs;
  io::FitsHeader cube_header;
  io::FitsHeader prior_header;
  try {
    std::tie(inputs.cube, cube_header) = io::read_fits_cube(opt.cube_path);
    std::tie(inputs.prior, prior_header) = io::read_fits_labels(opt.prior_path);
    if (!opt.prior_image_path.empty()) {
      inputs.prior_image = io::read_fits_image(opt.prior_image_path).first;
    }
    if (!opt.mask_path.empty()) {
      inputs.mask = runner::mask_from_cube(io::read_fits_cube(opt.mask_path).first);
    }
  } catch (const std::exception &e) {
    emitter.error(e.what(), log_file);
    emitter.run_end(false, "error", log_file);
    std::cerr << "Error reading inputs: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "[input] cube " << shape_to_string(inputs.cube.shape)
            << ", prior " << inputs.prior.rows() << "x" << inputs.prior.cols()
            << std::endl;

  if (opt.dry_run) {
    emitter.stage_start(Stage::PREPARE_INPUT, log_file);
    emitter.stage_end(Stage::PREPARE_INPUT, "skipped", {{"reason", "dry_run"}},
                      log_file);
    std::cout << "Dry run - no processing" << std::endl;
    emitter.run_end(true, "ok", log_file);
    return 0;
  }

  pipeline::DeblendResult result;
  try {
    result = pipeline::run_deblend(inputs, cfg, emitter, log_file);
  } catch (const std::exception &e) {
    // run_deblend already closed the run in the event stream.
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  try {
    const int k = cfg.data.upsample_factor;
    const int margin = cfg.data.crop_margin;
    const io::FitsHeader cards3d = io::rescale_coordinate_cards(
        io::coordinate_cards(cube_header, 3), k, margin, cfg.data.spectral_bin);
    // The prior is already on the fine grid; only the crop applies.
    const io::FitsHeader cards2d = io::rescale_coordinate_cards(
        io::coordinate_cards(prior_header, 2), 1, margin * k);

    io::write_fits_labels(out_dir / "labels_peak3d.fits", result.peak_3d, cards3d);
    std::cout << "[output] labels_peak3d.fits" << std::endl;
    if (cfg.output.write_fixed3d) {
      io::write_fits_labels(out_dir / "labels_fixed3d.fits", result.fixed_3d,
                            cards3d);
      std::cout << "[output] labels_fixed3d.fits" << std::endl;
    }
    if (cfg.output.write_2d) {
      io::write_fits_labels(out_dir / "labels_2d.fits", result.labels_2d,
                            cards2d);
      std::cout << "[output] labels_2d.fits" << std::endl;
    }
    if (cfg.output.write_peaks) {
      runner::write_json_file(out_dir / "peaks.json",
                              runner::peaks_to_json(result));
      std::cout << "[output] peaks.json" << std::endl;
    }
  } catch (const std::exception &e) {
    emitter.error(e.what(), log_file);
    emitter.run_end(false, "error", log_file);
    std::cerr << "Error writing outputs: " << e.what() << std::endl;
    return 1;
  }

  print_summary(result);
  emitter.run_end(true, "ok", log_file);
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Gas deblending runner"};

  RunOptions opt;

  auto run_cmd = app.add_subcommand("run", "Deblend one cube against a 2D prior");
  run_cmd->add_option("--config", opt.config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--cube", opt.cube_path, "Spectral cube (FITS)")
      ->required();
  run_cmd->add_option("--prior", opt.prior_path, "2D prior labels (FITS)")
      ->required();
  run_cmd->add_option("--runs-dir", opt.runs_dir, "Runs directory")->required();
  run_cmd->add_option("--prior-image", opt.prior_image_path,
                      "Flux image on the prior grid used for seeding");
  run_cmd->add_option("--mask", opt.mask_path,
                      "Source mask cube (FITS, nonzero = valid)");
  run_cmd->add_option("--upsample", opt.upsample,
                      "Override data.upsample_factor (0 = use config)");
  run_cmd->add_flag("--dry-run", opt.dry_run, "Read inputs only");

  auto schema_cmd =
      app.add_subcommand("schema", "Print the configuration JSON schema");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(opt);
  }

  if (schema_cmd->parsed()) {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
