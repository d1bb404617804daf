#include "annual_mosaic/config/configuration.hpp"
#include "annual_mosaic/core/dates.hpp"
#include "annual_mosaic/core/errors.hpp"
#include "annual_mosaic/core/events.hpp"
#include "annual_mosaic/core/utils.hpp"
#include "annual_mosaic/io/scene_catalog.hpp"
#include "annual_mosaic/pipeline/yearly_runner.hpp"
#include "runner_shared.hpp"

#include <CLI/CLI.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using namespace annual_mosaic;
using runner::RunOverrides;

int run_command(const std::string &config_path, const RunOverrides &overrides) {
  const fs::path cfg_path(config_path);
  if (!fs::exists(cfg_path)) {
    std::cerr << "Error: Config file not found: " << config_path << std::endl;
    return 1;
  }

  config::Config cfg;
  std::string config_sha256;
  try {
    cfg = config::Config::load(cfg_path);
    config_sha256 = core::sha256_file(cfg_path);
    runner::apply_overrides(cfg, overrides);
    cfg.validate();
  } catch (const AnnualMosaicError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::ofstream event_log_file;
  if (!cfg.output.log_file.empty()) {
    const fs::path log_path(cfg.output.log_file);
    if (log_path.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(log_path.parent_path(), ec);
    }
    event_log_file.open(log_path, std::ios::out | std::ios::app);
    if (!event_log_file.is_open()) {
      std::cerr << "Error: Cannot open log file: " << cfg.output.log_file << std::endl;
      return 1;
    }
  }

  core::EventEmitter emitter(std::cout, event_log_file.is_open() ? &event_log_file : nullptr);
  const std::string run_id = core::get_run_id();

  emitter.run_start(run_id, {{"config_path", config_path},
                             {"config_sha256", config_sha256},
                             {"scene_dir", cfg.input.scene_dir},
                             {"region", cfg.region.value},
                             {"first_year", cfg.years.first},
                             {"last_year", cfg.years.last},
                             {"parallel_workers", cfg.runtime.parallel_workers}});

  std::cerr << "Run ID: " << run_id << std::endl;

  std::unique_ptr<io::FitsSceneCatalog> catalog;
  ClipRegion clip;
  try {
    catalog = std::make_unique<io::FitsSceneCatalog>(
        cfg.input.scene_dir, cfg.input.pattern, cfg.quality.band,
        cfg.reflectance.bands, cfg.input.reference_grid);
    for (const auto &w : catalog->warnings()) {
      emitter.warning(run_id, w);
    }
    clip = runner::build_clip_region(cfg, catalog->target_grid());
  } catch (const std::exception &e) {
    emitter.error(run_id, e.what());
    emitter.run_end(run_id, false);
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const GridInfo &grid = clip.grid;
  std::cerr << "Scenes: " << catalog->scenes().size() << std::endl;
  std::cerr << "Grid: " << grid.rows << "x" << grid.cols
            << (grid.crs.empty() ? "" : " " + grid.crs) << std::endl;
  std::cerr << "Region: " << clip.name << " (" << clip.inside.count() << " pixels)"
            << std::endl;

  pipeline::YearlyRunner yearly(*catalog, clip, runner::run_parameters_from_config(cfg),
                                &emitter, run_id, &std::cerr);

  const auto windows = core::year_windows(cfg.years.first, cfg.years.last);
  const auto reports = yearly.run_years(windows);

  int n_ok = 0;
  int n_empty = 0;
  int n_failed = 0;
  std::cerr << std::endl;
  for (const auto &report : reports) {
    if (report.status == "ok")
      ++n_ok;
    else if (report.status == "empty")
      ++n_empty;
    else
      ++n_failed;
    std::cerr << runner::format_report_line(report) << std::endl;
  }

  emitter.run_end(run_id, n_failed == 0,
                  {{"years", static_cast<int>(reports.size())},
                   {"years_ok", n_ok},
                   {"years_empty", n_empty},
                   {"years_failed", n_failed}});
  return n_failed == 0 ? 0 : 1;
}

int validate_command(const std::string &config_path) {
  core::json result;
  result["path"] = config_path;
  result["valid"] = false;
  result["errors"] = core::json::array();

  try {
    config::Config cfg = config::Config::load(config_path);
    cfg.validate();
    result["valid"] = true;
  } catch (const AnnualMosaicError &e) {
    result["errors"].push_back(e.what());
  }

  std::cout << result.dump(2) << std::endl;
  return result["valid"].get<bool>() ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Annual cloud-free surface reflectance composites"};
  app.require_subcommand(1);

  std::string config_path;
  RunOverrides overrides;
  int first_year = 0;
  int last_year = 0;
  int workers = 0;

  auto run_cmd = app.add_subcommand("run", "Build one composite per year");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  run_cmd->add_option("--input-dir", overrides.input_dir, "Scene directory (overrides input.scene_dir)");
  auto first_opt = run_cmd->add_option("--first-year", first_year, "First year (inclusive)");
  auto last_opt = run_cmd->add_option("--last-year", last_year, "Last year (inclusive)");
  auto workers_opt = run_cmd->add_option("--workers", workers, "Worker threads")
                         ->check(CLI::Range(1, 64));
  run_cmd->add_option("--log-file", overrides.log_file, "JSON-lines event log");

  auto validate_cmd = app.add_subcommand("validate", "Validate a configuration file");
  validate_cmd->add_option("--config", config_path, "Path to config.yaml")->required();

  auto schema_cmd = app.add_subcommand("get-schema", "Print the configuration JSON schema");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    if (*first_opt)
      overrides.first_year = first_year;
    if (*last_opt)
      overrides.last_year = last_year;
    if (*workers_opt)
      overrides.workers = workers;
    return run_command(config_path, overrides);
  }

  if (validate_cmd->parsed()) {
    return validate_command(config_path);
  }

  if (schema_cmd->parsed()) {
    std::cout << annual_mosaic::config::get_schema_json() << std::endl;
    return 0;
  }

  return 1;
}
