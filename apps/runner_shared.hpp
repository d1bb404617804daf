#pragma once

#include "annual_mosaic/config/configuration.hpp"
#include "annual_mosaic/core/types.hpp"
#include "annual_mosaic/pipeline/yearly_runner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace annual_mosaic::runner {

// Command-line values that take precedence over the YAML file.
struct RunOverrides {
  std::string input_dir;
  std::optional<int> first_year;
  std::optional<int> last_year;
  std::optional<int> workers;
  std::string log_file;
};

void apply_overrides(config::Config &cfg, const RunOverrides &overrides);

pipeline::RunParameters run_parameters_from_config(const config::Config &cfg);

// Boundary polygon rasterized on `grid`, or the whole grid when no boundary
// file is configured.
ClipRegion build_clip_region(const config::Config &cfg, const GridInfo &grid);

std::string format_report_line(const pipeline::YearReport &report);

} // namespace annual_mosaic::runner
