#include "runner_shared.hpp"

#include "annual_mosaic/geometry/boundary.hpp"
#include "annual_mosaic/geometry/region.hpp"

#include <sstream>

namespace annual_mosaic::runner {

void apply_overrides(config::Config &cfg, const RunOverrides &overrides) {
  if (!overrides.input_dir.empty())
    cfg.input.scene_dir = overrides.input_dir;
  if (overrides.first_year)
    cfg.years.first = *overrides.first_year;
  if (overrides.last_year)
    cfg.years.last = *overrides.last_year;
  if (overrides.workers)
    cfg.runtime.parallel_workers = *overrides.workers;
  if (!overrides.log_file.empty())
    cfg.output.log_file = overrides.log_file;
}

pipeline::RunParameters run_parameters_from_config(const config::Config &cfg) {
  pipeline::RunParameters params;
  params.bits.cloud_bit = cfg.quality.cloud_bit;
  params.bits.shadow_bit = cfg.quality.shadow_bit;
  params.scaling.scale = cfg.reflectance.scale;
  params.scaling.offset = cfg.reflectance.offset;
  params.bands = cfg.reflectance.bands;
  params.vis.bands = cfg.visualization.bands;
  params.vis.min = cfg.visualization.min;
  params.vis.max = cfg.visualization.max;
  params.vis.gamma = cfg.visualization.gamma;
  params.tile_url_template = cfg.tiles.url_template;
  params.parallel_workers = cfg.runtime.parallel_workers;
  return params;
}

ClipRegion build_clip_region(const config::Config &cfg, const GridInfo &grid) {
  if (cfg.region.boundary_file.empty()) {
    return ClipRegion::whole_grid(grid, cfg.region.value.empty() ? "grid" : cfg.region.value);
  }
  geometry::Region region = geometry::load_boundary(
      cfg.region.boundary_file, cfg.region.property, cfg.region.value);
  return geometry::rasterize_region(region, grid);
}

std::string format_report_line(const pipeline::YearReport &report) {
  std::ostringstream oss;
  oss << report.year << "  " << report.status;
  if (report.status == "failed") {
    oss << "  " << report.error;
    return oss.str();
  }
  oss << "  scenes " << report.scenes_composited << "/" << report.scenes_selected
      << "  rejected " << report.rejected.size() << "  coverage "
      << report.pixels_with_data << "/" << report.pixels_in_region;
  if (!report.tile_reference.empty())
    oss << "\n      " << report.tile_reference;
  return oss.str();
}

} // namespace annual_mosaic::runner
