#include "annual_mosaic/core/errors.hpp"
#include "annual_mosaic/core/types.hpp"
#include "annual_mosaic/geometry/region.hpp"
#include "annual_mosaic/io/fits_io.hpp"
#include "annual_mosaic/io/scene_catalog.hpp"
#include "annual_mosaic/masking/quality_mask.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace annual_mosaic;
namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kBands{"SR_B2", "SR_B3", "SR_B4"};

GridInfo utm_grid() {
  GridInfo g;
  g.rows = 3;
  g.cols = 4;
  g.transform = {500000.0, 30.0, 0.0, 9000000.0, 0.0, -30.0};
  g.crs = "EPSG:32637";
  return g;
}

void write_band(const fs::path &path, const GridInfo &g, float value,
                const std::string &date_obs = {}) {
  io::FitsHeader header;
  io::write_grid_to_header(g, header);
  if (!date_obs.empty()) {
    header.set("DATE-OBS", date_obs);
  }
  io::write_fits_float(path, Matrix2Df::Constant(g.rows, g.cols, value), header);
}

struct TempDir {
  fs::path path;
  explicit TempDir(const std::string &name) : path(fs::temp_directory_path() / name) {
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

} // namespace

TEST_CASE("date_from_scene_id_uses_first_valid_eight_digit_token") {
  auto d = io::date_from_scene_id("LC08_L2SP_168060_20200115_20200823_02_T1");
  REQUIRE(d.has_value());
  REQUIRE(*d == Date{2020, 1, 15});

  REQUIRE_FALSE(io::date_from_scene_id("custom_scene").has_value());
  REQUIRE_FALSE(io::date_from_scene_id("run_99999999").has_value());
}

TEST_CASE("split_scene_stem_prefers_longest_band_suffix") {
  auto split = io::split_scene_stem("x_SR_B1", {"B1", "SR_B1"});
  REQUIRE(split.has_value());
  REQUIRE(split->first == "x");
  REQUIRE(split->second == "SR_B1");

  REQUIRE_FALSE(io::split_scene_stem("x_SR_B9", {"SR_B1"}).has_value());
  REQUIRE_FALSE(io::split_scene_stem("SR_B1", {"SR_B1"}).has_value());
}

TEST_CASE("fits_grid_keywords_round_trip") {
  TempDir dir("annual_mosaic_test_fits_grid");
  const GridInfo g = utm_grid();
  write_band(dir.path / "grid.fits", g, 1.0f);

  auto [data, header] = io::read_fits_float(dir.path / "grid.fits");
  GridInfo back = io::grid_from_header(header, static_cast<int>(data.rows()),
                                       static_cast<int>(data.cols()));

  REQUIRE(data.rows() == 3);
  REQUIRE(data.cols() == 4);
  REQUIRE(geometry::same_grid(g, back));
}

TEST_CASE("grid_from_header_without_keywords_is_pixel_grid") {
  io::FitsHeader header;
  GridInfo g = io::grid_from_header(header, 2, 5);
  REQUIRE(g.rows == 2);
  REQUIRE(g.cols == 5);
  REQUIRE(g.transform[1] == 1.0);
  REQUIRE(g.transform[5] == -1.0);
  REQUIRE(g.crs.empty());
}

TEST_CASE("scene_catalog_groups_files_and_dates_scenes") {
  TempDir dir("annual_mosaic_test_catalog");
  const GridInfo g = utm_grid();
  const std::string a = "LC08_L2SP_168060_20200115_20200823_02_T1";
  const std::string b = "LC08_L2SP_168060_20210301_20210310_02_T1";

  write_band(dir.path / (a + "_QA_PIXEL.fits"), g, 0.0f);
  write_band(dir.path / (a + "_SR_B4.fits"), g, 10000.4f);
  write_band(dir.path / (a + "_SR_B3.fits"), g, 9000.0f);
  write_band(dir.path / (b + "_SR_B4.fits"), g, 8000.0f);
  write_band(dir.path / "custom_scene_QA_PIXEL.fits", g, 8.0f, "2020-07-04T10:00:00");
  write_band(dir.path / "custom_scene_SR_B4.fits", g, 7000.0f);
  write_band(dir.path / "nodate_SR_B4.fits", g, 7000.0f);
  write_band(dir.path / "other_XYZ.fits", g, 1.0f);
  std::ofstream(dir.path / "notes.txt") << "ignored";

  io::FitsSceneCatalog catalog(dir.path, "*.fit;*.fits;*.fts", "QA_PIXEL", kBands);

  REQUIRE(catalog.scenes().size() == 3);
  REQUIRE(catalog.warnings().size() == 1);
  REQUIRE(catalog.warnings()[0].find("nodate") != std::string::npos);
  REQUIRE(geometry::same_grid(catalog.target_grid(), g));

  auto in_2020 = catalog.scenes_in_window({{2020, 1, 1}, {2020, 12, 31}});
  REQUIRE(in_2020.size() == 2);
  REQUIRE(in_2020[0].scene_id == a);
  REQUIRE(in_2020[1].scene_id == "custom_scene");
  REQUIRE(in_2020[1].acquired == Date{2020, 7, 4});

  auto in_2021 = catalog.scenes_in_window({{2021, 1, 1}, {2021, 12, 31}});
  REQUIRE(in_2021.size() == 1);
  REQUIRE(catalog.scenes_in_window({{2019, 1, 1}, {2019, 12, 31}}).empty());

  Scene scene_a = catalog.load(in_2020[0]);
  REQUIRE(scene_a.quality.has_value());
  REQUIRE(scene_a.reflectance.band_names == std::vector<std::string>{"SR_B3", "SR_B4"});
  REQUIRE(scene_a.reflectance.bands[1](2, 3) == 10000);
  REQUIRE(scene_a.reflectance.bands[0](0, 0) == 9000);

  Scene scene_b = catalog.load(in_2021[0]);
  REQUIRE_FALSE(scene_b.quality.has_value());

  Scene custom = catalog.load(in_2020[1]);
  REQUIRE(custom.quality->codes(1, 1) == 8u);
}

TEST_CASE("scene_catalog_uses_reference_grid_when_configured") {
  TempDir dir("annual_mosaic_test_reference_grid");
  GridInfo g = utm_grid();
  GridInfo reference = g;
  reference.rows = 6;
  reference.cols = 8;
  reference.transform[1] = 15.0;
  reference.transform[5] = -15.0;

  write_band(dir.path / "LC08_L2SP_168060_20200115_20200823_02_T1_SR_B4.fits", g, 1.0f);
  write_band(dir.path / "reference.fits", reference, 0.0f);

  io::FitsSceneCatalog catalog(dir.path, "*_SR_B*.fits", "QA_PIXEL", kBands,
                               dir.path / "reference.fits");

  REQUIRE(catalog.scenes().size() == 1);
  REQUIRE(geometry::same_grid(catalog.target_grid(), reference));
}

TEST_CASE("scene_catalog_without_scenes_or_reference_throws") {
  TempDir dir("annual_mosaic_test_empty_catalog");
  REQUIRE_THROWS_AS(io::FitsSceneCatalog(dir.path, "*.fits", "QA_PIXEL", kBands), PipelineError);
  REQUIRE_THROWS_AS(io::FitsSceneCatalog(dir.path / "missing", "*.fits", "QA_PIXEL", kBands),
                    IOError);
}

TEST_CASE("load_scene_rejects_bands_on_different_grids") {
  TempDir dir("annual_mosaic_test_scene_grids");
  GridInfo g = utm_grid();
  GridInfo shifted = g;
  shifted.transform[0] += 30.0;

  io::SceneFiles files;
  files.scene_id = "LC08_L2SP_168060_20200115_20200823_02_T1";
  files.acquired = {2020, 1, 15};
  files.quality = dir.path / "qa.fits";
  files.bands["SR_B4"] = dir.path / "b4.fits";
  write_band(*files.quality, g, 0.0f);
  write_band(files.bands["SR_B4"], shifted, 100.0f);

  REQUIRE_THROWS_AS(io::load_scene(files, kBands), GridMismatch);
}

TEST_CASE("load_scene_rejects_non_integer_quality_codes") {
  TempDir dir("annual_mosaic_test_scene_qa");
  io::SceneFiles files;
  files.scene_id = "s";
  files.quality = dir.path / "qa.fits";
  write_band(*files.quality, utm_grid(), 1.5f);

  REQUIRE_THROWS_AS(io::load_scene(files, kBands), FitsError);
}

TEST_CASE("load_scene_keeps_high_quality_bits_exact") {
  TempDir dir("annual_mosaic_test_scene_high_bits");
  const GridInfo g = utm_grid();
  const uint32_t cloudy = (1u << 28) | (1u << 3);

  QualityMatrix codes = QualityMatrix::Zero(g.rows, g.cols);
  codes(1, 2) = cloudy;
  codes(0, 0) = 0xffffffffu;
  io::FitsHeader header;
  io::write_grid_to_header(g, header);

  io::SceneFiles files;
  files.scene_id = "s";
  files.acquired = {2020, 1, 15};
  files.quality = dir.path / "qa.fits";
  files.bands["SR_B4"] = dir.path / "b4.fits";
  io::write_fits_uint32(*files.quality, codes, header);
  write_band(files.bands["SR_B4"], g, 10000.0f);

  Scene scene = io::load_scene(files, {"SR_B4"});
  REQUIRE(scene.quality->codes(1, 2) == cloudy);
  REQUIRE(scene.quality->codes(0, 0) == 0xffffffffu);

  MaskedScene masked = masking::mask_scene(scene, masking::QualityBits{}, masking::ReflectanceScaling{});
  REQUIRE_FALSE(masked.valid(1, 2));
  REQUIRE_FALSE(masked.valid(0, 0));
  REQUIRE(masked.valid(0, 1));
}

TEST_CASE("load_scene_rejects_digital_numbers_outside_int32") {
  TempDir dir("annual_mosaic_test_scene_dn_range");
  io::SceneFiles files;
  files.scene_id = "s";
  files.quality = dir.path / "qa.fits";
  files.bands["SR_B4"] = dir.path / "b4.fits";
  write_band(*files.quality, utm_grid(), 0.0f);
  write_band(files.bands["SR_B4"], utm_grid(), 3.0e9f);

  REQUIRE_THROWS_AS(io::load_scene(files, {"SR_B4"}), FitsError);
}

TEST_CASE("fits_write_ignores_structural_keywords_from_a_read_header") {
  TempDir dir("annual_mosaic_test_fits_rewrite");
  const GridInfo g = utm_grid();
  io::FitsHeader header;
  io::write_grid_to_header(g, header);
  io::write_fits_uint32(dir.path / "qa.fits", QualityMatrix::Constant(g.rows, g.cols, 8u), header);

  auto [codes, read_back] = io::read_fits_uint32(dir.path / "qa.fits");
  REQUIRE(read_back.get_double("BZERO").has_value());

  io::write_fits_float(dir.path / "copy.fits", Matrix2Df::Constant(g.rows, g.cols, 0.25f), read_back);
  auto [data, copy_header] = io::read_fits_float(dir.path / "copy.fits");
  REQUIRE(data(2, 3) == 0.25f);
  REQUIRE(copy_header.get_double("BITPIX").value_or(0.0) == -32.0);
  REQUIRE(codes(0, 0) == 8u);
}
