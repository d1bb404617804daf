#include "annual_mosaic/compositing/compositor.hpp"
#include "annual_mosaic/core/errors.hpp"
#include "annual_mosaic/core/types.hpp"
#include "annual_mosaic/masking/quality_mask.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace annual_mosaic;

namespace {

GridInfo grid_of(int rows, int cols) {
  GridInfo g;
  g.rows = rows;
  g.cols = cols;
  g.transform = {30.0, 0.01, 0.0, 2.0, 0.0, -0.01};
  g.crs = "EPSG:4326";
  return g;
}

// One-band scene with a constant value; `valid` everywhere unless cleared.
MaskedScene flat_scene(const std::string &id, const GridInfo &g, float value,
                       bool valid = true) {
  MaskedScene s;
  s.scene_id = id;
  s.acquired = {2020, 6, 1};
  s.grid = g;
  s.band_names = {"SR_B4"};
  s.bands = {Matrix2Df::Constant(g.rows, g.cols, value)};
  s.valid = MaskMatrix::Constant(g.rows, g.cols, valid);
  return s;
}

bool same_composite(const Composite &a, const Composite &b) {
  if (a.bands.size() != b.bands.size()) return false;
  if (a.has_data != b.has_data || a.valid_count != b.valid_count) return false;
  for (size_t k = 0; k < a.bands.size(); ++k) {
    for (Eigen::Index i = 0; i < a.bands[k].size(); ++i) {
      const float x = a.bands[k].data()[i];
      const float y = b.bands[k].data()[i];
      if (std::isnan(x) != std::isnan(y)) return false;
      if (!std::isnan(x) && x != y) return false;
    }
  }
  return true;
}

} // namespace

TEST_CASE("composite_median_of_even_count_is_mean_of_middle_values") {
  const GridInfo g = grid_of(1, 1);
  std::vector<MaskedScene> scenes{flat_scene("a", g, 4.0f), flat_scene("b", g, 1.0f),
                                  flat_scene("c", g, 3.0f), flat_scene("d", g, 2.0f)};

  auto out = compositing::composite(scenes, ClipRegion::whole_grid(g), {"SR_B4"});

  REQUIRE(out.bands[0](0, 0) == Catch::Approx(2.5f));
  REQUIRE(out.valid_count(0, 0) == 4);
  REQUIRE(out.has_data(0, 0));
  REQUIRE(out.contributing_scenes == 4);
}

TEST_CASE("composite_single_valid_observation_is_passed_through") {
  const GridInfo g = grid_of(1, 1);
  std::vector<MaskedScene> scenes{flat_scene("a", g, 5.0f), flat_scene("b", g, 9.0f, false)};

  auto out = compositing::composite(scenes, ClipRegion::whole_grid(g), {"SR_B4"});

  REQUIRE(out.bands[0](0, 0) == 5.0f);
  REQUIRE(out.valid_count(0, 0) == 1);
}

TEST_CASE("composite_pixel_without_valid_observation_is_no_data") {
  const GridInfo g = grid_of(1, 2);
  MaskedScene s = flat_scene("a", g, 0.1f);
  s.valid(0, 1) = false;

  auto out = compositing::composite({s}, ClipRegion::whole_grid(g), {"SR_B4"});

  REQUIRE(out.bands[0](0, 0) == Catch::Approx(0.1f));
  REQUIRE(std::isnan(out.bands[0](0, 1)));
  REQUIRE_FALSE(out.has_data(0, 1));
  REQUIRE(out.valid_count(0, 1) == 0);
}

TEST_CASE("composite_is_independent_of_scene_order") {
  const GridInfo g = grid_of(3, 4);
  std::vector<MaskedScene> scenes;
  for (int k = 0; k < 5; ++k) {
    MaskedScene s = flat_scene("s" + std::to_string(k), g, 0.0f);
    for (int r = 0; r < g.rows; ++r) {
      for (int c = 0; c < g.cols; ++c) {
        s.bands[0](r, c) = 0.01f * static_cast<float>((k * 7 + r * 3 + c) % 11);
        s.valid(r, c) = ((k + r + c) % 3) != 0;
      }
    }
    scenes.push_back(s);
  }

  const ClipRegion clip = ClipRegion::whole_grid(g);
  auto reference = compositing::composite(scenes, clip, {"SR_B4"});

  std::sort(scenes.begin(), scenes.end(),
            [](const MaskedScene &a, const MaskedScene &b) { return a.scene_id < b.scene_id; });
  int permutations = 0;
  do {
    auto out = compositing::composite(scenes, clip, {"SR_B4"});
    REQUIRE(same_composite(reference, out));
    ++permutations;
  } while (std::next_permutation(
               scenes.begin(), scenes.end(),
               [](const MaskedScene &a, const MaskedScene &b) { return a.scene_id < b.scene_id; }) &&
           permutations < 40);
}

TEST_CASE("composite_outside_region_is_no_data_even_when_all_scenes_are_valid") {
  const GridInfo g = grid_of(2, 2);
  ClipRegion clip = ClipRegion::whole_grid(g, "Kenya");
  clip.inside(0, 0) = false;
  clip.inside(1, 1) = false;

  auto out = compositing::composite({flat_scene("a", g, 0.2f), flat_scene("b", g, 0.4f)}, clip,
                                    {"SR_B4"});

  REQUIRE(std::isnan(out.bands[0](0, 0)));
  REQUIRE(std::isnan(out.bands[0](1, 1)));
  REQUIRE(out.valid_count(0, 0) == 0);
  REQUIRE(out.bands[0](0, 1) == Catch::Approx(0.3f));
  REQUIRE(out.bands[0](1, 0) == Catch::Approx(0.3f));
}

TEST_CASE("composite_of_no_scenes_is_all_no_data_with_grid_shape") {
  const GridInfo g = grid_of(3, 5);

  auto out = compositing::composite({}, ClipRegion::whole_grid(g), {"SR_B4", "SR_B3"});

  REQUIRE(out.empty_input());
  REQUIRE(out.bands.size() == 2);
  REQUIRE(out.bands[1].rows() == 3);
  REQUIRE(out.bands[1].cols() == 5);
  REQUIRE(out.bands[0].array().isNaN().all());
  REQUIRE_FALSE(out.has_data.any());
  REQUIRE(out.band_names == std::vector<std::string>{"SR_B4", "SR_B3"});
}

TEST_CASE("composite_scene_without_quality_band_changes_nothing") {
  const GridInfo g = grid_of(2, 3);
  Scene good;
  good.scene_id = "good";
  good.quality = QualityRaster{g, QualityMatrix::Zero(2, 3)};
  good.reflectance.grid = g;
  good.reflectance.band_names = {"SR_B4"};
  good.reflectance.bands = {Matrix2Di::Constant(2, 3, 10000)};

  Scene bad = good;
  bad.scene_id = "bad";
  bad.quality.reset();
  bad.reflectance.bands = {Matrix2Di::Constant(2, 3, 30000)};

  std::vector<MaskedScene> masked;
  std::vector<std::string> rejected;
  for (const Scene &s : {good, bad}) {
    try {
      masked.push_back(masking::mask_scene(s, {}, {}));
    } catch (const MissingAuxiliaryBand &) {
      rejected.push_back(s.scene_id);
    }
  }

  const ClipRegion clip = ClipRegion::whole_grid(g);
  auto with_bad = compositing::composite(masked, clip, {"SR_B4"});
  auto without_bad = compositing::composite({masking::mask_scene(good, {}, {})}, clip, {"SR_B4"});

  REQUIRE(rejected == std::vector<std::string>{"bad"});
  REQUIRE(same_composite(with_bad, without_bad));
  REQUIRE(with_bad.bands[0](1, 2) == Catch::Approx(0.075f).margin(1e-6));
}

TEST_CASE("composite_rejects_scenes_off_grid_or_missing_bands") {
  const GridInfo g = grid_of(2, 2);
  GridInfo shifted = g;
  shifted.transform[3] += 1.0;

  MaskedScene missing = flat_scene("missing", g, 0.9f);
  missing.band_names = {"SR_B5"};

  auto out = compositing::composite(
      {flat_scene("ok", g, 0.1f), flat_scene("shifted", shifted, 0.9f), missing},
      ClipRegion::whole_grid(g), {"SR_B4"});

  REQUIRE(out.contributing_scenes == 1);
  REQUIRE(out.rejected.size() == 2);
  REQUIRE(out.rejected[0].scene_id == "shifted");
  REQUIRE(out.rejected[0].kind == RejectionKind::GRID_MISMATCH);
  REQUIRE(out.rejected[1].scene_id == "missing");
  REQUIRE(out.rejected[1].kind == RejectionKind::MISSING_BAND);
  REQUIRE(out.bands[0](1, 1) == Catch::Approx(0.1f));
}

TEST_CASE("composite_selects_and_orders_requested_bands") {
  const GridInfo g = grid_of(1, 1);
  MaskedScene s = flat_scene("a", g, 0.1f);
  s.band_names = {"SR_B2", "SR_B3", "SR_B4"};
  s.bands = {Matrix2Df::Constant(1, 1, 0.2f), Matrix2Df::Constant(1, 1, 0.3f),
             Matrix2Df::Constant(1, 1, 0.4f)};

  auto out = compositing::composite({s}, ClipRegion::whole_grid(g), {"SR_B4", "SR_B2"});

  REQUIRE(out.bands.size() == 2);
  REQUIRE(out.bands[0](0, 0) == Catch::Approx(0.4f));
  REQUIRE(out.bands[1](0, 0) == Catch::Approx(0.2f));
}

TEST_CASE("composite_result_does_not_depend_on_worker_count") {
  const GridInfo g = grid_of(17, 9);
  std::vector<MaskedScene> scenes;
  for (int k = 0; k < 6; ++k) {
    MaskedScene s = flat_scene("s" + std::to_string(k), g, 0.0f);
    for (int r = 0; r < g.rows; ++r) {
      for (int c = 0; c < g.cols; ++c) {
        s.bands[0](r, c) = 0.001f * static_cast<float>((k * 31 + r * 17 + c * 5) % 97);
        s.valid(r, c) = ((k * 3 + r + 2 * c) % 4) != 0;
      }
    }
    scenes.push_back(s);
  }
  const ClipRegion clip = ClipRegion::whole_grid(g);

  compositing::CompositeOptions serial;
  auto reference = compositing::composite(scenes, clip, {"SR_B4"}, serial);

  for (int workers : {2, 3, 8, 64}) {
    compositing::CompositeOptions opts;
    opts.parallel_workers = workers;
    auto out = compositing::composite(scenes, clip, {"SR_B4"}, opts);
    REQUIRE(same_composite(reference, out));
  }
}

TEST_CASE("composite_rejects_invalid_band_lists") {
  const GridInfo g = grid_of(1, 1);
  const ClipRegion clip = ClipRegion::whole_grid(g);
  REQUIRE_THROWS_AS(compositing::composite({}, clip, {}), ValidationError);
  REQUIRE_THROWS_AS(compositing::composite({}, clip, {"SR_B4", "SR_B4"}), ValidationError);
}
