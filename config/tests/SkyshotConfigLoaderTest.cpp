#include "gtest/gtest.h"

#include <string>

#include <yaml-cpp/yaml.h>

#include "common/errors.hpp"
#include "config/SkyshotConfig.hpp"

using skyshot::Error;
using skyshot::ErrorKind;
using skyshot::plan::Easing;
using skyshot::plan::Preset;
using namespace skyshot::config;

namespace {

SkyshotConfig ParseInline(const std::string& yaml) {
  return ParseSkyshotConfig(YAML::Load(yaml), "inline");
}

// Returns the error detail, or an empty string when parsing succeeded.
std::string ConfigErrorFor(const std::string& yaml) {
  try {
    ParseInline(yaml);
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kConfigError);
    return e.detail();
  }
  return {};
}

}  // namespace

TEST(SkyshotConfigLoaderTest, ShippedConfigMatchesBuiltInDefaults) {
  const SkyshotConfig loaded =
      LoadSkyshotConfig(std::string(SKYSHOT_SOURCE_DIR) + "/configs/skyshot.yaml");
  const SkyshotConfig defaults;

  EXPECT_DOUBLE_EQ(loaded.planner.frame_rate, defaults.planner.frame_rate);
  EXPECT_EQ(loaded.planner.min_samples, defaults.planner.min_samples);
  EXPECT_DOUBLE_EQ(loaded.planner.terrain_clearance_m, defaults.planner.terrain_clearance_m);
  EXPECT_EQ(loaded.planner.preset_order, defaults.planner.preset_order);
  EXPECT_EQ(loaded.planner.ranges.size(), defaults.planner.ranges.size());

  const auto& orbit = loaded.planner.ranges.at(Preset::kOrbit);
  EXPECT_DOUBLE_EQ(orbit.sweep_deg.min, 15.0);
  EXPECT_DOUBLE_EQ(orbit.sweep_deg.max, 30.0);
  EXPECT_TRUE(orbit.hold_radius);
  EXPECT_TRUE(orbit.hold_altitude);
  const auto& crane = loaded.planner.ranges.at(Preset::kCrane);
  EXPECT_DOUBLE_EQ(crane.end_tilt_deg.min, 40.0);
  EXPECT_DOUBLE_EQ(crane.end_tilt_deg.max, 60.0);

  EXPECT_DOUBLE_EQ(loaded.recommender.drone_envelope.max_altitude_m, 120.0);
  EXPECT_DOUBLE_EQ(loaded.recommender.drone_hard_limit.max_speed_mps, 25.0);
  EXPECT_DOUBLE_EQ(loaded.recommender.plausible_max_speed_mps, 150.0);
  EXPECT_EQ(loaded.exports.composition_width, 1920);
  EXPECT_EQ(loaded.output.directory, "skyshot_out");
  EXPECT_EQ(loaded.output.formats, defaults.output.formats);
}

TEST(SkyshotConfigLoaderTest, EmptyDocumentKeepsDefaults) {
  const SkyshotConfig config = ParseInline("");
  EXPECT_DOUBLE_EQ(config.planner.frame_rate, 30.0);
  EXPECT_EQ(config.planner.ranges.size(), 10u);
}

TEST(SkyshotConfigLoaderTest, MissingKeysKeepDefaults) {
  const SkyshotConfig config = ParseInline(
      "planner:\n"
      "  frame_rate: 24\n"
      "  presets:\n"
      "    flyby:\n"
      "      sweep_deg: [90, 120]\n"
      "      easing: sine\n"
      "export:\n"
      "  units_per_meter: 0.5\n");

  EXPECT_DOUBLE_EQ(config.planner.frame_rate, 24.0);
  EXPECT_DOUBLE_EQ(config.planner.terrain_clearance_m, 10.0);
  EXPECT_EQ(config.planner.diversity.max_attempts, 8u);

  const auto& flyby = config.planner.ranges.at(Preset::kFlyby);
  EXPECT_DOUBLE_EQ(flyby.sweep_deg.min, 90.0);
  EXPECT_DOUBLE_EQ(flyby.sweep_deg.max, 120.0);
  EXPECT_DOUBLE_EQ(flyby.start_radius_m.min, 250.0);
  EXPECT_TRUE(flyby.hold_altitude);
  EXPECT_EQ(flyby.easing, Easing::kSine);

  EXPECT_DOUBLE_EQ(config.exports.units_per_meter, 0.5);
  EXPECT_EQ(config.exports.composition_height, 1080);
  EXPECT_DOUBLE_EQ(config.recommender.drone_envelope.max_speed_mps, 15.0);
}

TEST(SkyshotConfigLoaderTest, PresetOrderAcceptsAnySpelling) {
  const SkyshotConfig config = ParseInline("planner:\n  preset_order: [Crane, tilt_reveal]\n");
  ASSERT_EQ(config.planner.preset_order.size(), 2u);
  EXPECT_EQ(config.planner.preset_order[0], Preset::kCrane);
  EXPECT_EQ(config.planner.preset_order[1], Preset::kTiltReveal);
}

TEST(SkyshotConfigLoaderTest, NamesTheOffendingKey) {
  EXPECT_EQ(ConfigErrorFor("planner:\n  frame_rate: -5\n"),
            "Invalid value for 'planner.frame_rate' in inline");
  EXPECT_EQ(ConfigErrorFor("planner:\n  frame_rate: fast\n"),
            "Invalid value for 'planner.frame_rate' in inline");
  EXPECT_EQ(ConfigErrorFor("planner:\n  presets:\n    orbit:\n      sweep_deg: [30, 10]\n"),
            "Invalid value for 'planner.presets.orbit.sweep_deg' in inline");
  EXPECT_EQ(ConfigErrorFor("planner:\n  presets:\n    orbit:\n      easing: bounce\n"),
            "Invalid value for 'planner.presets.orbit.easing' in inline");
  EXPECT_EQ(ConfigErrorFor("planner:\n  presets:\n    barrel_roll:\n      sweep_deg: [1, 2]\n"),
            "Invalid value for 'planner.presets.barrel_roll' in inline");
  EXPECT_EQ(ConfigErrorFor("planner:\n  diversity:\n    max_attempts: 0\n"),
            "Invalid value for 'planner.diversity.max_attempts' in inline");
  EXPECT_EQ(ConfigErrorFor("export:\n  composition_width: 0\n"),
            "Invalid value for 'export.composition_width' in inline");
  EXPECT_EQ(ConfigErrorFor("output:\n  formats: [tour, fbx]\n"),
            "Invalid value for 'output.formats' in inline");
}

TEST(SkyshotConfigLoaderTest, RejectsInconsistentSections) {
  EXPECT_EQ(ConfigErrorFor("planner:\n  preset_order: [orbit, orbit]\n"),
            "Invalid value for 'planner.preset_order' in inline");
  EXPECT_EQ(ConfigErrorFor("recommender:\n  drone_hard_limit:\n    max_speed_mps: 10\n"),
            "Invalid value for 'recommender.drone_hard_limit' in inline");
  EXPECT_EQ(ConfigErrorFor("planner: 5\n"), "Invalid value for 'planner' in inline");
  EXPECT_FALSE(ConfigErrorFor("- just\n- a list\n").empty());
}

TEST(SkyshotConfigLoaderTest, MissingFileIsConfigError) {
  try {
    LoadSkyshotConfig("/nonexistent/skyshot.yaml");
    FAIL() << "expected a missing file to throw";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kConfigError);
    EXPECT_NE(e.detail().find("/nonexistent/skyshot.yaml"), std::string::npos);
  }
}

TEST(SkyshotConfigLoaderTest, ReadsPerShotOverrides) {
  const SkyshotConfig cfg = ParseInline(R"(
shots:
  - index: 0
    preset: crane
    duration_s: 4
    altitude_m: [20, 90]
    easing: sine
  - index: 2
    radius_m: 0
    tilt_deg: [30, 45]
)");
  ASSERT_EQ(cfg.shot_overrides.size(), 2u);

  const auto& first = cfg.shot_overrides.at(0);
  ASSERT_TRUE(first.preset.has_value());
  EXPECT_EQ(*first.preset, Preset::kCrane);
  ASSERT_TRUE(first.duration_s.has_value());
  EXPECT_DOUBLE_EQ(*first.duration_s, 4.0);
  ASSERT_TRUE(first.altitude_m.has_value());
  EXPECT_DOUBLE_EQ(first.altitude_m->start, 20.0);
  EXPECT_DOUBLE_EQ(first.altitude_m->end, 90.0);
  ASSERT_TRUE(first.easing.has_value());
  EXPECT_EQ(*first.easing, Easing::kSine);
  EXPECT_FALSE(first.radius_m.has_value());

  const auto& third = cfg.shot_overrides.at(2);
  ASSERT_TRUE(third.radius_m.has_value());
  EXPECT_DOUBLE_EQ(third.radius_m->start, 0.0);
  EXPECT_DOUBLE_EQ(third.radius_m->end, 0.0);
  EXPECT_FALSE(third.preset.has_value());
  EXPECT_TRUE(ParseInline("planner: {}").shot_overrides.empty());
}

TEST(SkyshotConfigLoaderTest, RejectsMalformedShotOverrides) {
  EXPECT_EQ(ConfigErrorFor("shots: {index: 0}"), "Invalid value for 'shots' in inline");
  EXPECT_EQ(ConfigErrorFor("shots:\n  - preset: orbit\n"),
            "Missing required field 'shots[0].index' in inline");
  EXPECT_EQ(ConfigErrorFor("shots:\n  - index: 1\n    preset: loop\n"),
            "Invalid value for 'shots[0].preset' in inline");
  EXPECT_EQ(ConfigErrorFor("shots:\n  - index: 1\n    radius_m: [1, 2, 3]\n"),
            "Invalid value for 'shots[0].radius_m' in inline");
  EXPECT_EQ(ConfigErrorFor("shots:\n  - index: 1\n  - index: 1\n"),
            "Invalid value for 'shots[1].index' in inline");
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
