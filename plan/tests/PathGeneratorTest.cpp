#include "gtest/gtest.h"

#include <cmath>
#include <string>

#include "common/errors.hpp"
#include "common/math/Geodesy.hpp"
#include "plan/Easing.hpp"
#include "plan/PathGenerator.hpp"
#include "plan/Preset.hpp"
#include "plan/PresetRegistry.hpp"

using namespace skyshot;
using namespace skyshot::plan;

namespace {

const geo::GeoPoint kCenter{40.7484, -73.9857};

PathParameters MakeParams(Range radius, Range altitude, Range azimuth, Range tilt) {
  PathParameters p;
  p.center = kCenter;
  p.radius_m = radius;
  p.altitude_m = altitude;
  p.azimuth_deg = azimuth;
  p.tilt_deg = tilt;
  return p;
}

ErrorKind CaughtKind(const PathGenerator& generator, Preset preset, const PathParameters& params,
                     const SampleTiming& timing) {
  try {
    generator.Generate(preset, params, timing);
  } catch (const Error& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected " << PresetName(preset) << " to throw";
  return ErrorKind::kIoError;
}

bool HasWarningContaining(const GeneratedPath& path, const std::string& needle) {
  for (const auto& w : path.warnings) {
    if (w.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

TEST(EasingTest, CurvesFixEndpointsAndMidpoint) {
  for (Easing easing : {Easing::kSmoothstep, Easing::kSmootherstep, Easing::kSine}) {
    EXPECT_DOUBLE_EQ(Ease(easing, 0.0), 0.0) << EasingName(easing);
    EXPECT_DOUBLE_EQ(Ease(easing, 1.0), 1.0) << EasingName(easing);
    EXPECT_NEAR(Ease(easing, 0.5), 0.5, 1e-12) << EasingName(easing);
    EXPECT_DOUBLE_EQ(Ease(easing, -0.3), 0.0) << EasingName(easing);
    EXPECT_DOUBLE_EQ(Ease(easing, 1.7), 1.0) << EasingName(easing);

    double previous = 0.0;
    for (int i = 1; i <= 100; ++i) {
      const double value = Ease(easing, i / 100.0);
      EXPECT_GE(value, previous);
      previous = value;
    }
  }
}

TEST(EasingTest, ParseRejectsUnknownNames) {
  EXPECT_EQ(ParseEasing("sine"), Easing::kSine);
  EXPECT_EQ(ParseEasing(EasingName(Easing::kSmootherstep)), Easing::kSmootherstep);
  try {
    ParseEasing("bounce");
    FAIL() << "expected ParseEasing to throw";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kInvalidParameter);
  }
}

TEST(PathGeneratorTest, SampleCountRoundsAndHonoursMinimum) {
  EXPECT_EQ(SampleCountFor(8.0, 30.0, 2), 240u);
  EXPECT_EQ(SampleCountFor(2.5, 24.0, 2), 60u);
  EXPECT_EQ(SampleCountFor(0.01, 30.0, 2), 2u);
  EXPECT_EQ(SampleCountFor(1.0, 30.0, 100), 100u);
  EXPECT_EQ(SampleCountFor(1.0, 30.0, 0), 30u);

  EXPECT_THROW(SampleCountFor(0.0, 30.0, 2), Error);
  EXPECT_THROW(SampleCountFor(8.0, -1.0, 2), Error);
  EXPECT_THROW(SampleCountFor(std::nan(""), 30.0, 2), Error);
  EXPECT_THROW(SampleCountFor(1e9, 30.0, 2), Error);
}

TEST(PathGeneratorTest, EveryPresetStampsUniformTimes) {
  const PresetRegistry registry = MakeBuiltinPresetRegistry();
  const PathGenerator generator(registry, GeneratorLimits{});
  const PathParameters params = MakeParams({100.0, 150.0}, {50.0, 120.0}, {0.0, 60.0},
                                           {10.0, 20.0});
  const SampleTiming timing{8.0, 240};

  for (Preset preset : kAllPresets) {
    const GeneratedPath path = generator.Generate(preset, params, timing);
    ASSERT_EQ(path.keyframes.size(), 240u) << PresetName(preset);
    for (std::size_t i = 0; i < path.keyframes.size(); ++i) {
      const CameraKeyframe& k = path.keyframes[i];
      EXPECT_NEAR(k.time_s, static_cast<double>(i) * 8.0 / 240.0, 1e-12) << PresetName(preset);
      EXPECT_GE(k.heading_deg, 0.0);
      EXPECT_LT(k.heading_deg, 360.0);
      EXPECT_GE(k.altitude_m, 10.0);
      EXPECT_TRUE(std::isfinite(k.latitude_deg) && std::isfinite(k.longitude_deg));
    }
  }
}

TEST(PathGeneratorTest, OrbitFullRevolutionKeepsRadiusAndCloses) {
  const PresetRegistry registry = MakeBuiltinPresetRegistry();
  const PathGenerator generator(registry, GeneratorLimits{});
  const PathParameters params = MakeParams({100.0, 100.0}, {60.0, 60.0}, {0.0, 360.0},
                                           {0.0, 0.0});
  const GeneratedPath path = generator.Generate(Preset::kOrbit, params, SampleTiming{8.0, 241});

  ASSERT_EQ(path.keyframes.size(), 241u);
  EXPECT_TRUE(path.warnings.empty());
  const double expected_tilt = geo::RadToDeg(std::atan2(100.0, 60.0));
  for (const auto& k : path.keyframes) {
    EXPECT_NEAR(geo::GreatCircleDistance(k.horizontal(), kCenter), 100.0, 1e-6);
    EXPECT_DOUBLE_EQ(k.altitude_m, 60.0);
    EXPECT_NEAR(geo::AngleDelta(k.heading_deg, geo::InitialBearing(k.horizontal(), kCenter)),
                0.0, 1e-9);
    EXPECT_NEAR(k.tilt_deg, expected_tilt, 1e-6);
  }
  EXPECT_NEAR(geo::GreatCircleDistance(path.keyframes.front().horizontal(),
                                       path.keyframes.back().horizontal()),
              0.0, 1e-6);

  // Halfway through the eased revolution the camera sits due south.
  const auto& mid = path.keyframes[120];
  EXPECT_NEAR(geo::AngleDelta(geo::InitialBearing(kCenter, mid.horizontal()), 180.0), 0.0, 1e-6);
}

TEST(PathGeneratorTest, ZeroRadiusOrbitHoldsStaticHover) {
  const PresetRegistry registry = MakeBuiltinPresetRegistry();
  const PathGenerator generator(registry, GeneratorLimits{});
  const PathParameters params = MakeParams({0.0, 0.0}, {80.0, 120.0}, {45.0, 90.0},
                                           {0.0, 0.0});
  const GeneratedPath path = generator.Generate(Preset::kOrbit, params, SampleTiming{4.0, 120});

  ASSERT_EQ(path.keyframes.size(), 120u);
  EXPECT_TRUE(HasWarningContaining(path, "static hover"));
  for (const auto& k : path.keyframes) {
    EXPECT_NEAR(geo::GreatCircleDistance(k.horizontal(), kCenter), 0.0, 1e-6);
    EXPECT_DOUBLE_EQ(k.altitude_m, 80.0);
    EXPECT_NEAR(k.heading_deg, 225.0, 1e-9);
  }
}

TEST(PathGeneratorTest, FlybyWithCoincidentEndpointsIsDegenerate) {
  const PresetRegistry registry = MakeBuiltinPresetRegistry();
  const PathGenerator generator(registry, GeneratorLimits{});
  const SampleTiming timing{8.0, 240};

  EXPECT_EQ(CaughtKind(generator, Preset::kFlyby,
                       MakeParams({200.0, 200.0}, {150.0, 150.0}, {30.0, 30.0}, {60.0, 60.0}),
                       timing),
            ErrorKind::kDegenerateGeometry);
  EXPECT_EQ(CaughtKind(generator, Preset::kFlythrough,
                       MakeParams({200.0, 200.0}, {40.0, 40.0}, {30.0, 390.0}, {80.0, 80.0}),
                       timing),
            ErrorKind::kDegenerateGeometry);
}

TEST(PathGeneratorTest, DescentWithEqualAltitudesIsDegenerate) {
  const PresetRegistry registry = MakeBuiltinPresetRegistry();
  const PathGenerator generator(registry, GeneratorLimits{});
  const PathParameters params = MakeParams({100.0, 100.0}, {120.0, 120.0}, {0.0, 20.0},
                                           {0.0, 0.0});

  EXPECT_EQ(CaughtKind(generator, Preset::kDescent, params, SampleTiming{8.0, 240}),
            ErrorKind::kDegenerateGeometry);
  EXPECT_EQ(CaughtKind(generator, Preset::kAscent, params, SampleTiming{8.0, 240}),
            ErrorKind::kDegenerateGeometry);
}

TEST(PathGeneratorTest, DescentAndAscentAreMonotonic) {
  const PresetRegistry registry = MakeBuiltinPresetRegistry();
  const PathGenerator generator(registry, GeneratorLimits{});
  // Range given low-to-high on purpose: the preset decides the direction.
  const PathParameters params = MakeParams({100.0, 100.0}, {50.0, 200.0}, {0.0, 20.0},
                                           {0.0, 0.0});

  const GeneratedPath down = generator.Generate(Preset::kDescent, params, SampleTiming{8.0, 240});
  const GeneratedPath up = generator.Generate(Preset::kAscent, params, SampleTiming{8.0, 240});
  EXPECT_DOUBLE_EQ(down.keyframes.front().altitude_m, 200.0);
  EXPECT_DOUBLE_EQ(down.keyframes.back().altitude_m, 50.0);
  EXPECT_DOUBLE_EQ(up.keyframes.front().altitude_m, 50.0);
  EXPECT_DOUBLE_EQ(up.keyframes.back().altitude_m, 200.0);
  for (std::size_t i = 1; i < down.keyframes.size(); ++i) {
    EXPECT_LE(down.keyframes[i].altitude_m, down.keyframes[i - 1].altitude_m);
    EXPECT_GE(up.keyframes[i].altitude_m, up.keyframes[i - 1].altitude_m);
  }
}

TEST(PathGeneratorTest, LowSamplesAreRaisedToClearance) {
  const PresetRegistry registry = MakeBuiltinPresetRegistry();
  const PathGenerator generator(registry, GeneratorLimits{10.0, 2});
  const PathParameters params = MakeParams({60.0, 60.0}, {2.0, 50.0}, {0.0, 0.0},
                                           {80.0, 40.0});
  const GeneratedPath path = generator.Generate(Preset::kCrane, params, SampleTiming{8.0, 240});

  EXPECT_DOUBLE_EQ(path.keyframes.front().altitude_m, 10.0);
  EXPECT_DOUBLE_EQ(path.keyframes.back().altitude_m, 50.0);
  EXPECT_TRUE(HasWarningContaining(path, "terrain clearance"));
  for (const auto& k : path.keyframes) {
    EXPECT_GE(k.altitude_m, 10.0);
  }
}

TEST(PathGeneratorTest, FlybyHeadsAlongTheChord) {
  const PresetRegistry registry = MakeBuiltinPresetRegistry();
  const PathGenerator generator(registry, GeneratorLimits{});
  const PathParameters params = MakeParams({300.0, 300.0}, {200.0, 200.0}, {0.0, 80.0},
                                           {65.0, 70.0});
  const GeneratedPath path = generator.Generate(Preset::kFlyby, params, SampleTiming{8.0, 240});

  const auto& before = path.keyframes[119];
  const auto& mid = path.keyframes[120];
  const auto& after = path.keyframes[121];
  EXPECT_NEAR(geo::AngleDelta(mid.heading_deg,
                              geo::InitialBearing(before.horizontal(), after.horizontal())),
              0.0, 0.05);
  EXPECT_DOUBLE_EQ(path.keyframes.front().tilt_deg, 65.0);
  EXPECT_DOUBLE_EQ(path.keyframes.back().tilt_deg, 70.0);
}

TEST(PathGeneratorTest, GenerationIsDeterministic) {
  const PresetRegistry registry = MakeBuiltinPresetRegistry();
  const PathGenerator generator(registry, GeneratorLimits{});
  const PathParameters params = MakeParams({150.0, 250.0}, {30.0, 60.0}, {10.0, 170.0},
                                           {75.0, 85.0});
  const GeneratedPath a = generator.Generate(Preset::kFlythrough, params, SampleTiming{6.0, 180});
  const GeneratedPath b = generator.Generate(Preset::kFlythrough, params, SampleTiming{6.0, 180});

  ASSERT_EQ(a.keyframes.size(), b.keyframes.size());
  for (std::size_t i = 0; i < a.keyframes.size(); ++i) {
    EXPECT_EQ(a.keyframes[i].latitude_deg, b.keyframes[i].latitude_deg);
    EXPECT_EQ(a.keyframes[i].longitude_deg, b.keyframes[i].longitude_deg);
    EXPECT_EQ(a.keyframes[i].altitude_m, b.keyframes[i].altitude_m);
    EXPECT_EQ(a.keyframes[i].heading_deg, b.keyframes[i].heading_deg);
    EXPECT_EQ(a.keyframes[i].tilt_deg, b.keyframes[i].tilt_deg);
  }
}

TEST(PathGeneratorTest, RejectsInvalidParameters) {
  const PresetRegistry registry = MakeBuiltinPresetRegistry();
  const PathGenerator generator(registry, GeneratorLimits{});
  const SampleTiming timing{8.0, 240};

  PathParameters negative_radius = MakeParams({-1.0, 50.0}, {50.0, 50.0}, {0.0, 20.0}, {0, 0});
  EXPECT_EQ(CaughtKind(generator, Preset::kOrbit, negative_radius, timing),
            ErrorKind::kInvalidParameter);

  PathParameters bad_tilt = MakeParams({50.0, 50.0}, {50.0, 50.0}, {0.0, 20.0}, {0.0, 200.0});
  EXPECT_EQ(CaughtKind(generator, Preset::kOrbit, bad_tilt, timing),
            ErrorKind::kInvalidParameter);

  PathParameters bad_center = MakeParams({50.0, 50.0}, {50.0, 50.0}, {0.0, 20.0}, {0, 0});
  bad_center.center = geo::GeoPoint{95.0, 0.0};
  EXPECT_EQ(CaughtKind(generator, Preset::kOrbit, bad_center, timing),
            ErrorKind::kInvalidParameter);

  const PathParameters fine = MakeParams({50.0, 50.0}, {50.0, 50.0}, {0.0, 20.0}, {0, 0});
  EXPECT_EQ(CaughtKind(generator, Preset::kOrbit, fine, SampleTiming{8.0, 1}),
            ErrorKind::kInvalidParameter);
}

TEST(PathGeneratorTest, UnregisteredPresetIsUnsupported) {
  PresetRegistry registry(std::vector<PresetDefinition>{});
  const PathGenerator generator(registry, GeneratorLimits{});
  const PathParameters params = MakeParams({50.0, 50.0}, {50.0, 50.0}, {0.0, 20.0}, {0, 0});
  EXPECT_EQ(CaughtKind(generator, Preset::kOrbit, params, SampleTiming{8.0, 240}),
            ErrorKind::kUnsupportedPreset);
  EXPECT_FALSE(registry.Contains(Preset::kOrbit));
}

TEST(PresetTest, ParseAcceptsCommonSpellings) {
  EXPECT_EQ(ParsePreset("orbit"), Preset::kOrbit);
  EXPECT_EQ(ParsePreset("TiltReveal"), Preset::kTiltReveal);
  EXPECT_EQ(ParsePreset("tilt_reveal"), Preset::kTiltReveal);
  EXPECT_THROW(ParsePreset("barrel_roll"), Error);
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
