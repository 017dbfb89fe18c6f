#pragma once

#include <cstddef>
#include <map>
#include <vector>

#include "plan/Easing.hpp"
#include "plan/PathParameters.hpp"
#include "plan/Preset.hpp"

namespace skyshot::plan {

// Sampling intervals for one preset. Azimuth start is always drawn from
// [0, 360); the end azimuth is start + sweep.
struct PresetRanges {
  Interval start_radius_m{};
  Interval end_radius_m{};
  Interval start_altitude_m{};
  Interval end_altitude_m{};
  Interval sweep_deg{};
  Interval start_tilt_deg{};
  Interval end_tilt_deg{};
  // Reuse the start value for the end (constant radius / altitude).
  bool hold_radius{false};
  bool hold_altitude{false};
  Easing easing{Easing::kSmoothstep};
};

struct DiversityConfig {
  double min_distance{0.15};
  std::size_t max_attempts{8};
};

struct PlannerConfig {
  double frame_rate{30.0};
  std::size_t min_samples{2};
  double terrain_clearance_m{10.0};
  std::size_t worker_count{0};
  DiversityConfig diversity{};
  std::vector<Preset> preset_order{
      Preset::kOrbit,      Preset::kFlyby,        Preset::kDescent, Preset::kAscent,
      Preset::kReveal,     Preset::kPan,          Preset::kTiltReveal,
      Preset::kEstablishing, Preset::kCrane,      Preset::kFlythrough,
  };
  std::map<Preset, PresetRanges> ranges{DefaultPresetRanges()};

  static std::map<Preset, PresetRanges> DefaultPresetRanges();
};

inline std::map<Preset, PresetRanges> PlannerConfig::DefaultPresetRanges() {
  std::map<Preset, PresetRanges> r;

  PresetRanges& orbit = r[Preset::kOrbit];
  orbit.start_radius_m = {60.0, 120.0};
  orbit.end_radius_m = orbit.start_radius_m;
  orbit.start_altitude_m = {40.0, 90.0};
  orbit.end_altitude_m = orbit.start_altitude_m;
  orbit.sweep_deg = {15.0, 30.0};
  orbit.start_tilt_deg = {0.0, 5.0};
  orbit.end_tilt_deg = {0.0, 5.0};
  orbit.hold_radius = true;
  orbit.hold_altitude = true;

  PresetRanges& flyby = r[Preset::kFlyby];
  flyby.start_radius_m = {250.0, 400.0};
  flyby.end_radius_m = {250.0, 400.0};
  flyby.start_altitude_m = {150.0, 250.0};
  flyby.end_altitude_m = flyby.start_altitude_m;
  flyby.sweep_deg = {60.0, 100.0};
  flyby.start_tilt_deg = {60.0, 75.0};
  flyby.end_tilt_deg = {60.0, 75.0};
  flyby.hold_altitude = true;

  PresetRanges& flythrough = r[Preset::kFlythrough];
  flythrough.start_radius_m = {150.0, 250.0};
  flythrough.end_radius_m = {150.0, 250.0};
  flythrough.start_altitude_m = {30.0, 60.0};
  flythrough.end_altitude_m = {30.0, 60.0};
  flythrough.sweep_deg = {140.0, 180.0};
  flythrough.start_tilt_deg = {75.0, 85.0};
  flythrough.end_tilt_deg = {75.0, 85.0};
  flythrough.easing = Easing::kSine;

  PresetRanges& descent = r[Preset::kDescent];
  descent.start_radius_m = {80.0, 150.0};
  descent.end_radius_m = descent.start_radius_m;
  descent.start_altitude_m = {150.0, 250.0};
  descent.end_altitude_m = {40.0, 80.0};
  descent.sweep_deg = {10.0, 30.0};
  descent.start_tilt_deg = {0.0, 5.0};
  descent.end_tilt_deg = {0.0, 5.0};
  descent.hold_radius = true;

  PresetRanges& ascent = r[Preset::kAscent];
  ascent = descent;
  ascent.start_altitude_m = {40.0, 80.0};
  ascent.end_altitude_m = {150.0, 250.0};

  PresetRanges& reveal = r[Preset::kReveal];
  reveal.start_radius_m = {30.0, 60.0};
  reveal.end_radius_m = {150.0, 250.0};
  reveal.start_altitude_m = {20.0, 40.0};
  reveal.end_altitude_m = {80.0, 140.0};
  reveal.sweep_deg = {0.0, 10.0};
  reveal.start_tilt_deg = {0.0, 10.0};
  reveal.end_tilt_deg = {0.0, 10.0};

  PresetRanges& pan = r[Preset::kPan];
  pan.start_radius_m = {100.0, 200.0};
  pan.end_radius_m = pan.start_radius_m;
  pan.start_altitude_m = {50.0, 100.0};
  pan.end_altitude_m = pan.start_altitude_m;
  pan.sweep_deg = {40.0, 90.0};
  pan.start_tilt_deg = {70.0, 85.0};
  pan.end_tilt_deg = {70.0, 85.0};
  pan.hold_radius = true;
  pan.hold_altitude = true;

  PresetRanges& tilt_reveal = r[Preset::kTiltReveal];
  tilt_reveal.start_radius_m = {80.0, 150.0};
  tilt_reveal.end_radius_m = tilt_reveal.start_radius_m;
  tilt_reveal.start_altitude_m = {30.0, 60.0};
  tilt_reveal.end_altitude_m = tilt_reveal.start_altitude_m;
  tilt_reveal.sweep_deg = {0.0, 0.0};
  tilt_reveal.start_tilt_deg = {10.0, 30.0};
  tilt_reveal.end_tilt_deg = {75.0, 88.0};
  tilt_reveal.hold_radius = true;
  tilt_reveal.hold_altitude = true;
  tilt_reveal.easing = Easing::kSmootherstep;

  PresetRanges& establishing = r[Preset::kEstablishing];
  establishing.start_radius_m = {600.0, 900.0};
  establishing.end_radius_m = {350.0, 500.0};
  establishing.start_altitude_m = {300.0, 450.0};
  establishing.end_altitude_m = {200.0, 300.0};
  establishing.sweep_deg = {5.0, 15.0};
  establishing.start_tilt_deg = {0.0, 5.0};
  establishing.end_tilt_deg = {0.0, 5.0};
  establishing.easing = Easing::kSine;

  PresetRanges& crane = r[Preset::kCrane];
  crane.start_radius_m = {40.0, 80.0};
  crane.end_radius_m = crane.start_radius_m;
  crane.start_altitude_m = {10.0, 20.0};
  crane.end_altitude_m = {60.0, 100.0};
  crane.sweep_deg = {0.0, 0.0};
  crane.start_tilt_deg = {80.0, 88.0};
  crane.end_tilt_deg = {40.0, 60.0};
  crane.hold_radius = true;

  return r;
}

}  // namespace skyshot::plan
