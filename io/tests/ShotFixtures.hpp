#pragma once

#include <cstddef>
#include <string>

#include "common/math/Geodesy.hpp"
#include "plan/CameraKeyframe.hpp"
#include "plan/ShotPlan.hpp"

namespace skyshot::fixtures {

inline const geo::GeoPoint kFixtureCenter{40.7484, -73.9857};

// Short orbit-like shot, two keyframes per second, 80 m out and climbing.
inline plan::ShotPlan MakeFixtureShot(std::size_t keyframe_count = 5) {
  plan::ShotPlan shot;
  shot.id = "shot_0_orbit";
  shot.index = 0;
  shot.title = "Orbit #1";
  shot.preset = plan::Preset::kOrbit;
  shot.frame_rate = 30.0;
  shot.duration_s = 0.5 * static_cast<double>(keyframe_count);
  shot.parameters.center = kFixtureCenter;
  shot.parameters.radius_m = plan::Range{80.0, 80.0};
  shot.parameters.altitude_m = plan::Range{60.0, 60.0 + 2.0 * keyframe_count};

  for (std::size_t i = 0; i < keyframe_count; ++i) {
    const double azimuth = 10.0 * static_cast<double>(i);
    const geo::GeoPoint p = geo::Destination(kFixtureCenter, azimuth, 80.0);
    plan::CameraKeyframe k;
    k.time_s = 0.5 * static_cast<double>(i);
    k.latitude_deg = p.latitude_deg;
    k.longitude_deg = p.longitude_deg;
    k.altitude_m = 60.0 + 2.0 * static_cast<double>(i);
    k.heading_deg = geo::NormalizeHeading(azimuth + 180.0);
    k.tilt_deg = 50.0 + static_cast<double>(i);
    k.roll_deg = 0.0;
    shot.keyframes.push_back(k);
  }
  return shot;
}

}  // namespace skyshot::fixtures
