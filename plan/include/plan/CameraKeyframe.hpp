#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "common/math/Geodesy.hpp"

namespace skyshot::plan {

// Interpolation declared by an external track. Stored and written back; the
// planner itself always samples densely and never interpolates.
enum class InterpolationMode {
  kAuto,
  kLinear,
  kBezier,
  kHold,
};

const char* InterpolationModeName(InterpolationMode mode);
std::optional<InterpolationMode> ParseInterpolationMode(std::string_view name);

struct CameraKeyframe {
  double time_s{0.0};
  double latitude_deg{0.0};
  double longitude_deg{0.0};
  double altitude_m{0.0};
  double heading_deg{0.0};  // clockwise from north, [0, 360)
  double tilt_deg{0.0};     // 0 looks straight down, 90 at the horizon
  double roll_deg{0.0};
  std::optional<double> fov_deg{};
  InterpolationMode interpolation{InterpolationMode::kAuto};

  geo::GeoPoint horizontal() const { return geo::GeoPoint{latitude_deg, longitude_deg}; }
  geo::Geodetic position() const { return geo::Geodetic{latitude_deg, longitude_deg, altitude_m}; }
};

using KeyframeSequence = std::vector<CameraKeyframe>;

}  // namespace skyshot::plan
