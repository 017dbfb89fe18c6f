#include "plan/PathGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "common/errors.hpp"

namespace skyshot::plan {
namespace {

// Below this horizontal separation the bearing to the center is meaningless.
constexpr double kMinHeadingDistanceM = 0.01;
constexpr double kMinEndpointSeparationM = 0.5;
constexpr double kVelocityProbe = 1e-4;
constexpr double kMaxSamples = 10'000'000.0;
constexpr double kMinTiltDeg = -90.0;
constexpr double kMaxTiltDeg = 180.0;

std::string InvalidFieldMessage(const char* field, double value) {
  std::ostringstream oss;
  oss << "invalid value for '" << field << "': " << value;
  return oss.str();
}

void RequireFinite(const char* field, double value) {
  if (!std::isfinite(value)) {
    throw Error(ErrorKind::kInvalidParameter, InvalidFieldMessage(field, value));
  }
}

void RequireNonNegative(const char* field, double value) {
  RequireFinite(field, value);
  if (value < 0.0) {
    throw Error(ErrorKind::kInvalidParameter, InvalidFieldMessage(field, value));
  }
}

void RequireTilt(const char* field, double value) {
  RequireFinite(field, value);
  if (value < kMinTiltDeg || value > kMaxTiltDeg) {
    throw Error(ErrorKind::kInvalidParameter, InvalidFieldMessage(field, value));
  }
}

bool IsFinite(const CameraKeyframe& k) {
  return std::isfinite(k.time_s) && std::isfinite(k.latitude_deg) &&
         std::isfinite(k.longitude_deg) && std::isfinite(k.altitude_m) &&
         std::isfinite(k.heading_deg) && std::isfinite(k.tilt_deg) && std::isfinite(k.roll_deg);
}

double LookAtTilt(const geo::GeoPoint& camera, double altitude_m, const geo::GeoPoint& target) {
  const double ground = geo::GreatCircleDistance(camera, target);
  return geo::RadToDeg(std::atan2(ground, std::max(altitude_m, 0.0)));
}

}  // namespace

std::size_t SampleCountFor(double duration_s, double frame_rate, std::size_t min_samples) {
  if (!std::isfinite(duration_s) || duration_s <= 0.0) {
    throw Error(ErrorKind::kInvalidParameter, InvalidFieldMessage("duration_s", duration_s));
  }
  if (!std::isfinite(frame_rate) || frame_rate <= 0.0) {
    throw Error(ErrorKind::kInvalidParameter, InvalidFieldMessage("frame_rate", frame_rate));
  }
  const double raw = std::round(duration_s * frame_rate);
  if (raw > kMaxSamples) {
    throw Error(ErrorKind::kInvalidParameter,
                InvalidFieldMessage("duration_s * frame_rate", raw));
  }
  const std::size_t floor = std::max<std::size_t>(min_samples, 2);
  return std::max(floor, static_cast<std::size_t>(raw));
}

void ValidatePathParameters(const PathParameters& params, const SampleTiming& timing) {
  if (!geo::IsValid(params.center)) {
    std::ostringstream oss;
    oss << "center (" << params.center.latitude_deg << ", " << params.center.longitude_deg
        << ") is outside [-90,90] x [-180,180]";
    throw Error(ErrorKind::kInvalidParameter, oss.str());
  }
  RequireNonNegative("radius_m.start", params.radius_m.start);
  RequireNonNegative("radius_m.end", params.radius_m.end);
  RequireFinite("altitude_m.start", params.altitude_m.start);
  RequireFinite("altitude_m.end", params.altitude_m.end);
  RequireFinite("azimuth_deg.start", params.azimuth_deg.start);
  RequireFinite("azimuth_deg.end", params.azimuth_deg.end);
  RequireTilt("tilt_deg.start", params.tilt_deg.start);
  RequireTilt("tilt_deg.end", params.tilt_deg.end);

  if (!std::isfinite(timing.duration_s) || timing.duration_s <= 0.0) {
    throw Error(ErrorKind::kInvalidParameter,
                InvalidFieldMessage("duration_s", timing.duration_s));
  }
  if (timing.sample_count < 2) {
    throw Error(ErrorKind::kInvalidParameter,
                InvalidFieldMessage("sample_count", static_cast<double>(timing.sample_count)));
  }
}

GeneratedPath PathGenerator::Generate(Preset preset, const PathParameters& params,
                                      const SampleTiming& timing) const {
  const PresetDefinition& def = registry_.Find(preset);
  ValidatePathParameters(params, timing);

  GeneratedPath out;
  PathParameters effective = params;

  if (def.requires_distinct_endpoints) {
    const geo::GeoPoint from =
        geo::Destination(params.center, params.azimuth_deg.start, params.radius_m.start);
    const geo::GeoPoint to =
        geo::Destination(params.center, params.azimuth_deg.end, params.radius_m.end);
    if (geo::GreatCircleDistance(from, to) < kMinEndpointSeparationM) {
      throw Error(ErrorKind::kDegenerateGeometry,
                  std::string(PresetName(preset)) +
                      " needs distinct start and end points; radius/azimuth range collapses "
                      "the pass to a single point");
    }
  }
  if (def.altitude_direction != 0 && params.altitude_m.start == params.altitude_m.end) {
    throw Error(ErrorKind::kDegenerateGeometry,
                std::string(PresetName(preset)) + " needs distinct start and end altitudes");
  }

  const bool hover =
      def.hover_on_zero_radius && params.radius_m.start == 0.0 && params.radius_m.end == 0.0;
  if (hover) {
    effective.altitude_m.end = effective.altitude_m.start;
    effective.azimuth_deg.end = effective.azimuth_deg.start;
    out.warnings.push_back(std::string(PresetName(preset)) +
                           " radius is zero; holding a static hover at altitude_m.start");
  }

  const std::size_t n = timing.sample_count;
  const double interval = timing.interval_s();
  const double fallback_heading = geo::NormalizeHeading(effective.azimuth_deg.start + 180.0);
  double held_heading = fallback_heading;
  std::size_t raised = 0;
  std::size_t tilt_out_of_range = 0;

  out.keyframes.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const double u = static_cast<double>(i) / static_cast<double>(n - 1);
    const double e = Ease(effective.easing, u);
    const ShapeSample sample = def.shape(effective, e);

    CameraKeyframe k;
    k.time_s = static_cast<double>(i) * interval;
    k.latitude_deg = sample.position.latitude_deg;
    k.longitude_deg = sample.position.longitude_deg;
    k.altitude_m = sample.altitude_m;
    if (k.altitude_m < limits_.terrain_clearance_m) {
      k.altitude_m = limits_.terrain_clearance_m;
      ++raised;
    }

    double heading = held_heading;
    switch (def.heading) {
      case HeadingMode::kLookAtCenter:
        if (!hover &&
            geo::GreatCircleDistance(sample.position, effective.center) >= kMinHeadingDistanceM) {
          heading = geo::InitialBearing(sample.position, effective.center);
        }
        break;
      case HeadingMode::kAlongVelocity: {
        const geo::GeoPoint behind = def.shape(effective, std::max(0.0, e - kVelocityProbe)).position;
        const geo::GeoPoint ahead = def.shape(effective, std::min(1.0, e + kVelocityProbe)).position;
        if (geo::GreatCircleDistance(behind, ahead) > 1e-6) {
          heading = geo::InitialBearing(behind, ahead);
        }
        break;
      }
      case HeadingMode::kExplicit:
        heading = sample.heading_deg;
        break;
    }
    k.heading_deg = geo::NormalizeHeading(heading);
    held_heading = k.heading_deg;

    switch (def.tilt) {
      case TiltMode::kLookAtOffset:
        k.tilt_deg = LookAtTilt(sample.position, k.altitude_m, effective.center) +
                     effective.tilt_deg.start +
                     (effective.tilt_deg.end - effective.tilt_deg.start) * e;
        break;
      case TiltMode::kExplicit:
        k.tilt_deg = sample.tilt_deg;
        break;
    }
    if (k.tilt_deg < 0.0 || k.tilt_deg > 180.0) {
      ++tilt_out_of_range;
    }

    if (!IsFinite(k)) {
      std::ostringstream oss;
      oss << PresetName(preset) << " produced a non-finite keyframe at sample " << i;
      throw Error(ErrorKind::kDegenerateGeometry, oss.str());
    }
    out.keyframes.push_back(k);
  }

  if (raised > 0) {
    std::ostringstream oss;
    oss << raised << " of " << n << " samples raised to the terrain clearance of "
        << limits_.terrain_clearance_m << " m";
    out.warnings.push_back(oss.str());
  }
  if (tilt_out_of_range > 0) {
    std::ostringstream oss;
    oss << tilt_out_of_range << " of " << n << " samples have tilt outside [0, 180] deg";
    out.warnings.push_back(oss.str());
  }
  return out;
}

}  // namespace skyshot::plan
