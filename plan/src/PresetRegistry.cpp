#include "plan/PresetRegistry.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>
#include <utility>

#include "common/errors.hpp"

namespace skyshot::plan {
namespace {

constexpr double kWeaveAmplitudeFraction = 0.12;
constexpr double kWeaveCycles = 2.0;

double Lerp(double a, double b, double t) { return a + (b - a) * t; }

double Lerp(const Range& range, double t) { return Lerp(range.start, range.end, t); }

geo::GeoPoint ArcPoint(const PathParameters& p, double e) {
  return geo::Destination(p.center, Lerp(p.azimuth_deg, e), Lerp(p.radius_m, e));
}

geo::GeoPoint FixedPoint(const PathParameters& p) {
  return geo::Destination(p.center, p.azimuth_deg.start, p.radius_m.start);
}

// Straight pass between the start and end points of the azimuth/radius range.
geo::GeoPoint ChordPoint(const PathParameters& p, double e, double* chord_bearing,
                         double* chord_length) {
  const geo::GeoPoint from = geo::Destination(p.center, p.azimuth_deg.start, p.radius_m.start);
  const geo::GeoPoint to = geo::Destination(p.center, p.azimuth_deg.end, p.radius_m.end);
  const double length = geo::GreatCircleDistance(from, to);
  const double bearing = geo::InitialBearing(from, to);
  if (chord_bearing) {
    *chord_bearing = bearing;
  }
  if (chord_length) {
    *chord_length = length;
  }
  return geo::Destination(from, bearing, length * e);
}

double HeadingTowardCenterFrom(const PathParameters& p, const geo::GeoPoint& position) {
  if (geo::GreatCircleDistance(position, p.center) < 1e-3) {
    return geo::NormalizeHeading(p.azimuth_deg.start + 180.0);
  }
  return geo::InitialBearing(position, p.center);
}

ShapeSample ArcShape(const PathParameters& p, double e) {
  ShapeSample s;
  s.position = ArcPoint(p, e);
  s.altitude_m = Lerp(p.altitude_m, e);
  return s;
}

ShapeSample DescentShape(const PathParameters& p, double e) {
  ShapeSample s;
  s.position = ArcPoint(p, e);
  const double high = std::max(p.altitude_m.start, p.altitude_m.end);
  const double low = std::min(p.altitude_m.start, p.altitude_m.end);
  s.altitude_m = Lerp(high, low, e);
  return s;
}

ShapeSample AscentShape(const PathParameters& p, double e) {
  ShapeSample s;
  s.position = ArcPoint(p, e);
  const double high = std::max(p.altitude_m.start, p.altitude_m.end);
  const double low = std::min(p.altitude_m.start, p.altitude_m.end);
  s.altitude_m = Lerp(low, high, e);
  return s;
}

ShapeSample FlybyShape(const PathParameters& p, double e) {
  ShapeSample s;
  s.position = ChordPoint(p, e, nullptr, nullptr);
  s.altitude_m = p.altitude_m.start;
  s.tilt_deg = Lerp(p.tilt_deg, e);
  return s;
}

ShapeSample FlythroughShape(const PathParameters& p, double e) {
  double bearing = 0.0;
  double length = 0.0;
  const geo::GeoPoint on_chord = ChordPoint(p, e, &bearing, &length);
  const double weave = kWeaveAmplitudeFraction * length *
                       std::sin(2.0 * std::numbers::pi * kWeaveCycles * e);

  ShapeSample s;
  s.position = geo::Destination(on_chord, bearing + 90.0, weave);
  s.altitude_m = Lerp(p.altitude_m, e);
  s.tilt_deg = Lerp(p.tilt_deg, e);
  return s;
}

ShapeSample PanShape(const PathParameters& p, double e) {
  ShapeSample s;
  s.position = FixedPoint(p);
  s.altitude_m = p.altitude_m.start;
  const double half_sweep = 0.5 * p.azimuth_deg.span();
  s.heading_deg = HeadingTowardCenterFrom(p, s.position) + Lerp(-half_sweep, half_sweep, e);
  s.tilt_deg = Lerp(p.tilt_deg, e);
  return s;
}

ShapeSample TiltRevealShape(const PathParameters& p, double e) {
  ShapeSample s;
  s.position = FixedPoint(p);
  s.altitude_m = p.altitude_m.start;
  s.tilt_deg = Lerp(p.tilt_deg, e);
  return s;
}

ShapeSample CraneShape(const PathParameters& p, double e) {
  ShapeSample s;
  s.position = FixedPoint(p);
  s.altitude_m = Lerp(p.altitude_m, e);
  s.tilt_deg = Lerp(p.tilt_deg, e);
  return s;
}

}  // namespace

PresetRegistry::PresetRegistry(std::vector<PresetDefinition> definitions)
    : definitions_(std::move(definitions)) {
  for (const auto& def : definitions_) {
    if (!def.shape) {
      throw Error(ErrorKind::kUnsupportedPreset,
                  std::string("preset '") + PresetName(def.preset) + "' has no shape");
    }
  }
}

const PresetDefinition& PresetRegistry::Find(Preset preset) const {
  const auto it = std::find_if(definitions_.begin(), definitions_.end(),
                               [preset](const PresetDefinition& def) {
                                 return def.preset == preset;
                               });
  if (it == definitions_.end()) {
    throw Error(ErrorKind::kUnsupportedPreset,
                std::string("preset '") + PresetName(preset) + "' is not registered");
  }
  return *it;
}

bool PresetRegistry::Contains(Preset preset) const {
  return std::any_of(definitions_.begin(), definitions_.end(),
                     [preset](const PresetDefinition& def) { return def.preset == preset; });
}

PresetRegistry MakeBuiltinPresetRegistry() {
  std::vector<PresetDefinition> defs;
  defs.reserve(kAllPresets.size());

  PresetDefinition orbit{Preset::kOrbit, &ArcShape};
  orbit.hover_on_zero_radius = true;
  defs.push_back(orbit);

  PresetDefinition flyby{Preset::kFlyby, &FlybyShape, HeadingMode::kAlongVelocity,
                         TiltMode::kExplicit};
  flyby.requires_distinct_endpoints = true;
  defs.push_back(flyby);

  PresetDefinition flythrough{Preset::kFlythrough, &FlythroughShape,
                              HeadingMode::kAlongVelocity, TiltMode::kExplicit};
  flythrough.requires_distinct_endpoints = true;
  defs.push_back(flythrough);

  PresetDefinition descent{Preset::kDescent, &DescentShape};
  descent.altitude_direction = -1;
  defs.push_back(descent);

  PresetDefinition ascent{Preset::kAscent, &AscentShape};
  ascent.altitude_direction = 1;
  defs.push_back(ascent);

  defs.push_back(PresetDefinition{Preset::kPan, &PanShape, HeadingMode::kExplicit,
                                  TiltMode::kExplicit});
  defs.push_back(PresetDefinition{Preset::kReveal, &ArcShape});
  defs.push_back(PresetDefinition{Preset::kTiltReveal, &TiltRevealShape,
                                  HeadingMode::kLookAtCenter, TiltMode::kExplicit});
  defs.push_back(PresetDefinition{Preset::kEstablishing, &ArcShape});
  defs.push_back(PresetDefinition{Preset::kCrane, &CraneShape, HeadingMode::kLookAtCenter,
                                  TiltMode::kExplicit});

  return PresetRegistry(std::move(defs));
}

}  // namespace skyshot::plan
