#pragma once

#include <vector>

#include "common/math/Geodesy.hpp"
#include "plan/PathParameters.hpp"
#include "plan/Preset.hpp"

namespace skyshot::plan {

// Camera placement produced by a preset at eased time e in [0,1].
struct ShapeSample {
  geo::GeoPoint position{};
  double altitude_m{0.0};
  double heading_deg{0.0};  // read only for HeadingMode::kExplicit
  double tilt_deg{0.0};     // read only for TiltMode::kExplicit
};

using PresetShape = ShapeSample (*)(const PathParameters& params, double e);

enum class HeadingMode {
  kLookAtCenter,
  kAlongVelocity,
  kExplicit,
};

enum class TiltMode {
  kLookAtOffset,  // look-at tilt plus lerp(tilt_deg)
  kExplicit,
};

struct PresetDefinition {
  Preset preset{Preset::kOrbit};
  PresetShape shape{nullptr};
  HeadingMode heading{HeadingMode::kLookAtCenter};
  TiltMode tilt{TiltMode::kLookAtOffset};
  // Zero radius on both ends collapses the shot into a static hover instead
  // of failing.
  bool hover_on_zero_radius{false};
  // Start and end of the pass must be distinct points.
  bool requires_distinct_endpoints{false};
  // Altitude must change; +1 climbs, -1 descends, 0 follows the range.
  int altitude_direction{0};
};

// Immutable lookup table built once and handed to the planner by reference.
class PresetRegistry {
 public:
  explicit PresetRegistry(std::vector<PresetDefinition> definitions);

  // Throws Error(kUnsupportedPreset) when the preset has no definition.
  const PresetDefinition& Find(Preset preset) const;
  bool Contains(Preset preset) const;
  const std::vector<PresetDefinition>& definitions() const { return definitions_; }

 private:
  std::vector<PresetDefinition> definitions_;
};

PresetRegistry MakeBuiltinPresetRegistry();

}  // namespace skyshot::plan
