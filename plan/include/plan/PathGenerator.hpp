#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "plan/CameraKeyframe.hpp"
#include "plan/PathParameters.hpp"
#include "plan/Preset.hpp"
#include "plan/PresetRegistry.hpp"

namespace skyshot::plan {

struct GeneratorLimits {
  double terrain_clearance_m{10.0};
  std::size_t min_samples{2};
};

struct GeneratedPath {
  KeyframeSequence keyframes;
  std::vector<std::string> warnings;
};

// duration x frame rate, rounded, never below min_samples (itself at least 2).
std::size_t SampleCountFor(double duration_s, double frame_rate, std::size_t min_samples);

// Throws Error(kInvalidParameter) describing the first offending field.
void ValidatePathParameters(const PathParameters& params, const SampleTiming& timing);

class PathGenerator {
 public:
  PathGenerator(const PresetRegistry& registry, GeneratorLimits limits)
      : registry_(registry), limits_(limits) {}

  // Pure: identical inputs give identical keyframes. Keyframe i is stamped
  // i * duration / sample_count and samples the preset at u = i / (n - 1).
  GeneratedPath Generate(Preset preset, const PathParameters& params,
                         const SampleTiming& timing) const;

  const GeneratorLimits& limits() const { return limits_; }

 private:
  const PresetRegistry& registry_;
  GeneratorLimits limits_;
};

}  // namespace skyshot::plan
