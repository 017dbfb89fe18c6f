#pragma once

#include <cstddef>

#include "common/math/Geodesy.hpp"
#include "plan/Easing.hpp"

namespace skyshot::plan {

// Value at the start and at the end of a shot.
struct Range {
  double start{0.0};
  double end{0.0};

  double span() const { return end - start; }
};

// Bounds a sampled value is drawn from.
struct Interval {
  double min{0.0};
  double max{0.0};

  bool contains(double value) const { return value >= min && value <= max; }
  double width() const { return max - min; }
};

struct PathParameters {
  geo::GeoPoint center{};
  Range radius_m{};
  Range altitude_m{};
  Range azimuth_deg{};  // sweep = end - start, may exceed 360
  Range tilt_deg{};
  Easing easing{Easing::kSmoothstep};
};

struct SampleTiming {
  double duration_s{0.0};
  std::size_t sample_count{0};

  double interval_s() const {
    return sample_count == 0 ? 0.0 : duration_s / static_cast<double>(sample_count);
  }
};

}  // namespace skyshot::plan
