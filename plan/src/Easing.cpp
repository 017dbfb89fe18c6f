#include "plan/Easing.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>

#include "common/errors.hpp"

namespace skyshot::plan {

double Ease(Easing easing, double u) {
  const double t = std::clamp(u, 0.0, 1.0);
  switch (easing) {
    case Easing::kSmoothstep:
      return t * t * (3.0 - 2.0 * t);
    case Easing::kSmootherstep:
      return t * t * t * (t * (t * 6.0 - 15.0) + 10.0);
    case Easing::kSine:
      return 0.5 - 0.5 * std::cos(std::numbers::pi * t);
  }
  return t;
}

const char* EasingName(Easing easing) {
  switch (easing) {
    case Easing::kSmoothstep:
      return "smoothstep";
    case Easing::kSmootherstep:
      return "smootherstep";
    case Easing::kSine:
      return "sine";
  }
  return "smoothstep";
}

Easing ParseEasing(std::string_view name) {
  if (name == "smoothstep") {
    return Easing::kSmoothstep;
  }
  if (name == "smootherstep") {
    return Easing::kSmootherstep;
  }
  if (name == "sine") {
    return Easing::kSine;
  }
  throw Error(ErrorKind::kInvalidParameter,
              "unknown easing '" + std::string(name) +
                  "' (expected smoothstep, smootherstep or sine)");
}

}  // namespace skyshot::plan
