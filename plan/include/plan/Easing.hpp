#pragma once

#include <string_view>

namespace skyshot::plan {

// Speed profiles. Every curve maps [0,1] onto [0,1] with zero slope at both
// ends, so motion starts and stops without a velocity jump.
enum class Easing {
  kSmoothstep,
  kSmootherstep,
  kSine,
};

double Ease(Easing easing, double u);

const char* EasingName(Easing easing);
// Throws Error(kInvalidParameter) for unknown names.
Easing ParseEasing(std::string_view name);

}  // namespace skyshot::plan
