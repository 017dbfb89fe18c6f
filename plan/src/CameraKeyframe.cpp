#include "plan/CameraKeyframe.hpp"

namespace skyshot::plan {

const char* InterpolationModeName(InterpolationMode mode) {
  switch (mode) {
    case InterpolationMode::kAuto:
      return "auto";
    case InterpolationMode::kLinear:
      return "linear";
    case InterpolationMode::kBezier:
      return "bezier";
    case InterpolationMode::kHold:
      return "hold";
  }
  return "auto";
}

std::optional<InterpolationMode> ParseInterpolationMode(std::string_view name) {
  if (name == "auto") {
    return InterpolationMode::kAuto;
  }
  if (name == "linear") {
    return InterpolationMode::kLinear;
  }
  if (name == "bezier") {
    return InterpolationMode::kBezier;
  }
  if (name == "hold") {
    return InterpolationMode::kHold;
  }
  return std::nullopt;
}

}  // namespace skyshot::plan
