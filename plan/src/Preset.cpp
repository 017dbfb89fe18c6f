#include "plan/Preset.hpp"

#include <cctype>

#include "common/errors.hpp"

namespace skyshot::plan {
namespace {

std::string Canonical(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (const char ch : name) {
    if (ch == '_' || ch == '-' || ch == ' ') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}

}  // namespace

const char* PresetName(Preset preset) {
  switch (preset) {
    case Preset::kOrbit:
      return "orbit";
    case Preset::kFlyby:
      return "flyby";
    case Preset::kFlythrough:
      return "flythrough";
    case Preset::kDescent:
      return "descent";
    case Preset::kAscent:
      return "ascent";
    case Preset::kPan:
      return "pan";
    case Preset::kReveal:
      return "reveal";
    case Preset::kTiltReveal:
      return "tilt_reveal";
    case Preset::kEstablishing:
      return "establishing";
    case Preset::kCrane:
      return "crane";
  }
  return "orbit";
}

const char* PresetTitle(Preset preset) {
  switch (preset) {
    case Preset::kOrbit:
      return "Orbit";
    case Preset::kFlyby:
      return "Flyby";
    case Preset::kFlythrough:
      return "Flythrough";
    case Preset::kDescent:
      return "Descent";
    case Preset::kAscent:
      return "Ascent";
    case Preset::kPan:
      return "Pan";
    case Preset::kReveal:
      return "Reveal";
    case Preset::kTiltReveal:
      return "Tilt Reveal";
    case Preset::kEstablishing:
      return "Establishing";
    case Preset::kCrane:
      return "Crane";
  }
  return "Orbit";
}

Preset ParsePreset(std::string_view name) {
  const std::string wanted = Canonical(name);
  for (const Preset preset : kAllPresets) {
    if (Canonical(PresetName(preset)) == wanted) {
      return preset;
    }
  }
  throw Error(ErrorKind::kUnsupportedPreset,
              "unknown preset '" + std::string(name) + "'");
}

}  // namespace skyshot::plan
