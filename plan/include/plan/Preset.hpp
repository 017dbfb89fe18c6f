#pragma once

#include <array>
#include <string>
#include <string_view>

namespace skyshot::plan {

enum class Preset {
  kOrbit,
  kFlyby,
  kFlythrough,
  kDescent,
  kAscent,
  kPan,
  kReveal,
  kTiltReveal,
  kEstablishing,
  kCrane,
};

inline constexpr std::array<Preset, 10> kAllPresets{
    Preset::kOrbit,   Preset::kFlyby,      Preset::kFlythrough,
    Preset::kDescent, Preset::kAscent,     Preset::kPan,
    Preset::kReveal,  Preset::kTiltReveal, Preset::kEstablishing,
    Preset::kCrane,
};

// Lower-case identifier used in configuration files and artifact names.
const char* PresetName(Preset preset);
// Human readable title.
const char* PresetTitle(Preset preset);

// Accepts the identifier case-insensitively ("orbit", "TiltReveal",
// "tilt_reveal"). Throws Error(kUnsupportedPreset) for anything else.
Preset ParsePreset(std::string_view name);

}  // namespace skyshot::plan
