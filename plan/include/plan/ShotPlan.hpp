#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "plan/CameraKeyframe.hpp"
#include "plan/PathParameters.hpp"
#include "plan/Preset.hpp"

namespace skyshot::plan {

enum class Platform {
  kDrone,
  kHelicopter,
  kEither,
};

const char* PlatformName(Platform platform);

struct KinematicProfile {
  std::size_t segment_count{0};
  double avg_horizontal_speed_mps{0.0};
  double min_horizontal_speed_mps{0.0};
  double max_horizontal_speed_mps{0.0};
  double max_vertical_rate_mps{0.0};
  double min_altitude_m{0.0};
  double max_altitude_m{0.0};
  double mean_altitude_m{0.0};
  double horizontal_path_length_m{0.0};
};

struct Recommendation {
  Platform platform{Platform::kEither};
  double confidence{0.0};
  std::vector<std::string> reasons{};
};

struct ShotMetadata {
  std::optional<KinematicProfile> kinematics{};
  std::optional<Recommendation> recommendation{};
  std::vector<std::string> warnings{};
};

struct ShotPlan {
  std::string id;
  std::size_t index{0};
  std::string title;
  std::optional<Preset> preset{};  // empty for imported tracks
  double duration_s{0.0};
  double frame_rate{0.0};
  PathParameters parameters{};
  KeyframeSequence keyframes{};
  ShotMetadata metadata{};
};

// Preset title, or "Imported track" for shots without a preset.
inline const char* ShotKindTitle(const ShotPlan& shot) {
  return shot.preset ? PresetTitle(*shot.preset) : "Imported track";
}

}  // namespace skyshot::plan
