#pragma once

#include "plan/CameraKeyframe.hpp"
#include "plan/ShotPlan.hpp"

namespace skyshot::plan {

struct PlatformEnvelope {
  double max_altitude_m{0.0};
  double max_speed_mps{0.0};
  double max_vertical_rate_mps{0.0};
};

struct RecommenderThresholds {
  // Comfortable operating envelope of a camera drone.
  PlatformEnvelope drone_envelope{120.0, 15.0, 5.0};
  // Beyond any of these only a helicopter can fly the shot.
  PlatformEnvelope drone_hard_limit{400.0, 25.0, 10.0};
  double plausible_max_speed_mps{150.0};
};

// Finite differences over consecutive keyframes. Segments with a
// non-positive time step are ignored.
KinematicProfile ComputeKinematicProfile(const KeyframeSequence& keyframes);

Recommendation Recommend(const KinematicProfile& profile, const RecommenderThresholds& thresholds);
Recommendation Recommend(const KeyframeSequence& keyframes,
                         const RecommenderThresholds& thresholds);

// Fills shot.metadata.kinematics and shot.metadata.recommendation; keyframes
// are left untouched.
void AnnotateShot(ShotPlan& shot, const RecommenderThresholds& thresholds);

}  // namespace skyshot::plan
