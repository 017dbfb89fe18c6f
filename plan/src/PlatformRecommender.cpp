#include "plan/PlatformRecommender.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <limits>
#include <string>

#include "common/math/Geodesy.hpp"

namespace skyshot::plan {
namespace {

struct Metric {
  const char* label;
  const char* unit;
  double value;
  double envelope;
  double hard_limit;
};

std::array<Metric, 3> MetricsOf(const KinematicProfile& profile,
                                const RecommenderThresholds& thresholds) {
  const auto& env = thresholds.drone_envelope;
  const auto& hard = thresholds.drone_hard_limit;
  return {{
      {"max altitude", "m", profile.max_altitude_m, env.max_altitude_m, hard.max_altitude_m},
      {"max horizontal speed", "m/s", profile.max_horizontal_speed_mps, env.max_speed_mps,
       hard.max_speed_mps},
      {"max vertical rate", "m/s", profile.max_vertical_rate_mps, env.max_vertical_rate_mps,
       hard.max_vertical_rate_mps},
  }};
}

std::string Describe(const Metric& m, const char* relation, double bound) {
  char buffer[160];
  std::snprintf(buffer, sizeof(buffer), "%s %.1f %s %s %.1f %s", m.label, m.value, m.unit,
                relation, bound, m.unit);
  return buffer;
}

double Clamp01(double value) {
  if (!std::isfinite(value)) {
    return 0.0;
  }
  return std::clamp(value, 0.0, 1.0);
}

double SafeRatio(double numerator, double denominator) {
  return denominator > 0.0 ? numerator / denominator : 0.0;
}

}  // namespace

const char* PlatformName(Platform platform) {
  switch (platform) {
    case Platform::kDrone:
      return "drone";
    case Platform::kHelicopter:
      return "helicopter";
    case Platform::kEither:
      return "either";
  }
  return "either";
}

KinematicProfile ComputeKinematicProfile(const KeyframeSequence& keyframes) {
  KinematicProfile profile;
  if (keyframes.empty()) {
    return profile;
  }

  double altitude_sum = 0.0;
  profile.min_altitude_m = keyframes.front().altitude_m;
  profile.max_altitude_m = keyframes.front().altitude_m;
  for (const auto& k : keyframes) {
    profile.min_altitude_m = std::min(profile.min_altitude_m, k.altitude_m);
    profile.max_altitude_m = std::max(profile.max_altitude_m, k.altitude_m);
    altitude_sum += k.altitude_m;
  }
  profile.mean_altitude_m = altitude_sum / static_cast<double>(keyframes.size());

  double moving_time = 0.0;
  double min_speed = std::numeric_limits<double>::infinity();
  for (std::size_t i = 1; i < keyframes.size(); ++i) {
    const CameraKeyframe& a = keyframes[i - 1];
    const CameraKeyframe& b = keyframes[i];
    const double dt = b.time_s - a.time_s;
    if (!(dt > 0.0)) {
      continue;
    }
    const double ground = geo::GreatCircleDistance(a.horizontal(), b.horizontal());
    const double speed = ground / dt;
    const double vertical = std::abs(b.altitude_m - a.altitude_m) / dt;

    ++profile.segment_count;
    moving_time += dt;
    profile.horizontal_path_length_m += ground;
    min_speed = std::min(min_speed, speed);
    profile.max_horizontal_speed_mps = std::max(profile.max_horizontal_speed_mps, speed);
    profile.max_vertical_rate_mps = std::max(profile.max_vertical_rate_mps, vertical);
  }
  if (profile.segment_count > 0) {
    profile.min_horizontal_speed_mps = min_speed;
    profile.avg_horizontal_speed_mps = profile.horizontal_path_length_m / moving_time;
  }
  return profile;
}

Recommendation Recommend(const KinematicProfile& profile,
                         const RecommenderThresholds& thresholds) {
  Recommendation rec;
  if (profile.segment_count == 0) {
    rec.platform = Platform::kEither;
    rec.confidence = 0.0;
    rec.reasons.push_back("no moving segments to evaluate");
    return rec;
  }

  const auto metrics = MetricsOf(profile, thresholds);

  bool any_above_hard = false;
  bool all_within_envelope = true;
  for (const auto& m : metrics) {
    any_above_hard = any_above_hard || m.value > m.hard_limit;
    all_within_envelope = all_within_envelope && m.value <= m.envelope;
  }

  if (any_above_hard) {
    rec.platform = Platform::kHelicopter;
    double excess = 0.0;
    for (const auto& m : metrics) {
      if (m.value > m.hard_limit) {
        excess = std::max(excess, SafeRatio(m.value - m.hard_limit, m.hard_limit));
        rec.reasons.push_back(Describe(m, "exceeds drone limit", m.hard_limit));
      }
    }
    rec.confidence = Clamp01(excess);
    return rec;
  }

  if (all_within_envelope) {
    rec.platform = Platform::kDrone;
    double headroom = 1.0;
    for (const auto& m : metrics) {
      headroom = std::min(headroom, SafeRatio(m.envelope - m.value, m.envelope));
      rec.reasons.push_back(Describe(m, "within drone envelope", m.envelope));
    }
    rec.confidence = Clamp01(headroom);
    return rec;
  }

  // Somewhere between the envelope and the hard limit.
  rec.platform = Platform::kEither;
  double nearest = 1.0;
  for (const auto& m : metrics) {
    if (m.value <= m.envelope) {
      continue;
    }
    const double half_band = 0.5 * (m.hard_limit - m.envelope);
    const double to_boundary = std::min(m.value - m.envelope, m.hard_limit - m.value);
    nearest = std::min(nearest, SafeRatio(to_boundary, half_band));
    rec.reasons.push_back(Describe(m, "above drone envelope", m.envelope));
  }
  rec.confidence = Clamp01(nearest);
  return rec;
}

Recommendation Recommend(const KeyframeSequence& keyframes,
                         const RecommenderThresholds& thresholds) {
  return Recommend(ComputeKinematicProfile(keyframes), thresholds);
}

void AnnotateShot(ShotPlan& shot, const RecommenderThresholds& thresholds) {
  const KinematicProfile profile = ComputeKinematicProfile(shot.keyframes);

  const bool finite = std::isfinite(profile.avg_horizontal_speed_mps) &&
                      std::isfinite(profile.max_horizontal_speed_mps) &&
                      std::isfinite(profile.max_vertical_rate_mps) &&
                      std::isfinite(profile.mean_altitude_m) &&
                      std::isfinite(profile.horizontal_path_length_m);
  if (!finite) {
    shot.metadata.warnings.push_back("kinematic profile contains non-finite values");
  } else if (profile.max_horizontal_speed_mps > thresholds.plausible_max_speed_mps) {
    char buffer[160];
    std::snprintf(buffer, sizeof(buffer),
                  "max horizontal speed %.1f m/s exceeds plausible limit %.1f m/s",
                  profile.max_horizontal_speed_mps, thresholds.plausible_max_speed_mps);
    shot.metadata.warnings.push_back(buffer);
  }

  shot.metadata.recommendation = Recommend(profile, thresholds);
  shot.metadata.kinematics = profile;
}

}  // namespace skyshot::plan
