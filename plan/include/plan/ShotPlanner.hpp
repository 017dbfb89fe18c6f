#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/math/Geodesy.hpp"
#include "plan/PathGenerator.hpp"
#include "plan/PathParameters.hpp"
#include "plan/PlannerConfig.hpp"
#include "plan/PlatformRecommender.hpp"
#include "plan/Preset.hpp"
#include "plan/PresetRegistry.hpp"
#include "plan/ShotPlan.hpp"

namespace skyshot::plan {

// Values that replace the sampled ones for a single shot.
struct ShotOverride {
  std::optional<Preset> preset{};
  std::optional<double> duration_s{};
  std::optional<Range> radius_m{};
  std::optional<Range> altitude_m{};
  std::optional<Range> azimuth_deg{};
  std::optional<Range> tilt_deg{};
  std::optional<Easing> easing{};
};

struct ShotRequest {
  geo::GeoPoint location{};
  std::size_t shot_count{1};
  double duration_s{8.0};
  std::optional<double> frame_rate{};
  std::map<std::size_t, ShotOverride> overrides{};  // keyed by shot index
};

struct ShotFailure {
  std::size_t index{0};
  ErrorKind kind{ErrorKind::kInvalidParameter};
  std::string message;
};

struct PlanBatch {
  std::vector<ShotPlan> shots;          // ascending index
  std::vector<ShotFailure> failures;    // ascending index
  std::vector<std::size_t> cancelled;   // indices never generated

  bool complete() const { return failures.empty() && cancelled.empty(); }
};

// 64-bit FNV-1a over the location (quantized to 1e-7 deg), shot index and
// attempt number.
std::uint64_t ShotSeed(const geo::GeoPoint& location, std::uint64_t index,
                       std::uint64_t attempt);

class ShotPlanner {
 public:
  ShotPlanner(const PresetRegistry& registry, PlannerConfig config,
              RecommenderThresholds thresholds = {});

  // Throws Error(kInvalidParameter) when the request as a whole is unusable
  // (location, shot count, duration, frame rate). Problems with individual
  // shots end up in PlanBatch::failures instead.
  PlanBatch Plan(const ShotRequest& request, std::stop_token stop = {},
                 logging::LogSink* log = nullptr) const;

  // Preset assigned to each shot index before overrides.
  std::vector<Preset> PresetSequence(const geo::GeoPoint& location, std::size_t count) const;

  const PlannerConfig& config() const { return config_; }

 private:
  struct Prepared;

  Prepared Prepare(const ShotRequest& request, std::size_t index, Preset preset,
                   double frame_rate, std::map<Preset, std::vector<PathParameters>>& accepted,
                   logging::LogSink* log) const;

  const PresetRegistry& registry_;
  PlannerConfig config_;
  RecommenderThresholds thresholds_;
  PathGenerator generator_;
};

}  // namespace skyshot::plan
