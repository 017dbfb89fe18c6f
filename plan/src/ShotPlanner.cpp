#include "plan/ShotPlanner.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <random>
#include <sstream>
#include <utility>

#include "common/task_pool.hpp"

namespace skyshot::plan {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
// Distinguishes cycle rotation seeds from parameter seeds.
constexpr std::uint64_t kRotationSalt = 0x9E3779B97F4A7C15ULL;

std::uint64_t MixWord(std::uint64_t hash, std::uint64_t word) {
  for (int byte = 0; byte < 8; ++byte) {
    hash ^= (word >> (8 * byte)) & 0xFFu;
    hash *= kFnvPrime;
  }
  return hash;
}

class UniformSampler {
 public:
  explicit UniformSampler(std::uint64_t seed) : rng_(seed) {}

  double Next() { return static_cast<double>(rng_() >> 11) * 0x1.0p-53; }
  double In(const Interval& interval) { return interval.min + interval.width() * Next(); }

 private:
  std::mt19937_64 rng_;
};

double Normalized(double value, const Interval& interval) {
  return interval.width() > 0.0 ? (value - interval.min) / interval.width() : 0.0;
}

Interval Span(const Interval& a, const Interval& b) {
  return Interval{std::min(a.min, b.min), std::max(a.max, b.max)};
}

// Distance between two parameter sets of the same preset, each component
// scaled by its sampling interval.
double ParameterDistance(const PathParameters& a, const PathParameters& b,
                         const PresetRanges& ranges) {
  const Interval radius = Span(ranges.start_radius_m, ranges.end_radius_m);
  const Interval altitude = Span(ranges.start_altitude_m, ranges.end_altitude_m);
  const Interval tilt = Span(ranges.start_tilt_deg, ranges.end_tilt_deg);

  auto mean = [](const Range& r) { return 0.5 * (r.start + r.end); };
  const double dr = Normalized(mean(a.radius_m), radius) - Normalized(mean(b.radius_m), radius);
  const double dh =
      Normalized(mean(a.altitude_m), altitude) - Normalized(mean(b.altitude_m), altitude);
  const double dt = Normalized(mean(a.tilt_deg), tilt) - Normalized(mean(b.tilt_deg), tilt);
  const double ds = Normalized(a.azimuth_deg.span(), ranges.sweep_deg) -
                    Normalized(b.azimuth_deg.span(), ranges.sweep_deg);
  const double da = geo::AngleDelta(a.azimuth_deg.start, b.azimuth_deg.start) / 180.0;
  return std::sqrt(dr * dr + dh * dh + dt * dt + ds * ds + da * da);
}

std::string OutsideMessage(const char* field, double value, const Interval& interval) {
  char buffer[192];
  std::snprintf(buffer, sizeof(buffer),
                "override %s=%.3f is outside the sampling interval [%.3f, %.3f]", field, value,
                interval.min, interval.max);
  return buffer;
}

void CheckOverride(const char* field, double value, const Interval& interval,
                   std::vector<std::string>& warnings) {
  if (!interval.contains(value)) {
    warnings.push_back(OutsideMessage(field, value, interval));
  }
}

PathParameters SampleParameters(const geo::GeoPoint& center, const PresetRanges& ranges,
                                UniformSampler& sampler) {
  PathParameters p;
  p.center = center;
  p.radius_m.start = sampler.In(ranges.start_radius_m);
  p.radius_m.end = ranges.hold_radius ? p.radius_m.start : sampler.In(ranges.end_radius_m);
  p.altitude_m.start = sampler.In(ranges.start_altitude_m);
  p.altitude_m.end =
      ranges.hold_altitude ? p.altitude_m.start : sampler.In(ranges.end_altitude_m);
  p.azimuth_deg.start = 360.0 * sampler.Next();
  p.azimuth_deg.end = p.azimuth_deg.start + sampler.In(ranges.sweep_deg);
  p.tilt_deg.start = sampler.In(ranges.start_tilt_deg);
  p.tilt_deg.end = sampler.In(ranges.end_tilt_deg);
  p.easing = ranges.easing;
  return p;
}

void ApplyOverride(const ShotOverride& ov, const PresetRanges& ranges, PathParameters& p,
                   std::vector<std::string>* warnings) {
  if (ov.radius_m) {
    p.radius_m = *ov.radius_m;
    if (warnings) {
      CheckOverride("radius_m.start", p.radius_m.start, ranges.start_radius_m, *warnings);
      CheckOverride("radius_m.end", p.radius_m.end, ranges.end_radius_m, *warnings);
    }
  }
  if (ov.altitude_m) {
    p.altitude_m = *ov.altitude_m;
    if (warnings) {
      CheckOverride("altitude_m.start", p.altitude_m.start, ranges.start_altitude_m, *warnings);
      CheckOverride("altitude_m.end", p.altitude_m.end, ranges.end_altitude_m, *warnings);
    }
  }
  if (ov.azimuth_deg) {
    p.azimuth_deg = *ov.azimuth_deg;
    if (warnings) {
      CheckOverride("azimuth sweep", p.azimuth_deg.span(), ranges.sweep_deg, *warnings);
    }
  }
  if (ov.tilt_deg) {
    p.tilt_deg = *ov.tilt_deg;
    if (warnings) {
      CheckOverride("tilt_deg.start", p.tilt_deg.start, ranges.start_tilt_deg, *warnings);
      CheckOverride("tilt_deg.end", p.tilt_deg.end, ranges.end_tilt_deg, *warnings);
    }
  }
  if (ov.easing) {
    p.easing = *ov.easing;
  }
}

std::string ShotId(std::size_t index, Preset preset) {
  return "shot_" + std::to_string(index) + "_" + PresetName(preset);
}

}  // namespace

struct ShotPlanner::Prepared {
  std::size_t index{0};
  Preset preset{Preset::kOrbit};
  double duration_s{0.0};
  double frame_rate{0.0};
  PathParameters parameters{};
  SampleTiming timing{};
  std::vector<std::string> warnings{};
};

std::uint64_t ShotSeed(const geo::GeoPoint& location, std::uint64_t index,
                       std::uint64_t attempt) {
  const auto lat = static_cast<std::int64_t>(std::llround(location.latitude_deg * 1e7));
  const auto lon = static_cast<std::int64_t>(std::llround(location.longitude_deg * 1e7));
  std::uint64_t hash = kFnvOffset;
  hash = MixWord(hash, static_cast<std::uint64_t>(lat));
  hash = MixWord(hash, static_cast<std::uint64_t>(lon));
  hash = MixWord(hash, index);
  hash = MixWord(hash, attempt);
  return hash;
}

ShotPlanner::ShotPlanner(const PresetRegistry& registry, PlannerConfig config,
                         RecommenderThresholds thresholds)
    : registry_(registry),
      config_(std::move(config)),
      thresholds_(thresholds),
      generator_(registry_, GeneratorLimits{config_.terrain_clearance_m, config_.min_samples}) {}

std::vector<Preset> ShotPlanner::PresetSequence(const geo::GeoPoint& location,
                                                std::size_t count) const {
  std::vector<Preset> order = config_.preset_order;
  if (order.empty()) {
    order.assign(kAllPresets.begin(), kAllPresets.end());
  }
  const std::size_t m = order.size();

  std::vector<Preset> sequence;
  sequence.reserve(count);
  for (std::size_t cycle = 0; sequence.size() < count; ++cycle) {
    std::size_t offset = 0;
    if (cycle > 0) {
      offset = static_cast<std::size_t>(ShotSeed(location, cycle, kRotationSalt) % m);
      if (m > 1 && order[offset] == sequence.back()) {
        offset = (offset + 1) % m;
      }
    }
    for (std::size_t k = 0; k < m && sequence.size() < count; ++k) {
      sequence.push_back(order[(offset + k) % m]);
    }
  }
  return sequence;
}

ShotPlanner::Prepared ShotPlanner::Prepare(
    const ShotRequest& request, std::size_t index, Preset preset, double frame_rate,
    std::map<Preset, std::vector<PathParameters>>& accepted, logging::LogSink* log) const {
  const auto override_it = request.overrides.find(index);
  const ShotOverride* ov = override_it == request.overrides.end() ? nullptr : &override_it->second;

  Prepared prepared;
  prepared.index = index;
  prepared.preset = preset;
  prepared.frame_rate = frame_rate;
  prepared.duration_s = (ov && ov->duration_s) ? *ov->duration_s : request.duration_s;

  if (!registry_.Contains(preset)) {
    throw Error(ErrorKind::kUnsupportedPreset,
                std::string("preset '") + PresetName(preset) + "' is not registered");
  }
  const auto ranges_it = config_.ranges.find(preset);
  if (ranges_it == config_.ranges.end()) {
    throw Error(ErrorKind::kUnsupportedPreset,
                std::string("no sampling ranges configured for preset '") + PresetName(preset) +
                    "'");
  }
  const PresetRanges& ranges = ranges_it->second;

  prepared.timing.duration_s = prepared.duration_s;
  prepared.timing.sample_count =
      SampleCountFor(prepared.duration_s, frame_rate, config_.min_samples);

  std::vector<PathParameters>& siblings = accepted[preset];
  const std::size_t max_attempts = std::max<std::size_t>(config_.diversity.max_attempts, 1);

  PathParameters best{};
  double best_distance = -1.0;
  bool diverse = false;
  for (std::size_t attempt = 0; attempt < max_attempts; ++attempt) {
    UniformSampler sampler(ShotSeed(request.location, index, attempt));
    PathParameters candidate = SampleParameters(request.location, ranges, sampler);
    if (ov) {
      ApplyOverride(*ov, ranges, candidate, nullptr);
    }

    double nearest = std::numeric_limits<double>::infinity();
    for (const auto& other : siblings) {
      nearest = std::min(nearest, ParameterDistance(candidate, other, ranges));
    }
    if (nearest > best_distance) {
      best_distance = nearest;
      best = candidate;
    }
    if (nearest > config_.diversity.min_distance) {
      diverse = true;
      break;
    }
  }

  if (!diverse) {
    char buffer[192];
    std::snprintf(buffer, sizeof(buffer),
                  "no candidate farther than %.3f from earlier %s shots after %zu attempts; "
                  "kept the farthest (%.3f)",
                  config_.diversity.min_distance, PresetName(preset), max_attempts,
                  best_distance);
    prepared.warnings.push_back(buffer);
    logging::Logf(log, logging::Level::kWarning, "shot %zu: %s", index, buffer);
  }
  if (ov) {
    ApplyOverride(*ov, ranges, best, &prepared.warnings);
  }

  ValidatePathParameters(best, prepared.timing);
  prepared.parameters = best;
  siblings.push_back(best);
  return prepared;
}

PlanBatch ShotPlanner::Plan(const ShotRequest& request, std::stop_token stop,
                            logging::LogSink* log) const {
  if (!geo::IsValid(request.location)) {
    std::ostringstream oss;
    oss << "location (" << request.location.latitude_deg << ", "
        << request.location.longitude_deg << ") is outside [-90,90] x [-180,180]";
    throw Error(ErrorKind::kInvalidParameter, oss.str());
  }
  if (request.shot_count == 0) {
    throw Error(ErrorKind::kInvalidParameter, "shot_count must be at least 1");
  }
  if (!std::isfinite(request.duration_s) || request.duration_s <= 0.0) {
    throw Error(ErrorKind::kInvalidParameter,
                "duration_s must be positive, got " + std::to_string(request.duration_s));
  }
  const double frame_rate = request.frame_rate.value_or(config_.frame_rate);
  if (!std::isfinite(frame_rate) || frame_rate <= 0.0) {
    throw Error(ErrorKind::kInvalidParameter,
                "frame_rate must be positive, got " + std::to_string(frame_rate));
  }

  const std::size_t count = request.shot_count;
  logging::Logf(log, logging::Level::kInfo, "planning %zu shots at (%.7f, %.7f)", count,
                request.location.latitude_deg, request.location.longitude_deg);

  std::vector<Preset> sequence = PresetSequence(request.location, count);
  for (const auto& [index, ov] : request.overrides) {
    if (index >= count) {
      logging::Logf(log, logging::Level::kWarning,
                    "override for shot %zu ignored: only %zu shots requested", index, count);
      continue;
    }
    if (ov.preset) {
      sequence[index] = *ov.preset;
    }
  }

  // Parameter selection depends on earlier shots, so it runs in index order.
  std::vector<std::optional<Prepared>> prepared(count);
  std::vector<std::optional<ShotFailure>> failures(count);
  std::map<Preset, std::vector<PathParameters>> accepted;
  for (std::size_t i = 0; i < count; ++i) {
    try {
      prepared[i] = Prepare(request, i, sequence[i], frame_rate, accepted, log);
    } catch (const Error& e) {
      failures[i] = ShotFailure{i, e.kind(), e.detail()};
      logging::Logf(log, logging::Level::kError, "shot %zu rejected: %s", i, e.what());
    }
  }

  enum class State { kPending, kDone, kFailed, kCancelled };
  std::vector<State> states(count, State::kPending);
  std::vector<ShotPlan> plans(count);

  {
    const std::size_t workers =
        config_.worker_count == 0 ? 0 : std::min(config_.worker_count, count);
    TaskPool pool(workers);
    for (std::size_t i = 0; i < count; ++i) {
      if (!prepared[i]) {
        states[i] = State::kFailed;
        continue;
      }
      const bool queued = pool.submit([&, i](std::stop_token pool_stop) {
        if (stop.stop_requested() || pool_stop.stop_requested()) {
          states[i] = State::kCancelled;
          return;
        }
        const Prepared& p = *prepared[i];
        try {
          GeneratedPath path = generator_.Generate(p.preset, p.parameters, p.timing);

          ShotPlan& shot = plans[i];
          shot.id = ShotId(p.index, p.preset);
          shot.index = p.index;
          shot.title = std::string(PresetTitle(p.preset)) + " #" + std::to_string(p.index + 1);
          shot.preset = p.preset;
          shot.duration_s = p.duration_s;
          shot.frame_rate = p.frame_rate;
          shot.parameters = p.parameters;
          shot.keyframes = std::move(path.keyframes);
          shot.metadata.warnings = p.warnings;
          shot.metadata.warnings.insert(shot.metadata.warnings.end(), path.warnings.begin(),
                                        path.warnings.end());
          AnnotateShot(shot, thresholds_);
          states[i] = State::kDone;
          logging::Logf(log, logging::Level::kInfo, "generated %s with %zu keyframes (%s)",
                        shot.id.c_str(), shot.keyframes.size(),
                        PlatformName(shot.metadata.recommendation->platform));
        } catch (const Error& e) {
          failures[i] = ShotFailure{i, e.kind(), e.detail()};
          states[i] = State::kFailed;
          logging::Logf(log, logging::Level::kError, "shot %zu failed: %s", i, e.what());
        } catch (const std::exception& e) {
          failures[i] = ShotFailure{i, ErrorKind::kInvalidParameter, e.what()};
          states[i] = State::kFailed;
          logging::Logf(log, logging::Level::kError, "shot %zu failed: %s", i, e.what());
        }
      });
      if (!queued) {
        states[i] = State::kCancelled;
      }
    }
    pool.shutdown();
  }

  PlanBatch batch;
  for (std::size_t i = 0; i < count; ++i) {
    switch (states[i]) {
      case State::kDone:
        batch.shots.push_back(std::move(plans[i]));
        break;
      case State::kFailed:
        if (failures[i]) {
          batch.failures.push_back(std::move(*failures[i]));
        }
        break;
      case State::kCancelled:
      case State::kPending:
        batch.cancelled.push_back(i);
        break;
    }
  }

  logging::Logf(log, batch.complete() ? logging::Level::kInfo : logging::Level::kWarning,
                "planned %zu of %zu shots (%zu failed, %zu cancelled)", batch.shots.size(), count,
                batch.failures.size(), batch.cancelled.size());
  return batch;
}

}  // namespace skyshot::plan
