#include "config/SkyshotConfig.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <set>
#include <sstream>

#include "common/errors.hpp"
#include "plan/Easing.hpp"
#include "plan/Preset.hpp"

namespace skyshot::config {
namespace {

using plan::Interval;
using plan::PresetRanges;

std::string BuildInvalidFieldMessage(const std::string& source, const std::string& field) {
  std::ostringstream oss;
  oss << "Invalid value for '" << field << "' in " << source;
  return oss.str();
}

[[noreturn]] void Invalid(const std::string& source, const std::string& field) {
  throw Error(ErrorKind::kConfigError, BuildInvalidFieldMessage(source, field));
}

std::string Join(const std::string& prefix, const char* key) {
  return prefix.empty() ? std::string(key) : prefix + "." + key;
}

template <typename T>
T ReadScalar(const YAML::Node& node, const char* key, T def, const std::string& source,
             const std::string& prefix) {
  if (!node || !node[key]) {
    return def;
  }
  const YAML::Node value = node[key];
  if (!value.IsScalar()) {
    Invalid(source, Join(prefix, key));
  }
  try {
    return value.as<T>();
  } catch (const YAML::BadConversion&) {
    Invalid(source, Join(prefix, key));
  }
}

std::string ReadString(const YAML::Node& node, const char* key, const std::string& def,
                       const std::string& source, const std::string& prefix) {
  return ReadScalar<std::string>(node, key, def, source, prefix);
}

Interval ReadInterval(const YAML::Node& node, const char* key, Interval def,
                      const std::string& source, const std::string& prefix) {
  if (!node || !node[key]) {
    return def;
  }
  const YAML::Node value = node[key];
  if (!value.IsSequence() || value.size() != 2) {
    Invalid(source, Join(prefix, key));
  }
  try {
    return Interval{value[0].as<double>(), value[1].as<double>()};
  } catch (const YAML::BadConversion&) {
    Invalid(source, Join(prefix, key));
  }
}

std::vector<std::string> ReadStringList(const YAML::Node& node, const char* key,
                                        const std::vector<std::string>& def,
                                        const std::string& source, const std::string& prefix) {
  if (!node || !node[key]) {
    return def;
  }
  const YAML::Node value = node[key];
  if (!value.IsSequence()) {
    Invalid(source, Join(prefix, key));
  }
  std::vector<std::string> out;
  for (const auto& item : value) {
    if (!item.IsScalar()) {
      Invalid(source, Join(prefix, key));
    }
    out.push_back(item.Scalar());
  }
  return out;
}

YAML::Node Section(const YAML::Node& root, const char* key, const std::string& source,
                   const std::string& prefix) {
  if (!root || !root[key]) {
    return YAML::Node();
  }
  const YAML::Node node = root[key];
  if (!node.IsMap()) {
    Invalid(source, Join(prefix, key));
  }
  return node;
}

plan::Easing ReadEasing(const YAML::Node& node, plan::Easing def, const std::string& source,
                        const std::string& prefix) {
  const std::string name = ReadString(node, "easing", plan::EasingName(def), source, prefix);
  try {
    return plan::ParseEasing(name);
  } catch (const Error&) {
    Invalid(source, Join(prefix, "easing"));
  }
}

PresetRanges ReadPresetRanges(const YAML::Node& node, PresetRanges ranges,
                              const std::string& source, const std::string& prefix) {
  ranges.start_radius_m = ReadInterval(node, "start_radius_m", ranges.start_radius_m, source, prefix);
  ranges.end_radius_m = ReadInterval(node, "end_radius_m", ranges.end_radius_m, source, prefix);
  ranges.start_altitude_m =
      ReadInterval(node, "start_altitude_m", ranges.start_altitude_m, source, prefix);
  ranges.end_altitude_m =
      ReadInterval(node, "end_altitude_m", ranges.end_altitude_m, source, prefix);
  ranges.sweep_deg = ReadInterval(node, "sweep_deg", ranges.sweep_deg, source, prefix);
  ranges.start_tilt_deg = ReadInterval(node, "start_tilt_deg", ranges.start_tilt_deg, source, prefix);
  ranges.end_tilt_deg = ReadInterval(node, "end_tilt_deg", ranges.end_tilt_deg, source, prefix);
  ranges.hold_radius = ReadScalar<bool>(node, "hold_radius", ranges.hold_radius, source, prefix);
  ranges.hold_altitude =
      ReadScalar<bool>(node, "hold_altitude", ranges.hold_altitude, source, prefix);
  ranges.easing = ReadEasing(node, ranges.easing, source, prefix);
  return ranges;
}

plan::PlatformEnvelope ReadEnvelope(const YAML::Node& node, plan::PlatformEnvelope env,
                                    const std::string& source, const std::string& prefix) {
  env.max_altitude_m = ReadScalar(node, "max_altitude_m", env.max_altitude_m, source, prefix);
  env.max_speed_mps = ReadScalar(node, "max_speed_mps", env.max_speed_mps, source, prefix);
  env.max_vertical_rate_mps =
      ReadScalar(node, "max_vertical_rate_mps", env.max_vertical_rate_mps, source, prefix);
  return env;
}

void ReadPlanner(const YAML::Node& root, plan::PlannerConfig& planner, const std::string& source) {
  const YAML::Node node = Section(root, "planner", source, "");
  const std::string prefix = "planner";
  planner.frame_rate = ReadScalar(node, "frame_rate", planner.frame_rate, source, prefix);
  planner.min_samples = ReadScalar(node, "min_samples", planner.min_samples, source, prefix);
  planner.terrain_clearance_m =
      ReadScalar(node, "terrain_clearance_m", planner.terrain_clearance_m, source, prefix);
  planner.worker_count = ReadScalar(node, "worker_count", planner.worker_count, source, prefix);

  const YAML::Node diversity = Section(node, "diversity", source, prefix);
  const std::string diversity_prefix = Join(prefix, "diversity");
  planner.diversity.min_distance = ReadScalar(diversity, "min_distance",
                                              planner.diversity.min_distance, source,
                                              diversity_prefix);
  planner.diversity.max_attempts = ReadScalar(diversity, "max_attempts",
                                              planner.diversity.max_attempts, source,
                                              diversity_prefix);

  if (node && node["preset_order"]) {
    const auto names = ReadStringList(node, "preset_order", {}, source, prefix);
    planner.preset_order.clear();
    for (const auto& name : names) {
      try {
        planner.preset_order.push_back(plan::ParsePreset(name));
      } catch (const Error&) {
        Invalid(source, Join(prefix, "preset_order") + "' entry '" + name);
      }
    }
  }

  const YAML::Node presets = Section(node, "presets", source, prefix);
  if (presets) {
    for (const auto& entry : presets) {
      const std::string name = entry.first.as<std::string>();
      const std::string preset_prefix = Join(Join(prefix, "presets"), name.c_str());
      plan::Preset preset{};
      try {
        preset = plan::ParsePreset(name);
      } catch (const Error&) {
        Invalid(source, preset_prefix);
      }
      if (!entry.second.IsMap()) {
        Invalid(source, preset_prefix);
      }
      planner.ranges[preset] =
          ReadPresetRanges(entry.second, planner.ranges[preset], source, preset_prefix);
    }
  }
}

// A [start, end] pair, or one number used for both ends.
std::optional<plan::Range> ReadRange(const YAML::Node& node, const char* key,
                                     const std::string& source, const std::string& prefix) {
  if (!node[key]) {
    return std::nullopt;
  }
  const YAML::Node value = node[key];
  if (!value.IsScalar() && !(value.IsSequence() && value.size() == 2)) {
    Invalid(source, Join(prefix, key));
  }
  try {
    if (value.IsScalar()) {
      const double v = value.as<double>();
      return plan::Range{v, v};
    }
    return plan::Range{value[0].as<double>(), value[1].as<double>()};
  } catch (const YAML::BadConversion&) {
    Invalid(source, Join(prefix, key));
  }
}

std::map<std::size_t, plan::ShotOverride> ReadShotOverrides(const YAML::Node& root,
                                                            const std::string& source) {
  std::map<std::size_t, plan::ShotOverride> overrides;
  if (!root["shots"]) {
    return overrides;
  }
  const YAML::Node shots = root["shots"];
  if (!shots.IsSequence()) {
    Invalid(source, "shots");
  }
  for (std::size_t i = 0; i < shots.size(); ++i) {
    const YAML::Node entry = shots[i];
    const std::string prefix = "shots[" + std::to_string(i) + "]";
    if (!entry.IsMap() || !entry["index"]) {
      throw Error(ErrorKind::kConfigError,
                  "Missing required field '" + Join(prefix, "index") + "' in " + source);
    }
    const auto index = ReadScalar<std::size_t>(entry, "index", 0, source, prefix);

    plan::ShotOverride ov;
    if (entry["preset"]) {
      const std::string name = ReadString(entry, "preset", "", source, prefix);
      try {
        ov.preset = plan::ParsePreset(name);
      } catch (const Error&) {
        Invalid(source, Join(prefix, "preset"));
      }
    }
    if (entry["duration_s"]) {
      ov.duration_s = ReadScalar<double>(entry, "duration_s", 0.0, source, prefix);
    }
    ov.radius_m = ReadRange(entry, "radius_m", source, prefix);
    ov.altitude_m = ReadRange(entry, "altitude_m", source, prefix);
    ov.azimuth_deg = ReadRange(entry, "azimuth_deg", source, prefix);
    ov.tilt_deg = ReadRange(entry, "tilt_deg", source, prefix);
    if (entry["easing"]) {
      ov.easing = ReadEasing(entry, plan::Easing::kSmoothstep, source, prefix);
    }

    if (!overrides.emplace(index, ov).second) {
      Invalid(source, Join(prefix, "index"));
    }
  }
  return overrides;
}

void ValidatePositive(double value, const std::string& source, const std::string& field) {
  if (!std::isfinite(value) || value <= 0.0) {
    Invalid(source, field);
  }
}

void ValidateNonNegative(double value, const std::string& source, const std::string& field) {
  if (!std::isfinite(value) || value < 0.0) {
    Invalid(source, field);
  }
}

void ValidateInterval(const Interval& interval, const std::string& source,
                      const std::string& field) {
  if (!std::isfinite(interval.min) || !std::isfinite(interval.max) ||
      interval.min > interval.max) {
    Invalid(source, field);
  }
}

void ValidateEnvelope(const plan::PlatformEnvelope& env, const std::string& source,
                      const std::string& prefix) {
  ValidatePositive(env.max_altitude_m, source, prefix + ".max_altitude_m");
  ValidatePositive(env.max_speed_mps, source, prefix + ".max_speed_mps");
  ValidatePositive(env.max_vertical_rate_mps, source, prefix + ".max_vertical_rate_mps");
}

}  // namespace

void ValidateSkyshotConfig(const SkyshotConfig& config, const std::string& source) {
  const plan::PlannerConfig& planner = config.planner;
  ValidatePositive(planner.frame_rate, source, "planner.frame_rate");
  if (planner.min_samples < 2) {
    Invalid(source, "planner.min_samples");
  }
  ValidateNonNegative(planner.terrain_clearance_m, source, "planner.terrain_clearance_m");
  ValidateNonNegative(planner.diversity.min_distance, source, "planner.diversity.min_distance");
  if (planner.diversity.max_attempts < 1) {
    Invalid(source, "planner.diversity.max_attempts");
  }

  if (planner.preset_order.empty()) {
    Invalid(source, "planner.preset_order");
  }
  std::set<plan::Preset> seen;
  for (const plan::Preset preset : planner.preset_order) {
    if (!seen.insert(preset).second) {
      Invalid(source, "planner.preset_order");
    }
    if (planner.ranges.find(preset) == planner.ranges.end()) {
      Invalid(source, std::string("planner.presets.") + plan::PresetName(preset));
    }
  }

  for (const auto& [preset, ranges] : planner.ranges) {
    const std::string prefix = std::string("planner.presets.") + plan::PresetName(preset);
    ValidateInterval(ranges.start_radius_m, source, prefix + ".start_radius_m");
    ValidateInterval(ranges.end_radius_m, source, prefix + ".end_radius_m");
    ValidateInterval(ranges.start_altitude_m, source, prefix + ".start_altitude_m");
    ValidateInterval(ranges.end_altitude_m, source, prefix + ".end_altitude_m");
    ValidateInterval(ranges.sweep_deg, source, prefix + ".sweep_deg");
    ValidateInterval(ranges.start_tilt_deg, source, prefix + ".start_tilt_deg");
    ValidateInterval(ranges.end_tilt_deg, source, prefix + ".end_tilt_deg");
    ValidateNonNegative(ranges.start_radius_m.min, source, prefix + ".start_radius_m");
    ValidateNonNegative(ranges.end_radius_m.min, source, prefix + ".end_radius_m");
  }

  const plan::RecommenderThresholds& rec = config.recommender;
  ValidateEnvelope(rec.drone_envelope, source, "recommender.drone_envelope");
  ValidateEnvelope(rec.drone_hard_limit, source, "recommender.drone_hard_limit");
  if (rec.drone_hard_limit.max_altitude_m < rec.drone_envelope.max_altitude_m ||
      rec.drone_hard_limit.max_speed_mps < rec.drone_envelope.max_speed_mps ||
      rec.drone_hard_limit.max_vertical_rate_mps < rec.drone_envelope.max_vertical_rate_mps) {
    Invalid(source, "recommender.drone_hard_limit");
  }
  ValidatePositive(rec.plausible_max_speed_mps, source, "recommender.plausible_max_speed_mps");

  ValidatePositive(config.exports.units_per_meter, source, "export.units_per_meter");
  if (config.exports.composition_width <= 0) {
    Invalid(source, "export.composition_width");
  }
  if (config.exports.composition_height <= 0) {
    Invalid(source, "export.composition_height");
  }
  if (!std::isfinite(config.exports.target_altitude_m)) {
    Invalid(source, "export.target_altitude_m");
  }

  if (config.output.directory.empty()) {
    Invalid(source, "output.directory");
  }
  static const std::set<std::string> kFormats{"tour", "script", "track", "metadata"};
  for (const auto& format : config.output.formats) {
    if (kFormats.count(format) == 0) {
      Invalid(source, "output.formats");
    }
  }
}

SkyshotConfig ParseSkyshotConfig(const YAML::Node& root, const std::string& source) {
  SkyshotConfig cfg;
  if (!root || root.IsNull()) {
    return cfg;
  }
  if (!root.IsMap()) {
    throw Error(ErrorKind::kConfigError, "Invalid or missing YAML root: " + source);
  }

  try {
    ReadPlanner(root, cfg.planner, source);

    const YAML::Node recommender = Section(root, "recommender", source, "");
    cfg.recommender.drone_envelope =
        ReadEnvelope(Section(recommender, "drone_envelope", source, "recommender"),
                     cfg.recommender.drone_envelope, source, "recommender.drone_envelope");
    cfg.recommender.drone_hard_limit =
        ReadEnvelope(Section(recommender, "drone_hard_limit", source, "recommender"),
                     cfg.recommender.drone_hard_limit, source, "recommender.drone_hard_limit");
    cfg.recommender.plausible_max_speed_mps =
        ReadScalar(recommender, "plausible_max_speed_mps", cfg.recommender.plausible_max_speed_mps,
                   source, "recommender");

    const YAML::Node exports = Section(root, "export", source, "");
    cfg.exports.units_per_meter =
        ReadScalar(exports, "units_per_meter", cfg.exports.units_per_meter, source, "export");
    cfg.exports.composition_width =
        ReadScalar(exports, "composition_width", cfg.exports.composition_width, source, "export");
    cfg.exports.composition_height = ReadScalar(exports, "composition_height",
                                                cfg.exports.composition_height, source, "export");
    cfg.exports.target_altitude_m =
        ReadScalar(exports, "target_altitude_m", cfg.exports.target_altitude_m, source, "export");

    const YAML::Node output = Section(root, "output", source, "");
    cfg.output.directory = ReadString(output, "directory", cfg.output.directory, source, "output");
    cfg.output.formats = ReadStringList(output, "formats", cfg.output.formats, source, "output");

    cfg.shot_overrides = ReadShotOverrides(root, source);
  } catch (const YAML::Exception& ex) {
    throw Error(ErrorKind::kConfigError,
                std::string("Failed to load config from ") + source + ": " + ex.what());
  }

  ValidateSkyshotConfig(cfg, source);
  return cfg;
}

SkyshotConfig LoadSkyshotConfig(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& ex) {
    throw Error(ErrorKind::kConfigError,
                std::string("Failed to load config from ") + path + ": " + ex.what());
  }
  return ParseSkyshotConfig(root, path);
}

}  // namespace skyshot::config
