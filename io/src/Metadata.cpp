#include "io/Metadata.hpp"

#include <yaml-cpp/yaml.h>

#include "common/errors.hpp"

namespace skyshot::io {
namespace {

void EmitRange(YAML::Emitter& out, const char* key, const plan::Range& range) {
  out << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq << range.start
      << range.end << YAML::EndSeq;
}

void EmitParameters(YAML::Emitter& out, const plan::PathParameters& p) {
  out << YAML::Key << "parameters" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "center" << YAML::Value << YAML::Flow << YAML::BeginSeq
      << p.center.latitude_deg << p.center.longitude_deg << YAML::EndSeq;
  EmitRange(out, "radius_m", p.radius_m);
  EmitRange(out, "altitude_m", p.altitude_m);
  EmitRange(out, "azimuth_deg", p.azimuth_deg);
  EmitRange(out, "tilt_deg", p.tilt_deg);
  out << YAML::Key << "easing" << YAML::Value << plan::EasingName(p.easing);
  out << YAML::EndMap;
}

void EmitKeyframes(YAML::Emitter& out, const plan::KeyframeSequence& keyframes) {
  out << YAML::Key << "keyframes" << YAML::Value << YAML::BeginSeq;
  for (const auto& k : keyframes) {
    out << YAML::Flow << YAML::BeginMap;
    out << YAML::Key << "t" << YAML::Value << k.time_s;
    out << YAML::Key << "lat" << YAML::Value << k.latitude_deg;
    out << YAML::Key << "lon" << YAML::Value << k.longitude_deg;
    out << YAML::Key << "alt" << YAML::Value << k.altitude_m;
    out << YAML::Key << "heading" << YAML::Value << k.heading_deg;
    out << YAML::Key << "tilt" << YAML::Value << k.tilt_deg;
    out << YAML::Key << "roll" << YAML::Value << k.roll_deg;
    if (k.fov_deg) {
      out << YAML::Key << "fov" << YAML::Value << *k.fov_deg;
    }
    out << YAML::Key << "interpolation" << YAML::Value
        << plan::InterpolationModeName(k.interpolation);
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
}

void EmitKinematics(YAML::Emitter& out, const plan::KinematicProfile& profile) {
  out << YAML::Key << "kinematics" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "segments" << YAML::Value << profile.segment_count;
  out << YAML::Key << "avg_speed_mps" << YAML::Value << profile.avg_horizontal_speed_mps;
  out << YAML::Key << "min_speed_mps" << YAML::Value << profile.min_horizontal_speed_mps;
  out << YAML::Key << "max_speed_mps" << YAML::Value << profile.max_horizontal_speed_mps;
  out << YAML::Key << "max_vertical_rate_mps" << YAML::Value << profile.max_vertical_rate_mps;
  out << YAML::Key << "min_altitude_m" << YAML::Value << profile.min_altitude_m;
  out << YAML::Key << "max_altitude_m" << YAML::Value << profile.max_altitude_m;
  out << YAML::Key << "mean_altitude_m" << YAML::Value << profile.mean_altitude_m;
  out << YAML::Key << "path_length_m" << YAML::Value << profile.horizontal_path_length_m;
  out << YAML::EndMap;
}

void EmitShot(YAML::Emitter& out, const plan::ShotPlan& shot) {
  out << YAML::BeginMap;
  out << YAML::Key << "id" << YAML::Value << shot.id;
  out << YAML::Key << "index" << YAML::Value << shot.index;
  out << YAML::Key << "title" << YAML::Value << shot.title;
  out << YAML::Key << "preset" << YAML::Value
      << (shot.preset ? plan::PresetName(*shot.preset) : "imported");
  out << YAML::Key << "duration_s" << YAML::Value << shot.duration_s;
  out << YAML::Key << "frame_rate" << YAML::Value << shot.frame_rate;
  out << YAML::Key << "sample_count" << YAML::Value << shot.keyframes.size();
  EmitParameters(out, shot.parameters);

  if (shot.metadata.kinematics) {
    EmitKinematics(out, *shot.metadata.kinematics);
  }
  if (shot.metadata.recommendation) {
    const plan::Recommendation& rec = *shot.metadata.recommendation;
    out << YAML::Key << "platform" << YAML::Value << plan::PlatformName(rec.platform);
    out << YAML::Key << "confidence" << YAML::Value << rec.confidence;
    out << YAML::Key << "reasons" << YAML::Value << rec.reasons;
  }
  out << YAML::Key << "warnings" << YAML::Value << shot.metadata.warnings;
  EmitKeyframes(out, shot.keyframes);
  out << YAML::EndMap;
}

}  // namespace

ExportArtifact ExportMetadata(const plan::PlanBatch& batch) {
  for (const auto& shot : batch.shots) {
    RequireExportableKeyframes(shot, "metadata");
  }

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "shots" << YAML::Value << YAML::BeginSeq;
  for (const auto& shot : batch.shots) {
    EmitShot(out, shot);
  }
  out << YAML::EndSeq;

  out << YAML::Key << "failures" << YAML::Value << YAML::BeginSeq;
  for (const auto& failure : batch.failures) {
    out << YAML::BeginMap;
    out << YAML::Key << "index" << YAML::Value << failure.index;
    out << YAML::Key << "kind" << YAML::Value << ErrorKindName(failure.kind);
    out << YAML::Key << "message" << YAML::Value << failure.message;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  out << YAML::Key << "cancelled" << YAML::Value << YAML::Flow << batch.cancelled;
  out << YAML::EndMap;

  if (!out.good()) {
    throw Error(ErrorKind::kExportFormatError, "metadata: " + out.GetLastError());
  }
  return ExportArtifact{"metadata.yaml", "metadata", std::string(out.c_str()) + "\n"};
}

}  // namespace skyshot::io
