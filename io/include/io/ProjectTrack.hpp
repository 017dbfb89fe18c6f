#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/math/Geodesy.hpp"
#include "io/ExportArtifact.hpp"
#include "plan/CameraKeyframe.hpp"
#include "plan/ShotPlan.hpp"

namespace skyshot::io {

// Relative encoding of trackPoint coordinates.
double LongitudeToRelative(double longitude_deg);
double LatitudeToRelative(double latitude_deg);
double AltitudeToRelative(double altitude_m);
double RelativeToLongitude(double relative);
double RelativeToLatitude(double relative);
double RelativeToAltitude(double relative);

// Parsed project-track document. `document` holds every member of the
// source file so an export can write back the ones the model does not own.
struct ProjectTrack {
  std::string name;
  int model_version{2};
  double frame_rate{30.0};
  std::optional<double> duration_frames{};
  // Factor turning stored cameraFrames positions into ECEF metres.
  double ecef_scale{1.0};
  std::optional<geo::Geodetic> target{};
  plan::KeyframeSequence keyframes;
  // Parsed source, member order preserved.
  nlohmann::ordered_json document;
};

// Both throw Error(kTrackParseError) and never return a partial track. A
// frame without `time` is stamped index / frameRate; one without `rotation`
// looks at the target (the first trackPoint, else the mean camera position).
ProjectTrack ImportProjectTrack(const std::string& text);
ProjectTrack ImportProjectTrackFile(const std::string& path);

// With a source the document is cloned. Frames whose keyframe differs from
// the imported one get time, coordinate/position, rotation, interpolation
// (version 2) and fov rewritten; unchanged values keep their source text.
// Without a source a fresh version 2 document is written.
ExportArtifact ExportProjectTrack(const plan::ShotPlan& shot, const ExportOptions& options,
                                  const ProjectTrack* source = nullptr);

// Wraps an imported track as a shot so the exporters can consume it.
plan::ShotPlan ShotFromTrack(const ProjectTrack& track);

}  // namespace skyshot::io
