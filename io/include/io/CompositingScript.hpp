#pragma once

#include <string>
#include <string_view>

#include <Eigen/Core>

#include "common/math/Geodesy.hpp"
#include "io/ExportArtifact.hpp"
#include "plan/ShotPlan.hpp"

namespace skyshot::io {

// Camera position in composition axes: x east, y down, z north, scaled from
// metres by units_per_meter. The anchor is the first keyframe of the shot.
Eigen::Vector3d CompositionPosition(const plan::CameraKeyframe& keyframe,
                                    const geo::Geodetic& anchor, double units_per_meter);

// Orientation property (x, y, z) in degrees: tilt - 90, heading, roll.
Eigen::Vector3d CompositionOrientation(const plan::CameraKeyframe& keyframe);

// ExtendScript (.jsx) creating a composition with one 3D camera layer and a
// Position and Orientation key per keyframe.
ExportArtifact ExportCompositingScript(const plan::ShotPlan& shot, const ExportOptions& options);

std::string EscapeScriptString(std::string_view text);

}  // namespace skyshot::io
