#pragma once

#include <string>

#include "plan/ShotPlan.hpp"

namespace skyshot::io {

// Text payload bound for a single file. Immutable once produced.
struct ExportArtifact {
  std::string name;    // file name, no directory
  std::string format;  // "tour", "script", "track" or "metadata"
  std::string payload;
};

struct ExportOptions {
  // Compositing script: scene units per metre and composition geometry.
  double units_per_meter{1.0};
  int composition_width{1920};
  int composition_height{1080};
  // Altitude of the look-at target written next to the camera path.
  double target_altitude_m{0.0};
};

// Throws Error(kExportFormatError) for an empty shot or a non-finite keyframe
// value. Format-specific ranges are checked by the exporter that needs them.
void RequireExportableKeyframes(const plan::ShotPlan& shot, const char* format);

// Shot id with every character outside [A-Za-z0-9_-] replaced by '_'.
std::string SafeFileStem(const std::string& id);

}  // namespace skyshot::io
