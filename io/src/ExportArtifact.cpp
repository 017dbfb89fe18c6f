#include "io/ExportArtifact.hpp"

#include <cctype>
#include <cmath>
#include <sstream>

#include "common/errors.hpp"

namespace skyshot::io {

void RequireExportableKeyframes(const plan::ShotPlan& shot, const char* format) {
  if (shot.keyframes.empty()) {
    throw Error(ErrorKind::kExportFormatError,
                std::string(format) + ": shot '" + shot.id + "' has no keyframes");
  }
  for (std::size_t i = 0; i < shot.keyframes.size(); ++i) {
    const plan::CameraKeyframe& k = shot.keyframes[i];
    const bool finite = std::isfinite(k.time_s) && std::isfinite(k.latitude_deg) &&
                        std::isfinite(k.longitude_deg) && std::isfinite(k.altitude_m) &&
                        std::isfinite(k.heading_deg) && std::isfinite(k.tilt_deg) &&
                        std::isfinite(k.roll_deg) && (!k.fov_deg || std::isfinite(*k.fov_deg));
    if (!finite) {
      std::ostringstream oss;
      oss << format << ": keyframe " << i << " of '" << shot.id << "' is not finite";
      throw Error(ErrorKind::kExportFormatError, oss.str());
    }
  }
}

std::string SafeFileStem(const std::string& id) {
  std::string stem = id.empty() ? std::string("shot") : id;
  for (char& c : stem) {
    const auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '_' && c != '-') {
      c = '_';
    }
  }
  return stem;
}

}  // namespace skyshot::io
