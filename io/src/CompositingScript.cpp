#include "io/CompositingScript.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <vector>

#include "common/errors.hpp"

namespace skyshot::io {
namespace {

std::string Number(double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.6f", value);
  return buffer;
}

std::string Triple(const Eigen::Vector3d& v) {
  return "[" + Number(v.x()) + ", " + Number(v.y()) + ", " + Number(v.z()) + "]";
}

}  // namespace

Eigen::Vector3d CompositionPosition(const plan::CameraKeyframe& keyframe,
                                    const geo::Geodetic& anchor, double units_per_meter) {
  const Eigen::Vector3d enu = geo::GeodeticToEnu(keyframe.position(), anchor);
  return Eigen::Vector3d(enu.x(), -enu.z(), enu.y()) * units_per_meter;
}

Eigen::Vector3d CompositionOrientation(const plan::CameraKeyframe& keyframe) {
  return Eigen::Vector3d(keyframe.tilt_deg - 90.0, keyframe.heading_deg, keyframe.roll_deg);
}

std::string EscapeScriptString(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buffer[8];
          std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(c));
          out += buffer;
        } else {
          out += c;
        }
        break;
    }
  }
  return out;
}

ExportArtifact ExportCompositingScript(const plan::ShotPlan& shot, const ExportOptions& options) {
  RequireExportableKeyframes(shot, "script");
  if (!std::isfinite(shot.frame_rate) || shot.frame_rate <= 0.0) {
    throw Error(ErrorKind::kExportFormatError,
                "script: frame rate of '" + shot.id + "' must be positive");
  }
  if (!std::isfinite(options.units_per_meter) || options.units_per_meter <= 0.0) {
    throw Error(ErrorKind::kExportFormatError, "script: units_per_meter must be positive");
  }

  const geo::Geodetic anchor = shot.keyframes.front().position();

  std::vector<long long> frames;
  frames.reserve(shot.keyframes.size());
  for (std::size_t i = 0; i < shot.keyframes.size(); ++i) {
    const long long frame = std::llround(shot.keyframes[i].time_s * shot.frame_rate);
    if (!frames.empty() && frame <= frames.back()) {
      std::ostringstream oss;
      oss << "script: keyframe " << i << " of '" << shot.id << "' lands on frame " << frame
          << ", which is already taken at " << shot.frame_rate << " fps";
      throw Error(ErrorKind::kExportFormatError, oss.str());
    }
    frames.push_back(frame);
  }
  const double duration_s =
      std::max(shot.duration_s, static_cast<double>(frames.back() + 1) / shot.frame_rate);

  const std::string name = EscapeScriptString(shot.title.empty() ? shot.id : shot.title);

  std::ostringstream out;
  out << "// " << SafeFileStem(shot.id) << ": " << plan::ShotKindTitle(shot) << "\n"
      << "(function () {\n"
      << "  var fps = " << Number(shot.frame_rate) << ";\n"
      << "  app.beginUndoGroup(\"" << name << "\");\n"
      << "  var comp = app.project.items.addComp(\"" << name << "\", "
      << options.composition_width << ", " << options.composition_height << ", 1.0, "
      << Number(duration_s) << ", fps);\n"
      << "  var camera = comp.layers.addCamera(\"" << name << " camera\", ["
      << options.composition_width / 2 << ", " << options.composition_height / 2 << "]);\n"
      << "  camera.autoOrient = AutoOrientType.NO_AUTO_ORIENT;\n"
      << "  var transform = camera.property(\"ADBE Transform Group\");\n"
      << "  var position = transform.property(\"ADBE Position\");\n"
      << "  var orientation = transform.property(\"ADBE Orientation\");\n";

  out << "  var frames = [";
  for (std::size_t i = 0; i < frames.size(); ++i) {
    out << (i == 0 ? "" : ", ") << frames[i];
  }
  out << "];\n";

  out << "  var positions = [\n";
  for (std::size_t i = 0; i < shot.keyframes.size(); ++i) {
    out << "    "
        << Triple(CompositionPosition(shot.keyframes[i], anchor, options.units_per_meter))
        << (i + 1 < shot.keyframes.size() ? ",\n" : "\n");
  }
  out << "  ];\n";

  out << "  var orientations = [\n";
  for (std::size_t i = 0; i < shot.keyframes.size(); ++i) {
    out << "    " << Triple(CompositionOrientation(shot.keyframes[i]))
        << (i + 1 < shot.keyframes.size() ? ",\n" : "\n");
  }
  out << "  ];\n";

  out << "  var times = [];\n"
      << "  for (var i = 0; i < frames.length; i++) {\n"
      << "    times.push(frames[i] / fps);\n"
      << "  }\n"
      << "  position.setValuesAtTimes(times, positions);\n"
      << "  orientation.setValuesAtTimes(times, orientations);\n"
      << "  app.endUndoGroup();\n"
      << "})();\n";

  return ExportArtifact{SafeFileStem(shot.id) + ".jsx", "script", out.str()};
}

}  // namespace skyshot::io
