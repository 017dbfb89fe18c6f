#include "io/ProjectTrack.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <sstream>
#include <vector>

#include "common/errors.hpp"

namespace skyshot::io {
namespace {

using Json = nlohmann::ordered_json;

constexpr double kLatitudeOffset = 89.9999;
constexpr double kLatitudeSpan = 179.9998;
constexpr double kAltitudeSpan = 65117481.0;
// ECEF magnitudes of points near the Earth's surface fall inside this band.
constexpr double kMinEcefMagnitude = 5'000'000.0;
constexpr double kMaxEcefMagnitude = 8'000'000.0;
// Below this a written value counts as the imported one.
constexpr double kUnchangedTolerance = 1e-9;

[[noreturn]] void Fail(const std::string& message) {
  throw Error(ErrorKind::kTrackParseError, message);
}

std::string MissingField(const std::string& where, const std::string& field) {
  return "missing field '" + field + "' in " + where;
}

std::string InvalidField(const std::string& where, const std::string& field) {
  return "invalid value for '" + field + "' in " + where;
}

const Json* Find(const Json& object, const char* key) {
  if (!object.is_object()) {
    return nullptr;
  }
  const auto it = object.find(key);
  return it == object.end() ? nullptr : &*it;
}

double RequireNumber(const Json& object, const char* key, const std::string& where) {
  const Json* value = Find(object, key);
  if (!value) {
    Fail(MissingField(where, key));
  }
  if (!value->is_number()) {
    Fail(InvalidField(where, key));
  }
  const double number = value->get<double>();
  if (!std::isfinite(number)) {
    Fail(InvalidField(where, key));
  }
  return number;
}

std::optional<double> OptionalNumber(const Json& object, const char* key,
                                     const std::string& where) {
  const Json* value = Find(object, key);
  if (!value || value->is_null()) {
    return std::nullopt;
  }
  return RequireNumber(object, key, where);
}

const Json& RequireObject(const Json& object, const char* key, const std::string& where) {
  const Json* child = Find(object, key);
  if (!child) {
    Fail(MissingField(where, key));
  }
  if (!child->is_object()) {
    Fail(InvalidField(where, key));
  }
  return *child;
}

std::optional<double> DetectEcefScale(const Eigen::Vector3d& stored) {
  // Metres, centimetres, or hectometres.
  for (const double scale : {1.0, 0.01, 100.0}) {
    const double magnitude = stored.norm() * scale;
    if (magnitude > kMinEcefMagnitude && magnitude < kMaxEcefMagnitude) {
      return scale;
    }
  }
  return std::nullopt;
}

Eigen::Vector3d ReadVector(const Json& object, const std::string& where) {
  return Eigen::Vector3d(RequireNumber(object, "x", where), RequireNumber(object, "y", where),
                         RequireNumber(object, "z", where));
}

std::optional<geo::Geodetic> ReadTarget(const Json& root) {
  const Json* points = Find(root, "trackPoints");
  if (!points) {
    return std::nullopt;
  }
  if (!points->is_array()) {
    Fail(InvalidField("document", "trackPoints"));
  }
  for (std::size_t i = 0; i < points->size(); ++i) {
    const Json& point = (*points)[i];
    const std::string where = "trackPoints[" + std::to_string(i) + "]";
    if (!Find(point, "coordinate")) {
      continue;
    }
    const Json& position = RequireObject(RequireObject(point, "coordinate", where), "position",
                                         where + ".coordinate");
    const Json* attributes = Find(position, "attributes");
    if (!attributes || !attributes->is_array() || attributes->size() < 3) {
      Fail(InvalidField(where, "coordinate.position.attributes"));
    }
    std::array<double, 3> relative{};
    for (std::size_t a = 0; a < 3; ++a) {
      const std::string attr_where = where + ".attributes[" + std::to_string(a) + "]";
      relative[a] = RequireNumber(RequireObject((*attributes)[a], "value", attr_where),
                                  "relative", attr_where + ".value");
    }
    return geo::Geodetic{RelativeToLatitude(relative[1]), RelativeToLongitude(relative[0]),
                         RelativeToAltitude(relative[2])};
  }
  return std::nullopt;
}

struct DecodedFrame {
  plan::CameraKeyframe keyframe;
  bool has_rotation{false};
};

DecodedFrame ReadFrame(const Json& frame, std::size_t index, const ProjectTrack& track,
                       std::optional<double>& ecef_scale) {
  const std::string where = "cameraFrames[" + std::to_string(index) + "]";
  if (!frame.is_object()) {
    Fail(where + " must be an object");
  }

  DecodedFrame decoded;
  plan::CameraKeyframe& k = decoded.keyframe;
  if (Find(frame, "time")) {
    k.time_s = RequireNumber(frame, "time", where);
  } else {
    k.time_s = static_cast<double>(index) / track.frame_rate;
  }

  k.interpolation = plan::InterpolationMode::kLinear;
  if (track.model_version >= 2) {
    k.interpolation = plan::InterpolationMode::kAuto;
    if (const Json* mode = Find(frame, "interpolation")) {
      if (!mode->is_string()) {
        Fail(InvalidField(where, "interpolation"));
      }
      const std::string name = mode->get<std::string>();
      const auto parsed = plan::ParseInterpolationMode(name);
      if (!parsed) {
        Fail("unknown interpolation mode '" + name + "' in " + where);
      }
      k.interpolation = *parsed;
    }
  }

  std::optional<Eigen::Vector3d> stored_position;
  if (Find(frame, "position")) {
    stored_position = ReadVector(RequireObject(frame, "position", where), where + ".position");
    if (!ecef_scale) {
      ecef_scale = DetectEcefScale(*stored_position);
    }
  }

  if (Find(frame, "coordinate")) {
    const Json& coordinate = RequireObject(frame, "coordinate", where);
    const std::string coordinate_where = where + ".coordinate";
    k.latitude_deg = RequireNumber(coordinate, "latitude", coordinate_where);
    k.longitude_deg = RequireNumber(coordinate, "longitude", coordinate_where);
    k.altitude_m = RequireNumber(coordinate, "altitude", coordinate_where);
  } else if (stored_position) {
    if (!ecef_scale) {
      Fail(where + ".position cannot be read as ECEF in metres or centimetres");
    }
    const geo::Geodetic g = geo::EcefToGeodetic(*stored_position * *ecef_scale);
    k.latitude_deg = g.latitude_deg;
    k.longitude_deg = g.longitude_deg;
    k.altitude_m = g.altitude_m;
  } else {
    Fail(MissingField(where, "coordinate"));
  }
  if (!geo::IsValid(k.horizontal())) {
    Fail(InvalidField(where, "coordinate"));
  }

  if (Find(frame, "rotation")) {
    const Eigen::Vector3d rotation =
        ReadVector(RequireObject(frame, "rotation", where), where + ".rotation");
    k.tilt_deg = -rotation.x();
    k.heading_deg = geo::NormalizeHeading(-rotation.y());
    k.roll_deg = rotation.z();
    decoded.has_rotation = true;
  }

  k.fov_deg = OptionalNumber(frame, "fov", where);
  return decoded;
}

geo::Geodetic MeanPosition(const std::vector<DecodedFrame>& frames) {
  double lat = 0.0;
  double lon = 0.0;
  for (const auto& f : frames) {
    lat += f.keyframe.latitude_deg;
    lon += f.keyframe.longitude_deg;
  }
  const auto n = static_cast<double>(frames.size());
  return geo::Geodetic{lat / n, lon / n, 0.0};
}

// Heading toward the target and tilt from the nadir to it, no roll.
void LookAt(plan::CameraKeyframe& k, const geo::Geodetic& target) {
  const double ground_m = geo::GreatCircleDistance(k.horizontal(), target.horizontal());
  k.heading_deg = ground_m > 0.0
                      ? geo::NormalizeHeading(geo::InitialBearing(k.horizontal(),
                                                                  target.horizontal()))
                      : 0.0;
  const double height_m = k.altitude_m - target.altitude_m;
  k.tilt_deg = 90.0 - geo::RadToDeg(std::atan2(height_m, std::max(ground_m, 1.0)));
  k.roll_deg = 0.0;
}

bool Same(double a, double b) { return std::abs(a - b) <= kUnchangedTolerance; }

bool SamePosition(const plan::CameraKeyframe& a, const plan::CameraKeyframe& b) {
  return Same(a.latitude_deg, b.latitude_deg) && Same(a.longitude_deg, b.longitude_deg) &&
         Same(a.altitude_m, b.altitude_m);
}

bool SameOrientation(const plan::CameraKeyframe& a, const plan::CameraKeyframe& b) {
  return std::abs(geo::AngleDelta(a.heading_deg, b.heading_deg)) <= kUnchangedTolerance &&
         Same(a.tilt_deg, b.tilt_deg) && Same(a.roll_deg, b.roll_deg);
}

Json& ChildObject(Json& parent, const char* key) {
  Json& child = parent[key];
  if (!child.is_object()) {
    child = Json::object();
  }
  return child;
}

// `original` is the keyframe imported from this frame, or null for a frame
// with no counterpart in the source.
void WriteFrame(Json& frame, const plan::CameraKeyframe& k, const plan::CameraKeyframe* original,
                bool with_interpolation, double ecef_scale) {
  if (!original || !Same(original->time_s, k.time_s)) {
    frame["time"] = k.time_s;
  }
  if (with_interpolation && (!original || original->interpolation != k.interpolation)) {
    frame["interpolation"] = plan::InterpolationModeName(k.interpolation);
  }

  if (!original || !SamePosition(*original, k)) {
    const bool has_coordinate = frame.contains("coordinate");
    const bool has_position = frame.contains("position");
    if (has_coordinate || !has_position) {
      Json& coordinate = ChildObject(frame, "coordinate");
      coordinate["latitude"] = k.latitude_deg;
      coordinate["longitude"] = k.longitude_deg;
      coordinate["altitude"] = k.altitude_m;
    }
    if (has_position || !has_coordinate) {
      const Eigen::Vector3d ecef = geo::GeodeticToEcef(k.position()) / ecef_scale;
      Json& position = ChildObject(frame, "position");
      position["x"] = ecef.x();
      position["y"] = ecef.y();
      position["z"] = ecef.z();
    }
  }

  if (!original || !SameOrientation(*original, k)) {
    Json& rotation = ChildObject(frame, "rotation");
    rotation["x"] = -k.tilt_deg;
    rotation["y"] = -k.heading_deg;
    rotation["z"] = k.roll_deg;
  }

  if (k.fov_deg && (!original || original->fov_deg != k.fov_deg)) {
    frame["fov"] = *k.fov_deg;
  }
}

Json TargetTrackPoint(const geo::Geodetic& target) {
  const Eigen::Vector3d ecef = geo::GeodeticToEcef(target);

  Json attributes = Json::array();
  for (const double relative : {LongitudeToRelative(target.longitude_deg),
                                LatitudeToRelative(target.latitude_deg),
                                AltitudeToRelative(target.altitude_m)}) {
    attributes.push_back(Json{{"value", Json{{"relative", relative}}}});
  }

  Json point = Json::object();
  point["name"] = "target";
  point["position"] = Json{{"x", ecef.x()}, {"y", ecef.y()}, {"z", ecef.z()}};
  point["coordinate"]["position"]["attributes"] = std::move(attributes);
  return point;
}

std::string Dump(const Json& document) {
  return document.dump(2, ' ', false, Json::error_handler_t::replace) + "\n";
}

}  // namespace

double LongitudeToRelative(double longitude_deg) { return (longitude_deg + 180.0) / 360.0; }

double LatitudeToRelative(double latitude_deg) {
  return (latitude_deg + kLatitudeOffset) / kLatitudeSpan;
}

double AltitudeToRelative(double altitude_m) {
  return std::max((altitude_m - 1.0) / kAltitudeSpan, 0.0);
}

double RelativeToLongitude(double relative) { return 360.0 * relative - 180.0; }

double RelativeToLatitude(double relative) { return kLatitudeSpan * relative - kLatitudeOffset; }

double RelativeToAltitude(double relative) { return kAltitudeSpan * relative + 1.0; }

ProjectTrack ImportProjectTrack(const std::string& text) {
  Json root;
  try {
    root = Json::parse(text);
  } catch (const Json::parse_error& e) {
    Fail(std::string("malformed document: ") + e.what());
  }
  if (!root.is_object()) {
    Fail("document root must be an object");
  }

  try {
    ProjectTrack track;

    const double version = RequireNumber(root, "modelVersion", "document");
    if (version != 1.0 && version != 2.0) {
      std::ostringstream oss;
      oss << "unsupported modelVersion " << version << " (expected 1 or 2)";
      Fail(oss.str());
    }
    track.model_version = static_cast<int>(version);

    if (Find(root, "settings")) {
      const Json& settings = RequireObject(root, "settings", "document");
      if (const Json* name = Find(settings, "name")) {
        if (!name->is_string()) {
          Fail(InvalidField("settings", "name"));
        }
        track.name = name->get<std::string>();
      }
      if (const auto rate = OptionalNumber(settings, "frameRate", "settings")) {
        if (*rate <= 0.0) {
          Fail(InvalidField("settings", "frameRate"));
        }
        track.frame_rate = *rate;
      }
      track.duration_frames = OptionalNumber(settings, "duration", "settings");
    }

    track.target = ReadTarget(root);

    const Json* frames = Find(root, "cameraFrames");
    if (!frames) {
      Fail(MissingField("document", "cameraFrames"));
    }
    if (!frames->is_array() || frames->empty()) {
      Fail("cameraFrames must be a non-empty array");
    }

    std::optional<double> ecef_scale;
    std::vector<DecodedFrame> decoded;
    decoded.reserve(frames->size());
    for (std::size_t i = 0; i < frames->size(); ++i) {
      DecodedFrame f = ReadFrame((*frames)[i], i, track, ecef_scale);
      if (!decoded.empty() && f.keyframe.time_s <= decoded.back().keyframe.time_s) {
        std::ostringstream oss;
        oss << "cameraFrames[" << i << "] time " << f.keyframe.time_s
            << " does not follow the previous frame";
        Fail(oss.str());
      }
      decoded.push_back(f);
    }

    const geo::Geodetic look_target = track.target ? *track.target : MeanPosition(decoded);
    track.keyframes.reserve(decoded.size());
    for (auto& f : decoded) {
      if (!f.has_rotation) {
        LookAt(f.keyframe, look_target);
      }
      track.keyframes.push_back(f.keyframe);
    }
    track.ecef_scale = ecef_scale.value_or(1.0);
    track.document = std::move(root);
    return track;
  } catch (const Json::exception& e) {
    Fail(std::string("malformed document: ") + e.what());
  }
}

ProjectTrack ImportProjectTrackFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error(ErrorKind::kIoError, "cannot open project track " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  try {
    return ImportProjectTrack(buffer.str());
  } catch (const Error& e) {
    if (e.kind() != ErrorKind::kTrackParseError) {
      throw;
    }
    throw Error(ErrorKind::kTrackParseError, path + ": " + e.detail());
  }
}

ExportArtifact ExportProjectTrack(const plan::ShotPlan& shot, const ExportOptions& options,
                                  const ProjectTrack* source) {
  RequireExportableKeyframes(shot, "track");
  const std::string file_name = SafeFileStem(shot.id) + ".track.json";

  if (source) {
    Json document = source->document;
    const Json* source_frames = Find(source->document, "cameraFrames");
    const bool has_source_frames =
        source_frames && source_frames->is_array() && !source_frames->empty();
    const bool with_interpolation = source->model_version >= 2;

    Json frames = Json::array();
    for (std::size_t i = 0; i < shot.keyframes.size(); ++i) {
      Json frame = has_source_frames ? (*source_frames)[std::min(i, source_frames->size() - 1)]
                                     : Json::object();
      const plan::CameraKeyframe* original =
          i < source->keyframes.size() ? &source->keyframes[i] : nullptr;
      WriteFrame(frame, shot.keyframes[i], original, with_interpolation, source->ecef_scale);
      frames.push_back(std::move(frame));
    }
    document["cameraFrames"] = std::move(frames);
    return ExportArtifact{file_name, "track", Dump(document)};
  }

  if (!std::isfinite(shot.frame_rate) || shot.frame_rate <= 0.0) {
    throw Error(ErrorKind::kExportFormatError,
                "track: frame rate of '" + shot.id + "' must be positive");
  }

  Json document = Json::object();
  document["modelVersion"] = 2;

  Json& settings = document["settings"];
  settings["name"] = shot.title.empty() ? shot.id : shot.title;
  settings["frameRate"] = shot.frame_rate;
  settings["duration"] = static_cast<long long>(std::llround(shot.duration_s * shot.frame_rate));

  document["trackPoints"] = Json::array({TargetTrackPoint(
      geo::Geodetic{shot.parameters.center.latitude_deg, shot.parameters.center.longitude_deg,
                    options.target_altitude_m})});

  Json frames = Json::array();
  for (const auto& k : shot.keyframes) {
    Json frame = Json::object();
    WriteFrame(frame, k, nullptr, true, 1.0);
    frames.push_back(std::move(frame));
  }
  document["cameraFrames"] = std::move(frames);

  return ExportArtifact{file_name, "track", Dump(document)};
}

plan::ShotPlan ShotFromTrack(const ProjectTrack& track) {
  plan::ShotPlan shot;
  shot.id = SafeFileStem(track.name.empty() ? std::string("imported_track") : track.name);
  shot.title = track.name.empty() ? std::string("Imported track") : track.name;
  shot.frame_rate = track.frame_rate;
  shot.keyframes = track.keyframes;
  shot.duration_s = track.duration_frames ? *track.duration_frames / track.frame_rate
                    : track.keyframes.empty() ? 0.0
                                              : track.keyframes.back().time_s;

  if (track.target) {
    shot.parameters.center = track.target->horizontal();
  } else if (!track.keyframes.empty()) {
    double lat = 0.0;
    double lon = 0.0;
    for (const auto& k : track.keyframes) {
      lat += k.latitude_deg;
      lon += k.longitude_deg;
    }
    const auto n = static_cast<double>(track.keyframes.size());
    shot.parameters.center = geo::GeoPoint{lat / n, lon / n};
  }
  return shot;
}

}  // namespace skyshot::io
