#include "io/TourFile.hpp"

#include <cstdio>
#include <sstream>

#include "common/errors.hpp"

namespace skyshot::io {
namespace {

constexpr const char* kKmlNamespace = "http://www.opengis.net/kml/2.2";
constexpr const char* kGxNamespace = "http://www.google.com/kml/ext/2.2";
// U+FFFD in UTF-8.
constexpr const char* kReplacementCharacter = "\xEF\xBF\xBD";

std::string Fixed(double value, int decimals) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
  return buffer;
}

void WriteCamera(std::ostringstream& out, const plan::CameraKeyframe& k) {
  out << "          <Camera>\n"
      << "            <longitude>" << Fixed(k.longitude_deg, 10) << "</longitude>\n"
      << "            <latitude>" << Fixed(k.latitude_deg, 10) << "</latitude>\n"
      << "            <altitude>" << Fixed(k.altitude_m, 3) << "</altitude>\n"
      << "            <heading>" << Fixed(k.heading_deg, 6) << "</heading>\n"
      << "            <tilt>" << Fixed(k.tilt_deg, 6) << "</tilt>\n"
      << "            <roll>" << Fixed(k.roll_deg, 6) << "</roll>\n"
      << "            <altitudeMode>absolute</altitudeMode>\n"
      << "          </Camera>\n";
}

// KML defines tilt on [0, 180].
void RequireKmlTilt(const plan::ShotPlan& shot) {
  for (std::size_t i = 0; i < shot.keyframes.size(); ++i) {
    const double tilt = shot.keyframes[i].tilt_deg;
    if (tilt < 0.0 || tilt > 180.0) {
      std::ostringstream oss;
      oss << "tour: keyframe " << i << " of '" << shot.id << "' has tilt " << tilt
          << " outside [0, 180]";
      throw Error(ErrorKind::kExportFormatError, oss.str());
    }
  }
}

}  // namespace

std::string EscapeXml(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&apos;";
        break;
      case '\t':
      case '\n':
      case '\r':
        out += c;
        break;
      default:
        // XML 1.0 has no encoding for the other C0 controls, not even as
        // character references.
        if (static_cast<unsigned char>(c) < 0x20) {
          out += kReplacementCharacter;
        } else {
          out += c;
        }
        break;
    }
  }
  return out;
}

ExportArtifact ExportTourFile(const plan::ShotPlan& shot, const ExportOptions& options) {
  RequireExportableKeyframes(shot, "tour");
  RequireKmlTilt(shot);

  const std::string title = EscapeXml(shot.title.empty() ? shot.id : shot.title);
  std::string description = std::string(plan::ShotKindTitle(shot));
  if (shot.metadata.recommendation) {
    description += ", ";
    description += plan::PlatformName(shot.metadata.recommendation->platform);
  }

  std::ostringstream out;
  out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      << "<kml xmlns=\"" << kKmlNamespace << "\" xmlns:gx=\"" << kGxNamespace << "\">\n"
      << "  <Document>\n"
      << "    <name>" << title << "</name>\n"
      << "    <description>" << EscapeXml(description) << "</description>\n"
      << "    <Placemark>\n"
      << "      <name>Target</name>\n"
      << "      <Point>\n"
      << "        <coordinates>" << Fixed(shot.parameters.center.longitude_deg, 10) << ","
      << Fixed(shot.parameters.center.latitude_deg, 10) << ","
      << Fixed(options.target_altitude_m, 3) << "</coordinates>\n"
      << "      </Point>\n"
      << "    </Placemark>\n"
      << "    <gx:Tour>\n"
      << "      <name>" << title << "</name>\n"
      << "      <gx:Playlist>\n";

  double previous_time = shot.keyframes.front().time_s;
  for (const auto& k : shot.keyframes) {
    out << "        <gx:FlyTo>\n"
        << "          <gx:duration>" << Fixed(k.time_s - previous_time, 6) << "</gx:duration>\n"
        << "          <gx:flyToMode>smooth</gx:flyToMode>\n";
    WriteCamera(out, k);
    out << "        </gx:FlyTo>\n";
    previous_time = k.time_s;
  }

  out << "      </gx:Playlist>\n"
      << "    </gx:Tour>\n"
      << "  </Document>\n"
      << "</kml>\n";

  return ExportArtifact{SafeFileStem(shot.id) + ".kml", "tour", out.str()};
}

}  // namespace skyshot::io
