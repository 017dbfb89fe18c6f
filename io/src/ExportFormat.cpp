#include "io/ExportFormat.hpp"

#include <string>

#include "common/errors.hpp"
#include "io/CompositingScript.hpp"
#include "io/TourFile.hpp"

namespace skyshot::io {
namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

ExportFormat ParseExportFormat(std::string_view name) {
  if (name == "tour" || name == "kml") {
    return TourFileFormat{};
  }
  if (name == "script" || name == "jsx") {
    return CompositingScriptFormat{};
  }
  if (name == "track" || name == "json") {
    return ProjectTrackFormat{};
  }
  throw Error(ErrorKind::kExportFormatError,
              "unknown export format '" + std::string(name) + "' (expected tour, script, track)");
}

const char* ExportFormatName(const ExportFormat& format) {
  return std::visit(Overloaded{
                        [](const TourFileFormat&) { return "tour"; },
                        [](const CompositingScriptFormat&) { return "script"; },
                        [](const ProjectTrackFormat&) { return "track"; },
                    },
                    format);
}

ExportArtifact Export(const plan::ShotPlan& shot, const ExportFormat& format,
                      const ExportOptions& options) {
  return std::visit(Overloaded{
                        [&](const TourFileFormat&) { return ExportTourFile(shot, options); },
                        [&](const CompositingScriptFormat&) {
                          return ExportCompositingScript(shot, options);
                        },
                        [&](const ProjectTrackFormat& track) {
                          return ExportProjectTrack(shot, options, track.source);
                        },
                    },
                    format);
}

}  // namespace skyshot::io
