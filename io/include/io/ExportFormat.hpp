#pragma once

#include <string_view>
#include <variant>

#include "io/ExportArtifact.hpp"
#include "io/ProjectTrack.hpp"
#include "plan/ShotPlan.hpp"

namespace skyshot::io {

struct TourFileFormat {};
struct CompositingScriptFormat {};
struct ProjectTrackFormat {
  // Imported document to write back into, if the shot came from one.
  const ProjectTrack* source{nullptr};
};

using ExportFormat = std::variant<TourFileFormat, CompositingScriptFormat, ProjectTrackFormat>;

// "tour", "script" or "track". Throws Error(kExportFormatError) otherwise.
ExportFormat ParseExportFormat(std::string_view name);
const char* ExportFormatName(const ExportFormat& format);

ExportArtifact Export(const plan::ShotPlan& shot, const ExportFormat& format,
                      const ExportOptions& options);

}  // namespace skyshot::io
