#pragma once

#include <string>
#include <string_view>

#include "io/ExportArtifact.hpp"
#include "plan/ShotPlan.hpp"

namespace skyshot::io {

// KML 2.2 document with one gx:Tour holding a gx:FlyTo per keyframe.
ExportArtifact ExportTourFile(const plan::ShotPlan& shot, const ExportOptions& options);

// Escapes markup characters; C0 controls other than tab, LF and CR become U+FFFD.
std::string EscapeXml(std::string_view text);

}  // namespace skyshot::io
