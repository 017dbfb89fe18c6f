#pragma once

#include "io/ExportArtifact.hpp"
#include "plan/ShotPlanner.hpp"

namespace skyshot::io {

// YAML record of a whole batch: one mapping per shot with its parameters,
// keyframes, kinematic summary and recommendation, then the failures.
ExportArtifact ExportMetadata(const plan::PlanBatch& batch);

}  // namespace skyshot::io
