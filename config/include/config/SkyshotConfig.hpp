#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "io/ExportArtifact.hpp"
#include "plan/PlannerConfig.hpp"
#include "plan/PlatformRecommender.hpp"
#include "plan/ShotPlanner.hpp"

namespace skyshot::config {

struct OutputConfig {
  std::string directory{"skyshot_out"};
  std::vector<std::string> formats{"tour", "script", "track", "metadata"};
};

struct SkyshotConfig {
  plan::PlannerConfig planner{};
  plan::RecommenderThresholds recommender{};
  io::ExportOptions exports{};
  OutputConfig output{};
  // From the `shots` list, keyed by shot index. Values are checked when the
  // shot is planned, not here.
  std::map<std::size_t, plan::ShotOverride> shot_overrides{};
};

// Every key is optional; missing keys keep the member defaults. Throws
// Error(kConfigError) naming the source and the offending key.
SkyshotConfig LoadSkyshotConfig(const std::string& path);
SkyshotConfig ParseSkyshotConfig(const YAML::Node& root, const std::string& source);

// Checks the invariants the planner, recommender and exporters rely on.
void ValidateSkyshotConfig(const SkyshotConfig& config, const std::string& source);

}  // namespace skyshot::config
