#include <cerrno>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "config/SkyshotConfig.hpp"
#include "io/ArtifactWriter.hpp"
#include "io/ExportFormat.hpp"
#include "io/Metadata.hpp"
#include "io/ProjectTrack.hpp"
#include "plan/PlatformRecommender.hpp"
#include "plan/PresetRegistry.hpp"
#include "plan/ShotPlanner.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitPartial = 2;

constexpr const char* kUsage =
    "Usage: skyshot_cli --lat deg --lon deg [--shots n] [--duration seconds] [--fps rate] "
    "[--config path] [--out dir] [--formats tour,script,track,metadata] [--workers n]\n"
    "       skyshot_cli --import track.json [--config path] [--out dir] [--formats ...]";

using skyshot::logging::Level;
using skyshot::logging::Logf;

struct CliOptions {
  std::optional<double> lat;
  std::optional<double> lon;
  std::size_t shots{3};
  double duration_s{8.0};
  std::optional<double> fps;
  std::optional<std::string> config_path;
  std::optional<std::string> out_dir;
  std::optional<std::vector<std::string>> formats;
  std::optional<std::size_t> workers;
  std::optional<std::string> import_path;
};

bool ParseDouble(const char* text, double& value) {
  if (!text || *text == '\0') {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const double parsed = std::strtod(text, &end);
  if (end == text || *end != '\0' || errno == ERANGE) {
    return false;
  }
  value = parsed;
  return true;
}

bool ParseCount(const char* text, std::size_t& value) {
  if (!text || *text == '\0' || *text == '-') {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const unsigned long long parsed = std::strtoull(text, &end, 10);
  if (end == text || *end != '\0' || errno == ERANGE) {
    return false;
  }
  value = static_cast<std::size_t>(parsed);
  return true;
}

std::vector<std::string> SplitList(const std::string& text) {
  std::vector<std::string> out;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

// Returns the exit code when main should stop right away.
std::optional<int> ParseArgs(int argc, char* argv[], CliOptions& opts,
                             skyshot::logging::LogSink* log) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    const char* value = has_value ? argv[i + 1] : nullptr;
    bool ok = true;

    if (arg == "--help") {
      Logf(log, Level::kInfo, "%s", kUsage);
      return kExitOk;
    } else if (!has_value) {
      Logf(log, Level::kError, "%s requires an argument or is not recognised", arg.c_str());
      return kExitUsage;
    } else if (arg == "--lat") {
      double v = 0.0;
      ok = ParseDouble(value, v);
      opts.lat = v;
    } else if (arg == "--lon") {
      double v = 0.0;
      ok = ParseDouble(value, v);
      opts.lon = v;
    } else if (arg == "--shots") {
      ok = ParseCount(value, opts.shots);
    } else if (arg == "--duration") {
      ok = ParseDouble(value, opts.duration_s);
    } else if (arg == "--fps") {
      double v = 0.0;
      ok = ParseDouble(value, v);
      opts.fps = v;
    } else if (arg == "--workers") {
      std::size_t v = 0;
      ok = ParseCount(value, v);
      opts.workers = v;
    } else if (arg == "--config") {
      opts.config_path = value;
    } else if (arg == "--out") {
      opts.out_dir = value;
    } else if (arg == "--formats") {
      opts.formats = SplitList(value);
    } else if (arg == "--import") {
      opts.import_path = value;
    } else {
      Logf(log, Level::kError, "Unrecognized argument '%s'", arg.c_str());
      return kExitUsage;
    }

    if (!ok) {
      Logf(log, Level::kError, "Invalid value '%s' for %s", value, arg.c_str());
      return kExitUsage;
    }
    ++i;
  }
  return std::nullopt;
}

// Writes every requested artifact; returns the number that failed.
std::size_t ExportBatch(const skyshot::plan::PlanBatch& batch,
                        const skyshot::config::SkyshotConfig& config,
                        const skyshot::io::ProjectTrack* source,
                        skyshot::logging::LogSink* log) {
  const skyshot::io::ArtifactWriter writer(config.output.directory, log);
  std::size_t failures = 0;

  for (const auto& shot : batch.shots) {
    for (const auto& name : config.output.formats) {
      if (name == "metadata") {
        continue;
      }
      try {
        skyshot::io::ExportFormat format = skyshot::io::ParseExportFormat(name);
        if (auto* track = std::get_if<skyshot::io::ProjectTrackFormat>(&format)) {
          track->source = source;
        }
        writer.Write(skyshot::io::Export(shot, format, config.exports));
      } catch (const skyshot::Error& e) {
        ++failures;
        Logf(log, Level::kError, "%s export of %s failed: %s", name.c_str(), shot.id.c_str(),
             e.what());
      }
    }
  }

  for (const auto& name : config.output.formats) {
    if (name != "metadata") {
      continue;
    }
    try {
      writer.Write(skyshot::io::ExportMetadata(batch));
    } catch (const skyshot::Error& e) {
      ++failures;
      Logf(log, Level::kError, "metadata export failed: %s", e.what());
    }
  }
  return failures;
}

}  // namespace

int main(int argc, char* argv[]) {
  const auto console = skyshot::logging::make_console_log_sink(Level::kInfo);
  skyshot::logging::LogSink* log = console.get();

  CliOptions opts;
  if (const auto code = ParseArgs(argc, argv, opts, log)) {
    return *code;
  }

  skyshot::config::SkyshotConfig config;
  try {
    if (opts.config_path) {
      config = skyshot::config::LoadSkyshotConfig(*opts.config_path);
    }
    if (opts.workers) {
      config.planner.worker_count = *opts.workers;
    }
    if (opts.out_dir) {
      config.output.directory = *opts.out_dir;
    }
    if (opts.formats) {
      config.output.formats = *opts.formats;
    }
    skyshot::config::ValidateSkyshotConfig(config, opts.config_path.value_or("command line"));
  } catch (const skyshot::Error& e) {
    Logf(log, Level::kError, "%s", e.what());
    return kExitUsage;
  }

  if (opts.import_path) {
    skyshot::io::ProjectTrack track;
    try {
      track = skyshot::io::ImportProjectTrackFile(*opts.import_path);
    } catch (const skyshot::Error& e) {
      Logf(log, Level::kError, "%s", e.what());
      return kExitUsage;
    }
    Logf(log, Level::kInfo, "imported %zu keyframes from %s (modelVersion %d)",
         track.keyframes.size(), opts.import_path->c_str(), track.model_version);

    skyshot::plan::PlanBatch batch;
    batch.shots.push_back(skyshot::io::ShotFromTrack(track));
    skyshot::plan::AnnotateShot(batch.shots.back(), config.recommender);
    const std::size_t failed = ExportBatch(batch, config, &track, log);
    return failed == 0 ? kExitOk : kExitPartial;
  }

  if (!opts.lat || !opts.lon) {
    Logf(log, Level::kError, "--lat and --lon are required\n%s", kUsage);
    return kExitUsage;
  }

  skyshot::plan::ShotRequest request;
  request.location = skyshot::geo::GeoPoint{*opts.lat, *opts.lon};
  request.shot_count = opts.shots;
  request.duration_s = opts.duration_s;
  request.frame_rate = opts.fps;
  request.overrides = config.shot_overrides;

  const skyshot::plan::PresetRegistry registry = skyshot::plan::MakeBuiltinPresetRegistry();
  const skyshot::plan::ShotPlanner planner(registry, config.planner, config.recommender);

  skyshot::plan::PlanBatch batch;
  try {
    batch = planner.Plan(request, {}, log);
  } catch (const skyshot::Error& e) {
    Logf(log, Level::kError, "%s", e.what());
    return kExitUsage;
  }

  const std::size_t failed = ExportBatch(batch, config, nullptr, log);
  if (!batch.complete() || failed > 0 || batch.shots.empty()) {
    return kExitPartial;
  }
  return kExitOk;
}
