#include "io/ArtifactWriter.hpp"

#include <cerrno>
#include <cinttypes>
#include <random>
#include <system_error>
#include <utility>

#include <unistd.h>

#include "common/errors.hpp"

namespace skyshot::io {
namespace {

constexpr int kTempNameAttempts = 4;

bool IsPlainFileName(const std::string& name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace

ScopedFile::ScopedFile(const std::filesystem::path& path, const char* mode) { Open(path, mode); }

ScopedFile::~ScopedFile() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool ScopedFile::Open(const std::filesystem::path& path, const char* mode) {
  if (file_) {
    std::fclose(file_);
  }
  file_ = std::fopen(path.c_str(), mode);
  return file_ != nullptr;
}

bool ScopedFile::Close() {
  if (!file_) {
    return false;
  }
  const bool flushed = std::fflush(file_) == 0;
  const bool closed = std::fclose(file_) == 0;
  file_ = nullptr;
  return flushed && closed;
}

ArtifactWriter::ArtifactWriter(std::filesystem::path directory, logging::LogSink* log)
    : directory_(std::move(directory)), log_(log) {}

std::filesystem::path ArtifactWriter::TempPathFor(const std::string& name) const {
  std::random_device device;
  const std::uint64_t token = (static_cast<std::uint64_t>(device()) << 32) | device();
  char suffix[48];
  std::snprintf(suffix, sizeof(suffix), ".tmp-%ld-%016" PRIx64, static_cast<long>(::getpid()),
                token);
  return directory_ / (name + suffix);
}

std::filesystem::path ArtifactWriter::Write(const ExportArtifact& artifact) const {
  if (!IsPlainFileName(artifact.name)) {
    throw Error(ErrorKind::kIoError, "artifact name '" + artifact.name + "' is not a file name");
  }

  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw Error(ErrorKind::kIoError,
                "cannot create " + directory_.string() + ": " + ec.message());
  }

  const std::filesystem::path final_path = directory_ / artifact.name;
  std::filesystem::path temp_path;

  {
    // "x" refuses to reuse a name another writer already holds.
    ScopedFile file;
    for (int attempt = 0; attempt < kTempNameAttempts && !file.valid(); ++attempt) {
      temp_path = TempPathFor(artifact.name);
      file.Open(temp_path, "wbx");
      if (!file.valid() && errno != EEXIST) {
        break;
      }
    }
    if (!file.valid()) {
      throw Error(ErrorKind::kIoError, "cannot open " + temp_path.string() + " for writing");
    }
    const std::size_t written =
        std::fwrite(artifact.payload.data(), 1, artifact.payload.size(), file.get());
    const bool complete = written == artifact.payload.size();
    if (!file.Close() || !complete) {
      RemoveQuietly(temp_path);
      throw Error(ErrorKind::kIoError, "short write to " + temp_path.string());
    }
  }

  std::filesystem::rename(temp_path, final_path, ec);
  if (ec) {
    RemoveQuietly(temp_path);
    throw Error(ErrorKind::kIoError, "cannot publish " + final_path.string() + ": " +
                                         ec.message());
  }

  logging::Logf(log_, logging::Level::kInfo, "wrote %s (%zu bytes)", final_path.c_str(),
                artifact.payload.size());
  return final_path;
}

}  // namespace skyshot::io
