#pragma once

#include <cstdio>
#include <filesystem>
#include <string>

#include "common/logging.hpp"
#include "io/ExportArtifact.hpp"

namespace skyshot::io {

// Owns a FILE* for the lifetime of one write; closed on every exit path.
class ScopedFile {
 public:
  ScopedFile() = default;
  ScopedFile(const std::filesystem::path& path, const char* mode);
  ~ScopedFile();

  ScopedFile(const ScopedFile&) = delete;
  ScopedFile& operator=(const ScopedFile&) = delete;

  // Closes any file already held first.
  bool Open(const std::filesystem::path& path, const char* mode);

  bool valid() const { return file_ != nullptr; }
  std::FILE* get() const { return file_; }

  // Flushes and closes; false when either step failed.
  bool Close();

 private:
  std::FILE* file_ = nullptr;
};

// Publishes artifacts into a directory. Each payload goes to
// "<name>.tmp-<pid>-<random>" first and is renamed over the final name only after
// a complete write, so a partial file never appears at the final path.
class ArtifactWriter {
 public:
  explicit ArtifactWriter(std::filesystem::path directory, logging::LogSink* log = nullptr);

  // Returns the published path. Throws Error(kIoError) on failure, after
  // removing the temporary file.
  std::filesystem::path Write(const ExportArtifact& artifact) const;

  // Fresh temporary path beside `name`; the writer keeps no state between calls.
  std::filesystem::path TempPathFor(const std::string& name) const;

  const std::filesystem::path& directory() const { return directory_; }

 private:
  std::filesystem::path directory_;
  logging::LogSink* log_;
};

}  // namespace skyshot::io
