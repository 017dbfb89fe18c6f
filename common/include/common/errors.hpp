#pragma once

#include <stdexcept>
#include <string>

namespace skyshot {

enum class ErrorKind {
  kInvalidParameter,
  kDegenerateGeometry,
  kUnsupportedPreset,
  kExportFormatError,
  kTrackParseError,
  kConfigError,
  kIoError,
};

inline const char* ErrorKindName(ErrorKind kind);

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& message)
      : std::runtime_error(std::string(ErrorKindName(kind)) + ": " + message),
        kind_(kind),
        detail_(message) {}

  ErrorKind kind() const { return kind_; }
  // Message without the kind prefix.
  const std::string& detail() const { return detail_; }

 private:
  ErrorKind kind_;
  std::string detail_;
};

inline const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidParameter:
      return "InvalidParameter";
    case ErrorKind::kDegenerateGeometry:
      return "DegenerateGeometry";
    case ErrorKind::kUnsupportedPreset:
      return "UnsupportedPreset";
    case ErrorKind::kExportFormatError:
      return "ExportFormatError";
    case ErrorKind::kTrackParseError:
      return "TrackParseError";
    case ErrorKind::kConfigError:
      return "ConfigError";
    case ErrorKind::kIoError:
      return "IoError";
  }
  return "Error";
}

}  // namespace skyshot
