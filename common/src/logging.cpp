#include "common/logging.hpp"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace skyshot::logging {
namespace {

std::string FormatTimestamp(const std::chrono::system_clock::time_point& tp) {
  const auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      tp.time_since_epoch()) % 1000;
  std::ostringstream oss;
  oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << ms.count();
  return oss.str();
}

std::string SanitizeMessage(std::string_view message) {
  std::string sanitized(message);
  while (!sanitized.empty() &&
         (sanitized.back() == '\n' || sanitized.back() == '\r')) {
    sanitized.pop_back();
  }
  return sanitized;
}

std::string FormatString(const char* fmt, va_list args) {
  va_list copy;
  va_copy(copy, args);
  const int len = std::vsnprintf(nullptr, 0, fmt, copy);
  va_end(copy);
  if (len <= 0) {
    return {};
  }
  std::string buffer(static_cast<size_t>(len) + 1, '\0');
  std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
  buffer.resize(static_cast<size_t>(len));
  return buffer;
}

}  // namespace

const char* LevelTag(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarning:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "INFO";
}

void Logf(LogSink* sink, Level level, const char* fmt, ...) {
  if (!sink) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  const std::string formatted = FormatString(fmt, args);
  va_end(args);
  sink->log(level, formatted);
}

void OstreamLogSink::log(Level level, std::string_view message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::scoped_lock lock(mutex_);
  os_ << '[' << LevelTag(level) << "] " << SanitizeMessage(message) << std::endl;
}

void BufferedLogSink::log(Level level, std::string_view message) {
  const std::string timestamp = FormatTimestamp(std::chrono::system_clock::now());
  std::string formatted = '[' + timestamp + std::string("] [") + LevelTag(level) + "] " +
                          SanitizeMessage(message);

  std::scoped_lock lock(mutex_);
  entries_.push_back(Entry{level, std::move(formatted)});
  if (entries_.size() > max_entries_) {
    entries_.pop_front();
  }
}

std::vector<Entry> BufferedLogSink::Snapshot() const {
  std::scoped_lock lock(mutex_);
  return std::vector<Entry>(entries_.begin(), entries_.end());
}

void BufferedLogSink::Clear() {
  std::scoped_lock lock(mutex_);
  entries_.clear();
}

std::size_t BufferedLogSink::CountAtLeast(Level level) const {
  std::scoped_lock lock(mutex_);
  std::size_t count = 0;
  for (const auto& entry : entries_) {
    if (static_cast<int>(entry.level) >= static_cast<int>(level)) {
      ++count;
    }
  }
  return count;
}

}  // namespace skyshot::logging
