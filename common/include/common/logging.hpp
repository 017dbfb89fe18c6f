#pragma once

#include <cstddef>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace skyshot::logging {

enum class Level {
  kDebug,
  kInfo,
  kWarning,
  kError,
};

const char* LevelTag(Level level);

class LogSink {
 public:
  virtual ~LogSink() = default;
  virtual void log(Level level, std::string_view message) = 0;
};

// Sinks are optional everywhere; a null sink drops the message.
inline void log(LogSink* sink, Level level, std::string_view message) {
  if (sink) {
    sink->log(level, message);
  }
}

// printf-style helper for formatting messages into a sink.
void Logf(LogSink* sink, Level level, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

class OstreamLogSink : public LogSink {
 public:
  explicit OstreamLogSink(std::ostream& os, Level min_level = Level::kInfo)
      : os_(os), min_level_(min_level) {}

  void log(Level level, std::string_view message) override;

 private:
  std::ostream& os_;
  Level min_level_;
  std::mutex mutex_;
};

struct Entry {
  Level level;
  std::string formatted;
};

// Keeps the most recent entries in memory, each prefixed with a wall-clock
// timestamp. Safe to share between worker threads.
class BufferedLogSink : public LogSink {
 public:
  explicit BufferedLogSink(std::size_t max_entries = 512)
      : max_entries_(max_entries) {}

  void log(Level level, std::string_view message) override;

  std::vector<Entry> Snapshot() const;
  void Clear();
  std::size_t CountAtLeast(Level level) const;

 private:
  std::size_t max_entries_;
  std::deque<Entry> entries_;
  mutable std::mutex mutex_;
};

// Forwards every message to all attached sinks.
class TeeLogSink : public LogSink {
 public:
  void Attach(LogSink* sink) {
    if (sink) {
      sinks_.push_back(sink);
    }
  }

  void log(Level level, std::string_view message) override {
    for (LogSink* sink : sinks_) {
      sink->log(level, message);
    }
  }

 private:
  std::vector<LogSink*> sinks_;
};

using LogSinkPtr = std::shared_ptr<LogSink>;

inline LogSinkPtr make_console_log_sink(Level min_level = Level::kInfo) {
  return std::make_shared<OstreamLogSink>(std::clog, min_level);
}

}  // namespace skyshot::logging
