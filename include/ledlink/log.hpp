#pragma once
/**
 * @file log.hpp
 * @brief Leveled log lines routed through a caller-supplied sink.
 *
 * The library writes nothing on its own. Every component logs through a
 * Logger copied from the Device options; the default sink prints
 * `[ledlink] level=info msg` lines on stderr, matching the CLI's
 * key=value output so both can be grepped together.
 */

#include <functional>
#include <string>

namespace ledlink {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* to_string(LogLevel level);

using LogSink = std::function<void(LogLevel level, const std::string& line)>;

/// Sink writing to std::cerr. Lines from concurrent threads are not interleaved.
LogSink stderr_sink();

class Logger {
public:
  Logger() = default;
  Logger(LogLevel threshold, LogSink sink)
  : threshold_(threshold), sink_(std::move(sink)) {}

  void log(LogLevel level, const std::string& line) const {
    if (sink_ && level >= threshold_) sink_(level, line);
  }

  void debug(const std::string& line) const { log(LogLevel::Debug, line); }
  void info (const std::string& line) const { log(LogLevel::Info,  line); }
  void warn (const std::string& line) const { log(LogLevel::Warn,  line); }
  void error(const std::string& line) const { log(LogLevel::Error, line); }

  LogLevel threshold() const { return threshold_; }

private:
  LogLevel threshold_{LogLevel::Warn};
  LogSink sink_;
};

} // namespace ledlink
