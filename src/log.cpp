#include "ledlink/log.hpp"

#include <iostream>
#include <mutex>

namespace ledlink {

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "unknown";
}

LogSink stderr_sink() {
  return [](LogLevel level, const std::string& line) {
    static std::mutex mu;   // heartbeat thread and callers share stderr
    std::lock_guard<std::mutex> lock(mu);
    std::cerr << "[ledlink] level=" << to_string(level) << " " << line << "\n";
  };
}

} // namespace ledlink
