#include <tyredeg/log.hpp>
#include <cstdio>
#include <utility>

namespace tyredeg {

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    default:              return "OFF";
  }
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

void Logger::set_level(LogLevel level) {
  std::lock_guard<std::mutex> lock(mu_);
  level_ = level;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lock(mu_);
  return level_;
}

void Logger::set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(mu_);
  sink_ = std::move(sink);
}

bool Logger::enabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mu_);
  return level != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::log(LogLevel level, const char* message) {
  Sink sink;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (level == LogLevel::Off || static_cast<int>(level) < static_cast<int>(level_)) return;
    sink = sink_;
  }
  // The sink runs unlocked so it may log or reconfigure the logger itself.
  if (sink) {
    sink(level, std::string(message ? message : ""));
    return;
  }
  std::fprintf(stderr, "[tyredeg] [%s] %s\n", log_level_name(level), message ? message : "");
}

} // namespace tyredeg
