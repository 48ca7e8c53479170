#include "shared/PromptLogger.h"

#include <iostream>
#include <mutex>

namespace prompt {

namespace {

struct LoggerState {
  std::mutex mutex;
  LogLevel level{LogLevel::Info};
  LogSink sink;
};

LoggerState& loggerState() {
  static LoggerState state;
  return state;
}

void writeToStderr(LogLevel level, const std::string& component, const std::string& message) {
  std::cerr << fmt::format("[{}] [{}] {}\n", logLevelName(level), component, message);
}

} // namespace

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Trace:
      return "trace";
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Error:
      return "error";
    case LogLevel::Off:
      return "off";
  }
  return "off";
}

std::optional<LogLevel> logLevelFromName(std::string_view name) {
  for (LogLevel level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
    if (name == logLevelName(level)) {
      return level;
    }
  }
  return std::nullopt;
}

Logger Logger::forComponent(std::string component) {
  return Logger(std::move(component));
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(loggerState().mutex);
  loggerState().level = level;
}

LogLevel Logger::level() {
  std::lock_guard<std::mutex> lock(loggerState().mutex);
  return loggerState().level;
}

void Logger::setSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(loggerState().mutex);
  loggerState().sink = std::move(sink);
}

void Logger::resetSink() {
  setSink(nullptr);
}

bool Logger::enabled(LogLevel level) const {
  return level != LogLevel::Off && level >= Logger::level();
}

void Logger::log(LogLevel level, const std::string& message) const {
  if (!enabled(level)) {
    return;
  }
  LogSink sink;
  {
    std::lock_guard<std::mutex> lock(loggerState().mutex);
    sink = loggerState().sink;
  }
  if (sink) {
    sink(level, component_, message);
  } else {
    writeToStderr(level, component_, message);
  }
}

} // namespace prompt
