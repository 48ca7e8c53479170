#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace prompt {

enum class LogLevel : uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

const char* logLevelName(LogLevel level);
std::optional<LogLevel> logLevelFromName(std::string_view name);

using LogSink = std::function<void(LogLevel level, const std::string& component, const std::string& message)>;

// Named logger; level and sink are process wide.
class Logger {
public:
  static Logger forComponent(std::string component);

  static void setLevel(LogLevel level);
  static LogLevel level();
  static void setSink(LogSink sink);
  static void resetSink();

  bool enabled(LogLevel level) const;
  void log(LogLevel level, const std::string& message) const;

  template <typename... Args>
  void trace(fmt::format_string<Args...> format, Args&&... args) const {
    write(LogLevel::Trace, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(fmt::format_string<Args...> format, Args&&... args) const {
    write(LogLevel::Debug, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> format, Args&&... args) const {
    write(LogLevel::Info, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(fmt::format_string<Args...> format, Args&&... args) const {
    write(LogLevel::Warn, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> format, Args&&... args) const {
    write(LogLevel::Error, format, std::forward<Args>(args)...);
  }

  const std::string& component() const {
    return component_;
  }

private:
  explicit Logger(std::string component) : component_(std::move(component)) {}

  template <typename... Args>
  void write(LogLevel level, fmt::format_string<Args...> format, Args&&... args) const {
    if (!enabled(level)) {
      return;
    }
    log(level, fmt::format(format, std::forward<Args>(args)...));
  }

  std::string component_;
};

} // namespace prompt
