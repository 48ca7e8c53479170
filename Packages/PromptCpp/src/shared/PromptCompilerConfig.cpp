#include "shared/PromptCompilerConfig.h"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace prompt {

namespace {

const char* readEnvironment(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // namespace

CompilerOptions loadCompilerOptionsFromEnvironment() {
  static const Logger log = Logger::forComponent("CompilerConfig");

  CompilerOptions options;
  if (const char* env = readEnvironment("PROMPTCPP_ENV")) {
    options.dev = std::string(env) == "development";
  }
  if (const char* iterations = readEnvironment("PROMPTCPP_MAX_COMPILE_ITERATIONS")) {
    try {
      unsigned long parsed = std::stoul(iterations);
      if (parsed == 0) {
        log.warn("PROMPTCPP_MAX_COMPILE_ITERATIONS must be positive, keeping {}", options.maxCompileIterations);
      } else {
        options.maxCompileIterations = static_cast<std::size_t>(parsed);
      }
    } catch (const std::logic_error&) {
      log.warn("Ignoring invalid PROMPTCPP_MAX_COMPILE_ITERATIONS value '{}'", iterations);
    }
  }
  if (const char* level = readEnvironment("PROMPTCPP_LOG_LEVEL")) {
    options.logLevel = logLevelFromName(level);
    if (!options.logLevel) {
      log.warn("Ignoring unknown PROMPTCPP_LOG_LEVEL '{}'", level);
    }
  }
  return options;
}

} // namespace prompt
