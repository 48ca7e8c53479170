#pragma once

#include "runtime/PromptValue.h"
#include "shared/PromptLogger.h"

#include <cstddef>
#include <optional>

namespace prompt {

inline constexpr std::size_t kDefaultMaxCompileIterations = 10;

struct CompilerOptions {
  std::size_t maxCompileIterations{kDefaultMaxCompileIterations};
  // Development mode turns on mutation tracking in compileUntilStable.
  bool dev{false};
  // Falls back to a MarkdownRenderer when unset.
  ContentRendererPtr defaultRenderer;
  std::optional<LogLevel> logLevel;
};

// PROMPTCPP_ENV, PROMPTCPP_MAX_COMPILE_ITERATIONS, PROMPTCPP_LOG_LEVEL.
CompilerOptions loadCompilerOptionsFromEnvironment();

} // namespace prompt
