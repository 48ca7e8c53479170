#pragma once

#include "shared/PromptLogger.h"

#include <exception>
#include <string_view>

namespace prompt {

// Error that escapes to the caller of the compiler.
void logUncaughtError(const Logger& logger, std::string_view componentName, std::string_view phase, const std::exception& error);

// Error raised by a component callback and contained by the compiler.
void logCaughtError(const Logger& logger, std::string_view componentName, std::string_view phase, const std::exception& error);

} // namespace prompt
