#include "shared/PromptFiberErrorLogger.h"

namespace prompt {

void logUncaughtError(const Logger& logger, std::string_view componentName, std::string_view phase, const std::exception& error) {
  logger.error("Uncaught error in <{}> during {}: {}", componentName, phase, error.what());
}

void logCaughtError(const Logger& logger, std::string_view componentName, std::string_view phase, const std::exception& error) {
  logger.warn("Error in <{}> during {} was handled: {}", componentName, phase, error.what());
}

} // namespace prompt
