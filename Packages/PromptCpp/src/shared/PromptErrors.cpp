#include "shared/PromptErrors.h"

namespace prompt {

bool isAbortError(const std::exception& error) {
  return dynamic_cast<const AbortError*>(&error) != nullptr;
}

std::string describeException(const std::exception_ptr& error) {
  if (!error) {
    return "unknown error";
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& exception) {
    return exception.what();
  } catch (const std::string& message) {
    return message;
  } catch (const char* message) {
    return message;
  } catch (...) {
    return "non-standard exception";
  }
}

} // namespace prompt
