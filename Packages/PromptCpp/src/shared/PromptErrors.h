#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace prompt {

// A hook call that does not line up with the record stored at its position.
class HookOrderError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// A hook called while no component is rendering.
class InvalidHookCallError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// Raised by callbacks after the surrounding execution was cancelled.
class AbortError : public std::runtime_error {
public:
  explicit AbortError(const std::string& message = "Operation aborted")
      : std::runtime_error(message) {}
};

bool isAbortError(const std::exception& error);

std::string describeException(const std::exception_ptr& error);

} // namespace prompt
