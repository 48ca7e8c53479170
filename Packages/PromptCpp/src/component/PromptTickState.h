#pragma once

#include "com/PromptObjectModel.h"

#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace prompt {

enum class EnginePhase : uint8_t {
  Render,
  ModelExecution,
  ToolExecution,
  TickStart,
  TickEnd,
  Complete,
  Unknown,
};

const char* enginePhaseName(EnginePhase phase);

struct EngineError {
  std::exception_ptr error;
  std::string message;
  EnginePhase phase{EnginePhase::Unknown};
  bool recoverable{true};
};

EngineError captureEngineError(std::exception_ptr error, EnginePhase phase, bool recoverable = true);

struct StopReason {
  std::string reason;
  std::optional<std::string> description;
  bool recoverable{false};
};

// Per-tick context passed to every render and lifecycle call.
struct TickState {
  int tick{1};
  std::function<void(const std::string& reason)> stop;
  std::vector<ExecutionMessage> queuedMessages;
  std::optional<COMInput> previous;
  std::optional<COMInput> current;
  std::optional<StopReason> stopReason;
  std::optional<EngineError> error;
};

TickState makeTickState(int tick = 1);

} // namespace prompt
