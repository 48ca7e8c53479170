#include "component/PromptTickState.h"

#include "shared/PromptErrors.h"

namespace prompt {

const char* enginePhaseName(EnginePhase phase) {
  switch (phase) {
    case EnginePhase::Render:
      return "render";
    case EnginePhase::ModelExecution:
      return "model_execution";
    case EnginePhase::ToolExecution:
      return "tool_execution";
    case EnginePhase::TickStart:
      return "tick_start";
    case EnginePhase::TickEnd:
      return "tick_end";
    case EnginePhase::Complete:
      return "complete";
    case EnginePhase::Unknown:
      break;
  }
  return "unknown";
}

EngineError captureEngineError(std::exception_ptr error, EnginePhase phase, bool recoverable) {
  EngineError captured;
  captured.message = describeException(error);
  captured.error = std::move(error);
  captured.phase = phase;
  captured.recoverable = recoverable;
  return captured;
}

TickState makeTickState(int tick) {
  TickState state;
  state.tick = tick < 1 ? 1 : tick;
  state.stop = [](const std::string&) {};
  return state;
}

} // namespace prompt
