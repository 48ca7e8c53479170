#include "prompt-reconciler/PromptFiberWorkState.h"

namespace prompt {

const char* compilerPhaseName(CompilerPhase phase) {
  switch (phase) {
    case CompilerPhase::Idle:
      return "idle";
    case CompilerPhase::TickStart:
      return "tickStart";
    case CompilerPhase::Render:
      return "render";
    case CompilerPhase::Compile:
      return "compile";
    case CompilerPhase::Mount:
      return "mount";
    case CompilerPhase::TickEnd:
      return "tickEnd";
    case CompilerPhase::Complete:
      return "complete";
    case CompilerPhase::Unmount:
      return "unmount";
  }
  return "unknown";
}

bool FiberWorkState::shouldSkipRecompile() const {
  switch (phase) {
    case CompilerPhase::TickStart:
    case CompilerPhase::TickEnd:
    case CompilerPhase::Complete:
    case CompilerPhase::Unmount:
      return true;
    case CompilerPhase::Render:
      return isRendering;
    default:
      return false;
  }
}

void FiberWorkState::scheduleWork() {
  if (shouldSkipRecompile()) {
    return;
  }
  com->requestRecompile("fiber state update");
}

} // namespace prompt
