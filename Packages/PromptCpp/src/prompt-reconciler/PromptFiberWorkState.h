#pragma once

#include "com/PromptObjectModel.h"

#include <cstdint>

namespace prompt {

enum class CompilerPhase : uint8_t {
  Idle,
  TickStart,
  Render,
  Compile,
  Mount,
  TickEnd,
  Complete,
  Unmount,
};

const char* compilerPhaseName(CompilerPhase phase);

// Phase bookkeeping shared by the compiler, the reconciler and hook setters.
struct FiberWorkState {
  explicit FiberWorkState(ContextObjectModel& com) : com(&com) {}

  ContextObjectModel* com;
  CompilerPhase phase{CompilerPhase::Idle};
  bool isRendering{false};

  // Recompile requests are dropped while lifecycle callbacks run and while
  // a render is in progress.
  bool shouldSkipRecompile() const;

  void scheduleWork();
};

// Sets the phase for the current scope.
class PhaseScope {
public:
  PhaseScope(FiberWorkState& state, CompilerPhase phase) : state_(state), previous_(state.phase) {
    state_.phase = phase;
  }
  ~PhaseScope() {
    state_.phase = previous_;
  }

  PhaseScope(const PhaseScope&) = delete;
  PhaseScope& operator=(const PhaseScope&) = delete;

private:
  FiberWorkState& state_;
  CompilerPhase previous_;
};

} // namespace prompt
