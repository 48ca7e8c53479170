#pragma once

#include "com/PromptObjectModel.h"
#include "component/PromptComponentHooks.h"
#include "component/PromptTickState.h"
#include "prompt-reconciler/PromptCompiledStructure.h"
#include "prompt-reconciler/PromptContentBlockRegistry.h"
#include "prompt-reconciler/PromptFiber.h"
#include "prompt-reconciler/PromptFiberCollector.h"
#include "prompt-reconciler/PromptFiberReconciler.h"
#include "prompt-reconciler/PromptFiberWorkState.h"
#include "shared/PromptCompilerConfig.h"
#include "shared/PromptLogger.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prompt {

// Owns the persistent fiber tree of one execution and drives it through
// compile passes and lifecycle notifications. Calls must be serialized.
class FiberCompiler {
public:
  explicit FiberCompiler(
      ContextObjectModel& com,
      const ComponentHookRegistry* hookRegistry = nullptr,
      CompilerOptions options = {});
  ~FiberCompiler();

  FiberCompiler(const FiberCompiler&) = delete;
  FiberCompiler& operator=(const FiberCompiler&) = delete;

  // Reconcile, commit, collect. A failing render still commits the work
  // that was done, then rethrows.
  CompiledStructure compile(const ElementPtr& element, const TickState& state);

  CompileStabilizationResult compileUntilStable(
      const ElementPtr& element,
      const TickState& state,
      const CompileStabilizationOptions& options = {});

  void notifyStart();
  void notifyTickStart(const TickState& state);
  void notifyTickEnd(const TickState& state);
  // First recovery that continues execution, if any handler produced one.
  std::optional<RecoveryAction> notifyError(const TickState& state);
  void notifyAfterCompile(const CompiledStructure& compiled, const TickState& state, const AfterCompileContext& context);
  void notifyComplete(const COMInput& finalState);
  void notifyOnMessage(const ExecutionMessage& message, const TickState& state);
  void unmount();

  // Re-collects the current tree without reconciling.
  CompiledStructure collect(const TickState& state) const;

  FiberId root() const {
    return root_;
  }
  const FiberTree& tree() const {
    return tree_;
  }
  ComponentPtr instanceAt(FiberId fiber) const;
  FiberId findFiberByKey(const std::string& key) const;

  CompilerPhase phase() const {
    return workState_->phase;
  }
  bool shouldSkipRecompile() const {
    return workState_->shouldSkipRecompile();
  }
  const CompilerOptions& options() const {
    return options_;
  }

private:
  // Live fibers in top-down order, captured before callbacks run.
  std::vector<FiberId> snapshotFibers() const;
  void reregisterTools(const std::vector<FiberId>& fibers);

  ContextObjectModel& com_;
  CompilerOptions options_;
  FiberTree tree_;
  InstanceTable instances_;
  std::shared_ptr<FiberWorkState> workState_;
  FiberReconciler reconciler_;
  ContentBlockRegistry registry_;
  FiberCollector collector_;
  FiberId root_;
  Logger logger_;
};

} // namespace prompt
