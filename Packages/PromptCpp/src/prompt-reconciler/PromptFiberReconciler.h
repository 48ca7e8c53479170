#pragma once

#include "component/PromptComponentHooks.h"
#include "prompt-reconciler/PromptFiber.h"
#include "prompt-reconciler/PromptFiberWorkState.h"
#include "shared/PromptLogger.h"

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace prompt {

struct PendingEffect {
  FiberId fiber;
  std::size_t hookIndex{0};
  EffectPhase phase{EffectPhase::Commit};
};

// Diffs element trees against the persistent fiber tree. Fibers are updated
// in place. An old fiber replaced at its own position is unmounted before
// the new one is built; other dropped subtrees are unmounted by commit().
//
// Matching: a keyed element reuses the unclaimed old child with the same key
// and type; an unkeyed element reuses the unclaimed old child at its own
// position when type and (absent) key agree. Everything else is created.
class FiberReconciler {
public:
  FiberReconciler(
      FiberTree& tree,
      InstanceTable& instances,
      std::shared_ptr<FiberWorkState> workState,
      const ComponentHookRegistry* hookRegistry);

  // Returns the root fiber for `element`, which is `current` when reused.
  FiberId reconcileRoot(FiberId current, const ElementPtr& element, const TickState& state);

  // Unmounts replaced subtrees, then runs mount effects and commit effects.
  // The first unmount failure is rethrown after all effects ran.
  void commit();

  // commit() for a pass whose render threw; failures are only logged.
  void commitAfterFailure() noexcept;

  // Bottom-up: children, hook cleanups, onUnmount, then the fiber itself.
  // Cancellation errors are suppressed, others rethrown once the whole
  // subtree is released.
  void unmountFiber(FiberId id);

  // Runs `call` through the instance's resolved lifecycle middleware.
  void invokeLifecycle(InstanceId instance, ComponentHookName hook, const std::function<void()>& call);

  std::size_t pendingDeletionCount() const {
    return deletions_.size();
  }
  std::size_t pendingEffectCount() const {
    return pendingEffects_.size();
  }

private:
  FiberId reconcileElement(FiberId existing, const ElementPtr& element, FiberId parent, uint32_t index);
  void reconcileChildren(FiberId parent, const std::vector<NormalizedChild>& children);
  void reconcileRendered(FiberId fiber, const ElementPtr& rendered);
  bool canReuse(FiberId existing, const Element& element) const;

  FiberId createFiber(const ElementPtr& element, FiberId parent, uint32_t index);
  FiberId createLeaf(const NormalizedChild& child, FiberId parent, uint32_t index);
  void beginWork(FiberId fiber);
  void updateFunctionComponent(FiberId fiber);
  void updateClassComponent(FiberId fiber);
  void updateInstanceComponent(FiberId fiber);
  void mountInstance(FiberId fiber, ComponentPtr component, ComponentClassPtr componentClass);
  void updateInstance(InstanceId instance, const Props& props, bool mergeProps);
  void adoptPropBindings(InstanceRecord& record, const Props& props);
  void renderInstance(FiberId fiber);

  void scheduleDeletion(FiberId fiber);
  // Unmounts an old fiber before its replacement is built; failures are
  // rethrown by commit().
  void unmountReplaced(FiberId fiber);
  void collectEffects(FiberId fiber);
  void runEffects(EffectPhase phase);
  void releaseHooks(HookList& hooks);
  void unmountInstance(InstanceId instance);
  ScheduleUpdate makeScheduler() const;

  FiberTree& tree_;
  InstanceTable& instances_;
  std::shared_ptr<FiberWorkState> workState_;
  const ComponentHookRegistry* hookRegistry_;
  const TickState* tickState_{nullptr};
  std::vector<FiberId> deletions_;
  std::exception_ptr replacementFailure_;
  std::vector<PendingEffect> pendingEffects_;
  std::vector<FiberId> workInProgress_;
  // Live instances per static tool name; the tool leaves the COM with the last one.
  std::unordered_map<std::string, std::size_t> staticToolOwners_;
  Logger logger_;
};

} // namespace prompt
