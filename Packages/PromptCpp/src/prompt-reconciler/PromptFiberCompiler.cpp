#include "prompt-reconciler/PromptFiberCompiler.h"

#include "renderers/ContentRenderer.h"
#include "shared/PromptFiberErrorLogger.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <exception>

namespace prompt {

namespace {

ContentRendererPtr resolveDefaultRenderer(const CompilerOptions& options) {
  if (options.defaultRenderer) {
    return options.defaultRenderer;
  }
  return std::make_shared<MarkdownRenderer>();
}

struct MutationSnapshot {
  std::size_t timelineSize{0};
  std::vector<std::string> sectionIds;
  std::size_t toolCount{0};

  static MutationSnapshot take(const ContextObjectModel& com) {
    MutationSnapshot snapshot;
    snapshot.timelineSize = com.getTimeline().size();
    for (const auto& section : com.getSections()) {
      snapshot.sectionIds.push_back(section.id);
    }
    std::sort(snapshot.sectionIds.begin(), snapshot.sectionIds.end());
    snapshot.toolCount = com.getTools().size();
    return snapshot;
  }

  bool operator==(const MutationSnapshot& other) const {
    return timelineSize == other.timelineSize && sectionIds == other.sectionIds && toolCount == other.toolCount;
  }
  bool operator!=(const MutationSnapshot& other) const {
    return !(*this == other);
  }
};

} // namespace

FiberCompiler::FiberCompiler(
    ContextObjectModel& com,
    const ComponentHookRegistry* hookRegistry,
    CompilerOptions options)
    : com_(com),
      options_(std::move(options)),
      workState_(std::make_shared<FiberWorkState>(com)),
      reconciler_(tree_, instances_, workState_, hookRegistry),
      registry_(ContentBlockRegistry::withDefaults()),
      collector_(tree_, com, resolveDefaultRenderer(options_), registry_),
      logger_(Logger::forComponent("FiberCompiler")) {
  if (options_.logLevel) {
    Logger::setLevel(*options_.logLevel);
  }
}

FiberCompiler::~FiberCompiler() {
  try {
    unmount();
  } catch (const std::exception& error) {
    logCaughtError(logger_, "root", "unmount on destruction", error);
  }
}

CompiledStructure FiberCompiler::compile(const ElementPtr& element, const TickState& state) {
  try {
    root_ = reconciler_.reconcileRoot(root_, element, state);
  } catch (const std::exception& error) {
    logUncaughtError(logger_, element ? element->type.name() : "root", "render", error);
    reconciler_.commitAfterFailure();
    if (root_ && !tree_.contains(root_)) {
      root_ = FiberId{};
    }
    throw;
  }
  reconciler_.commit();
  return collector_.collect(root_, state);
}

CompileStabilizationResult FiberCompiler::compileUntilStable(
    const ElementPtr& element,
    const TickState& state,
    const CompileStabilizationOptions& options) {
  const std::size_t maxIterations = std::max<std::size_t>(1, options.maxIterations.value_or(options_.maxCompileIterations));
  const bool trackMutations = options.trackMutations.value_or(options_.dev);

  CompileStabilizationResult result;
  while (true) {
    com_.resetRecompileRequest();
    result.compiled = compile(element, state);

    const AfterCompileContext context{result.iterations, maxIterations};
    if (trackMutations) {
      const MutationSnapshot before = MutationSnapshot::take(com_);
      notifyAfterCompile(result.compiled, state, context);
      if (MutationSnapshot::take(com_) != before && !com_.wasRecompileRequested()) {
        logger_.warn(
            "Object model changed during afterCompile of iteration {} without a recompile request; "
            "the change is not part of the compiled output",
            result.iterations);
      }
    } else {
      notifyAfterCompile(result.compiled, state, context);
    }

    for (const auto& reason : com_.getRecompileReasons()) {
      result.recompileReasons.push_back(fmt::format("[iteration {}] {}", result.iterations, reason));
    }
    ++result.iterations;

    if (!com_.wasRecompileRequested()) {
      break;
    }
    if (result.iterations >= maxIterations) {
      logger_.warn(
          "Compilation stabilization hit max iterations ({}): {}",
          maxIterations,
          fmt::join(result.recompileReasons, "; "));
      break;
    }
  }
  result.forcedStable = result.iterations >= maxIterations && com_.wasRecompileRequested();
  return result;
}

std::vector<FiberId> FiberCompiler::snapshotFibers() const {
  std::vector<FiberId> fibers;
  if (root_ && tree_.contains(root_)) {
    traverseFiber(tree_, root_, [&](FiberId id, const FiberNode&) {
      fibers.push_back(id);
      return true;
    });
  }
  return fibers;
}

void FiberCompiler::notifyStart() {
  for (FiberId fiber : snapshotFibers()) {
    if (!tree_.contains(fiber) || !tree_.node(fiber).instance) {
      continue;
    }
    const InstanceId instance = tree_.node(fiber).instance;
    const ComponentPtr component = instances_.at(instance).component;
    reconciler_.invokeLifecycle(instance, ComponentHookName::OnStart, [&]() { component->onStart(com_); });
  }
}

void FiberCompiler::notifyTickStart(const TickState& state) {
  PhaseScope phase(*workState_, CompilerPhase::TickStart);
  const std::vector<FiberId> fibers = snapshotFibers();

  for (FiberId fiber : fibers) {
    if (!tree_.contains(fiber)) {
      continue;
    }
    const FiberNode& node = tree_.node(fiber);
    for (const auto& record : node.hooks.records()) {
      if (record.tag != HookTag::TickStart) {
        continue;
      }
      const TickCallback callback = std::get<LifecycleRecord>(record.data).tick;
      if (!callback) {
        continue;
      }
      try {
        callback(com_, state);
      } catch (const std::exception& error) {
        logCaughtError(logger_, node.type.name(), "useTickStart", error);
      }
    }
  }

  for (FiberId fiber : fibers) {
    if (!tree_.contains(fiber) || !tree_.node(fiber).instance) {
      continue;
    }
    const InstanceId instance = tree_.node(fiber).instance;
    const InstanceRecord& record = instances_.at(instance);
    const ComponentPtr component = record.component;
    const std::string name = record.name;
    try {
      reconciler_.invokeLifecycle(
          instance, ComponentHookName::OnTickStart, [&]() { component->onTickStart(com_, state); });
    } catch (const std::exception& error) {
      logCaughtError(logger_, name, "onTickStart", error);
    }
  }

  reregisterTools(fibers);
}

void FiberCompiler::reregisterTools(const std::vector<FiberId>& fibers) {
  for (FiberId fiber : fibers) {
    if (!tree_.contains(fiber) || !tree_.node(fiber).instance) {
      continue;
    }
    const InstanceRecord* record = instances_.find(tree_.node(fiber).instance);
    if (record == nullptr) {
      continue;
    }
    if (record->componentClass && record->componentClass->tool) {
      com_.addTool(record->componentClass->tool);
    }
    if (auto tool = record->component->tool()) {
      com_.addTool(std::move(tool));
    }
  }
}

void FiberCompiler::notifyTickEnd(const TickState& state) {
  PhaseScope phase(*workState_, CompilerPhase::TickEnd);
  const std::vector<FiberId> fibers = snapshotFibers();

  for (FiberId fiber : fibers) {
    if (!tree_.contains(fiber)) {
      continue;
    }
    const FiberNode& node = tree_.node(fiber);
    for (const auto& record : node.hooks.records()) {
      if (record.tag != HookTag::TickEnd) {
        continue;
      }
      const TickCallback callback = std::get<LifecycleRecord>(record.data).tick;
      if (!callback) {
        continue;
      }
      try {
        callback(com_, state);
      } catch (const std::exception& error) {
        logCaughtError(logger_, node.type.name(), "useTickEnd", error);
      }
    }
  }

  for (FiberId fiber : fibers) {
    if (!tree_.contains(fiber) || !tree_.node(fiber).instance) {
      continue;
    }
    const InstanceId instance = tree_.node(fiber).instance;
    const ComponentPtr component = instances_.at(instance).component;
    try {
      reconciler_.invokeLifecycle(instance, ComponentHookName::OnTickEnd, [&]() { component->onTickEnd(com_, state); });
    } catch (const std::exception& error) {
      if (!component->handlesErrors()) {
        logUncaughtError(logger_, component->displayName(), "onTickEnd", error);
        throw;
      }
      TickState errorState = state;
      errorState.error = captureEngineError(std::current_exception(), EnginePhase::TickEnd);
      reconciler_.invokeLifecycle(instance, ComponentHookName::OnError, [&]() {
        auto recovery = component->onError(com_, errorState);
        if (recovery && recovery->recoveryMessage) {
          logger_.info("<{}> recovered from onTickEnd failure: {}", component->displayName(), *recovery->recoveryMessage);
        }
      });
    }
  }
}

std::optional<RecoveryAction> FiberCompiler::notifyError(const TickState& state) {
  std::vector<RecoveryAction> recoveries;
  for (FiberId fiber : snapshotFibers()) {
    if (!tree_.contains(fiber) || !tree_.node(fiber).instance) {
      continue;
    }
    const InstanceId instance = tree_.node(fiber).instance;
    const ComponentPtr component = instances_.at(instance).component;
    if (!component->handlesErrors()) {
      continue;
    }
    try {
      reconciler_.invokeLifecycle(instance, ComponentHookName::OnError, [&]() {
        if (auto recovery = component->onError(com_, state)) {
          recoveries.push_back(std::move(*recovery));
        }
      });
    } catch (const std::exception& error) {
      logCaughtError(logger_, component->displayName(), "onError", error);
    }
  }

  for (auto& recovery : recoveries) {
    if (recovery.continueExecution) {
      return std::move(recovery);
    }
  }
  return std::nullopt;
}

void FiberCompiler::notifyAfterCompile(
    const CompiledStructure& compiled,
    const TickState& state,
    const AfterCompileContext& context) {
  for (FiberId fiber : snapshotFibers()) {
    if (!tree_.contains(fiber)) {
      continue;
    }
    if (const InstanceId instance = tree_.node(fiber).instance) {
      const ComponentPtr component = instances_.at(instance).component;
      try {
        reconciler_.invokeLifecycle(instance, ComponentHookName::OnAfterCompile, [&]() {
          component->onAfterCompile(com_, compiled, state, context);
        });
      } catch (const std::exception& error) {
        logCaughtError(logger_, component->displayName(), "onAfterCompile", error);
      }
    }

    if (!tree_.contains(fiber)) {
      continue;
    }
    const FiberNode& node = tree_.node(fiber);
    std::vector<AfterCompileCallback> callbacks;
    for (const auto& record : node.hooks.records()) {
      if (record.tag == HookTag::AfterCompile) {
        if (const auto& callback = std::get<LifecycleRecord>(record.data).afterCompile) {
          callbacks.push_back(callback);
        }
      }
    }
    const std::string name = node.type.name();
    for (const auto& callback : callbacks) {
      try {
        callback(com_, compiled, state, context);
      } catch (const std::exception& error) {
        logCaughtError(logger_, name, "useAfterCompile", error);
      }
    }
  }
}

void FiberCompiler::notifyComplete(const COMInput& finalState) {
  PhaseScope phase(*workState_, CompilerPhase::Complete);
  for (FiberId fiber : snapshotFibers()) {
    if (!tree_.contains(fiber) || !tree_.node(fiber).instance) {
      continue;
    }
    const InstanceId instance = tree_.node(fiber).instance;
    const ComponentPtr component = instances_.at(instance).component;
    reconciler_.invokeLifecycle(
        instance, ComponentHookName::OnComplete, [&]() { component->onComplete(com_, finalState); });
  }
}

void FiberCompiler::notifyOnMessage(const ExecutionMessage& message, const TickState& state) {
  for (FiberId fiber : snapshotFibers()) {
    if (!tree_.contains(fiber)) {
      continue;
    }
    if (const InstanceId instance = tree_.node(fiber).instance) {
      const ComponentPtr component = instances_.at(instance).component;
      try {
        reconciler_.invokeLifecycle(
            instance, ComponentHookName::OnMessage, [&]() { component->onMessage(com_, message, state); });
      } catch (const std::exception& error) {
        logCaughtError(logger_, component->displayName(), "onMessage", error);
      }
    }

    if (!tree_.contains(fiber)) {
      continue;
    }
    const FiberNode& node = tree_.node(fiber);
    std::vector<MessageCallback> callbacks;
    for (const auto& record : node.hooks.records()) {
      if (record.tag == HookTag::OnMessage) {
        if (const auto& callback = std::get<LifecycleRecord>(record.data).message) {
          callbacks.push_back(callback);
        }
      }
    }
    const std::string name = node.type.name();
    for (const auto& callback : callbacks) {
      try {
        callback(com_, message, state);
      } catch (const std::exception& error) {
        logCaughtError(logger_, name, "useOnMessage", error);
      }
    }
  }
}

void FiberCompiler::unmount() {
  if (!root_) {
    return;
  }
  const FiberId root = root_;
  root_ = FiberId{};
  reconciler_.unmountFiber(root);
}

CompiledStructure FiberCompiler::collect(const TickState& state) const {
  return collector_.collect(root_, state);
}

ComponentPtr FiberCompiler::instanceAt(FiberId fiber) const {
  if (!tree_.contains(fiber)) {
    return nullptr;
  }
  const InstanceRecord* record = instances_.find(tree_.node(fiber).instance);
  return record ? record->component : nullptr;
}

FiberId FiberCompiler::findFiberByKey(const std::string& key) const {
  if (!root_) {
    return FiberId{};
  }
  return prompt::findFiberByKey(tree_, root_, key);
}

} // namespace prompt
