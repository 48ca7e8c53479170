#include "prompt-reconciler/PromptFiberReconciler.h"

#include "shared/PromptErrors.h"
#include "shared/PromptFiberErrorLogger.h"

#include <fmt/format.h>

#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace prompt {

namespace {

constexpr ComponentHookName kLifecycleHooks[] = {
    ComponentHookName::OnMount,
    ComponentHookName::OnUnmount,
    ComponentHookName::OnStart,
    ComponentHookName::OnTickStart,
    ComponentHookName::Render,
    ComponentHookName::OnAfterCompile,
    ComponentHookName::OnTickEnd,
    ComponentHookName::OnMessage,
    ComponentHookName::OnComplete,
    ComponentHookName::OnError,
};

const ComponentHookRegistry& emptyHookRegistry() {
  static const ComponentHookRegistry registry;
  return registry;
}

// Marks the render pass so hook setters do not request recompiles.
class RenderPassScope {
public:
  explicit RenderPassScope(FiberWorkState& state) : state_(state), phase_(state, CompilerPhase::Render) {
    state_.isRendering = true;
  }
  ~RenderPassScope() {
    state_.isRendering = false;
  }

private:
  FiberWorkState& state_;
  PhaseScope phase_;
};

void keepFirst(std::exception_ptr& failure) {
  if (!failure) {
    failure = std::current_exception();
  }
}

} // namespace

FiberReconciler::FiberReconciler(
    FiberTree& tree,
    InstanceTable& instances,
    std::shared_ptr<FiberWorkState> workState,
    const ComponentHookRegistry* hookRegistry)
    : tree_(tree),
      instances_(instances),
      workState_(std::move(workState)),
      hookRegistry_(hookRegistry),
      logger_(Logger::forComponent("FiberReconciler")) {}

FiberId FiberReconciler::reconcileRoot(FiberId current, const ElementPtr& element, const TickState& state) {
  tickState_ = &state;
  RenderPassScope scope(*workState_);
  return reconcileElement(current, element, FiberId{}, 0);
}

FiberId FiberReconciler::reconcileElement(FiberId existing, const ElementPtr& element, FiberId parent, uint32_t index) {
  if (!element || element->type.isUnknown()) {
    if (existing) {
      scheduleDeletion(existing);
    }
    return FiberId{};
  }
  if (existing && canReuse(existing, *element)) {
    FiberNode& node = tree_.node(existing);
    node.type = element->type;
    node.props = element->props;
    node.flags |= Update;
    workInProgress_.push_back(existing);
    beginWork(existing);
    return existing;
  }
  if (existing) {
    unmountReplaced(existing);
  }
  return createFiber(element, parent, index);
}

bool FiberReconciler::canReuse(FiberId existing, const Element& element) const {
  const FiberNode& node = tree_.node(existing);
  return node.type.sameIdentity(element.type) && node.key == element.key;
}

void FiberReconciler::reconcileChildren(FiberId parent, const std::vector<NormalizedChild>& children) {
  const std::vector<FiberId> previous = tree_.children(parent);
  std::vector<bool> claimed(previous.size(), false);
  std::unordered_map<std::string, std::size_t> keyed;
  for (std::size_t i = 0; i < previous.size(); ++i) {
    const auto& key = tree_.node(previous[i]).key;
    if (key) {
      keyed.emplace(*key, i);
    }
  }

  std::vector<FiberId> next;
  std::vector<FiberId> created;
  try {
    for (std::size_t i = 0; i < children.size(); ++i) {
      const NormalizedChild& child = children[i];
      const auto index = static_cast<uint32_t>(next.size());

      if (child.kind != NormalizedChildKind::Element) {
        const ElementTypeKind leafKind =
            child.kind == NormalizedChildKind::Text ? ElementTypeKind::Text : ElementTypeKind::ContentBlock;
        if (i < previous.size() && !claimed[i] && tree_.node(previous[i]).type.kind() == leafKind &&
            !tree_.node(previous[i]).key) {
          claimed[i] = true;
          FiberNode& leaf = tree_.node(previous[i]);
          leaf.text = child.text;
          leaf.block = child.block;
          next.push_back(previous[i]);
        } else {
          if (i < previous.size() && !claimed[i] && !tree_.node(previous[i]).key) {
            claimed[i] = true;
            unmountReplaced(previous[i]);
          }
          FiberId leaf = createLeaf(child, parent, index);
          created.push_back(leaf);
          next.push_back(leaf);
        }
        continue;
      }

      const Element& element = *child.element;
      if (element.type.isUnknown()) {
        continue;
      }

      std::optional<std::size_t> match;
      if (element.key) {
        auto it = keyed.find(*element.key);
        if (it != keyed.end() && !claimed[it->second] && canReuse(previous[it->second], element)) {
          match = it->second;
        }
      } else if (i < previous.size() && !claimed[i] && canReuse(previous[i], element)) {
        match = i;
      }

      FiberId fiber;
      if (match) {
        claimed[*match] = true;
        fiber = reconcileElement(previous[*match], child.element, parent, index);
      } else {
        // Nothing else can claim an unkeyed old child at this position.
        if (i < previous.size() && !claimed[i] && !tree_.node(previous[i]).key) {
          claimed[i] = true;
          unmountReplaced(previous[i]);
        }
        fiber = createFiber(child.element, parent, index);
        created.push_back(fiber);
      }
      if (fiber) {
        next.push_back(fiber);
      }
    }
  } catch (...) {
    // Fibers created by the failed pass are not linked yet.
    for (FiberId fiber : created) {
      scheduleDeletion(fiber);
    }
    throw;
  }

  for (std::size_t i = 0; i < previous.size(); ++i) {
    if (!claimed[i]) {
      scheduleDeletion(previous[i]);
    }
  }
  tree_.setChildren(parent, next);
}

void FiberReconciler::reconcileRendered(FiberId fiber, const ElementPtr& rendered) {
  if (!rendered || rendered->type.isUnknown()) {
    reconcileChildren(fiber, {});
    return;
  }
  if (rendered->type.kind() == ElementTypeKind::Fragment) {
    reconcileChildren(fiber, normalizeChildren(rendered->children()));
    return;
  }
  NormalizedChild child;
  child.kind = NormalizedChildKind::Element;
  child.element = rendered;
  reconcileChildren(fiber, {child});
}

FiberId FiberReconciler::createFiber(const ElementPtr& element, FiberId parent, uint32_t index) {
  FiberId id = tree_.create(element->type, element->props, element->key);
  FiberNode& node = tree_.node(id);
  node.parent = parent;
  node.index = index;
  node.flags |= Placement;
  workInProgress_.push_back(id);
  try {
    beginWork(id);
  } catch (...) {
    scheduleDeletion(id);
    throw;
  }
  return id;
}

FiberId FiberReconciler::createLeaf(const NormalizedChild& child, FiberId parent, uint32_t index) {
  const bool isText = child.kind == NormalizedChildKind::Text;
  FiberId id = tree_.create(isText ? ElementType::text() : ElementType::contentBlock(), Props{}, std::nullopt);
  FiberNode& node = tree_.node(id);
  node.text = child.text;
  node.block = child.block;
  node.parent = parent;
  node.index = index;
  node.flags |= Placement;
  workInProgress_.push_back(id);
  return id;
}

void FiberReconciler::beginWork(FiberId fiber) {
  const ElementType type = tree_.node(fiber).type;
  switch (type.kind()) {
    case ElementTypeKind::FunctionComponent:
      if (type.isTerminalFunction()) {
        reconcileChildren(fiber, normalizeChildren(tree_.node(fiber).props.get("children")));
      } else {
        updateFunctionComponent(fiber);
      }
      return;
    case ElementTypeKind::ClassComponent:
      updateClassComponent(fiber);
      return;
    case ElementTypeKind::PrebuiltInstance:
      updateInstanceComponent(fiber);
      return;
    case ElementTypeKind::HostTag:
    case ElementTypeKind::Fragment:
      reconcileChildren(fiber, normalizeChildren(tree_.node(fiber).props.get("children")));
      return;
    default:
      reconcileChildren(fiber, {});
      return;
  }
}

void FiberReconciler::updateFunctionComponent(FiberId fiber) {
  FiberNode& node = tree_.node(fiber);
  const FunctionComponentPtr component = node.type.functionComponent();
  if (!node.hooks.mounted() && !node.hooks.empty()) {
    // Leftovers of a first render that threw.
    releaseHooks(node.hooks);
  }

  ElementPtr rendered;
  {
    RenderContext context{node.hooks, *workState_->com, *tickState_, node.props, component->name, makeScheduler()};
    RenderContextScope scope(context);
    rendered = component->render(node.props, *workState_->com, *tickState_);
    finishHooks(context);
  }
  node.hooks.markMounted();
  collectEffects(fiber);

  if (rendered && rendered->type.sameIdentity(node.type)) {
    // Returned itself: terminal, only the children reconcile.
    reconcileChildren(fiber, normalizeChildren(rendered->children()));
    return;
  }
  reconcileRendered(fiber, rendered);
}

void FiberReconciler::updateClassComponent(FiberId fiber) {
  FiberNode& node = tree_.node(fiber);
  if (!node.instance) {
    const ComponentClassPtr componentClass = node.type.componentClassPtr();
    ComponentPtr component = componentClass->construct ? componentClass->construct(node.props) : nullptr;
    if (!component) {
      throw std::runtime_error(fmt::format("Component class {} did not produce an instance", componentClass->name));
    }
    if (component->displayName().empty()) {
      component->setDisplayName(componentClass->name);
    }
    mountInstance(fiber, std::move(component), componentClass);
  } else {
    updateInstance(node.instance, node.props, true);
  }
  renderInstance(fiber);
}

void FiberReconciler::updateInstanceComponent(FiberId fiber) {
  FiberNode& node = tree_.node(fiber);
  if (!node.instance) {
    mountInstance(fiber, node.type.prebuiltInstance(), nullptr);
  } else {
    updateInstance(node.instance, node.props, false);
  }
  renderInstance(fiber);
}

void FiberReconciler::mountInstance(FiberId fiber, ComponentPtr component, ComponentClassPtr componentClass) {
  FiberNode& node = tree_.node(fiber);
  ContextObjectModel& com = *workState_->com;

  InstanceRecord record;
  record.component = component;
  record.componentClass = componentClass;
  record.name = component->displayName().empty() ? node.type.name() : component->displayName();
  record.tags = componentClass ? componentClass->tags : autoGenerateTags(record.name);

  if (!node.props.empty()) {
    component->mergeProps(node.props);
  }

  const ComponentHookRegistry& registry = hookRegistry_ ? *hookRegistry_ : emptyHookRegistry();
  for (ComponentHookName hook : kLifecycleHooks) {
    auto middleware = registry.getMiddleware(hook, componentClass.get(), record.name, record.tags);
    if (!middleware.empty()) {
      record.middleware.emplace(hook, std::move(middleware));
    }
  }

  if (auto ref = optionalStringProp(node.props, "ref")) {
    com.setRef(*ref, component);
    record.ref = ref;
    node.ref = ref;
  }

  adoptPropBindings(record, node.props);
  const InstanceId instance = instances_.insert(std::move(record));
  node.instance = instance;

  if (componentClass && componentClass->tool) {
    com.addTool(componentClass->tool);
    ++staticToolOwners_[componentClass->tool->metadata.name];
  }

  invokeLifecycle(instance, ComponentHookName::OnMount, [&]() { component->onMount(com); });
  adoptPropBindings(instances_.at(instance), tree_.node(fiber).props);
}

void FiberReconciler::updateInstance(InstanceId instance, const Props& props, bool mergeProps) {
  InstanceRecord& record = instances_.at(instance);
  adoptPropBindings(record, props);
  for (auto& [key, signal] : record.propSignals) {
    const Value next = props.get(key);
    if (!next.isUndefined() && next != signal->get()) {
      signal->set(next);
    }
  }
  if (mergeProps && !props.empty()) {
    record.component->mergeProps(props);
  }
}

void FiberReconciler::adoptPropBindings(InstanceRecord& record, const Props& props) {
  for (auto& signal : record.component->takePropBindings()) {
    const Value current = props.get(signal->propKey());
    if (!current.isUndefined()) {
      signal->set(current);
    }
    record.propSignals[signal->propKey()] = std::move(signal);
  }
}

void FiberReconciler::renderInstance(FiberId fiber) {
  const InstanceId instance = tree_.node(fiber).instance;
  ComponentPtr component = instances_.at(instance).component;
  ElementPtr rendered;
  invokeLifecycle(instance, ComponentHookName::Render, [&]() {
    rendered = component->render(*workState_->com, *tickState_);
  });
  reconcileRendered(fiber, rendered);
}

void FiberReconciler::scheduleDeletion(FiberId fiber) {
  if (!tree_.contains(fiber)) {
    return;
  }
  tree_.detach(fiber);
  tree_.node(fiber).flags |= Deletion;
  deletions_.push_back(fiber);
}

void FiberReconciler::unmountReplaced(FiberId fiber) {
  if (!tree_.contains(fiber)) {
    return;
  }
  tree_.detach(fiber);
  try {
    unmountFiber(fiber);
  } catch (const std::exception&) {
    keepFirst(replacementFailure_);
  }
}

void FiberReconciler::collectEffects(FiberId fiber) {
  const HookList& hooks = tree_.node(fiber).hooks;
  for (std::size_t i = 0; i < hooks.size(); ++i) {
    const auto* effect = std::get_if<EffectRecord>(&hooks.at(i).data);
    if (effect && effect->pending) {
      pendingEffects_.push_back(PendingEffect{fiber, i, effect->phase});
    }
  }
}

void FiberReconciler::commit() {
  std::exception_ptr failure = std::exchange(replacementFailure_, nullptr);

  std::vector<FiberId> deletions;
  deletions.swap(deletions_);
  for (FiberId fiber : deletions) {
    try {
      unmountFiber(fiber);
    } catch (const std::exception&) {
      keepFirst(failure);
    }
  }

  {
    PhaseScope phase(*workState_, CompilerPhase::Mount);
    runEffects(EffectPhase::Mount);
  }
  {
    PhaseScope phase(*workState_, CompilerPhase::Compile);
    runEffects(EffectPhase::Commit);
  }

  for (FiberId fiber : workInProgress_) {
    if (tree_.contains(fiber)) {
      tree_.node(fiber).flags = NoFlags;
    }
  }
  workInProgress_.clear();

  if (failure) {
    std::rethrow_exception(failure);
  }
}

void FiberReconciler::commitAfterFailure() noexcept {
  try {
    commit();
  } catch (const std::exception& error) {
    logCaughtError(logger_, "root", "commit after failed render", error);
  }
}

void FiberReconciler::runEffects(EffectPhase phase) {
  std::vector<PendingEffect> ready;
  std::vector<PendingEffect> remaining;
  for (auto& effect : pendingEffects_) {
    (effect.phase == phase ? ready : remaining).push_back(effect);
  }
  pendingEffects_.swap(remaining);

  for (const auto& pending : ready) {
    if (!tree_.contains(pending.fiber)) {
      continue;
    }
    FiberNode& node = tree_.node(pending.fiber);
    if (pending.hookIndex >= node.hooks.size()) {
      continue;
    }
    auto* effect = std::get_if<EffectRecord>(&node.hooks.at(pending.hookIndex).data);
    if (effect == nullptr || !effect->pending) {
      continue;
    }
    effect->pending = false;
    const std::string componentName = node.type.name();
    try {
      if (effect->destroy) {
        EffectCleanup destroy = std::move(effect->destroy);
        effect->destroy = nullptr;
        destroy();
      }
      if (effect->create) {
        EffectCleanup cleanup = effect->create(*workState_->com);
        // The record may have been released while the effect ran.
        if (tree_.contains(pending.fiber) && pending.hookIndex < tree_.node(pending.fiber).hooks.size()) {
          if (auto* current = std::get_if<EffectRecord>(&tree_.node(pending.fiber).hooks.at(pending.hookIndex).data)) {
            current->destroy = std::move(cleanup);
          }
        }
      }
    } catch (const std::exception& error) {
      logCaughtError(logger_, componentName, "effect", error);
    }
  }
}

void FiberReconciler::unmountFiber(FiberId id) {
  if (!tree_.contains(id)) {
    return;
  }
  std::exception_ptr failure;
  for (FiberId child : tree_.children(id)) {
    try {
      unmountFiber(child);
    } catch (const std::exception&) {
      keepFirst(failure);
    }
  }

  {
    PhaseScope phase(*workState_, CompilerPhase::Unmount);
    FiberNode& node = tree_.node(id);
    try {
      releaseHooks(node.hooks);
    } catch (const std::exception& error) {
      if (!isAbortError(error)) {
        keepFirst(failure);
      }
    }
    if (node.instance) {
      const InstanceId instance = node.instance;
      node.instance = InstanceId{};
      try {
        unmountInstance(instance);
      } catch (const std::exception&) {
        keepFirst(failure);
      }
    }
  }

  tree_.destroy(id);
  if (failure) {
    std::rethrow_exception(failure);
  }
}

void FiberReconciler::releaseHooks(HookList& hooks) {
  std::exception_ptr failure;
  for (auto& record : hooks.records()) {
    if (auto* effect = std::get_if<EffectRecord>(&record.data)) {
      if (effect->destroy) {
        EffectCleanup destroy = std::move(effect->destroy);
        effect->destroy = nullptr;
        try {
          destroy();
        } catch (const std::exception&) {
          keepFirst(failure);
        }
      }
    } else if (auto* signal = std::get_if<SignalRecord>(&record.data)) {
      if (signal->signal) {
        signal->signal->dispose();
      }
    } else if (auto* state = std::get_if<StateRecord>(&record.data)) {
      if (state->queue) {
        state->queue->scheduleUpdate = nullptr;
      }
    }
  }
  hooks.reset();
  if (failure) {
    std::rethrow_exception(failure);
  }
}

void FiberReconciler::unmountInstance(InstanceId instance) {
  InstanceRecord& record = instances_.at(instance);
  ContextObjectModel& com = *workState_->com;
  const ComponentPtr component = record.component;

  for (auto& [key, signal] : record.propSignals) {
    signal->dispose();
  }

  std::exception_ptr failure;
  try {
    invokeLifecycle(instance, ComponentHookName::OnUnmount, [&]() { component->onUnmount(com); });
  } catch (const std::exception& error) {
    if (isAbortError(error)) {
      logger_.debug("Ignoring cancellation while unmounting <{}>: {}", record.name, error.what());
    } else {
      keepFirst(failure);
    }
  }

  InstanceRecord& released = instances_.at(instance);
  if (released.ref && com.getRef(*released.ref) == component) {
    com.removeRef(*released.ref);
  }
  if (released.componentClass && released.componentClass->tool) {
    const ExecutableToolPtr& tool = released.componentClass->tool;
    auto owners = staticToolOwners_.find(tool->metadata.name);
    if (owners != staticToolOwners_.end() && --owners->second == 0) {
      staticToolOwners_.erase(owners);
      if (com.getTool(tool->metadata.name) == tool) {
        com.removeTool(tool->metadata.name);
      }
    }
  }
  instances_.erase(instance);

  if (failure) {
    std::rethrow_exception(failure);
  }
}

void FiberReconciler::invokeLifecycle(InstanceId instance, ComponentHookName hook, const std::function<void()>& call) {
  const InstanceRecord& record = instances_.at(instance);
  auto it = record.middleware.find(hook);
  if (it == record.middleware.end()) {
    call();
    return;
  }
  // Copies: middleware may mount or unmount other instances.
  const std::vector<ComponentHookMiddleware> middleware = it->second;
  const std::string name = record.name;
  const std::vector<std::string> tags = record.tags;
  const ComponentPtr component = record.component;
  ComponentHookInvocation invocation{hook, name, tags, *component};
  runWithMiddleware(middleware, invocation, call);
}

ScheduleUpdate FiberReconciler::makeScheduler() const {
  std::weak_ptr<FiberWorkState> weakState = workState_;
  return [weakState]() {
    if (auto state = weakState.lock()) {
      state->scheduleWork();
    }
  };
}

} // namespace prompt
