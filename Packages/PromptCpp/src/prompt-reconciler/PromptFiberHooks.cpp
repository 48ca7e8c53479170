#include "prompt-reconciler/PromptFiberHooks.h"

#include "shared/PromptErrors.h"

#include <fmt/format.h>

namespace prompt {

namespace {

thread_local RenderContext* currentContext = nullptr;

// Signal created by useSignal; a changing set() schedules the owning fiber.
class HookSignal : public Signal {
public:
  HookSignal(Value initial, ScheduleUpdate scheduleUpdate)
      : Signal(std::move(initial), "useSignal"), scheduleUpdate_(std::move(scheduleUpdate)) {}

  void set(Value next) override {
    if (isDisposed()) {
      return;
    }
    const bool changed = next != get();
    Signal::set(std::move(next));
    if (changed && scheduleUpdate_) {
      scheduleUpdate_();
    }
  }

private:
  ScheduleUpdate scheduleUpdate_;
};

Value basicStateReducer(const Value& /*state*/, const Value& action) {
  return action;
}

template <typename Record>
Record& recordData(HookRecord& record) {
  return std::get<Record>(record.data);
}

} // namespace

const char* hookTagName(HookTag tag) {
  switch (tag) {
    case HookTag::State:
      return "useState";
    case HookTag::Reducer:
      return "useReducer";
    case HookTag::Signal:
      return "useSignal";
    case HookTag::ComState:
      return "useComState";
    case HookTag::Watch:
      return "useWatch";
    case HookTag::Computed:
      return "useComputed";
    case HookTag::Effect:
      return "useEffect";
    case HookTag::TickStart:
      return "useTickStart";
    case HookTag::TickEnd:
      return "useTickEnd";
    case HookTag::AfterCompile:
      return "useAfterCompile";
    case HookTag::OnMessage:
      return "useOnMessage";
    case HookTag::Memo:
      return "useMemo";
    case HookTag::Callback:
      return "useCallback";
    case HookTag::Ref:
      return "useRef";
  }
  return "unknown";
}

void StateQueue::dispatch(const Value& action) {
  Value next = reducer ? reducer(state, action) : action;
  if (next == state) {
    return;
  }
  state = std::move(next);
  if (scheduleUpdate) {
    scheduleUpdate();
  }
}

void StateQueue::apply(const StateUpdater& updater) {
  dispatch(updater(state));
}

RenderContextScope::RenderContextScope(RenderContext& context) : previous_(currentContext) {
  currentContext = &context;
}

RenderContextScope::~RenderContextScope() {
  currentContext = previous_;
}

RenderContext& currentRenderContext() {
  if (currentContext == nullptr) {
    throw InvalidHookCallError(
        "Invalid hook call. Hooks can only be called inside the body of a function component");
  }
  return *currentContext;
}

bool isRenderingComponent() {
  return currentContext != nullptr;
}

HookRecord& nextHook(HookTag tag) {
  RenderContext& context = currentRenderContext();
  HookList& hooks = context.hooks;
  const std::size_t index = context.cursor++;

  if (!hooks.mounted()) {
    if (index < hooks.size()) {
      throw HookOrderError(fmt::format(
          "{} called twice at position {} in <{}> during mount",
          hookTagName(tag),
          index,
          context.componentName));
    }
    HookRecord record{tag, {}};
    switch (tag) {
      case HookTag::State:
      case HookTag::Reducer:
        record.data = StateRecord{};
        break;
      case HookTag::Signal:
      case HookTag::ComState:
      case HookTag::Watch:
      case HookTag::Computed:
        record.data = SignalRecord{};
        break;
      case HookTag::Effect:
        record.data = EffectRecord{};
        break;
      case HookTag::TickStart:
      case HookTag::TickEnd:
      case HookTag::AfterCompile:
      case HookTag::OnMessage:
        record.data = LifecycleRecord{};
        break;
      case HookTag::Memo:
      case HookTag::Callback:
        record.data = MemoRecord{};
        break;
      case HookTag::Ref:
        record.data = RefRecord{};
        break;
    }
    hooks.append(std::move(record));
    return hooks.at(index);
  }

  if (index >= hooks.size()) {
    throw HookOrderError("Rendered more hooks than during the previous render");
  }
  HookRecord& record = hooks.at(index);
  if (record.tag != tag) {
    throw HookOrderError(fmt::format(
        "Hook order changed in <{}>: expected {} at position {} but got {}",
        context.componentName,
        hookTagName(record.tag),
        index,
        hookTagName(tag)));
  }
  return record;
}

void finishHooks(RenderContext& context) {
  if (context.hooks.mounted() && context.cursor != context.hooks.size()) {
    throw HookOrderError(fmt::format(
        "Rendered fewer hooks than during the previous render in <{}> ({} of {})",
        context.componentName,
        context.cursor,
        context.hooks.size()));
  }
}

bool areHookInputsEqual(const std::vector<Value>& next, const std::optional<std::vector<Value>>& previous) {
  if (!previous || previous->size() != next.size()) {
    return false;
  }
  for (std::size_t i = 0; i < next.size(); ++i) {
    if (next[i] != (*previous)[i]) {
      return false;
    }
  }
  return true;
}

ReducerHandle useReducer(Reducer reducer, Value initialArg, const std::function<Value(const Value&)>& init) {
  RenderContext& context = currentRenderContext();
  StateRecord& record = recordData<StateRecord>(nextHook(HookTag::Reducer));
  if (!record.queue) {
    record.queue = std::make_shared<StateQueue>();
    record.queue->state = init ? init(initialArg) : std::move(initialArg);
  }
  record.queue->reducer = std::move(reducer);
  record.queue->scheduleUpdate = context.scheduleUpdate;

  std::weak_ptr<StateQueue> weakQueue = record.queue;
  return ReducerHandle{
      record.queue->state,
      [weakQueue](const Value& action) {
        if (auto queue = weakQueue.lock()) {
          queue->dispatch(action);
        }
      }};
}

StateHandle useState(Value initialValue) {
  RenderContext& context = currentRenderContext();
  StateRecord& record = recordData<StateRecord>(nextHook(HookTag::State));
  if (!record.queue) {
    record.queue = std::make_shared<StateQueue>();
    record.queue->state = std::move(initialValue);
    record.queue->reducer = basicStateReducer;
  }
  record.queue->scheduleUpdate = context.scheduleUpdate;

  std::weak_ptr<StateQueue> weakQueue = record.queue;
  return StateHandle{
      record.queue->state,
      [weakQueue](Value next) {
        if (auto queue = weakQueue.lock()) {
          queue->dispatch(next);
        }
      },
      [weakQueue](const StateUpdater& updater) {
        if (auto queue = weakQueue.lock()) {
          queue->apply(updater);
        }
      }};
}

SignalPtr useSignal(Value initialValue) {
  RenderContext& context = currentRenderContext();
  SignalRecord& record = recordData<SignalRecord>(nextHook(HookTag::Signal));
  if (!record.signal) {
    record.signal = std::make_shared<HookSignal>(std::move(initialValue), context.scheduleUpdate);
  }
  return record.signal;
}

SignalPtr useComState(const std::string& key, Value initialValue) {
  RenderContext& context = currentRenderContext();
  SignalRecord& record = recordData<SignalRecord>(nextHook(HookTag::ComState));
  if (!record.signal) {
    record.signal = createComStateSignal(context.com, key, std::move(initialValue));
  }
  return record.signal;
}

SignalPtr useWatch(const std::string& key, Value defaultValue) {
  RenderContext& context = currentRenderContext();
  SignalRecord& record = recordData<SignalRecord>(nextHook(HookTag::Watch));
  if (!record.signal) {
    record.signal = createReadonlyComStateSignal(context.com, key, std::move(defaultValue));
  }
  return record.signal;
}

std::shared_ptr<ComputedSignal> useComputed(
    std::function<Value()> compute,
    const std::vector<Value>& deps,
    std::vector<SignalPtr> sources) {
  SignalRecord& record = recordData<SignalRecord>(nextHook(HookTag::Computed));
  if (record.signal && areHookInputsEqual(deps, record.deps)) {
    return std::static_pointer_cast<ComputedSignal>(record.signal);
  }
  if (record.signal) {
    record.signal->dispose();
  }
  auto signal = computed(std::move(sources), std::move(compute));
  record.signal = signal;
  record.deps = deps;
  return signal;
}

Value useInput(const std::string& propKey, Value defaultValue) {
  RenderContext& context = currentRenderContext();
  Value value = context.props.get(propKey);
  return value.isUndefined() ? std::move(defaultValue) : value;
}

namespace {

void updateEffect(HookTag tag, EffectPhase phase, EffectCallback create, std::optional<std::vector<Value>> deps) {
  EffectRecord& record = recordData<EffectRecord>(nextHook(tag));
  const bool unchanged = record.create && deps && areHookInputsEqual(*deps, record.deps);
  if (unchanged) {
    record.pending = false;
    return;
  }
  record.phase = phase;
  record.create = std::move(create);
  record.deps = std::move(deps);
  record.pending = true;
}

LifecycleRecord& nextLifecycle(HookTag tag) {
  return recordData<LifecycleRecord>(nextHook(tag));
}

} // namespace

void useEffect(EffectCallback create, std::optional<std::vector<Value>> deps) {
  updateEffect(HookTag::Effect, EffectPhase::Commit, std::move(create), std::move(deps));
}

void useOnMount(std::function<void(ContextObjectModel& com)> callback) {
  updateEffect(
      HookTag::Effect,
      EffectPhase::Mount,
      [callback = std::move(callback)](ContextObjectModel& com) -> EffectCleanup {
        callback(com);
        return nullptr;
      },
      std::vector<Value>{});
}

void useOnUnmount(std::function<void(ContextObjectModel& com)> callback) {
  updateEffect(
      HookTag::Effect,
      EffectPhase::Commit,
      [callback = std::move(callback)](ContextObjectModel& com) -> EffectCleanup {
        ContextObjectModel* target = &com;
        return [callback, target]() { callback(*target); };
      },
      std::vector<Value>{});
}

void useTickStart(TickCallback callback) {
  nextLifecycle(HookTag::TickStart).tick = std::move(callback);
}

void useTickEnd(TickCallback callback) {
  nextLifecycle(HookTag::TickEnd).tick = std::move(callback);
}

void useAfterCompile(AfterCompileCallback callback) {
  nextLifecycle(HookTag::AfterCompile).afterCompile = std::move(callback);
}

void useOnMessage(MessageCallback callback) {
  nextLifecycle(HookTag::OnMessage).message = std::move(callback);
}

MemoRecord& nextMemoRecord(HookTag tag, const std::vector<Value>& deps, bool& stale) {
  MemoRecord& record = recordData<MemoRecord>(nextHook(tag));
  stale = !record.value.has_value() || !areHookInputsEqual(deps, record.deps);
  if (stale) {
    record.deps = deps;
  }
  return record;
}

Value useMemo(const std::function<Value()>& factory, const std::vector<Value>& deps) {
  bool stale = false;
  MemoRecord& record = nextMemoRecord(HookTag::Memo, deps, stale);
  if (stale) {
    record.value = factory();
  }
  return std::any_cast<Value>(record.value);
}

RefPtr useRef(Value initialValue) {
  RefRecord& record = recordData<RefRecord>(nextHook(HookTag::Ref));
  if (!record.ref) {
    record.ref = std::make_shared<RefObject>(RefObject{std::move(initialValue)});
  }
  return record.ref;
}

ComponentPtr useCOMRef(const std::string& refName) {
  return currentRenderContext().com.getRef(refName);
}

Value usePrevious(const Value& value) {
  RefPtr ref = useRef();
  Value previous = ref->current;
  ref->current = value;
  return previous;
}

} // namespace prompt
