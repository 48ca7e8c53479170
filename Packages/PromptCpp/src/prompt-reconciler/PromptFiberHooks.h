#pragma once

#include "com/PromptObjectModel.h"
#include "component/PromptComponent.h"
#include "component/PromptTickState.h"
#include "runtime/PromptValue.h"
#include "state/PromptSignal.h"

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prompt {

struct CompiledStructure;

enum class HookTag : uint8_t {
  State,
  Reducer,
  Signal,
  ComState,
  Watch,
  Computed,
  Effect,
  TickStart,
  TickEnd,
  AfterCompile,
  OnMessage,
  Memo,
  Callback,
  Ref,
};

const char* hookTagName(HookTag tag);

enum class EffectPhase : uint8_t {
  Mount,
  Commit,
  TickStart,
  TickEnd,
  AfterCompile,
  Unmount,
};

using EffectCleanup = std::function<void()>;
using EffectCallback = std::function<EffectCleanup(ContextObjectModel& com)>;
using TickCallback = std::function<void(ContextObjectModel& com, const TickState& state)>;
using AfterCompileCallback = std::function<void(
    ContextObjectModel& com,
    const CompiledStructure& compiled,
    const TickState& state,
    const AfterCompileContext& context)>;
using MessageCallback =
    std::function<void(ContextObjectModel& com, const ExecutionMessage& message, const TickState& state)>;

using Reducer = std::function<Value(const Value& state, const Value& action)>;
using StateUpdater = std::function<Value(const Value& previous)>;
using ScheduleUpdate = std::function<void()>;

// Current value of a state or reducer hook. Dispatching applies the reducer
// immediately and requests an update unless the result is unchanged.
struct StateQueue {
  Value state;
  Reducer reducer;
  ScheduleUpdate scheduleUpdate;

  void dispatch(const Value& action);
  void apply(const StateUpdater& updater);
};

struct RefObject {
  Value current;
};

using RefPtr = std::shared_ptr<RefObject>;

struct StateRecord {
  std::shared_ptr<StateQueue> queue;
};

// Signals owned by the fiber; disposed on unmount.
struct SignalRecord {
  SignalPtr signal;
  std::optional<std::vector<Value>> deps;
};

struct EffectRecord {
  EffectPhase phase{EffectPhase::Commit};
  EffectCallback create;
  EffectCleanup destroy;
  std::optional<std::vector<Value>> deps;
  bool pending{false};
};

// Callback refreshed on every render and invoked by the compiler later.
struct LifecycleRecord {
  TickCallback tick;
  AfterCompileCallback afterCompile;
  MessageCallback message;
};

struct MemoRecord {
  std::any value;
  std::optional<std::vector<Value>> deps;
};

struct RefRecord {
  RefPtr ref;
};

struct HookRecord {
  HookTag tag;
  std::variant<StateRecord, SignalRecord, EffectRecord, LifecycleRecord, MemoRecord, RefRecord> data;
};

// Positional hook records of one function component fiber.
class HookList {
public:
  std::size_t size() const {
    return records_.size();
  }
  bool empty() const {
    return records_.empty();
  }
  HookRecord& at(std::size_t index) {
    return records_.at(index);
  }
  const HookRecord& at(std::size_t index) const {
    return records_.at(index);
  }
  std::vector<HookRecord>& records() {
    return records_;
  }
  const std::vector<HookRecord>& records() const {
    return records_;
  }
  void append(HookRecord record) {
    records_.push_back(std::move(record));
  }

  // False until one render finished without throwing.
  bool mounted() const {
    return mounted_;
  }
  void markMounted() {
    mounted_ = true;
  }

  void reset() {
    records_.clear();
    mounted_ = false;
  }

private:
  std::vector<HookRecord> records_;
  bool mounted_{false};
};

struct RenderContext {
  HookList& hooks;
  ContextObjectModel& com;
  const TickState& tickState;
  const Props& props;
  const std::string& componentName;
  ScheduleUpdate scheduleUpdate;
  std::size_t cursor{0};
};

// Installs a render context for the current thread and restores the
// previous one on destruction.
class RenderContextScope {
public:
  explicit RenderContextScope(RenderContext& context);
  ~RenderContextScope();

  RenderContextScope(const RenderContextScope&) = delete;
  RenderContextScope& operator=(const RenderContextScope&) = delete;

private:
  RenderContext* previous_;
};

// Throws InvalidHookCallError outside of a function component render.
RenderContext& currentRenderContext();
bool isRenderingComponent();

// Record at the cursor, created on mount. Throws HookOrderError when the
// call sequence diverges from the previous render.
HookRecord& nextHook(HookTag tag);

// Verifies every record of the previous render was consumed.
void finishHooks(RenderContext& context);

bool areHookInputsEqual(const std::vector<Value>& next, const std::optional<std::vector<Value>>& previous);

struct StateHandle {
  Value value;
  std::function<void(Value next)> set;
  std::function<void(const StateUpdater& updater)> update;
};

struct ReducerHandle {
  Value state;
  std::function<void(const Value& action)> dispatch;
};

StateHandle useState(Value initialValue);
ReducerHandle useReducer(
    Reducer reducer,
    Value initialArg,
    const std::function<Value(const Value&)>& init = nullptr);

// Local signal; a changing set() requests a recompile.
SignalPtr useSignal(Value initialValue);
SignalPtr useComState(const std::string& key, Value initialValue);
SignalPtr useWatch(const std::string& key, Value defaultValue = Value::undefined());
std::shared_ptr<ComputedSignal> useComputed(
    std::function<Value()> compute,
    const std::vector<Value>& deps,
    std::vector<SignalPtr> sources = {});
Value useInput(const std::string& propKey, Value defaultValue = Value::undefined());

void useEffect(EffectCallback create, std::optional<std::vector<Value>> deps = std::nullopt);
void useOnMount(std::function<void(ContextObjectModel& com)> callback);
void useOnUnmount(std::function<void(ContextObjectModel& com)> callback);
void useTickStart(TickCallback callback);
void useTickEnd(TickCallback callback);
void useAfterCompile(AfterCompileCallback callback);
void useOnMessage(MessageCallback callback);

Value useMemo(const std::function<Value()>& factory, const std::vector<Value>& deps);

// Memo record at the cursor. `stale` is set when deps changed.
MemoRecord& nextMemoRecord(HookTag tag, const std::vector<Value>& deps, bool& stale);

template <typename Fn>
Fn useCallback(Fn callback, const std::vector<Value>& deps) {
  bool stale = false;
  MemoRecord& record = nextMemoRecord(HookTag::Callback, deps, stale);
  if (stale || std::any_cast<Fn>(&record.value) == nullptr) {
    record.value = std::move(callback);
  }
  return std::any_cast<Fn>(record.value);
}

RefPtr useRef(Value initialValue = Value::undefined());
ComponentPtr useCOMRef(const std::string& refName);
Value usePrevious(const Value& value);

} // namespace prompt
