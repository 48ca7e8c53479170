#include "prompt-reconciler/PromptFiberCompiler.h"
#include "prompt-reconciler/PromptFiberHooks.h"
#include "shared/PromptErrors.h"

#include <cassert>
#include <functional>
#include <string>
#include <vector>

namespace prompt::test {

namespace {

struct Observed {
  std::vector<double> counts;
  std::function<void(Value)> setCount;
  int memoRuns{0};
  Value memo;
  RefPtr ref;
  Value reduced;
  std::function<void(const Value&)> dispatch;
  Value previous;
  Value input;
  SignalPtr signal;
  SignalPtr shared;
  SignalPtr watched;
  Value product;
  int effectRuns{0};
  int effectCleanups{0};
  int mounts{0};
  int unmounts{0};
};

} // namespace

bool runPromptHooksTests() {
  // Hooks outside a render are rejected.
  bool invalidThrew = false;
  try {
    useState(Value::number(0));
  } catch (const InvalidHookCallError&) {
    invalidThrew = true;
  }
  assert(invalidThrew);
  assert(!isRenderingComponent());

  assert(areHookInputsEqual({Value::number(1)}, std::vector<Value>{Value::number(1)}));
  assert(!areHookInputsEqual({Value::number(1)}, std::nullopt));
  assert(!areHookInputsEqual({Value::number(1)}, std::vector<Value>{}));

  {
    ContextObjectModel com;
    Observed observed;
    const TickState tick = makeTickState();

    auto everything = defineFunctionComponent("Everything", [&observed](const Props& props, ContextObjectModel&, const TickState&) {
      auto count = useState(Value::number(0));
      observed.counts.push_back(count.value.asNumber());
      observed.setCount = count.set;

      const Value dep = props.get("dep");
      observed.memo = useMemo(
          [&observed, dep]() {
            ++observed.memoRuns;
            return Value::string("memo " + dep.toDisplayString());
          },
          {dep});

      observed.ref = useRef(Value::number(0));
      observed.ref->current = Value::number(observed.ref->current.asNumber() + 1);

      auto reducer = useReducer(
          [](const Value& state, const Value& action) { return Value::number(state.asNumber() + action.asNumber()); },
          Value::number(10));
      observed.reduced = reducer.state;
      observed.dispatch = reducer.dispatch;

      observed.previous = usePrevious(dep);
      observed.input = useInput("title", Value("untitled"));
      observed.signal = useSignal(Value("idle"));
      observed.shared = useComState("mode", Value("draft"));
      observed.watched = useWatch("mode");

      auto source = observed.signal;
      auto product = useComputed([source]() { return Value::string(source->get().asString() + "!"); }, {}, {source});
      observed.product = product->get();

      useEffect(
          [&observed](ContextObjectModel&) -> EffectCleanup {
            ++observed.effectRuns;
            return [&observed]() { ++observed.effectCleanups; };
          },
          std::vector<Value>{dep});
      useOnMount([&observed](ContextObjectModel&) { ++observed.mounts; });
      useOnUnmount([&observed](ContextObjectModel&) { ++observed.unmounts; });
      return ElementPtr{};
    });

    FiberCompiler compiler(com);
    compiler.compile(jsx(everything, Props{{"dep", Value::number(1)}}), tick);
    assert(observed.counts == (std::vector<double>{0}));
    assert(observed.memo == Value("memo 1"));
    assert(observed.memoRuns == 1);
    assert(observed.reduced == Value::number(10));
    assert(observed.previous.isUndefined());
    assert(observed.input == Value("untitled"));
    assert(observed.shared->get() == Value("draft"));
    assert(com.getState("mode") == Value("draft"));
    assert(observed.watched->get() == Value("draft"));
    assert(observed.product == Value("idle!"));
    assert(observed.effectRuns == 1);
    assert(observed.mounts == 1);
    assert(!com.wasRecompileRequested());

    // Setters outside a render request a recompile and persist.
    observed.setCount(Value::number(5));
    assert(com.wasRecompileRequested());
    assert(com.getRecompileReasons() == (std::vector<std::string>{"fiber state update"}));
    com.resetRecompileRequest();
    observed.setCount(Value::number(5));
    assert(!com.wasRecompileRequested());

    observed.dispatch(Value::number(5));
    assert(com.wasRecompileRequested());
    com.resetRecompileRequest();

    observed.signal->set(Value("busy"));
    assert(com.wasRecompileRequested());
    com.resetRecompileRequest();

    compiler.compile(jsx(everything, Props{{"dep", Value::number(1)}, {"title", "Report"}}), tick);
    assert(observed.counts == (std::vector<double>{0, 5}));
    assert(observed.memoRuns == 1);
    assert(observed.ref->current == Value::number(2));
    assert(observed.reduced == Value::number(15));
    assert(observed.previous == Value::number(1));
    assert(observed.input == Value("Report"));
    assert(observed.product == Value("busy!"));
    assert(observed.effectRuns == 1);
    assert(observed.effectCleanups == 0);
    assert(observed.mounts == 1);

    // Changed deps rerun memo and effect after cleaning up the previous run.
    compiler.compile(jsx(everything, Props{{"dep", Value::number(2)}}), tick);
    assert(observed.memo == Value("memo 2"));
    assert(observed.memoRuns == 2);
    assert(observed.effectRuns == 2);
    assert(observed.effectCleanups == 1);

    // Shared state flows both ways.
    com.setState("mode", Value("final"));
    assert(observed.shared->get() == Value("final"));
    assert(observed.watched->get() == Value("final"));

    SignalPtr localSignal = observed.signal;
    compiler.unmount();
    assert(observed.effectCleanups == 2);
    assert(observed.unmounts == 1);
    assert(localSignal->isDisposed());
  }

  {
    // A state update made while rendering does not request a recompile;
    // one made in an effect does.
    ContextObjectModel com;
    const TickState tick = makeTickState();

    auto eager = defineFunctionComponent("Eager", [](const Props&, ContextObjectModel&, const TickState&) {
      auto value = useState(Value::number(0));
      if (value.value.asNumber() == 0) {
        value.set(Value::number(1));
      }
      return ElementPtr{};
    });
    auto loader = defineFunctionComponent("Loader", [](const Props&, ContextObjectModel&, const TickState&) {
      auto loaded = useState(Value::boolean(false));
      auto set = loaded.set;
      useEffect(
          [set](ContextObjectModel&) -> EffectCleanup {
            set(Value::boolean(true));
            return nullptr;
          },
          std::vector<Value>{});
      return ElementPtr{};
    });

    FiberCompiler compiler(com);
    compiler.compile(jsx(eager), tick);
    assert(!com.wasRecompileRequested());

    FiberCompiler effectCompiler(com);
    effectCompiler.compile(jsx(loader), tick);
    assert(com.wasRecompileRequested());
    assert(com.getRecompileReasons() == (std::vector<std::string>{"fiber state update"}));
  }

  {
    // Hook order is checked between renders.
    ContextObjectModel com;
    const TickState tick = makeTickState();

    auto conditional = defineFunctionComponent("Conditional", [](const Props& props, ContextObjectModel&, const TickState&) {
      useState(Value::number(0));
      if (props.get("extra").isTruthy()) {
        useRef();
      }
      return ElementPtr{};
    });
    auto swapping = defineFunctionComponent("Swapping", [](const Props& props, ContextObjectModel&, const TickState&) {
      if (props.get("ref").isTruthy()) {
        useRef();
      } else {
        useState(Value::number(0));
      }
      return ElementPtr{};
    });

    FiberCompiler compiler(com);
    compiler.compile(jsx(conditional), tick);

    bool moreThrew = false;
    try {
      compiler.compile(jsx(conditional, Props{{"extra", Value::boolean(true)}}), tick);
    } catch (const HookOrderError&) {
      moreThrew = true;
    }
    assert(moreThrew);

    compiler.compile(jsx(conditional), tick);

    FiberCompiler swapCompiler(com);
    swapCompiler.compile(jsx(swapping), tick);
    bool swapThrew = false;
    try {
      swapCompiler.compile(jsx(swapping, Props{{"ref", Value::boolean(true)}}), tick);
    } catch (const HookOrderError& error) {
      swapThrew = std::string(error.what()).find("Swapping") != std::string::npos;
    }
    assert(swapThrew);
  }

  return true;
}

} // namespace prompt::test
