#include "com/PromptObjectModel.h"
#include "state/PromptSignal.h"

#include <cassert>
#include <stdexcept>
#include <vector>

namespace prompt::test {

bool runPromptSignalTests() {
  // Subscribers fire on change only.
  auto count = createSignal(Value::number(0), "count");
  std::vector<double> seen;
  auto subscription = count->subscribe([&](const Value& next, const Value& previous) {
    seen.push_back(next.asNumber());
    assert(previous.isNumber());
  });
  count->set(Value::number(1));
  count->set(Value::number(1));
  count->update([](const Value& value) { return Value::number(value.asNumber() + 1); });
  assert((*count)() == Value::number(2));
  assert(seen == (std::vector<double>{1, 2}));

  count->unsubscribe(subscription);
  count->set(Value::number(5));
  assert(seen.size() == 2);

  count->dispose();
  count->set(Value::number(9));
  assert(count->get() == Value::number(5));
  assert(count->isDisposed());

  // Batches defer notifications until the outermost scope closes.
  auto batched = createSignal(Value("a"));
  int notifications = 0;
  batched->subscribe([&](const Value&, const Value&) { ++notifications; });
  {
    SignalBatch outer;
    batched->set(Value("b"));
    {
      SignalBatch inner;
      batched->set(Value("c"));
    }
    assert(notifications == 0);
    assert(SignalBatch::active());
  }
  assert(notifications == 2);
  assert(!SignalBatch::active());

  // Computed signals follow their sources.
  auto first = createSignal(Value::number(2));
  auto second = createSignal(Value::number(3));
  auto product = computed({first, second}, [first, second]() {
    return Value::number(first->get().asNumber() * second->get().asNumber());
  });
  assert(product->get() == Value::number(6));
  first->set(Value::number(4));
  assert(product->get() == Value::number(12));
  bool computedThrew = false;
  try {
    product->set(Value::number(1));
  } catch (const std::logic_error&) {
    computedThrew = true;
  }
  assert(computedThrew);
  product->dispose();
  assert(first->subscriberCount() == 0);

  // Prop signals start from their default.
  PropSignal prop("title", Value("untitled"));
  assert(prop.get() == Value("untitled"));
  assert(prop.propKey() == "title");

  // Object model state signals bind both ways.
  ContextObjectModel com;
  auto mode = createComStateSignal(com, "mode", Value("draft"));
  assert(com.getState("mode") == Value("draft"));
  mode->set(Value("final"));
  assert(com.getState("mode") == Value("final"));
  com.setState("mode", Value("review"));
  assert(mode->get() == Value("review"));

  auto watched = createReadonlyComStateSignal(com, "mode", Value("ignored"));
  assert(watched->get() == Value("review"));
  bool readOnlyThrew = false;
  try {
    watched->set(Value("x"));
  } catch (const std::logic_error&) {
    readOnlyThrew = true;
  }
  assert(readOnlyThrew);

  auto missing = createReadonlyComStateSignal(com, "absent", Value("fallback"));
  assert(missing->get() == Value("fallback"));
  assert(com.getState("absent").isUndefined());

  mode->dispose();
  com.setState("mode", Value("after"));
  assert(mode->get() == Value("review"));
  assert(watched->get() == Value("after"));

  return true;
}

} // namespace prompt::test
