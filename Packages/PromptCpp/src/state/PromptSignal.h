#pragma once

#include "com/PromptObjectModel.h"
#include "runtime/PromptValue.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace prompt {

using SignalListener = std::function<void(const Value& next, const Value& previous)>;
using SignalSubscription = std::uint64_t;

// Reactive value cell. Subscribers run only when the value changes.
class Signal {
public:
  explicit Signal(Value initial = Value::undefined(), std::string debugName = {});
  virtual ~Signal() = default;

  Signal(const Signal&) = delete;
  Signal& operator=(const Signal&) = delete;

  const Value& get() const {
    return value_;
  }
  const Value& operator()() const {
    return value_;
  }

  virtual void set(Value next);
  void update(const std::function<Value(const Value&)>& updater);

  SignalSubscription subscribe(SignalListener listener);
  void unsubscribe(SignalSubscription subscription);
  std::size_t subscriberCount() const {
    return listeners_.size();
  }

  virtual void dispose();
  bool isDisposed() const {
    return disposed_;
  }

  const std::string& debugName() const {
    return debugName_;
  }

protected:
  // Stores the value and notifies without going through set().
  void assign(Value next);

private:
  void notify(const Value& next, const Value& previous);

  Value value_;
  std::string debugName_;
  std::map<SignalSubscription, SignalListener> listeners_;
  SignalSubscription nextSubscription_{1};
  bool disposed_{false};
};

using SignalPtr = std::shared_ptr<Signal>;

SignalPtr createSignal(Value initial = Value::undefined(), std::string debugName = {});

// Defers signal notifications until the outermost batch closes.
class SignalBatch {
public:
  SignalBatch();
  ~SignalBatch();

  SignalBatch(const SignalBatch&) = delete;
  SignalBatch& operator=(const SignalBatch&) = delete;

  static bool active();
  static void enqueue(std::function<void()> notification);
};

// Derived value recomputed whenever one of its sources changes.
class ComputedSignal : public Signal {
public:
  ComputedSignal(std::vector<SignalPtr> sources, std::function<Value()> compute);
  ~ComputedSignal() override;

  void set(Value next) override;
  void dispose() override;

private:
  void recompute();

  std::vector<SignalPtr> sources_;
  std::vector<SignalSubscription> subscriptions_;
  std::function<Value()> compute_;
};

std::shared_ptr<ComputedSignal> computed(std::vector<SignalPtr> sources, std::function<Value()> compute);

// Mirrors one prop of a component instance; the reconciler pushes new values.
class PropSignal : public Signal {
public:
  PropSignal(std::string propKey, Value defaultValue);

  const std::string& propKey() const {
    return propKey_;
  }
  const Value& defaultValue() const {
    return defaultValue_;
  }

private:
  std::string propKey_;
  Value defaultValue_;
};

using PropSignalPtr = std::shared_ptr<PropSignal>;

// Two-way binding to a shared state key of the object model.
class ComStateSignal : public Signal {
public:
  ComStateSignal(ContextObjectModel& com, std::string key, Value initial, bool readOnly = false);
  ~ComStateSignal() override;

  void set(Value next) override;
  void dispose() override;

  const std::string& key() const {
    return key_;
  }
  bool readOnly() const {
    return readOnly_;
  }

private:
  ContextObjectModel* com_;
  std::string key_;
  bool readOnly_;
  StateSubscription subscription_{0};
};

SignalPtr createComStateSignal(ContextObjectModel& com, const std::string& key, Value initial);
SignalPtr createReadonlyComStateSignal(ContextObjectModel& com, const std::string& key, Value defaultValue);

} // namespace prompt
