#include "state/PromptSignal.h"

#include <stdexcept>

namespace prompt {

namespace {

struct BatchState {
  int depth{0};
  std::vector<std::function<void()>> pending;
};

BatchState& batchState() {
  thread_local BatchState state;
  return state;
}

} // namespace

Signal::Signal(Value initial, std::string debugName)
    : value_(std::move(initial)), debugName_(std::move(debugName)) {}

void Signal::set(Value next) {
  assign(std::move(next));
}

void Signal::assign(Value next) {
  if (disposed_ || next == value_) {
    return;
  }
  Value previous = std::move(value_);
  value_ = std::move(next);
  notify(value_, previous);
}

void Signal::update(const std::function<Value(const Value&)>& updater) {
  set(updater(value_));
}

SignalSubscription Signal::subscribe(SignalListener listener) {
  SignalSubscription id = nextSubscription_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Signal::unsubscribe(SignalSubscription subscription) {
  listeners_.erase(subscription);
}

void Signal::dispose() {
  disposed_ = true;
  listeners_.clear();
}

void Signal::notify(const Value& next, const Value& previous) {
  if (listeners_.empty()) {
    return;
  }
  auto listeners = listeners_;
  if (SignalBatch::active()) {
    SignalBatch::enqueue([listeners, next, previous]() {
      for (const auto& entry : listeners) {
        entry.second(next, previous);
      }
    });
    return;
  }
  for (const auto& entry : listeners) {
    entry.second(next, previous);
  }
}

SignalPtr createSignal(Value initial, std::string debugName) {
  return std::make_shared<Signal>(std::move(initial), std::move(debugName));
}

SignalBatch::SignalBatch() {
  ++batchState().depth;
}

SignalBatch::~SignalBatch() {
  BatchState& state = batchState();
  if (--state.depth > 0) {
    return;
  }
  while (!state.pending.empty()) {
    auto pending = std::move(state.pending);
    state.pending.clear();
    for (auto& notification : pending) {
      notification();
    }
  }
}

bool SignalBatch::active() {
  return batchState().depth > 0;
}

void SignalBatch::enqueue(std::function<void()> notification) {
  batchState().pending.push_back(std::move(notification));
}

ComputedSignal::ComputedSignal(std::vector<SignalPtr> sources, std::function<Value()> compute)
    : Signal(compute ? compute() : Value::undefined(), "computed"),
      sources_(std::move(sources)),
      compute_(std::move(compute)) {
  for (const auto& source : sources_) {
    subscriptions_.push_back(source->subscribe([this](const Value&, const Value&) { recompute(); }));
  }
}

ComputedSignal::~ComputedSignal() {
  for (std::size_t i = 0; i < sources_.size(); ++i) {
    sources_[i]->unsubscribe(subscriptions_[i]);
  }
}

void ComputedSignal::set(Value) {
  throw std::logic_error("Cannot set a computed signal");
}

void ComputedSignal::dispose() {
  for (std::size_t i = 0; i < sources_.size(); ++i) {
    sources_[i]->unsubscribe(subscriptions_[i]);
  }
  sources_.clear();
  subscriptions_.clear();
  Signal::dispose();
}

void ComputedSignal::recompute() {
  if (compute_) {
    assign(compute_());
  }
}

std::shared_ptr<ComputedSignal> computed(std::vector<SignalPtr> sources, std::function<Value()> compute) {
  return std::make_shared<ComputedSignal>(std::move(sources), std::move(compute));
}

PropSignal::PropSignal(std::string propKey, Value defaultValue)
    : Signal(defaultValue, "prop:" + propKey),
      propKey_(std::move(propKey)),
      defaultValue_(std::move(defaultValue)) {}

ComStateSignal::ComStateSignal(ContextObjectModel& com, std::string key, Value initial, bool readOnly)
    : Signal(Value::undefined(), "com:" + key),
      com_(&com),
      key_(std::move(key)),
      readOnly_(readOnly) {
  Value existing = com.getState(key_);
  if (existing.isUndefined() && !readOnly_) {
    com.setState(key_, initial);
    existing = initial;
  }
  assign(existing.isUndefined() ? std::move(initial) : std::move(existing));
  subscription_ = com.subscribeState([this](const std::string& changed, const Value& next, const Value&) {
    if (changed == key_) {
      assign(next);
    }
  });
}

ComStateSignal::~ComStateSignal() {
  if (com_ != nullptr) {
    com_->unsubscribeState(subscription_);
  }
}

void ComStateSignal::set(Value next) {
  if (readOnly_) {
    throw std::logic_error("Cannot set read-only state signal '" + key_ + "'");
  }
  if (isDisposed()) {
    return;
  }
  com_->setState(key_, std::move(next));
}

void ComStateSignal::dispose() {
  if (com_ != nullptr) {
    com_->unsubscribeState(subscription_);
    com_ = nullptr;
  }
  Signal::dispose();
}

SignalPtr createComStateSignal(ContextObjectModel& com, const std::string& key, Value initial) {
  return std::make_shared<ComStateSignal>(com, key, std::move(initial));
}

SignalPtr createReadonlyComStateSignal(ContextObjectModel& com, const std::string& key, Value defaultValue) {
  return std::make_shared<ComStateSignal>(com, key, std::move(defaultValue), true);
}

} // namespace prompt
