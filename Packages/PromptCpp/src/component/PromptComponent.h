#pragma once

#include "com/PromptObjectModel.h"
#include "component/PromptComponentHooks.h"
#include "component/PromptTickState.h"
#include "runtime/PromptJSXRuntime.h"
#include "state/PromptSignal.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace prompt {

struct CompiledStructure;

struct AfterCompileContext {
  std::size_t iteration{0};
  std::size_t maxIterations{0};
};

struct RecoveryAction {
  bool continueExecution{false};
  std::optional<std::string> recoveryMessage;
  std::function<void(ContextObjectModel& com)> modifications;
};

// Stateful component. Lifecycle methods default to no-ops.
class Component {
public:
  explicit Component(Props props = {});
  virtual ~Component() = default;

  Component(const Component&) = delete;
  Component& operator=(const Component&) = delete;

  virtual void onMount(ContextObjectModel& com);
  virtual void onUnmount(ContextObjectModel& com);
  virtual void onStart(ContextObjectModel& com);
  virtual void onTickStart(ContextObjectModel& com, const TickState& state);
  virtual ElementPtr render(ContextObjectModel& com, const TickState& state);
  virtual void onAfterCompile(
      ContextObjectModel& com,
      const CompiledStructure& compiled,
      const TickState& state,
      const AfterCompileContext& context);
  virtual void onTickEnd(ContextObjectModel& com, const TickState& state);
  virtual void onMessage(ContextObjectModel& com, const ExecutionMessage& message, const TickState& state);
  virtual void onComplete(ContextObjectModel& com, const COMInput& finalState);
  virtual std::optional<RecoveryAction> onError(ContextObjectModel& com, const TickState& state);

  // True when onError is implemented; failures are only routed to handlers.
  virtual bool handlesErrors() const;

  // Tool owned by this instance, re-registered after every onTickStart.
  virtual ExecutableToolPtr tool() const;

  const Props& props() const {
    return props_;
  }
  void setProps(Props props) {
    props_ = std::move(props);
  }
  void mergeProps(const Props& props) {
    props_.merge(props);
  }

  const std::string& displayName() const {
    return displayName_;
  }
  void setDisplayName(std::string name) {
    displayName_ = std::move(name);
  }

  // Bindings registered since the last call; drained by the reconciler.
  std::vector<PropSignalPtr> takePropBindings();

protected:
  PropSignalPtr bindProp(std::string propKey, Value defaultValue = Value::undefined());

private:
  Props props_;
  std::string displayName_;
  std::vector<PropSignalPtr> pendingPropBindings_;
};

using ComponentFactory = std::function<ComponentPtr(const Props& props)>;

// Registration record for a component class.
struct ComponentClass {
  std::string name;
  ComponentFactory construct;
  // Registered on mount, removed on unmount.
  ExecutableToolPtr tool;
  std::vector<std::string> tags;
  std::map<ComponentHookName, std::vector<ComponentHookMiddleware>> hooks;
};

template <typename T>
ComponentClassPtr defineComponent(
    std::string name,
    ExecutableToolPtr tool = nullptr,
    std::optional<std::vector<std::string>> tags = std::nullopt) {
  static_assert(std::is_base_of<Component, T>::value, "defineComponent requires a Component subclass");
  auto componentClass = std::make_shared<ComponentClass>();
  componentClass->tags = tags ? std::move(*tags) : autoGenerateTags(name);
  componentClass->name = std::move(name);
  componentClass->construct = [](const Props& props) -> ComponentPtr { return std::make_shared<T>(props); };
  componentClass->tool = std::move(tool);
  return componentClass;
}

ComponentClassPtr defineComponentClass(ComponentClass componentClass);

} // namespace prompt
