#include "component/PromptComponent.h"

namespace prompt {

Component::Component(Props props) : props_(std::move(props)) {}

void Component::onMount(ContextObjectModel&) {}

void Component::onUnmount(ContextObjectModel&) {}

void Component::onStart(ContextObjectModel&) {}

void Component::onTickStart(ContextObjectModel&, const TickState&) {}

ElementPtr Component::render(ContextObjectModel&, const TickState&) {
  return nullptr;
}

void Component::onAfterCompile(
    ContextObjectModel&,
    const CompiledStructure&,
    const TickState&,
    const AfterCompileContext&) {}

void Component::onTickEnd(ContextObjectModel&, const TickState&) {}

void Component::onMessage(ContextObjectModel&, const ExecutionMessage&, const TickState&) {}

void Component::onComplete(ContextObjectModel&, const COMInput&) {}

std::optional<RecoveryAction> Component::onError(ContextObjectModel&, const TickState&) {
  return std::nullopt;
}

bool Component::handlesErrors() const {
  return false;
}

ExecutableToolPtr Component::tool() const {
  return nullptr;
}

std::vector<PropSignalPtr> Component::takePropBindings() {
  std::vector<PropSignalPtr> bindings;
  bindings.swap(pendingPropBindings_);
  return bindings;
}

PropSignalPtr Component::bindProp(std::string propKey, Value defaultValue) {
  Value initial = props_.get(propKey);
  auto signal = std::make_shared<PropSignal>(std::move(propKey), defaultValue);
  if (!initial.isUndefined()) {
    signal->set(std::move(initial));
  }
  pendingPropBindings_.push_back(signal);
  return signal;
}

ComponentClassPtr defineComponentClass(ComponentClass componentClass) {
  if (componentClass.tags.empty()) {
    componentClass.tags = autoGenerateTags(componentClass.name);
  }
  return std::make_shared<const ComponentClass>(std::move(componentClass));
}

} // namespace prompt
