#include "runtime/PromptJSXRuntime.h"

#include "component/PromptComponent.h"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace prompt {

namespace {

std::optional<std::string> coerceKey(const Value& value) {
  if (value.isString()) {
    return value.asString();
  }
  if (value.isNumber()) {
    return numberToString(value.asNumber());
  }
  if (value.isNullish()) {
    return std::nullopt;
  }
  throw std::invalid_argument("Element key must be a string or a number");
}

void removeReservedProps(Props& props) {
  static constexpr std::array kReserved{"__self", "__source"};
  for (const char* reserved : kReserved) {
    props.erase(reserved);
  }
}

void collectChildrenRecursive(const Value& value, std::vector<NormalizedChild>& out) {
  switch (value.kind) {
    case ValueKind::Null:
    case ValueKind::Undefined:
    case ValueKind::Boolean:
      return;
    case ValueKind::Number:
      out.push_back(NormalizedChild{NormalizedChildKind::Text, nullptr, nullptr, numberToString(value.asNumber())});
      return;
    case ValueKind::String:
      out.push_back(NormalizedChild{NormalizedChildKind::Text, nullptr, nullptr, value.asString()});
      return;
    case ValueKind::Element:
      out.push_back(NormalizedChild{NormalizedChildKind::Element, value.asElement(), nullptr, {}});
      return;
    case ValueKind::Block:
      out.push_back(NormalizedChild{NormalizedChildKind::ContentBlock, nullptr, value.asBlock(), {}});
      return;
    case ValueKind::Array:
      for (const auto& item : value.asArray()) {
        collectChildrenRecursive(item, out);
      }
      return;
    default:
      return;
  }
}

} // namespace

FunctionComponentPtr defineFunctionComponent(std::string name, RenderFunction render) {
  auto component = std::make_shared<FunctionComponentType>();
  component->name = std::move(name);
  component->render = std::move(render);
  return component;
}

FunctionComponentPtr defineTerminalComponent(std::string name) {
  auto component = std::make_shared<FunctionComponentType>();
  component->name = std::move(name);
  component->terminal = true;
  return component;
}

ElementType ElementType::host(std::string tag) {
  ElementType type;
  type.kind_ = ElementTypeKind::HostTag;
  type.hostTag_ = std::move(tag);
  return type;
}

ElementType ElementType::function(FunctionComponentPtr component) {
  ElementType type;
  if (component) {
    type.kind_ = ElementTypeKind::FunctionComponent;
    type.function_ = std::move(component);
  }
  return type;
}

ElementType ElementType::componentClass(ComponentClassPtr componentClass) {
  ElementType type;
  if (componentClass && componentClass->construct) {
    type.kind_ = ElementTypeKind::ClassComponent;
    type.class_ = std::move(componentClass);
  }
  return type;
}

ElementType ElementType::fragment() {
  ElementType type;
  type.kind_ = ElementTypeKind::Fragment;
  return type;
}

ElementType ElementType::instance(ComponentPtr instance) {
  ElementType type;
  if (instance) {
    type.kind_ = ElementTypeKind::PrebuiltInstance;
    type.instance_ = std::move(instance);
  }
  return type;
}

ElementType ElementType::text() {
  ElementType type;
  type.kind_ = ElementTypeKind::Text;
  return type;
}

ElementType ElementType::contentBlock() {
  ElementType type;
  type.kind_ = ElementTypeKind::ContentBlock;
  return type;
}

bool ElementType::isTerminalFunction() const {
  return kind_ == ElementTypeKind::FunctionComponent && function_->terminal;
}

bool ElementType::sameIdentity(const ElementType& other) const {
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
    case ElementTypeKind::HostTag:
      return hostTag_ == other.hostTag_;
    case ElementTypeKind::FunctionComponent:
      return function_ == other.function_ || function_->name == other.function_->name;
    case ElementTypeKind::ClassComponent:
      return class_ == other.class_ || class_->name == other.class_->name;
    case ElementTypeKind::PrebuiltInstance:
      return instance_ == other.instance_;
    default:
      return true;
  }
}

bool ElementType::is(const FunctionComponentPtr& component) const {
  return kind_ == ElementTypeKind::FunctionComponent && component &&
      (function_ == component || function_->name == component->name);
}

std::string ElementType::name() const {
  switch (kind_) {
    case ElementTypeKind::HostTag:
      return hostTag_;
    case ElementTypeKind::FunctionComponent:
      return function_->name;
    case ElementTypeKind::ClassComponent:
      return class_->name;
    case ElementTypeKind::Fragment:
      return "Fragment";
    case ElementTypeKind::PrebuiltInstance:
      return instance_->displayName();
    case ElementTypeKind::Text:
      return "text";
    case ElementTypeKind::ContentBlock:
      return "content-block";
    case ElementTypeKind::Unknown:
      break;
  }
  return "unknown";
}

ElementPtr jsx(ElementType type, Props props, std::optional<std::string> key) {
  auto element = std::make_shared<Element>();
  element->type = std::move(type);

  removeReservedProps(props);
  if (auto keyProp = props.take("key")) {
    auto coerced = coerceKey(*keyProp);
    if (!key) {
      key = std::move(coerced);
    }
  }

  element->props = std::move(props);
  element->key = std::move(key);
  return element;
}

ElementPtr jsx(const FunctionComponentPtr& component, Props props, std::optional<std::string> key) {
  return jsx(ElementType::function(component), std::move(props), std::move(key));
}

ElementPtr jsx(const ComponentClassPtr& componentClass, Props props, std::optional<std::string> key) {
  return jsx(ElementType::componentClass(componentClass), std::move(props), std::move(key));
}

ElementPtr jsx(const ComponentPtr& instance, Props props, std::optional<std::string> key) {
  return jsx(ElementType::instance(instance), std::move(props), std::move(key));
}

ElementPtr jsx(const std::string& hostTag, Props props, std::optional<std::string> key) {
  return jsx(ElementType::host(hostTag), std::move(props), std::move(key));
}

ElementPtr jsx(const char* hostTag, Props props, std::optional<std::string> key) {
  return jsx(ElementType::host(hostTag), std::move(props), std::move(key));
}

ElementPtr fragment(Value::Array children, std::optional<std::string> key) {
  Props props;
  props.set("children", Value::array(std::move(children)));
  return jsx(ElementType::fragment(), std::move(props), std::move(key));
}

Value children(std::initializer_list<Value> values) {
  return Value::array(Value::Array(values));
}

Value children(const std::vector<ElementPtr>& elements) {
  Value::Array values;
  values.reserve(elements.size());
  for (const auto& element : elements) {
    values.push_back(Value::element(element));
  }
  return Value::array(std::move(values));
}

std::vector<NormalizedChild> normalizeChildren(const Value& children) {
  std::vector<NormalizedChild> out;
  collectChildrenRecursive(children, out);
  return out;
}

bool isElementValue(const Value& value) {
  return value.isElement() && value.asElement() != nullptr;
}

} // namespace prompt
