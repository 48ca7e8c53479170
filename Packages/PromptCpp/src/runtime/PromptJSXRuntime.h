#pragma once

#include "runtime/PromptValue.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prompt {

class ContextObjectModel;
struct TickState;
struct ComponentClass;

using ComponentClassPtr = std::shared_ptr<const ComponentClass>;

using RenderFunction = std::function<ElementPtr(const Props& props, ContextObjectModel& com, const TickState& state)>;

struct FunctionComponentType {
  std::string name;
  RenderFunction render;
  // Terminal components are never invoked; only their children reconcile.
  bool terminal{false};
  std::vector<std::string> tags;
};

using FunctionComponentPtr = std::shared_ptr<const FunctionComponentType>;

FunctionComponentPtr defineFunctionComponent(std::string name, RenderFunction render);
FunctionComponentPtr defineTerminalComponent(std::string name);

enum class ElementTypeKind : uint8_t {
  Unknown,
  HostTag,
  FunctionComponent,
  ClassComponent,
  Fragment,
  PrebuiltInstance,
  // Fiber-only kinds produced by child normalization.
  Text,
  ContentBlock,
};

class ElementType {
public:
  ElementType() = default;

  static ElementType host(std::string tag);
  static ElementType function(FunctionComponentPtr component);
  static ElementType componentClass(ComponentClassPtr componentClass);
  static ElementType fragment();
  static ElementType instance(ComponentPtr instance);
  static ElementType text();
  static ElementType contentBlock();

  ElementTypeKind kind() const {
    return kind_;
  }

  const std::string& hostTag() const {
    return hostTag_;
  }
  const FunctionComponentPtr& functionComponent() const {
    return function_;
  }
  const ComponentClassPtr& componentClassPtr() const {
    return class_;
  }
  const ComponentPtr& prebuiltInstance() const {
    return instance_;
  }

  bool isUnknown() const {
    return kind_ == ElementTypeKind::Unknown;
  }
  bool isTerminalFunction() const;

  // Reference identity; function and class types fall back to the registered
  // name so two registrations of one component still match.
  bool sameIdentity(const ElementType& other) const;
  bool is(const FunctionComponentPtr& component) const;

  std::string name() const;

private:
  ElementTypeKind kind_{ElementTypeKind::Unknown};
  std::string hostTag_;
  FunctionComponentPtr function_;
  ComponentClassPtr class_;
  ComponentPtr instance_;
};

struct Element {
  ElementType type;
  Props props;
  std::optional<std::string> key;

  Value children() const {
    return props.get("children");
  }
};

ElementPtr jsx(ElementType type, Props props = {}, std::optional<std::string> key = std::nullopt);
ElementPtr jsx(const FunctionComponentPtr& component, Props props = {}, std::optional<std::string> key = std::nullopt);
ElementPtr jsx(const ComponentClassPtr& componentClass, Props props = {}, std::optional<std::string> key = std::nullopt);
ElementPtr jsx(const ComponentPtr& instance, Props props = {}, std::optional<std::string> key = std::nullopt);
ElementPtr jsx(const std::string& hostTag, Props props = {}, std::optional<std::string> key = std::nullopt);
ElementPtr jsx(const char* hostTag, Props props = {}, std::optional<std::string> key = std::nullopt);

ElementPtr fragment(Value::Array children, std::optional<std::string> key = std::nullopt);

// Array value of the given children, for the `children` prop.
Value children(std::initializer_list<Value> values);
Value children(const std::vector<ElementPtr>& elements);

enum class NormalizedChildKind : uint8_t {
  Element,
  ContentBlock,
  Text,
};

struct NormalizedChild {
  NormalizedChildKind kind;
  ElementPtr element;
  ContentBlockPtr block;
  std::string text;
};

// Flattens nested arrays and drops null, undefined and booleans.
std::vector<NormalizedChild> normalizeChildren(const Value& children);

bool isElementValue(const Value& value);

} // namespace prompt
