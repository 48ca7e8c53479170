#include "runtime/PromptValue.h"

#include "content/PromptContentBlock.h"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace prompt {

Props::Props(std::initializer_list<PropEntry> entries) {
  for (const auto& entry : entries) {
    set(entry.first, entry.second);
  }
}

bool Props::has(const std::string& key) const {
  return find(key) != nullptr;
}

const Value* Props::find(const std::string& key) const {
  for (const auto& entry : entries_) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

Value Props::get(const std::string& key) const {
  const Value* value = find(key);
  return value ? *value : Value::undefined();
}

void Props::set(const std::string& key, Value value) {
  for (auto& entry : entries_) {
    if (entry.first == key) {
      entry.second = std::move(value);
      return;
    }
  }
  entries_.emplace_back(key, std::move(value));
}

bool Props::erase(const std::string& key) {
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->first == key) {
      entries_.erase(it);
      return true;
    }
  }
  return false;
}

std::optional<Value> Props::take(const std::string& key) {
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->first == key) {
      Value value = std::move(it->second);
      entries_.erase(it);
      return value;
    }
  }
  return std::nullopt;
}

void Props::merge(const Props& other) {
  for (const auto& entry : other.entries_) {
    set(entry.first, entry.second);
  }
}

bool operator==(const Props& lhs, const Props& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (const auto& entry : lhs.entries_) {
    const Value* other = rhs.find(entry.first);
    if (!other || *other != entry.second) {
      return false;
    }
  }
  return true;
}

Value::Value(const char* text) : kind(ValueKind::String), payload(std::string(text)) {}

Value::Value(std::string text) : kind(ValueKind::String), payload(std::move(text)) {}

Value Value::null() {
  Value value;
  value.kind = ValueKind::Null;
  return value;
}

Value Value::undefined() {
  return Value{};
}

Value Value::boolean(bool flag) {
  Value value;
  value.kind = ValueKind::Boolean;
  value.payload = flag;
  return value;
}

Value Value::number(double number) {
  Value value;
  value.kind = ValueKind::Number;
  value.payload = number;
  return value;
}

Value Value::string(std::string text) {
  return Value(std::move(text));
}

Value Value::element(ElementPtr element) {
  if (!element) {
    return Value::null();
  }
  Value value;
  value.kind = ValueKind::Element;
  value.payload = std::move(element);
  return value;
}

Value Value::array(Array values) {
  Value value;
  value.kind = ValueKind::Array;
  value.payload = std::move(values);
  return value;
}

Value Value::object(Props values) {
  Value value;
  value.kind = ValueKind::Object;
  value.payload = std::move(values);
  return value;
}

Value Value::block(ContentBlock block) {
  return Value::block(std::make_shared<const ContentBlock>(std::move(block)));
}

Value Value::block(ContentBlockPtr block) {
  if (!block) {
    return Value::null();
  }
  Value value;
  value.kind = ValueKind::Block;
  value.payload = std::move(block);
  return value;
}

Value Value::renderer(ContentRendererPtr renderer) {
  if (!renderer) {
    return Value::null();
  }
  Value value;
  value.kind = ValueKind::Renderer;
  value.payload = std::move(renderer);
  return value;
}

Value Value::tool(ExecutableToolPtr tool) {
  if (!tool) {
    return Value::null();
  }
  Value value;
  value.kind = ValueKind::Tool;
  value.payload = std::move(tool);
  return value;
}

Value Value::instance(ComponentPtr instance) {
  if (!instance) {
    return Value::null();
  }
  Value value;
  value.kind = ValueKind::Instance;
  value.payload = std::move(instance);
  return value;
}

bool Value::asBoolean() const {
  return std::get<bool>(payload);
}

double Value::asNumber() const {
  return std::get<double>(payload);
}

const std::string& Value::asString() const {
  return std::get<std::string>(payload);
}

const ElementPtr& Value::asElement() const {
  return std::get<ElementPtr>(payload);
}

const Value::Array& Value::asArray() const {
  return std::get<Array>(payload);
}

const Props& Value::asObject() const {
  return std::get<Props>(payload);
}

const ContentBlockPtr& Value::asBlock() const {
  return std::get<ContentBlockPtr>(payload);
}

const ContentRendererPtr& Value::asRenderer() const {
  return std::get<ContentRendererPtr>(payload);
}

const ExecutableToolPtr& Value::asTool() const {
  return std::get<ExecutableToolPtr>(payload);
}

const ComponentPtr& Value::asInstance() const {
  return std::get<ComponentPtr>(payload);
}

bool Value::isTruthyRenderable() const {
  switch (kind) {
    case ValueKind::Null:
    case ValueKind::Undefined:
      return false;
    case ValueKind::Boolean:
      return asBoolean();
    default:
      return true;
  }
}

bool Value::isTruthy() const {
  switch (kind) {
    case ValueKind::Null:
    case ValueKind::Undefined:
      return false;
    case ValueKind::Boolean:
      return asBoolean();
    case ValueKind::Number:
      return asNumber() != 0.0 && !std::isnan(asNumber());
    case ValueKind::String:
      return !asString().empty();
    default:
      return true;
  }
}

std::string Value::toDisplayString() const {
  switch (kind) {
    case ValueKind::Null:
      return "null";
    case ValueKind::Undefined:
      return "undefined";
    case ValueKind::Boolean:
      return asBoolean() ? "true" : "false";
    case ValueKind::Number:
      return numberToString(asNumber());
    case ValueKind::String:
      return asString();
    case ValueKind::Array: {
      std::string out = "[";
      const auto& values = asArray();
      for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
          out += ", ";
        }
        out += values[i].toDisplayString();
      }
      return out + "]";
    }
    case ValueKind::Object: {
      std::string out = "{";
      bool first = true;
      for (const auto& entry : asObject()) {
        if (!first) {
          out += ", ";
        }
        first = false;
        out += entry.first + ": " + entry.second.toDisplayString();
      }
      return out + "}";
    }
    case ValueKind::Block:
      return describeContentBlock(*asBlock());
    default:
      return std::string("<") + valueKindName(kind) + ">";
  }
}

bool operator==(const Value& lhs, const Value& rhs) {
  if (lhs.kind != rhs.kind) {
    return false;
  }
  return lhs.payload == rhs.payload;
}

std::string numberToString(double number) {
  if (std::isnan(number)) {
    return "NaN";
  }
  if (std::isinf(number)) {
    return number > 0 ? "Infinity" : "-Infinity";
  }
  std::ostringstream out;
  out.precision(15);
  out << number;
  return out.str();
}

const char* valueKindName(ValueKind kind) {
  switch (kind) {
    case ValueKind::Null:
      return "null";
    case ValueKind::Undefined:
      return "undefined";
    case ValueKind::Boolean:
      return "boolean";
    case ValueKind::Number:
      return "number";
    case ValueKind::String:
      return "string";
    case ValueKind::Element:
      return "element";
    case ValueKind::Array:
      return "array";
    case ValueKind::Object:
      return "object";
    case ValueKind::Block:
      return "block";
    case ValueKind::Renderer:
      return "renderer";
    case ValueKind::Tool:
      return "tool";
    case ValueKind::Instance:
      return "instance";
  }
  return "unknown";
}

std::optional<std::string> optionalStringProp(const Props& props, const std::string& key) {
  const Value* value = props.find(key);
  if (!value || !value->isString()) {
    return std::nullopt;
  }
  return value->asString();
}

std::optional<double> optionalNumberProp(const Props& props, const std::string& key) {
  const Value* value = props.find(key);
  if (!value || !value->isNumber()) {
    return std::nullopt;
  }
  return value->asNumber();
}

std::vector<std::string> stringListProp(const Props& props, const std::string& key) {
  return optionalStringListProp(props, key).value_or(std::vector<std::string>{});
}

std::optional<std::vector<std::string>> optionalStringListProp(const Props& props, const std::string& key) {
  const Value* value = props.find(key);
  if (!value || !value->isArray()) {
    return std::nullopt;
  }
  std::vector<std::string> out;
  for (const auto& item : value->asArray()) {
    if (item.isString()) {
      out.push_back(item.asString());
    }
  }
  return out;
}

std::optional<Props> optionalObjectProp(const Props& props, const std::string& key) {
  const Value* value = props.find(key);
  if (!value || !value->isObject()) {
    return std::nullopt;
  }
  return value->asObject();
}

Value stringList(const std::vector<std::string>& values) {
  Value::Array out;
  out.reserve(values.size());
  for (const auto& value : values) {
    out.emplace_back(value);
  }
  return Value::array(std::move(out));
}

} // namespace prompt
