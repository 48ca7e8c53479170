#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace prompt {

struct Element;
struct ContentBlock;
class ContentRenderer;
struct ExecutableTool;
class Component;

using ElementPtr = std::shared_ptr<const Element>;
using ContentBlockPtr = std::shared_ptr<const ContentBlock>;
using ContentRendererPtr = std::shared_ptr<const ContentRenderer>;
using ExecutableToolPtr = std::shared_ptr<const ExecutableTool>;
using ComponentPtr = std::shared_ptr<Component>;

struct Value;

using PropEntry = std::pair<std::string, Value>;
using PropList = std::vector<PropEntry>;

// Ordered string-keyed map. Assigning an existing key keeps its position.
class Props {
public:
  Props() = default;
  Props(std::initializer_list<PropEntry> entries);

  [[nodiscard]] bool has(const std::string& key) const;
  const Value* find(const std::string& key) const;
  Value get(const std::string& key) const;
  void set(const std::string& key, Value value);
  bool erase(const std::string& key);
  std::optional<Value> take(const std::string& key);

  // Later keys win.
  void merge(const Props& other);

  bool empty() const {
    return entries_.empty();
  }
  std::size_t size() const {
    return entries_.size();
  }
  const PropList& entries() const {
    return entries_;
  }
  PropList::const_iterator begin() const {
    return entries_.begin();
  }
  PropList::const_iterator end() const {
    return entries_.end();
  }

  friend bool operator==(const Props& lhs, const Props& rhs);
  friend bool operator!=(const Props& lhs, const Props& rhs) {
    return !(lhs == rhs);
  }

private:
  PropList entries_;
};

enum class ValueKind : uint8_t {
  Null,
  Undefined,
  Boolean,
  Number,
  String,
  Element,
  Array,
  Object,
  Block,
  Renderer,
  Tool,
  Instance,
};

struct Value {
  using Array = std::vector<Value>;

  ValueKind kind{ValueKind::Undefined};
  std::variant<
      std::monostate,
      bool,
      double,
      std::string,
      ElementPtr,
      Array,
      Props,
      ContentBlockPtr,
      ContentRendererPtr,
      ExecutableToolPtr,
      ComponentPtr>
      payload{};

  Value() = default;
  Value(const char* text);
  Value(std::string text);

  static Value null();
  static Value undefined();
  static Value boolean(bool value);
  static Value number(double value);
  static Value string(std::string value);
  static Value element(ElementPtr value);
  static Value array(Array values);
  static Value object(Props values);
  static Value block(ContentBlock value);
  static Value block(ContentBlockPtr value);
  static Value renderer(ContentRendererPtr value);
  static Value tool(ExecutableToolPtr value);
  static Value instance(ComponentPtr value);

  bool isNull() const {
    return kind == ValueKind::Null;
  }
  bool isUndefined() const {
    return kind == ValueKind::Undefined;
  }
  bool isNullish() const {
    return isNull() || isUndefined();
  }
  bool isBoolean() const {
    return kind == ValueKind::Boolean;
  }
  bool isNumber() const {
    return kind == ValueKind::Number;
  }
  bool isString() const {
    return kind == ValueKind::String;
  }
  bool isElement() const {
    return kind == ValueKind::Element;
  }
  bool isArray() const {
    return kind == ValueKind::Array;
  }
  bool isObject() const {
    return kind == ValueKind::Object;
  }
  bool isBlock() const {
    return kind == ValueKind::Block;
  }
  bool isRenderer() const {
    return kind == ValueKind::Renderer;
  }
  bool isTool() const {
    return kind == ValueKind::Tool;
  }
  bool isInstance() const {
    return kind == ValueKind::Instance;
  }

  bool asBoolean() const;
  double asNumber() const;
  const std::string& asString() const;
  const ElementPtr& asElement() const;
  const Array& asArray() const;
  const Props& asObject() const;
  const ContentBlockPtr& asBlock() const;
  const ContentRendererPtr& asRenderer() const;
  const ExecutableToolPtr& asTool() const;
  const ComponentPtr& asInstance() const;

  // Null, undefined and false render nothing.
  [[nodiscard]] bool isTruthyRenderable() const;
  [[nodiscard]] bool isTruthy() const;

  // Strings verbatim, numbers without trailing zeros, other kinds summarized.
  std::string toDisplayString() const;

  friend bool operator==(const Value& lhs, const Value& rhs);
  friend bool operator!=(const Value& lhs, const Value& rhs) {
    return !(lhs == rhs);
  }
};

std::string numberToString(double number);
const char* valueKindName(ValueKind kind);

// Reads a string-typed prop; absent or non-string yields nullopt.
std::optional<std::string> optionalStringProp(const Props& props, const std::string& key);
std::optional<double> optionalNumberProp(const Props& props, const std::string& key);
std::vector<std::string> stringListProp(const Props& props, const std::string& key);
std::optional<std::vector<std::string>> optionalStringListProp(const Props& props, const std::string& key);
std::optional<Props> optionalObjectProp(const Props& props, const std::string& key);

Value stringList(const std::vector<std::string>& values);

} // namespace prompt
