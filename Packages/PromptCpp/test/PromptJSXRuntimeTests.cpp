#include "component/PromptComponent.h"
#include "component/PromptPrimitives.h"
#include "content/PromptContentBlock.h"
#include "runtime/PromptJSXRuntime.h"

#include <cassert>
#include <stdexcept>

namespace prompt::test {

namespace {

class Plain : public Component {
public:
  using Component::Component;
};

} // namespace

bool runPromptJSXRuntimeTests() {
  // Keys are lifted out of props and numbers coerced.
  auto keyed = jsx("div", Props{{"key", Value::number(7)}, {"id", "root"}, {"__self", "x"}, {"__source", "y"}});
  assert(keyed->type.kind() == ElementTypeKind::HostTag);
  assert(keyed->type.hostTag() == "div");
  assert(keyed->key == std::optional<std::string>("7"));
  assert(!keyed->props.has("key"));
  assert(!keyed->props.has("__self"));
  assert(!keyed->props.has("__source"));
  assert(keyed->props.get("id") == Value("root"));

  auto explicitKey = jsx("div", Props{{"key", "prop"}}, std::string("argument"));
  assert(explicitKey->key == std::optional<std::string>("argument"));

  bool threw = false;
  try {
    jsx("div", Props{{"key", Value::object(Props{})}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  // Refs and children stay in props.
  auto withRef = jsx("span", Props{{"ref", "handle"}, {"children", "hi"}});
  assert(withRef->props.get("ref") == Value("handle"));
  assert(withRef->children() == Value("hi"));

  // Element type kinds and identity.
  auto greeting = defineFunctionComponent("Greeting", [](const Props&, ContextObjectModel&, const TickState&) {
    return ElementPtr{};
  });
  auto sameName = defineFunctionComponent("Greeting", nullptr);
  assert(ElementType::function(greeting).sameIdentity(ElementType::function(sameName)));
  assert(ElementType::function(greeting).is(greeting));
  assert(!ElementType::host("Greeting").sameIdentity(ElementType::function(greeting)));
  assert(ElementType::function(nullptr).isUnknown());
  assert(ElementType().isUnknown());
  assert(ElementType::fragment().name() == "Fragment");
  assert(!ElementType::function(greeting).isTerminalFunction());
  assert(ElementType::function(primitives::section()).isTerminalFunction());
  assert(primitives::section() == primitives::section());

  auto plainClass = defineComponent<Plain>("PlainThing");
  assert(ElementType::componentClass(plainClass).kind() == ElementTypeKind::ClassComponent);
  assert(ElementType::componentClass(plainClass).name() == "PlainThing");
  assert(plainClass->tags == (std::vector<std::string>{"plain", "thing"}));

  auto instance = std::make_shared<Plain>();
  assert(ElementType::instance(instance).kind() == ElementTypeKind::PrebuiltInstance);
  assert(ElementType::instance(instance).sameIdentity(ElementType::instance(instance)));
  assert(!ElementType::instance(instance).sameIdentity(ElementType::instance(std::make_shared<Plain>())));

  // Children normalization.
  auto child = jsx("b");
  Value nested = children({
      "text",
      Value::number(3),
      Value::null(),
      Value::boolean(false),
      Value::array({Value::element(child), Value::undefined(), Value::array({"deep"})}),
      Value::block(ContentBlock::text("block")),
  });
  auto normalized = normalizeChildren(nested);
  assert(normalized.size() == 5);
  assert(normalized[0].kind == NormalizedChildKind::Text && normalized[0].text == "text");
  assert(normalized[1].kind == NormalizedChildKind::Text && normalized[1].text == "3");
  assert(normalized[2].kind == NormalizedChildKind::Element && normalized[2].element == child);
  assert(normalized[3].text == "deep");
  assert(normalized[4].kind == NormalizedChildKind::ContentBlock);
  assert(normalized[4].block->as<TextBlock>()->text == "block");

  auto frag = fragment({Value::element(child), "tail"}, std::string("f"));
  assert(frag->type.kind() == ElementTypeKind::Fragment);
  assert(frag->key == std::optional<std::string>("f"));
  assert(normalizeChildren(frag->children()).size() == 2);

  assert(isElementValue(Value::element(child)));
  assert(!isElementValue(Value("x")));

  return true;
}

} // namespace prompt::test
