#include "component/PromptPrimitives.h"
#include "component/PromptTickState.h"
#include "prompt-reconciler/PromptContentBlockRegistry.h"
#include "prompt-reconciler/PromptContentExtractors.h"
#include "renderers/ContentRenderer.h"

#include <cassert>
#include <memory>
#include <string>

namespace prompt::test {

namespace {

ContentBlock mapElement(
    const ContentBlockRegistry& registry,
    const ElementPtr& element,
    const ContentRendererPtr& renderer,
    const ElementExpander& expand = nullptr) {
  const ContentBlockMapper* mapper = registry.find(element->type);
  assert(mapper != nullptr);
  auto block = (*mapper)(*element, renderer, expand);
  assert(block.has_value());
  return *block;
}

std::string formatOne(const ContentRenderer& renderer, const ContentBlock& block) {
  auto formatted = renderer.format({block});
  assert(formatted.size() == 1);
  return contentBlockText(formatted[0]);
}

} // namespace

bool runPromptContentTests() {
  using namespace primitives;

  const ContentBlockRegistry registry = ContentBlockRegistry::withDefaults();
  const auto markdown = std::make_shared<MarkdownRenderer>();

  // Lookup by host tag or lower-cased component name.
  assert(registry.has(ElementType::function(text())));
  assert(registry.has(ElementType::host("text")));
  assert(registry.has(ElementType::host("blockquote")));
  assert(!registry.has(ElementType::host("aside")));
  assert(!registry.has(ElementType::fragment()));
  assert(!registry.has(ElementType::function(section())));

  // Headings.
  auto heading = mapElement(registry, jsx(h2(), Props{{"children", "Title"}}), markdown);
  assert(heading.semantic->type == SemanticType::Heading);
  assert(heading.semantic->level == 2);
  assert(formatOne(*markdown, heading) == "## Title");

  auto header = mapElement(registry, jsx(primitives::header(), Props{{"level", Value::number(3)}, {"children", "Deep"}}), markdown);
  assert(header.semantic->level == 3);
  assert(formatOne(*markdown, header) == "### Deep");

  // Inline formatting inside a paragraph.
  auto paragraph = mapElement(
      registry,
      jsx("p",
          Props{{"children",
                 children(
                     {"Hello ",
                      Value::element(jsx("strong", Props{{"children", "world"}})),
                      " see ",
                      Value::element(jsx("a", Props{{"href", "https://example.com"}, {"children", "docs"}}))})}}),
      markdown);
  assert(paragraph.semantic->type == SemanticType::Paragraph);
  assert(contentBlockText(paragraph) == "Hello world see docs");
  assert(formatOne(*markdown, paragraph) == "Hello **world** see [docs](https://example.com)");

  // Plain text primitive.
  auto plain = mapElement(registry, jsx(text(), Props{{"text", "raw"}}), markdown);
  assert(plain.as<TextBlock>()->text == "raw");
  auto textChildren = mapElement(registry, jsx(text(), Props{{"children", "child text"}}), markdown);
  assert(contentBlockText(textChildren) == "child text");

  // Tables from props and from Row/Column children.
  auto propsTable = mapElement(
      registry,
      jsx(table(),
          Props{{"headers", Value::array({"A", "B"})},
                {"rows", Value::array({Value::array({"1", "2"}), Value::array({Value::number(3), "4"})})}}),
      markdown);
  assert(propsTable.semantic->table->rows.size() == 2);
  assert(formatOne(*markdown, propsTable) == "| A | B |\n| --- | --- |\n| 1 | 2 |\n| 3 | 4 |");

  auto rowTable = mapElement(
      registry,
      jsx(table(),
          Props{{"children",
                 children(
                     {jsx(row(),
                          Props{{"header", Value::boolean(true)},
                                {"children",
                                 children(
                                     {jsx(column(), Props{{"children", "Name"}}),
                                      jsx(column(), Props{{"align", "right"}, {"children", "Score"}})})}}),
                      jsx(row(),
                          Props{{"children",
                                 children(
                                     {jsx(column(), Props{{"children", "Ada"}}),
                                      jsx(column(), Props{{"children", "10"}})})}})})}}),
      markdown);
  const TableStructure& structure = *rowTable.semantic->table;
  assert(structure.headers == (std::vector<std::string>{"Name", "Score"}));
  assert(structure.rows.size() == 1);
  assert(structure.alignments[1] == ColumnAlignment::Right);
  assert(formatOne(*markdown, rowTable) == "| Name | Score |\n| --- | ---: |\n| Ada | 10 |");

  // Ordered list with a nested list.
  auto orderedList = mapElement(
      registry,
      jsx(list(),
          Props{{"ordered", Value::boolean(true)},
                {"children",
                 children(
                     {jsx(listItem(), Props{{"children", "one"}}),
                      jsx(listItem(),
                          Props{{"children",
                                 children(
                                     {"two",
                                      Value::element(jsx(list(), Props{{"children", children({jsx(listItem(), Props{{"children", "nested"}})})}}))})}})})}}),
      markdown);
  assert(orderedList.semantic->list->ordered);
  assert(formatOne(*markdown, orderedList) == "1. one\n2. two\n  - nested");

  auto tasks = mapElement(
      registry,
      jsx("ul",
          Props{{"task", Value::boolean(true)},
                {"children",
                 children(
                     {jsx("li", Props{{"checked", Value::boolean(true)}, {"children", "done"}}),
                      jsx("li", Props{{"children", "todo"}})})}}),
      markdown);
  assert(formatOne(*markdown, tasks) == "- [x] done\n- [ ] todo");

  auto forcedOrdered = mapElement(registry, jsx("ol", Props{{"children", children({jsx("li", Props{{"children", "x"}})})}}), markdown);
  assert(forcedOrdered.semantic->list->ordered);

  // Code, json and structural breaks.
  auto code = mapElement(registry, jsx(primitives::code(), Props{{"language", "cpp"}, {"children", "int x;"}}), markdown);
  assert(code.type() == ContentBlockType::Code);
  assert(formatOne(*markdown, code) == "```cpp\nint x;\n```");

  auto pre = mapElement(registry, jsx("pre", Props{{"children", "raw"}}), markdown);
  assert(pre.as<CodeBlock>()->language == "other");

  auto data = mapElement(registry, jsx(json(), Props{{"data", Value::object(Props{{"k", "v"}})}}), markdown);
  assert(data.type() == ContentBlockType::Json);
  assert(contentBlockText(data) == "{k: v}");

  assert(formatOne(*markdown, mapElement(registry, jsx("hr"), markdown)) == "---");
  assert(formatOne(*markdown, mapElement(registry, jsx("br"), markdown)) == "\n");

  // Media and event blocks.
  auto image = mapElement(registry, jsx(primitives::image(), Props{{"source", "https://img"}, {"altText", "logo"}}), markdown);
  assert(image.as<ImageBlock>()->altText == std::optional<std::string>("logo"));

  auto action = mapElement(registry, jsx(userAction(), Props{{"action", "click"}, {"children", "Clicked save"}}), markdown);
  assert(action.as<UserActionBlock>()->action == "click");
  assert(formatOne(*markdown, action) == "Clicked save");

  auto change = mapElement(
      registry,
      jsx("state_change", Props{{"entity", "task"}, {"from", "open"}, {"to", "done"}}),
      markdown);
  assert(change.as<StateChangeBlock>()->to == Value("done"));

  // Non-terminal components are evaluated through the expand.
  ContextObjectModel com;
  const TickState tick = makeTickState();
  auto shout = defineFunctionComponent("Shout", [](const Props& props, ContextObjectModel&, const TickState&) {
    return jsx("strong", Props{{"children", props.get("children")}});
  });
  ElementExpander expand = [&](const Element& element) {
    return element.type.functionComponent()->render(element.props, com, tick);
  };
  auto shouted = jsx("p", Props{{"children", Value::element(jsx(shout, Props{{"children", "hey"}}))}});
  assert(formatOne(*markdown, mapElement(registry, shouted, markdown, expand)) == "**hey**");

  SemanticNode unexpandd = extractSemanticNodeFromElement(*shouted, markdown);
  assert(unexpandd.children.size() == 1);
  assert(unexpandd.children[0].semantic == SemanticType::Custom);
  assert(unexpandd.children[0].props.get("_tagName") == Value("shout"));

  // Text extraction and type names.
  assert(extractTextFromElement(*shouted) == "hey");
  assert(elementTypeName(ElementType::function(listItem())) == "listitem");
  assert(elementTypeName(ElementType::fragment()).empty());

  // Custom mappers.
  ContentBlockRegistry custom;
  custom.registerMapper("note", [](const Element& element, const ContentRendererPtr&, const ElementExpander&) {
    return std::optional<ContentBlock>(ContentBlock::text("note: " + extractTextFromElement(element)));
  });
  auto note = mapElement(custom, jsx("note", Props{{"children", "remember"}}), markdown);
  assert(note.as<TextBlock>()->text == "note: remember");

  return true;
}

} // namespace prompt::test
