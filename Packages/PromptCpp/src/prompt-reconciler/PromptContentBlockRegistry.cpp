#include "prompt-reconciler/PromptContentBlockRegistry.h"

#include <utility>

namespace prompt {

namespace {

SemanticInfo semanticOf(SemanticType type) {
  SemanticInfo info;
  info.type = type;
  return info;
}

ContentBlock semanticTextBlock(
    const Element& element,
    const ContentRendererPtr& renderer,
    const ElementExpander& expand,
    SemanticInfo semantic) {
  ContentBlock block = ContentBlock::text("");
  block.semanticNode = extractSemanticNodeFromElement(element, renderer, expand);
  block.semantic = std::move(semantic);
  return block;
}

ContentBlockMapper headingMapper(int level) {
  return [level](const Element& element, const ContentRendererPtr& renderer, const ElementExpander& expand) {
    SemanticInfo semantic = semanticOf(SemanticType::Heading);
    semantic.level = level;
    return std::optional<ContentBlock>(semanticTextBlock(element, renderer, expand, std::move(semantic)));
  };
}

ContentBlockMapper semanticMapper(SemanticType type) {
  return [type](const Element& element, const ContentRendererPtr& renderer, const ElementExpander& expand) {
    return std::optional<ContentBlock>(semanticTextBlock(element, renderer, expand, semanticOf(type)));
  };
}

ContentBlockMapper listMapper(bool forceOrdered) {
  return [forceOrdered](const Element& element, const ContentRendererPtr&, const ElementExpander&) {
    ListStructure list = extractListStructure(element);
    if (forceOrdered) {
      list.ordered = true;
    }
    ContentBlock block = ContentBlock::text("");
    block.semantic = semanticOf(SemanticType::List);
    block.semantic->list = std::move(list);
    return std::optional<ContentBlock>(std::move(block));
  };
}

std::optional<ContentBlock> mapText(const Element& element, const ContentRendererPtr& renderer, const ElementExpander& expand) {
  if (!element.children().isNullish()) {
    ContentBlock block = ContentBlock::text("");
    block.semanticNode = extractSemanticNodeFromElement(element, renderer, expand);
    return block;
  }
  const std::string text = optionalStringProp(element.props, "text").value_or("");
  ContentBlock block = ContentBlock::text(text);
  if (!text.empty()) {
    SemanticNode node;
    node.text = text;
    block.semanticNode = std::move(node);
  }
  return block;
}

std::optional<ContentBlock> mapImage(const Element& element, const ContentRendererPtr&, const ElementExpander&) {
  ContentBlock block;
  block.payload = ImageBlock{
      element.props.get("source"),
      optionalStringProp(element.props, "mimeType"),
      optionalStringProp(element.props, "altText")};
  return block;
}

std::optional<ContentBlock> mapDocument(const Element& element, const ContentRendererPtr&, const ElementExpander&) {
  ContentBlock block;
  block.payload = DocumentBlock{
      element.props.get("source"),
      optionalStringProp(element.props, "mimeType"),
      optionalStringProp(element.props, "title")};
  return block;
}

std::optional<ContentBlock> mapAudio(const Element& element, const ContentRendererPtr&, const ElementExpander&) {
  ContentBlock block;
  block.payload = AudioBlock{
      element.props.get("source"),
      optionalStringProp(element.props, "mimeType"),
      optionalStringProp(element.props, "transcript")};
  return block;
}

std::optional<ContentBlock> mapVideo(const Element& element, const ContentRendererPtr&, const ElementExpander&) {
  ContentBlock block;
  block.payload = VideoBlock{
      element.props.get("source"),
      optionalStringProp(element.props, "mimeType"),
      optionalStringProp(element.props, "transcript")};
  return block;
}

std::optional<ContentBlock> mapCode(const Element& element, const ContentRendererPtr&, const ElementExpander&) {
  std::string text;
  if (element.props.has("children")) {
    text = extractTextFromElement(element);
  } else {
    text = optionalStringProp(element.props, "text").value_or("");
  }
  return ContentBlock::code(optionalStringProp(element.props, "language").value_or(""), std::move(text));
}

std::optional<ContentBlock> mapJson(const Element& element, const ContentRendererPtr&, const ElementExpander&) {
  ContentBlock block = ContentBlock::json(element.props.get("data"));
  if (auto text = optionalStringProp(element.props, "text")) {
    std::get<JsonBlock>(block.payload).text = std::move(text);
  }
  return block;
}

std::optional<ContentBlock> mapHeader(const Element& element, const ContentRendererPtr& renderer, const ElementExpander& expand) {
  SemanticInfo semantic = semanticOf(SemanticType::Heading);
  const auto level = optionalNumberProp(element.props, "level");
  semantic.level = level && *level >= 1 ? static_cast<int>(*level) : 1;
  return semanticTextBlock(element, renderer, expand, std::move(semantic));
}

std::optional<ContentBlock> mapTable(const Element& element, const ContentRendererPtr&, const ElementExpander&) {
  ContentBlock block = ContentBlock::text("");
  block.semantic = semanticOf(SemanticType::Table);
  block.semantic->table = extractTableStructure(element);
  return block;
}

std::optional<ContentBlock> mapListItem(const Element& element, const ContentRendererPtr&, const ElementExpander&) {
  ContentBlock block = ContentBlock::text(extractTextFromElement(element));
  block.semantic = semanticOf(SemanticType::ListItem);
  return block;
}

std::optional<ContentBlock> mapPreformatted(const Element& element, const ContentRendererPtr&, const ElementExpander&) {
  return ContentBlock::code("other", extractTextFromElement(element));
}

std::optional<ContentBlock> mapLineBreak(const Element&, const ContentRendererPtr&, const ElementExpander&) {
  ContentBlock block = ContentBlock::text("\n");
  block.semantic = semanticOf(SemanticType::LineBreak);
  return block;
}

std::optional<ContentBlock> mapHorizontalRule(const Element&, const ContentRendererPtr&, const ElementExpander&) {
  ContentBlock block = ContentBlock::text("---");
  block.semantic = semanticOf(SemanticType::HorizontalRule);
  return block;
}

std::optional<std::string> childrenString(const Element& element) {
  const Value children = element.children();
  if (children.isString()) {
    return children.asString();
  }
  return std::nullopt;
}

std::optional<ContentBlock> mapUserAction(const Element& element, const ContentRendererPtr&, const ElementExpander&) {
  ContentBlock block;
  block.payload = UserActionBlock{
      optionalStringProp(element.props, "action").value_or(""),
      optionalStringProp(element.props, "actor"),
      optionalStringProp(element.props, "target"),
      element.props.get("details"),
      childrenString(element)};
  return block;
}

std::optional<ContentBlock> mapSystemEvent(const Element& element, const ContentRendererPtr&, const ElementExpander&) {
  ContentBlock block;
  block.payload = SystemEventBlock{
      optionalStringProp(element.props, "event").value_or(""),
      optionalStringProp(element.props, "source"),
      element.props.get("data"),
      childrenString(element)};
  return block;
}

std::optional<ContentBlock> mapStateChange(const Element& element, const ContentRendererPtr&, const ElementExpander&) {
  ContentBlock block;
  block.payload = StateChangeBlock{
      optionalStringProp(element.props, "entity").value_or(""),
      optionalStringProp(element.props, "field"),
      element.props.get("from"),
      element.props.get("to"),
      optionalStringProp(element.props, "trigger"),
      childrenString(element)};
  return block;
}

} // namespace

void ContentBlockRegistry::registerMapper(const std::string& typeName, ContentBlockMapper mapper) {
  mappers_[typeName] = std::move(mapper);
}

const ContentBlockMapper* ContentBlockRegistry::find(const ElementType& type) const {
  if (type.kind() != ElementTypeKind::HostTag && type.kind() != ElementTypeKind::FunctionComponent) {
    return nullptr;
  }
  auto it = mappers_.find(elementTypeName(type));
  return it == mappers_.end() ? nullptr : &it->second;
}

ContentBlockRegistry ContentBlockRegistry::withDefaults() {
  ContentBlockRegistry registry;
  registry.registerMapper("text", mapText);
  registry.registerMapper("p", semanticMapper(SemanticType::Paragraph));
  registry.registerMapper("blockquote", semanticMapper(SemanticType::Blockquote));
  registry.registerMapper("image", mapImage);
  registry.registerMapper("document", mapDocument);
  registry.registerMapper("audio", mapAudio);
  registry.registerMapper("video", mapVideo);
  registry.registerMapper("code", mapCode);
  registry.registerMapper("json", mapJson);
  registry.registerMapper("h1", headingMapper(1));
  registry.registerMapper("h2", headingMapper(2));
  registry.registerMapper("h3", headingMapper(3));
  registry.registerMapper("header", mapHeader);
  registry.registerMapper("paragraph", semanticMapper(SemanticType::Paragraph));
  registry.registerMapper("table", mapTable);
  registry.registerMapper("list", listMapper(false));
  registry.registerMapper("ul", listMapper(false));
  registry.registerMapper("ol", listMapper(true));
  registry.registerMapper("li", mapListItem);
  registry.registerMapper("listitem", mapListItem);
  registry.registerMapper("pre", mapPreformatted);
  registry.registerMapper("br", mapLineBreak);
  registry.registerMapper("hr", mapHorizontalRule);
  registry.registerMapper("useraction", mapUserAction);
  registry.registerMapper("user_action", mapUserAction);
  registry.registerMapper("systemevent", mapSystemEvent);
  registry.registerMapper("system_event", mapSystemEvent);
  registry.registerMapper("statechange", mapStateChange);
  registry.registerMapper("state_change", mapStateChange);
  return registry;
}

} // namespace prompt
