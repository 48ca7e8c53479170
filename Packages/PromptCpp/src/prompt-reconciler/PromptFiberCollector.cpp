#include "prompt-reconciler/PromptFiberCollector.h"

#include "component/PromptPrimitives.h"

#include <fmt/format.h>

namespace prompt {

struct FiberCollector::Pass {
  const TickState& tick;
  ElementExpander expand;
  CompiledStructure compiled;
  std::vector<ContentRendererPtr> renderers;
  std::size_t generatedSectionIds{0};

  const ContentRendererPtr& currentRenderer(const ContentRendererPtr& fallback) const {
    return renderers.empty() ? fallback : renderers.back();
  }
};

namespace {

Element elementView(const FiberNode& node) {
  return Element{node.type, node.props, node.key};
}

Props propsWithoutChildren(const Props& props) {
  Props result = props;
  result.erase("children");
  return result;
}

template <typename T>
std::optional<T> optionalEnumProp(const Props& props, const char* key, std::optional<T> (*fromName)(std::string_view)) {
  auto name = optionalStringProp(props, key);
  return name ? fromName(*name) : std::nullopt;
}

} // namespace

Value contentBlocksToValue(const ContentBlockList& blocks) {
  Value::Array values;
  values.reserve(blocks.size());
  for (const auto& block : blocks) {
    values.push_back(Value::block(block));
  }
  return Value::array(std::move(values));
}

ContentBlockList contentBlocksFromValue(const Value& value) {
  ContentBlockList blocks;
  if (value.isString()) {
    blocks.push_back(ContentBlock::text(value.asString()));
    return blocks;
  }
  if (value.isBlock() && value.asBlock()) {
    blocks.push_back(*value.asBlock());
    return blocks;
  }
  if (!value.isArray()) {
    return blocks;
  }
  for (const auto& item : value.asArray()) {
    if (item.isBlock() && item.asBlock()) {
      blocks.push_back(*item.asBlock());
    } else if (item.isString()) {
      blocks.push_back(ContentBlock::text(item.asString()));
    } else if (item.isNumber()) {
      blocks.push_back(ContentBlock::text(numberToString(item.asNumber())));
    }
  }
  return blocks;
}

FiberCollector::FiberCollector(
    const FiberTree& tree,
    ContextObjectModel& com,
    ContentRendererPtr defaultRenderer,
    const ContentBlockRegistry& registry)
    : tree_(tree),
      com_(com),
      defaultRenderer_(std::move(defaultRenderer)),
      registry_(registry),
      logger_(Logger::forComponent("FiberCollector")) {}

CompiledStructure FiberCollector::collect(FiberId root, const TickState& state) const {
  Pass pass{state, makeExpander(state)};
  if (root && tree_.contains(root)) {
    traverse(pass, root, false);
  }
  pass.compiled.metadata = com_.getMetadata();
  return std::move(pass.compiled);
}

void FiberCollector::traverse(Pass& pass, FiberId fiber, bool inSection) const {
  const FiberNode& node = tree_.node(fiber);
  const ElementType& type = node.type;

  if (type.is(primitives::renderer())) {
    const Value instance = node.props.get("instance");
    if (instance.isRenderer() && instance.asRenderer()) {
      pass.renderers.push_back(instance.asRenderer());
      traverseChildren(pass, fiber, inSection);
      pass.renderers.pop_back();
    } else {
      traverseChildren(pass, fiber, inSection);
    }
    return;
  }
  if (type.is(primitives::section())) {
    collectSection(pass, fiber);
    traverseChildren(pass, fiber, true);
    return;
  }
  if (type.is(primitives::entry())) {
    collectEntry(pass, fiber);
    traverseChildren(pass, fiber, true);
    return;
  }
  if (type.is(primitives::ephemeral())) {
    collectEphemeral(pass, fiber);
    return;
  }
  if (type.is(primitives::tool())) {
    collectTool(pass, fiber);
  } else if (!inSection && isLooseContent(node)) {
    collectLoose(pass, fiber);
    return;
  }
  traverseChildren(pass, fiber, inSection);
}

void FiberCollector::traverseChildren(Pass& pass, FiberId fiber, bool inSection) const {
  for (FiberId child : tree_.children(fiber)) {
    traverse(pass, child, inSection);
  }
}

bool FiberCollector::isLooseContent(const FiberNode& node) const {
  const ElementTypeKind kind = node.type.kind();
  return kind == ElementTypeKind::Text || kind == ElementTypeKind::ContentBlock || registry_.has(node.type);
}

void FiberCollector::collectSection(Pass& pass, FiberId fiber) const {
  const FiberNode& node = tree_.node(fiber);
  const ContentRendererPtr& renderer = pass.currentRenderer(defaultRenderer_);

  CompiledSection section;
  section.id = optionalStringProp(node.props, "id").value_or("");
  if (section.id.empty()) {
    section.id = fmt::format("section-{}", pass.generatedSectionIds++);
  }

  const Value children = node.props.get("children");
  if (node.child) {
    section.content = contentBlocksToValue(collectContentFromFiber(fiber, renderer, pass.tick));
  } else if (!children.isUndefined()) {
    section.content = children;
  } else if (node.props.has("content")) {
    section.content = node.props.get("content");
  } else {
    section.content = Value::array({});
  }
  section.title = optionalStringProp(node.props, "title");
  section.visibility = optionalEnumProp<Visibility>(node.props, "visibility", visibilityFromName);
  section.audience = optionalEnumProp<Audience>(node.props, "audience", audienceFromName);
  section.tags = optionalStringListProp(node.props, "tags");
  section.metadata = optionalObjectProp(node.props, "metadata");
  section.renderer = renderer;

  auto& sections = pass.compiled.sections;
  auto existing = sections.find(section.id);
  if (existing == sections.end()) {
    SystemMessageItem item;
    item.type = SystemMessageItemType::Section;
    item.sectionId = section.id;
    item.index = pass.compiled.systemMessageItems.size();
    item.renderer = renderer;
    pass.compiled.systemMessageItems.push_back(std::move(item));
    sections.emplace(section.id, std::move(section));
    return;
  }

  CompiledSection& merged = existing->second;
  merged.content = mergeSectionContent(merged.content, section.content);
  if (section.title) {
    merged.title = section.title;
  }
  if (section.visibility) {
    merged.visibility = section.visibility;
  }
  if (section.audience) {
    merged.audience = section.audience;
  }
  if (section.tags) {
    merged.tags = section.tags;
  }
  if (section.metadata) {
    merged.metadata = section.metadata;
  }
  merged.renderer = section.renderer;
}

void FiberCollector::collectEntry(Pass& pass, FiberId fiber) const {
  const FiberNode& node = tree_.node(fiber);
  const std::string kind = optionalStringProp(node.props, "kind").value_or("message");
  if (kind != "message") {
    logger_.debug("Skipping entry of kind {}", kind);
    return;
  }
  const ContentRendererPtr& renderer = pass.currentRenderer(defaultRenderer_);
  const Props message = optionalObjectProp(node.props, "message").value_or(Props{});

  ContentBlockList content;
  if (node.child) {
    content = collectContentFromFiber(fiber, renderer, pass.tick);
  }
  if (content.empty()) {
    content = contentBlocksFromValue(message.get("content"));
  }
  if (content.empty()) {
    content = contentBlocksFromValue(node.props.get("content"));
  }

  const MessageRole role =
      messageRoleFromName(optionalStringProp(message, "role").value_or("user")).value_or(MessageRole::User);

  if (role == MessageRole::System) {
    SystemMessageItem item;
    item.type = SystemMessageItemType::Message;
    item.content = std::move(content);
    item.index = pass.compiled.systemMessageItems.size();
    item.renderer = renderer;
    pass.compiled.systemMessageItems.push_back(std::move(item));
    return;
  }

  CompiledTimelineEntry entry;
  entry.kind = kind;
  entry.message.role = role;
  entry.message.content = std::move(content);
  entry.message.id = optionalStringProp(message, "id");
  entry.message.metadata = optionalObjectProp(message, "metadata").value_or(Props{});
  entry.tags = stringListProp(node.props, "tags");
  entry.visibility = optionalEnumProp<Visibility>(node.props, "visibility", visibilityFromName);
  entry.metadata = optionalObjectProp(node.props, "metadata").value_or(Props{});
  if (renderer != defaultRenderer_) {
    entry.renderer = renderer;
  }
  pass.compiled.timelineEntries.push_back(std::move(entry));
}

void FiberCollector::collectEphemeral(Pass& pass, FiberId fiber) const {
  const FiberNode& node = tree_.node(fiber);
  const ContentRendererPtr& renderer = pass.currentRenderer(defaultRenderer_);

  CompiledEphemeral entry;
  if (node.child) {
    entry.content = collectContentFromFiber(fiber, renderer, pass.tick);
  }
  if (entry.content.empty()) {
    entry.content = contentBlocksFromValue(node.props.get("content"));
  }
  entry.type = optionalStringProp(node.props, "type");
  entry.position = optionalEnumProp<EphemeralPosition>(node.props, "position", ephemeralPositionFromName)
                       .value_or(EphemeralPosition::End);
  entry.order = static_cast<int>(optionalNumberProp(node.props, "order").value_or(0));
  entry.id = optionalStringProp(node.props, "id");
  entry.tags = stringListProp(node.props, "tags");
  entry.metadata = optionalObjectProp(node.props, "metadata").value_or(Props{});
  entry.renderer = renderer;
  pass.compiled.ephemeral.push_back(std::move(entry));
}

void FiberCollector::collectTool(Pass& pass, FiberId fiber) const {
  const FiberNode& node = tree_.node(fiber);
  const Value definition = node.props.get("definition");
  ExecutableToolPtr tool;
  if (definition.isTool()) {
    tool = definition.asTool();
  } else if (definition.isString()) {
    tool = com_.getTool(definition.asString());
  }
  if (!tool) {
    logger_.warn("Tool element without a resolvable definition ({})", definition.toDisplayString());
    return;
  }

  auto& tools = pass.compiled.tools;
  for (auto& existing : tools) {
    if (existing.name == tool->metadata.name) {
      existing.tool = tool;
      return;
    }
  }
  tools.push_back(CompiledTool{tool->metadata.name, tool});
}

void FiberCollector::collectLoose(Pass& pass, FiberId fiber) const {
  const ContentRendererPtr& renderer = pass.currentRenderer(defaultRenderer_);
  ContentBlockList blocks;
  collectContentFromChild(fiber, blocks, renderer, pass.expand);
  if (blocks.empty()) {
    return;
  }
  SystemMessageItem item;
  item.type = SystemMessageItemType::Loose;
  item.content = std::move(blocks);
  item.index = pass.compiled.systemMessageItems.size();
  item.renderer = renderer;
  pass.compiled.systemMessageItems.push_back(std::move(item));
}

ContentBlockList FiberCollector::collectContentFromFiber(
    FiberId fiber,
    const ContentRendererPtr& renderer,
    const TickState& state) const {
  ContentBlockList blocks;
  const ElementExpander expand = makeExpander(state);
  for (FiberId child : tree_.children(fiber)) {
    collectContentFromChild(child, blocks, renderer, expand);
  }
  return blocks;
}

void FiberCollector::collectContentFromChild(
    FiberId fiber,
    ContentBlockList& blocks,
    const ContentRendererPtr& renderer,
    const ElementExpander& expand) const {
  const FiberNode& node = tree_.node(fiber);
  switch (node.type.kind()) {
    case ElementTypeKind::ContentBlock:
      if (node.block) {
        blocks.push_back(*node.block);
      }
      return;
    case ElementTypeKind::Text:
      blocks.push_back(ContentBlock::text(node.text));
      return;
    default:
      break;
  }

  if (const ContentBlockMapper* mapper = registry_.find(node.type)) {
    if (auto block = (*mapper)(elementView(node), renderer, expand)) {
      blocks.push_back(std::move(*block));
    }
    return;
  }

  if (node.type.is(primitives::renderer())) {
    const Value instance = node.props.get("instance");
    const ContentRendererPtr nested = instance.isRenderer() && instance.asRenderer() ? instance.asRenderer() : renderer;
    for (FiberId child : tree_.children(fiber)) {
      collectContentFromChild(child, blocks, nested, expand);
    }
    return;
  }

  if (node.type.kind() == ElementTypeKind::HostTag) {
    ContentBlock block = ContentBlock::text("");
    block.semanticNode = extractSemanticNodeFromElement(elementView(node), renderer, expand);
    SemanticInfo semantic;
    semantic.type = SemanticType::Custom;
    semantic.rendererTag = node.type.hostTag();
    semantic.rendererAttrs = propsWithoutChildren(node.props);
    block.semantic = std::move(semantic);
    blocks.push_back(std::move(block));
    return;
  }

  for (FiberId child : tree_.children(fiber)) {
    collectContentFromChild(child, blocks, renderer, expand);
  }
}

ElementExpander FiberCollector::makeExpander(const TickState& state) const {
  return [this, &state](const Element& element) -> ElementPtr {
    const FunctionComponentPtr& component = element.type.functionComponent();
    if (!component || !component->render) {
      return nullptr;
    }
    try {
      return component->render(element.props, com_, state);
    } catch (const std::exception& error) {
      logger_.debug("<{}> cannot be evaluated outside a render: {}", component->name, error.what());
      return nullptr;
    }
  };
}

} // namespace prompt
