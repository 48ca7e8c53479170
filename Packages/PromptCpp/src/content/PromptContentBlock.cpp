#include "content/PromptContentBlock.h"

#include "renderers/ContentRenderer.h"

#include <array>

#include <fmt/format.h>

namespace prompt {

namespace {

constexpr std::array<const char*, 13> kBlockTypeNames{
    "text",
    "image",
    "document",
    "audio",
    "video",
    "code",
    "json",
    "tool_use",
    "tool_result",
    "reasoning",
    "user_action",
    "system_event",
    "state_change"};

std::string describeOptional(const std::optional<std::string>& value) {
  return value ? fmt::format("\"{}\"", *value) : std::string("-");
}

std::string describePayload(const ContentBlock& block) {
  switch (block.type()) {
    case ContentBlockType::Text:
      return fmt::format("text=\"{}\"", block.as<TextBlock>()->text);
    case ContentBlockType::Image: {
      const auto* image = block.as<ImageBlock>();
      return fmt::format(
          "source={} mime={} alt={}",
          image->source.toDisplayString(),
          describeOptional(image->mimeType),
          describeOptional(image->altText));
    }
    case ContentBlockType::Document: {
      const auto* document = block.as<DocumentBlock>();
      return fmt::format(
          "source={} mime={} title={}",
          document->source.toDisplayString(),
          describeOptional(document->mimeType),
          describeOptional(document->title));
    }
    case ContentBlockType::Audio: {
      const auto* audio = block.as<AudioBlock>();
      return fmt::format(
          "source={} mime={} transcript={}",
          audio->source.toDisplayString(),
          describeOptional(audio->mimeType),
          describeOptional(audio->transcript));
    }
    case ContentBlockType::Video: {
      const auto* video = block.as<VideoBlock>();
      return fmt::format(
          "source={} mime={} transcript={}",
          video->source.toDisplayString(),
          describeOptional(video->mimeType),
          describeOptional(video->transcript));
    }
    case ContentBlockType::Code: {
      const auto* code = block.as<CodeBlock>();
      return fmt::format("language={} text=\"{}\"", code->language, code->text);
    }
    case ContentBlockType::Json: {
      const auto* json = block.as<JsonBlock>();
      return fmt::format("data={} text={}", json->data.toDisplayString(), describeOptional(json->text));
    }
    case ContentBlockType::ToolUse: {
      const auto* use = block.as<ToolUseBlock>();
      return fmt::format("id={} name={} input={}", use->toolUseId, use->name, use->input.toDisplayString());
    }
    case ContentBlockType::ToolResult: {
      const auto* result = block.as<ToolResultBlock>();
      std::string nested;
      for (const auto& item : result->content) {
        nested += item ? "(" + describeContentBlock(*item) + ")" : std::string("(null)");
      }
      return fmt::format(
          "id={} name={} error={} content=[{}]",
          result->toolUseId,
          result->name,
          result->isError,
          nested);
    }
    case ContentBlockType::Reasoning: {
      const auto* reasoning = block.as<ReasoningBlock>();
      return fmt::format("text=\"{}\" redacted={}", reasoning->text, reasoning->isRedacted);
    }
    case ContentBlockType::UserAction: {
      const auto* action = block.as<UserActionBlock>();
      return fmt::format(
          "action={} actor={} target={} text={}",
          action->action,
          describeOptional(action->actor),
          describeOptional(action->target),
          describeOptional(action->text));
    }
    case ContentBlockType::SystemEvent: {
      const auto* event = block.as<SystemEventBlock>();
      return fmt::format(
          "event={} source={} data={} text={}",
          event->event,
          describeOptional(event->source),
          event->data.toDisplayString(),
          describeOptional(event->text));
    }
    case ContentBlockType::StateChange: {
      const auto* change = block.as<StateChangeBlock>();
      return fmt::format(
          "entity={} field={} from={} to={} text={}",
          change->entity,
          describeOptional(change->field),
          change->from.toDisplayString(),
          change->to.toDisplayString(),
          describeOptional(change->text));
    }
  }
  return {};
}

std::string describeList(const ListStructure& list) {
  std::string items;
  for (const auto& item : list.items) {
    items += fmt::format("({}", item.text);
    if (item.checked) {
      items += *item.checked ? " [x]" : " [ ]";
    }
    if (item.nested) {
      items += " " + describeList(*item.nested);
    }
    items += ")";
  }
  return fmt::format("list(ordered={} task={} items={})", list.ordered, list.task, items);
}

} // namespace

const char* contentBlockTypeName(ContentBlockType type) {
  return kBlockTypeNames[static_cast<std::size_t>(type)];
}

std::optional<ContentBlockType> contentBlockTypeFromName(std::string_view name) {
  for (std::size_t i = 0; i < kBlockTypeNames.size(); ++i) {
    if (name == kBlockTypeNames[i]) {
      return static_cast<ContentBlockType>(i);
    }
  }
  return std::nullopt;
}

const char* semanticTypeName(SemanticType type) {
  switch (type) {
    case SemanticType::Strong:
      return "strong";
    case SemanticType::Em:
      return "em";
    case SemanticType::Mark:
      return "mark";
    case SemanticType::Underline:
      return "underline";
    case SemanticType::Strikethrough:
      return "strikethrough";
    case SemanticType::Subscript:
      return "subscript";
    case SemanticType::Superscript:
      return "superscript";
    case SemanticType::Small:
      return "small";
    case SemanticType::Code:
      return "code";
    case SemanticType::Link:
      return "link";
    case SemanticType::Quote:
      return "quote";
    case SemanticType::Citation:
      return "citation";
    case SemanticType::Keyboard:
      return "keyboard";
    case SemanticType::Variable:
      return "variable";
    case SemanticType::Paragraph:
      return "paragraph";
    case SemanticType::Blockquote:
      return "blockquote";
    case SemanticType::Heading:
      return "heading";
    case SemanticType::List:
      return "list";
    case SemanticType::ListItem:
      return "list-item";
    case SemanticType::Table:
      return "table";
    case SemanticType::LineBreak:
      return "line-break";
    case SemanticType::HorizontalRule:
      return "horizontal-rule";
    case SemanticType::Image:
      return "image";
    case SemanticType::Audio:
      return "audio";
    case SemanticType::Video:
      return "video";
    case SemanticType::Custom:
      return "custom";
  }
  return "custom";
}

ContentBlock ContentBlock::text(std::string text) {
  ContentBlock block;
  block.payload = TextBlock{std::move(text)};
  return block;
}

ContentBlock ContentBlock::code(std::string language, std::string text) {
  ContentBlock block;
  block.payload = CodeBlock{std::move(language), std::move(text)};
  return block;
}

ContentBlock ContentBlock::json(Value data) {
  ContentBlock block;
  block.payload = JsonBlock{std::move(data), std::nullopt};
  return block;
}

std::string semanticNodeText(const SemanticNode& node) {
  std::string out = node.text.value_or("");
  for (const auto& child : node.children) {
    out += semanticNodeText(child);
  }
  return out;
}

std::string contentBlockText(const ContentBlock& block) {
  switch (block.type()) {
    case ContentBlockType::Text: {
      const auto& text = block.as<TextBlock>()->text;
      if (text.empty() && block.semanticNode) {
        return semanticNodeText(*block.semanticNode);
      }
      return text;
    }
    case ContentBlockType::Code:
      return block.as<CodeBlock>()->text;
    case ContentBlockType::Reasoning:
      return block.as<ReasoningBlock>()->text;
    case ContentBlockType::Json: {
      const auto* json = block.as<JsonBlock>();
      return json->text.value_or(json->data.toDisplayString());
    }
    case ContentBlockType::UserAction:
      return block.as<UserActionBlock>()->text.value_or("");
    case ContentBlockType::SystemEvent:
      return block.as<SystemEventBlock>()->text.value_or("");
    case ContentBlockType::StateChange:
      return block.as<StateChangeBlock>()->text.value_or("");
    default:
      return {};
  }
}

std::string describeSemanticNode(const SemanticNode& node) {
  std::string out = "{";
  if (node.semantic) {
    out += semanticTypeName(*node.semantic);
  }
  if (node.text) {
    out += fmt::format(" \"{}\"", *node.text);
  }
  if (!node.props.empty()) {
    out += " " + Value::object(node.props).toDisplayString();
  }
  if (node.renderer) {
    out += " renderer=" + node.renderer->name();
  }
  for (const auto& child : node.children) {
    out += " " + describeSemanticNode(child);
  }
  return out + "}";
}

std::string describeContentBlock(const ContentBlock& block) {
  std::string out = fmt::format("{} {}", contentBlockTypeName(block.type()), describePayload(block));
  if (block.semantic) {
    out += fmt::format(" semantic={}", semanticTypeName(block.semantic->type));
    if (block.semantic->level) {
      out += fmt::format(" level={}", *block.semantic->level);
    }
    if (block.semantic->table) {
      out += fmt::format(
          " table(headers={} rows={})",
          block.semantic->table->headers.size(),
          block.semantic->table->rows.size());
    }
    if (block.semantic->list) {
      out += " " + describeList(*block.semantic->list);
    }
    if (block.semantic->rendererTag) {
      out += fmt::format(" tag={}", *block.semantic->rendererTag);
    }
  }
  if (block.semanticNode) {
    out += " node=" + describeSemanticNode(*block.semanticNode);
  }
  if (block.renderer) {
    out += " renderer=" + block.renderer->name();
  }
  return out;
}

} // namespace prompt
