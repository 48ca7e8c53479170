#pragma once

#include "runtime/PromptValue.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace prompt {

enum class ContentBlockType : uint8_t {
  Text,
  Image,
  Document,
  Audio,
  Video,
  Code,
  Json,
  ToolUse,
  ToolResult,
  Reasoning,
  UserAction,
  SystemEvent,
  StateChange,
};

const char* contentBlockTypeName(ContentBlockType type);
std::optional<ContentBlockType> contentBlockTypeFromName(std::string_view name);

enum class SemanticType : uint8_t {
  Strong,
  Em,
  Mark,
  Underline,
  Strikethrough,
  Subscript,
  Superscript,
  Small,
  Code,
  Link,
  Quote,
  Citation,
  Keyboard,
  Variable,
  Paragraph,
  Blockquote,
  Heading,
  List,
  ListItem,
  Table,
  LineBreak,
  HorizontalRule,
  Image,
  Audio,
  Video,
  Custom,
};

const char* semanticTypeName(SemanticType type);

// Formatting tree for text-like blocks; leaves carry text.
struct SemanticNode {
  std::optional<std::string> text;
  std::optional<SemanticType> semantic;
  Props props;
  std::vector<SemanticNode> children;
  ContentRendererPtr renderer;
};

enum class ColumnAlignment : uint8_t {
  Left,
  Center,
  Right,
};

struct TableStructure {
  std::vector<std::string> headers;
  std::vector<std::vector<std::string>> rows;
  std::vector<ColumnAlignment> alignments;
};

struct ListStructure;

struct ListItemStructure {
  std::string text;
  std::optional<bool> checked;
  std::shared_ptr<const ListStructure> nested;
};

struct ListStructure {
  bool ordered{false};
  bool task{false};
  std::vector<ListItemStructure> items;
};

struct SemanticInfo {
  SemanticType type{SemanticType::Paragraph};
  std::optional<int> level;
  std::optional<TableStructure> table;
  std::optional<ListStructure> list;
  std::optional<std::string> rendererTag;
  Props rendererAttrs;
};

struct TextBlock {
  std::string text;
};

struct ImageBlock {
  Value source;
  std::optional<std::string> mimeType;
  std::optional<std::string> altText;
};

struct DocumentBlock {
  Value source;
  std::optional<std::string> mimeType;
  std::optional<std::string> title;
};

struct AudioBlock {
  Value source;
  std::optional<std::string> mimeType;
  std::optional<std::string> transcript;
};

struct VideoBlock {
  Value source;
  std::optional<std::string> mimeType;
  std::optional<std::string> transcript;
};

struct CodeBlock {
  std::string language;
  std::string text;
};

struct JsonBlock {
  Value data;
  std::optional<std::string> text;
};

struct ToolUseBlock {
  std::string toolUseId;
  std::string name;
  Value input;
};

struct ToolResultBlock {
  std::string toolUseId;
  std::string name;
  std::vector<ContentBlockPtr> content;
  bool isError{false};
};

struct ReasoningBlock {
  std::string text;
  std::optional<std::string> signature;
  bool isRedacted{false};
};

struct UserActionBlock {
  std::string action;
  std::optional<std::string> actor;
  std::optional<std::string> target;
  Value details;
  std::optional<std::string> text;
};

struct SystemEventBlock {
  std::string event;
  std::optional<std::string> source;
  Value data;
  std::optional<std::string> text;
};

struct StateChangeBlock {
  std::string entity;
  std::optional<std::string> field;
  Value from;
  Value to;
  std::optional<std::string> trigger;
  std::optional<std::string> text;
};

// Alternatives are declared in ContentBlockType order.
struct ContentBlock {
  using Payload = std::variant<
      TextBlock,
      ImageBlock,
      DocumentBlock,
      AudioBlock,
      VideoBlock,
      CodeBlock,
      JsonBlock,
      ToolUseBlock,
      ToolResultBlock,
      ReasoningBlock,
      UserActionBlock,
      SystemEventBlock,
      StateChangeBlock>;

  Payload payload;
  std::optional<SemanticNode> semanticNode;
  std::optional<SemanticInfo> semantic;
  ContentRendererPtr renderer;

  ContentBlockType type() const {
    return static_cast<ContentBlockType>(payload.index());
  }

  template <typename T>
  const T* as() const {
    return std::get_if<T>(&payload);
  }

  static ContentBlock text(std::string text);
  static ContentBlock code(std::string language, std::string text);
  static ContentBlock json(Value data);
};

using ContentBlockList = std::vector<ContentBlock>;

// Plain text of a block: text/code/reasoning bodies, flattened semantic
// nodes, or the optional text of event blocks.
std::string contentBlockText(const ContentBlock& block);
std::string semanticNodeText(const SemanticNode& node);

// Canonical single-line description, stable across runs.
std::string describeContentBlock(const ContentBlock& block);
std::string describeSemanticNode(const SemanticNode& node);

} // namespace prompt
