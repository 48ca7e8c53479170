#include "renderers/ContentRenderer.h"

#include <fmt/format.h>

namespace prompt {

ContentBlockList ContentRenderer::format(const ContentBlockList& blocks) const {
  ContentBlockList formatted;
  for (const auto& block : blocks) {
    if (block.semanticNode && block.type() == ContentBlockType::Text) {
      const ContentRenderer& nodeRenderer =
          block.semanticNode->renderer ? *block.semanticNode->renderer : *this;
      std::string text = nodeRenderer.formatNode(*block.semanticNode);
      if (block.semantic && block.semantic->type == SemanticType::Heading) {
        text = std::string(static_cast<std::size_t>(block.semantic->level.value_or(1)), '#') + " " + text;
      } else if (block.semantic && block.semantic->type == SemanticType::Blockquote) {
        text = "> " + text;
      }
      formatted.push_back(ContentBlock::text(std::move(text)));
      continue;
    }
    if (block.semantic) {
      if (auto semantic = formatSemantic(block)) {
        formatted.push_back(std::move(*semantic));
        continue;
      }
    }
    auto standard = formatStandard(block);
    formatted.insert(formatted.end(), standard.begin(), standard.end());
  }
  return formatted;
}

std::string MarkdownRenderer::formatNode(const SemanticNode& node) const {
  if (node.renderer && node.renderer.get() != this) {
    SemanticNode inner;
    inner.children = node.children;
    return node.renderer->formatNode(inner);
  }

  std::string content;
  if (!node.children.empty()) {
    for (const auto& child : node.children) {
      content += formatNode(child);
    }
  } else if (node.text) {
    content = *node.text;
  }

  if (!node.semantic) {
    return content;
  }

  switch (*node.semantic) {
    case SemanticType::Strong:
      return "**" + content + "**";
    case SemanticType::Em:
      return "*" + content + "*";
    case SemanticType::Code:
      return "`" + content + "`";
    case SemanticType::Mark:
      return "==" + content + "==";
    case SemanticType::Underline:
      return "<u>" + content + "</u>";
    case SemanticType::Strikethrough:
      return "~~" + content + "~~";
    case SemanticType::Subscript:
      return "<sub>" + content + "</sub>";
    case SemanticType::Superscript:
      return "<sup>" + content + "</sup>";
    case SemanticType::Small:
      return "<small>" + content + "</small>";
    case SemanticType::Link:
      return fmt::format("[{}]({})", content, node.props.get("href").toDisplayString());
    case SemanticType::Quote:
      return "\"" + content + "\"";
    case SemanticType::Citation:
      return "*" + content + "*";
    case SemanticType::Keyboard:
      return "<kbd>" + content + "</kbd>";
    case SemanticType::Variable:
      return "*" + content + "*";
    case SemanticType::Image:
      return fmt::format(
          "![{}]({})",
          optionalStringProp(node.props, "alt").value_or(""),
          optionalStringProp(node.props, "src").value_or(""));
    case SemanticType::Audio:
    case SemanticType::Video:
      return fmt::format("[{}]({})", content, optionalStringProp(node.props, "src").value_or(""));
    case SemanticType::Paragraph:
      return content + "\n\n";
    case SemanticType::Blockquote:
      return "> " + content;
    case SemanticType::LineBreak:
      return "\n";
    case SemanticType::HorizontalRule:
      return "---";
    default:
      return content;
  }
}

std::optional<ContentBlock> MarkdownRenderer::formatSemantic(const ContentBlock& block) const {
  const SemanticInfo& semantic = *block.semantic;
  switch (semantic.type) {
    case SemanticType::Heading: {
      std::string prefix(static_cast<std::size_t>(semantic.level.value_or(1)), '#');
      return ContentBlock::text(prefix + " " + contentBlockText(block));
    }
    case SemanticType::Table:
      if (semantic.table) {
        return ContentBlock::text(formatTable(*semantic.table));
      }
      return std::nullopt;
    case SemanticType::List:
      if (semantic.list) {
        return ContentBlock::text(formatList(*semantic.list));
      }
      return std::nullopt;
    case SemanticType::ListItem:
      return ContentBlock::text("- " + contentBlockText(block));
    case SemanticType::Blockquote:
      return ContentBlock::text("> " + contentBlockText(block));
    case SemanticType::LineBreak:
      return ContentBlock::text("\n");
    case SemanticType::HorizontalRule:
      return ContentBlock::text("---");
    default:
      return std::nullopt;
  }
}

ContentBlockList MarkdownRenderer::formatStandard(const ContentBlock& block) const {
  switch (block.type()) {
    case ContentBlockType::Code: {
      const auto* code = block.as<CodeBlock>();
      return {ContentBlock::text(fmt::format("```{}\n{}\n```", code->language, code->text))};
    }
    case ContentBlockType::Json:
      return {ContentBlock::text(fmt::format("```json\n{}\n```", contentBlockText(block)))};
    case ContentBlockType::UserAction:
    case ContentBlockType::SystemEvent:
    case ContentBlockType::StateChange: {
      std::string text = contentBlockText(block);
      if (text.empty()) {
        return {block};
      }
      return {ContentBlock::text(text)};
    }
    default:
      return {block};
  }
}

std::string MarkdownRenderer::formatTable(const TableStructure& table) {
  auto row = [](const std::vector<std::string>& cells) {
    std::string line = "|";
    for (const auto& cell : cells) {
      line += " " + cell + " |";
    }
    return line;
  };

  std::string out;
  if (!table.headers.empty()) {
    out += row(table.headers) + "\n|";
    for (std::size_t i = 0; i < table.headers.size(); ++i) {
      ColumnAlignment alignment = i < table.alignments.size() ? table.alignments[i] : ColumnAlignment::Left;
      switch (alignment) {
        case ColumnAlignment::Center:
          out += " :---: |";
          break;
        case ColumnAlignment::Right:
          out += " ---: |";
          break;
        case ColumnAlignment::Left:
          out += " --- |";
          break;
      }
    }
    out += "\n";
  }
  for (const auto& cells : table.rows) {
    out += row(cells) + "\n";
  }
  if (!out.empty()) {
    out.pop_back();
  }
  return out;
}

std::string MarkdownRenderer::formatList(const ListStructure& list, int depth) {
  std::string out;
  std::string indent(static_cast<std::size_t>(depth) * 2, ' ');
  for (std::size_t i = 0; i < list.items.size(); ++i) {
    const auto& item = list.items[i];
    std::string marker = list.ordered ? fmt::format("{}.", i + 1) : std::string("-");
    std::string checkbox;
    if (list.task || item.checked) {
      checkbox = item.checked.value_or(false) ? "[x] " : "[ ] ";
    }
    out += fmt::format("{}{} {}{}\n", indent, marker, checkbox, item.text);
    if (item.nested) {
      out += formatList(*item.nested, depth + 1);
    }
  }
  if (depth == 0 && !out.empty()) {
    out.pop_back();
  }
  return out;
}

} // namespace prompt
