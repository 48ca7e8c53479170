#include "prompt-reconciler/PromptContentExtractors.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <memory>

namespace prompt {

namespace {

const std::map<std::string, SemanticType>& inlineSemanticTypes() {
  static const std::map<std::string, SemanticType> types = {
      {"inlinecode", SemanticType::Code},
      {"code", SemanticType::Code},
      {"strong", SemanticType::Strong},
      {"b", SemanticType::Strong},
      {"em", SemanticType::Em},
      {"i", SemanticType::Em},
      {"mark", SemanticType::Mark},
      {"u", SemanticType::Underline},
      {"s", SemanticType::Strikethrough},
      {"del", SemanticType::Strikethrough},
      {"sub", SemanticType::Subscript},
      {"sup", SemanticType::Superscript},
      {"small", SemanticType::Small},
      {"a", SemanticType::Link},
      {"q", SemanticType::Quote},
      {"cite", SemanticType::Citation},
      {"kbd", SemanticType::Keyboard},
      {"var", SemanticType::Variable},
      {"p", SemanticType::Paragraph},
      {"blockquote", SemanticType::Blockquote},
      {"img", SemanticType::Image},
      {"audio", SemanticType::Audio},
      {"video", SemanticType::Video},
  };
  return types;
}

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

std::string trim(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

void flattenInto(const Value& value, std::vector<Value>& out) {
  if (value.isArray()) {
    for (const auto& item : value.asArray()) {
      flattenInto(item, out);
    }
    return;
  }
  if (value.isNullish() || value.isBoolean()) {
    return;
  }
  out.push_back(value);
}

Props propsWithoutChildren(const Props& props) {
  Props result = props;
  result.erase("children");
  return result;
}

bool hasRenderer(const std::vector<SemanticNode>& nodes) {
  return std::any_of(nodes.begin(), nodes.end(), [](const SemanticNode& node) { return node.renderer != nullptr; });
}

std::string textOfValue(const Value& value);

std::string textOfChildren(const Value& children) {
  std::string text;
  for (const auto& child : flattenChildValues(children)) {
    text += textOfValue(child);
  }
  return text;
}

std::string textOfValue(const Value& value) {
  if (value.isString()) {
    return value.asString();
  }
  if (value.isNumber()) {
    return numberToString(value.asNumber());
  }
  if (isElementValue(value)) {
    return textOfChildren(value.asElement()->children());
  }
  if (value.isBlock() && value.asBlock()) {
    return contentBlockText(*value.asBlock());
  }
  return {};
}

class SemanticExtractor {
public:
  explicit SemanticExtractor(const ElementExpander& expand) : expand_(expand) {}

  std::vector<SemanticNode> extractChildren(const Value& children, const ContentRendererPtr& renderer) const {
    std::vector<SemanticNode> nodes;
    for (const auto& child : flattenChildValues(children)) {
      auto extracted = extract(child, renderer);
      nodes.insert(nodes.end(), std::make_move_iterator(extracted.begin()), std::make_move_iterator(extracted.end()));
    }
    return nodes;
  }

private:
  std::vector<SemanticNode> extract(const Value& value, const ContentRendererPtr& renderer) const {
    if (value.isString() || value.isNumber()) {
      SemanticNode leaf;
      leaf.text = textOfValue(value);
      return {std::move(leaf)};
    }
    if (value.isBlock() && value.asBlock()) {
      SemanticNode leaf;
      leaf.text = contentBlockText(*value.asBlock());
      return {std::move(leaf)};
    }
    if (!isElementValue(value)) {
      return {};
    }

    const Element& element = *value.asElement();
    const std::string typeName = elementTypeName(element.type);

    if (element.type.kind() == ElementTypeKind::FunctionComponent && !element.type.isTerminalFunction() && expand_) {
      ElementPtr rendered = expand_(element);
      if (rendered && !rendered->type.sameIdentity(element.type)) {
        if (elementTypeName(rendered->type) == "renderer" && rendered->props.get("instance").isRenderer()) {
          Value children = rendered->props.has("children") ? rendered->children() : element.children();
          return {rendererNode(rendered->props.get("instance").asRenderer(), children)};
        }
        return extract(Value::element(rendered), renderer);
      }
    }

    if (typeName == "renderer") {
      const Value instance = element.props.get("instance");
      return {rendererNode(instance.isRenderer() ? instance.asRenderer() : nullptr, element.children())};
    }

    std::vector<SemanticNode> childNodes = extractChildren(element.children(), renderer);

    const auto& inlineTypes = inlineSemanticTypes();
    auto semantic = inlineTypes.find(typeName);
    if (semantic != inlineTypes.end()) {
      SemanticNode node;
      node.semantic = semantic->second;
      if (semantic->second == SemanticType::Link && element.props.has("href")) {
        node.props.set("href", element.props.get("href"));
      } else if (
          semantic->second == SemanticType::Image || semantic->second == SemanticType::Audio ||
          semantic->second == SemanticType::Video) {
        node.props = propsWithoutChildren(element.props);
      }
      node.children = std::move(childNodes);
      return {std::move(node)};
    }

    if (!typeName.empty()) {
      SemanticNode node;
      node.semantic = SemanticType::Custom;
      node.props = propsWithoutChildren(element.props);
      node.props.set("_tagName", typeName);
      node.children = std::move(childNodes);
      return {std::move(node)};
    }

    return childNodes;
  }

  SemanticNode rendererNode(const ContentRendererPtr& renderer, const Value& children) const {
    SemanticNode node;
    node.renderer = renderer;
    node.children = extractChildren(children, renderer);
    return node;
  }

  const ElementExpander& expand_;
};

std::vector<Value> childElementsOrStrings(const Element& element) {
  return flattenChildValues(element.children());
}

void extractRowData(const Element& row, std::vector<std::string>& cells, std::vector<ColumnAlignment>& alignments) {
  for (const auto& child : childElementsOrStrings(row)) {
    if (!isElementValue(child)) {
      if (child.isString()) {
        cells.push_back(child.asString());
        alignments.push_back(ColumnAlignment::Left);
      }
      continue;
    }
    const Element& column = *child.asElement();
    if (elementTypeName(column.type) != "column") {
      continue;
    }
    cells.push_back(extractTextFromElement(column));
    const auto align = optionalStringProp(column.props, "align").value_or("left");
    alignments.push_back(
        align == "center"      ? ColumnAlignment::Center
            : align == "right" ? ColumnAlignment::Right
                               : ColumnAlignment::Left);
  }
}

std::vector<std::string> valueRow(const Value& row) {
  std::vector<std::string> cells;
  if (!row.isArray()) {
    return cells;
  }
  for (const auto& cell : row.asArray()) {
    cells.push_back(cell.toDisplayString());
  }
  return cells;
}

ListItemStructure extractListItemData(const Element& item) {
  ListItemStructure data;
  std::string text;
  for (const auto& child : childElementsOrStrings(item)) {
    if (child.isString() || child.isNumber()) {
      text += textOfValue(child);
    } else if (isElementValue(child)) {
      const Element& childElement = *child.asElement();
      if (elementTypeName(childElement.type) == "list") {
        data.nested = std::make_shared<ListStructure>(extractListStructure(childElement));
      } else {
        text += extractTextFromElement(childElement);
      }
    }
  }
  data.text = trim(text);
  const Value checked = item.props.get("checked");
  if (checked.isBoolean()) {
    data.checked = checked.asBoolean();
  }
  return data;
}

} // namespace

std::string elementTypeName(const ElementType& type) {
  switch (type.kind()) {
    case ElementTypeKind::HostTag:
      return type.hostTag();
    case ElementTypeKind::FunctionComponent:
    case ElementTypeKind::ClassComponent:
      return toLower(type.name());
    default:
      return {};
  }
}

std::vector<Value> flattenChildValues(const Value& children) {
  std::vector<Value> out;
  flattenInto(children, out);
  return out;
}

SemanticNode extractSemanticNodeFromElement(
    const Element& element,
    const ContentRendererPtr& renderer,
    const ElementExpander& expand) {
  SemanticExtractor extractor(expand);
  std::vector<SemanticNode> extracted = extractor.extractChildren(element.children(), renderer);

  SemanticNode root;
  if (extracted.empty()) {
    if (renderer) {
      root.renderer = renderer;
    } else {
      root.text = std::string();
    }
    return root;
  }
  if (renderer && !hasRenderer(extracted)) {
    root.renderer = renderer;
  }
  root.children = std::move(extracted);
  return root;
}

std::string extractTextFromElement(const Element& element) {
  return textOfChildren(element.children());
}

TableStructure extractTableStructure(const Element& element) {
  TableStructure table;
  const Value headers = element.props.get("headers");
  const Value rows = element.props.get("rows");
  if (headers.isArray() && rows.isArray()) {
    table.headers = valueRow(headers);
    for (const auto& row : rows.asArray()) {
      table.rows.push_back(valueRow(row));
    }
    return table;
  }

  for (const auto& child : childElementsOrStrings(element)) {
    if (!isElementValue(child)) {
      continue;
    }
    const Element& row = *child.asElement();
    if (elementTypeName(row.type) != "row") {
      continue;
    }
    std::vector<std::string> cells;
    std::vector<ColumnAlignment> alignments;
    extractRowData(row, cells, alignments);
    if (row.props.get("header").isTruthy()) {
      table.headers.insert(table.headers.end(), cells.begin(), cells.end());
    } else {
      table.rows.push_back(std::move(cells));
    }
    if (!alignments.empty() && table.alignments.empty()) {
      table.alignments = std::move(alignments);
    }
  }
  return table;
}

ListStructure extractListStructure(const Element& element) {
  ListStructure list;
  const Value ordered = element.props.get("ordered");
  const Value task = element.props.get("task");
  list.ordered = ordered.isBoolean() && ordered.asBoolean();
  list.task = task.isBoolean() && task.asBoolean();

  for (const auto& child : childElementsOrStrings(element)) {
    if (!isElementValue(child)) {
      if (child.isString()) {
        ListItemStructure item;
        item.text = child.asString();
        list.items.push_back(std::move(item));
      }
      continue;
    }
    const Element& item = *child.asElement();
    const std::string typeName = elementTypeName(item.type);
    if (typeName == "listitem" || typeName == "li") {
      list.items.push_back(extractListItemData(item));
    }
  }
  return list;
}

} // namespace prompt
