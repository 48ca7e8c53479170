#include "prompt-reconciler/PromptCompiledStructure.h"

#include "renderers/ContentRenderer.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace prompt {

namespace {

std::string describeRenderer(const ContentRendererPtr& renderer) {
  return renderer ? renderer->name() : std::string("-");
}

std::string describeBlocks(const ContentBlockList& blocks) {
  std::string out = "[";
  for (std::size_t i = 0; i < blocks.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += describeContentBlock(blocks[i]);
  }
  return out + "]";
}

std::string describeTags(const std::vector<std::string>& tags) {
  return fmt::format("[{}]", fmt::join(tags, ","));
}

} // namespace

const char* systemMessageItemTypeName(SystemMessageItemType type) {
  switch (type) {
    case SystemMessageItemType::Section:
      return "section";
    case SystemMessageItemType::Message:
      return "message";
    case SystemMessageItemType::Loose:
      return "loose";
  }
  return "unknown";
}

const CompiledSection* CompiledStructure::findSection(const std::string& id) const {
  auto it = sections.find(id);
  return it == sections.end() ? nullptr : &it->second;
}

const CompiledTool* CompiledStructure::findTool(const std::string& name) const {
  for (const auto& tool : tools) {
    if (tool.name == name) {
      return &tool;
    }
  }
  return nullptr;
}

std::string describeCompiledStructure(const CompiledStructure& compiled) {
  std::string out;
  for (const auto& [id, section] : compiled.sections) {
    out += fmt::format(
        "section {} title={} visibility={} audience={} tags={} metadata={} renderer={} content={}\n",
        id,
        section.title.value_or("-"),
        section.visibility ? visibilityName(*section.visibility) : "-",
        section.audience ? audienceName(*section.audience) : "-",
        section.tags ? describeTags(*section.tags) : std::string("-"),
        section.metadata ? Value::object(*section.metadata).toDisplayString() : std::string("-"),
        describeRenderer(section.renderer),
        section.content.toDisplayString());
  }
  for (const auto& entry : compiled.timelineEntries) {
    out += fmt::format(
        "timeline {} role={} id={} tags={} visibility={} metadata={} message-metadata={} renderer={} content={}\n",
        entry.kind,
        messageRoleName(entry.message.role),
        entry.message.id.value_or("-"),
        describeTags(entry.tags),
        entry.visibility ? visibilityName(*entry.visibility) : "-",
        Value::object(entry.metadata).toDisplayString(),
        Value::object(entry.message.metadata).toDisplayString(),
        describeRenderer(entry.renderer),
        describeBlocks(entry.message.content));
  }
  for (const auto& item : compiled.systemMessageItems) {
    out += fmt::format(
        "system {} #{} section={} renderer={} content={}\n",
        systemMessageItemTypeName(item.type),
        item.index,
        item.sectionId.empty() ? std::string("-") : item.sectionId,
        describeRenderer(item.renderer),
        describeBlocks(item.content));
  }
  for (const auto& tool : compiled.tools) {
    out += fmt::format("tool {}\n", tool.name);
  }
  for (const auto& entry : compiled.ephemeral) {
    out += fmt::format(
        "ephemeral position={} order={} type={} id={} tags={} metadata={} renderer={} content={}\n",
        ephemeralPositionName(entry.position),
        entry.order,
        entry.type.value_or("-"),
        entry.id.value_or("-"),
        describeTags(entry.tags),
        Value::object(entry.metadata).toDisplayString(),
        describeRenderer(entry.renderer),
        describeBlocks(entry.content));
  }
  out += fmt::format("metadata {}\n", Value::object(compiled.metadata).toDisplayString());
  return out;
}

} // namespace prompt
