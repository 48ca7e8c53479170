#include "prompt-reconciler/PromptStructureRenderer.h"

#include "prompt-reconciler/PromptFiberCollector.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

namespace prompt {

namespace {

bool isEventBlock(const ContentBlock& block) {
  switch (block.type()) {
    case ContentBlockType::UserAction:
    case ContentBlockType::SystemEvent:
    case ContentBlockType::StateChange:
      return true;
    default:
      return false;
  }
}

} // namespace

ContentBlockList consolidateTextBlocks(const ContentBlockList& blocks) {
  ContentBlockList result;
  std::vector<std::string> pending;
  auto flush = [&]() {
    if (!pending.empty()) {
      result.push_back(ContentBlock::text(fmt::format("{}", fmt::join(pending, "\n\n"))));
      pending.clear();
    }
  };

  for (const auto& block : blocks) {
    if (const auto* text = block.as<TextBlock>()) {
      pending.push_back(text->text);
    } else {
      flush();
      result.push_back(block);
    }
  }
  flush();
  return result;
}

StructureRenderer::StructureRenderer(ContextObjectModel& com, ContentRendererPtr defaultRenderer)
    : com_(com),
      defaultRenderer_(defaultRenderer ? std::move(defaultRenderer) : std::make_shared<MarkdownRenderer>()),
      logger_(Logger::forComponent("StructureRenderer")) {}

void StructureRenderer::setDefaultRenderer(ContentRendererPtr renderer) {
  if (renderer) {
    defaultRenderer_ = std::move(renderer);
  }
}

void StructureRenderer::apply(const CompiledStructure& compiled) {
  for (const auto& [id, section] : compiled.sections) {
    applySection(section);
  }
  for (const auto& entry : compiled.timelineEntries) {
    applyTimelineEntry(entry);
  }
  consolidateSystemMessage(compiled.systemMessageItems);
  for (const auto& tool : compiled.tools) {
    com_.addTool(tool.tool);
  }
  for (const auto& ephemeral : compiled.ephemeral) {
    applyEphemeral(ephemeral);
  }
  for (const auto& [key, value] : compiled.metadata) {
    com_.addMetadata(key, value);
  }
  logger_.debug(
      "Applied {} section(s), {} timeline entries, {} tool(s)",
      compiled.sections.size(),
      compiled.timelineEntries.size(),
      compiled.tools.size());
}

void StructureRenderer::applySection(const CompiledSection& compiled) {
  const ContentRenderer& renderer = rendererFor(compiled.renderer);

  COMSection section;
  section.id = compiled.id;
  section.content = compiled.content;
  section.title = compiled.title;
  section.visibility = compiled.visibility;
  section.audience = compiled.audience;
  section.tags = compiled.tags;
  section.metadata = compiled.metadata;
  section.renderer = compiled.renderer;
  if (compiled.content.isArray()) {
    section.formattedContent = renderer.format(contentBlocksFromValue(compiled.content));
    section.formattedWith = renderer.name();
  }
  com_.addSection(std::move(section));
}

void StructureRenderer::applyTimelineEntry(const CompiledTimelineEntry& compiled) {
  if (compiled.kind != "message") {
    return;
  }
  MessageOptions options;
  options.tags = compiled.tags;
  options.visibility = compiled.visibility;
  options.metadata = compiled.metadata;
  if (compiled.renderer) {
    options.metadata.set("renderer", Value::renderer(compiled.renderer));
  }
  com_.addMessage(compiled.message, std::move(options));
}

void StructureRenderer::applyEphemeral(const CompiledEphemeral& compiled) {
  EphemeralEntry entry;
  entry.type = compiled.type;
  entry.content = consolidateTextBlocks(rendererFor(compiled.renderer).format(compiled.content));
  entry.position = compiled.position;
  entry.order = compiled.order;
  entry.id = compiled.id;
  entry.tags = compiled.tags;
  entry.metadata = compiled.metadata;
  com_.addEphemeral(std::move(entry));
}

void StructureRenderer::consolidateSystemMessage(const std::vector<SystemMessageItem>& items) {
  if (items.empty()) {
    return;
  }
  std::vector<SystemMessageItem> sorted = items;
  std::stable_sort(sorted.begin(), sorted.end(), [](const SystemMessageItem& lhs, const SystemMessageItem& rhs) {
    return lhs.index < rhs.index;
  });

  std::vector<std::string> parts;
  for (const auto& item : sorted) {
    if (item.type != SystemMessageItemType::Section) {
      std::string text = formattedText(item.renderer, item.content);
      if (!text.empty()) {
        parts.push_back(std::move(text));
      }
      continue;
    }

    const COMSection* section = com_.getSection(item.sectionId);
    if (section == nullptr) {
      logger_.warn("System message references unknown section {}", item.sectionId);
      continue;
    }
    std::vector<std::string> sectionParts;
    if (section->title) {
      sectionParts.push_back("## " + *section->title);
    }
    if (section->content.isArray()) {
      std::string text = formattedText(section->renderer, contentBlocksFromValue(section->content));
      if (!text.empty()) {
        sectionParts.push_back(std::move(text));
      }
    } else if (section->content.isString()) {
      sectionParts.push_back(section->content.asString());
    }
    if (!sectionParts.empty()) {
      parts.push_back(fmt::format("{}", fmt::join(sectionParts, "\n")));
    }
  }

  if (parts.empty()) {
    return;
  }
  Message system;
  system.role = MessageRole::System;
  system.content.push_back(ContentBlock::text(fmt::format("{}", fmt::join(parts, "\n\n"))));
  com_.addMessage(std::move(system));
}

COMInput StructureRenderer::formatInput(const COMInput& input) const {
  COMInput formatted = input;

  for (auto& entry : formatted.timeline) {
    ContentRendererPtr explicitRenderer;
    const Value stored = entry.metadata.get("renderer");
    if (stored.isRenderer()) {
      explicitRenderer = stored.asRenderer();
    }
    const ContentBlockList& content = entry.message.content;
    const bool semantic = std::any_of(content.begin(), content.end(), [](const ContentBlock& block) {
      return block.semanticNode || block.semantic;
    });
    const bool events = std::any_of(content.begin(), content.end(), isEventBlock);
    if (explicitRenderer || semantic || events) {
      entry.message.content = rendererFor(explicitRenderer).format(content);
    }
  }

  for (auto& section : formatted.sections) {
    if (section.formattedContent) {
      section.content = contentBlocksToValue(*section.formattedContent);
      section.formattedContent.reset();
      section.formattedWith.reset();
    } else if (section.content.isArray()) {
      section.content = contentBlocksToValue(defaultRenderer_->format(contentBlocksFromValue(section.content)));
    }
  }
  return formatted;
}

const ContentRenderer& StructureRenderer::rendererFor(const ContentRendererPtr& renderer) const {
  return renderer ? *renderer : *defaultRenderer_;
}

std::string StructureRenderer::formattedText(const ContentRendererPtr& renderer, const ContentBlockList& blocks) const {
  std::vector<std::string> texts;
  for (const auto& block : rendererFor(renderer).format(blocks)) {
    if (const auto* text = block.as<TextBlock>()) {
      texts.push_back(text->text);
    }
  }
  return fmt::format("{}", fmt::join(texts, "\n"));
}

} // namespace prompt
