#pragma once

#include "com/PromptObjectModel.h"
#include "prompt-reconciler/PromptCompiledStructure.h"
#include "renderers/ContentRenderer.h"
#include "shared/PromptLogger.h"

#include <vector>

namespace prompt {

// Merges runs of text blocks into one block joined by blank lines. Other
// blocks are kept and split the runs.
ContentBlockList consolidateTextBlocks(const ContentBlockList& blocks);

// Publishes a compiled structure into the object model and formats the
// model input built from it.
//
// Sections are formatted when applied and the result is cached on the
// section. Timeline content is kept as collected; it is formatted by
// formatInput() only when a renderer was set explicitly, or when it carries
// semantic or event blocks.
class StructureRenderer {
public:
  explicit StructureRenderer(ContextObjectModel& com, ContentRendererPtr defaultRenderer = nullptr);

  void setDefaultRenderer(ContentRendererPtr renderer);
  const ContentRendererPtr& defaultRenderer() const {
    return defaultRenderer_;
  }

  // Expects an object model cleared for the current tick. System content is
  // added as a single system message.
  void apply(const CompiledStructure& compiled);

  COMInput formatInput(const COMInput& input) const;

private:
  void applySection(const CompiledSection& compiled);
  void applyTimelineEntry(const CompiledTimelineEntry& compiled);
  void applyEphemeral(const CompiledEphemeral& compiled);
  void consolidateSystemMessage(const std::vector<SystemMessageItem>& items);

  const ContentRenderer& rendererFor(const ContentRendererPtr& renderer) const;
  std::string formattedText(const ContentRendererPtr& renderer, const ContentBlockList& blocks) const;

  ContextObjectModel& com_;
  ContentRendererPtr defaultRenderer_;
  Logger logger_;
};

} // namespace prompt
