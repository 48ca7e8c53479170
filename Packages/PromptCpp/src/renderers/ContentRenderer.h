#pragma once

#include "content/PromptContentBlock.h"

#include <string>
#include <vector>

namespace prompt {

// Formats semantic content blocks into plain blocks for a model context.
// Blocks without semantic information pass through formatStandard.
class ContentRenderer {
public:
  virtual ~ContentRenderer() = default;

  virtual std::string name() const = 0;

  ContentBlockList format(const ContentBlockList& blocks) const;

  virtual std::string formatNode(const SemanticNode& node) const = 0;
  virtual std::optional<ContentBlock> formatSemantic(const ContentBlock& block) const = 0;
  virtual ContentBlockList formatStandard(const ContentBlock& block) const = 0;
};

class MarkdownRenderer final : public ContentRenderer {
public:
  std::string name() const override {
    return "markdown";
  }

  std::string formatNode(const SemanticNode& node) const override;
  std::optional<ContentBlock> formatSemantic(const ContentBlock& block) const override;
  ContentBlockList formatStandard(const ContentBlock& block) const override;

  static std::string formatTable(const TableStructure& table);
  static std::string formatList(const ListStructure& list, int depth = 0);
};

} // namespace prompt
