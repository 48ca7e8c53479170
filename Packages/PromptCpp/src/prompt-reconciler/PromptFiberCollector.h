#pragma once

#include "com/PromptObjectModel.h"
#include "component/PromptTickState.h"
#include "prompt-reconciler/PromptCompiledStructure.h"
#include "prompt-reconciler/PromptContentBlockRegistry.h"
#include "prompt-reconciler/PromptFiber.h"
#include "shared/PromptLogger.h"

#include <vector>

namespace prompt {

// Walks a reconciled fiber tree and builds the compiled structure. Reads the
// tree only; the object model is consulted for tool lookups and metadata.
class FiberCollector {
public:
  FiberCollector(
      const FiberTree& tree,
      ContextObjectModel& com,
      ContentRendererPtr defaultRenderer,
      const ContentBlockRegistry& registry);

  CompiledStructure collect(FiberId root, const TickState& state) const;

  // Content blocks of a fiber's children, as seen inside a section.
  ContentBlockList collectContentFromFiber(FiberId fiber, const ContentRendererPtr& renderer, const TickState& state) const;

  const ContentRendererPtr& defaultRenderer() const {
    return defaultRenderer_;
  }

private:
  struct Pass;

  void traverse(Pass& pass, FiberId fiber, bool inSection) const;
  void traverseChildren(Pass& pass, FiberId fiber, bool inSection) const;
  void collectSection(Pass& pass, FiberId fiber) const;
  void collectEntry(Pass& pass, FiberId fiber) const;
  void collectEphemeral(Pass& pass, FiberId fiber) const;
  void collectTool(Pass& pass, FiberId fiber) const;
  void collectLoose(Pass& pass, FiberId fiber) const;
  bool isLooseContent(const FiberNode& node) const;

  void collectContentFromChild(
      FiberId fiber,
      ContentBlockList& blocks,
      const ContentRendererPtr& renderer,
      const ElementExpander& expand) const;
  ElementExpander makeExpander(const TickState& state) const;

  const FiberTree& tree_;
  ContextObjectModel& com_;
  ContentRendererPtr defaultRenderer_;
  const ContentBlockRegistry& registry_;
  Logger logger_;
};

// String values become one text block; arrays keep their block, string and
// number items.
ContentBlockList contentBlocksFromValue(const Value& value);
Value contentBlocksToValue(const ContentBlockList& blocks);

} // namespace prompt
