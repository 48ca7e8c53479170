#pragma once

#include "com/PromptObjectModel.h"
#include "content/PromptContentBlock.h"
#include "runtime/PromptValue.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace prompt {

struct CompiledSection {
  std::string id;
  Value content;
  std::optional<std::string> title;
  std::optional<Visibility> visibility;
  std::optional<Audience> audience;
  std::optional<std::vector<std::string>> tags;
  std::optional<Props> metadata;
  ContentRendererPtr renderer;
};

struct CompiledTimelineEntry {
  std::string kind{"message"};
  Message message;
  std::vector<std::string> tags;
  std::optional<Visibility> visibility;
  Props metadata;
  // Only set when it differs from the compiler default.
  ContentRendererPtr renderer;
};

enum class SystemMessageItemType : uint8_t {
  Section,
  Message,
  Loose,
};

const char* systemMessageItemTypeName(SystemMessageItemType type);

// System content in declaration order. Sections are referenced by id.
struct SystemMessageItem {
  SystemMessageItemType type{SystemMessageItemType::Loose};
  std::string sectionId;
  ContentBlockList content;
  std::size_t index{0};
  ContentRendererPtr renderer;
};

struct CompiledTool {
  std::string name;
  ExecutableToolPtr tool;
};

struct CompiledEphemeral {
  ContentBlockList content;
  EphemeralPosition position{EphemeralPosition::End};
  int order{0};
  std::optional<std::string> type;
  std::optional<std::string> id;
  std::vector<std::string> tags;
  Props metadata;
  ContentRendererPtr renderer;
};

struct CompiledStructure {
  std::map<std::string, CompiledSection> sections;
  std::vector<CompiledTimelineEntry> timelineEntries;
  std::vector<SystemMessageItem> systemMessageItems;
  std::vector<CompiledTool> tools;
  std::vector<CompiledEphemeral> ephemeral;
  Props metadata;

  const CompiledSection* findSection(const std::string& id) const;
  const CompiledTool* findTool(const std::string& name) const;
};

// Multi-line canonical dump; two structures with equal dumps are
// indistinguishable to the model-invocation layer.
std::string describeCompiledStructure(const CompiledStructure& compiled);

struct CompileStabilizationOptions {
  std::optional<std::size_t> maxIterations;
  std::optional<bool> trackMutations;
};

struct CompileStabilizationResult {
  CompiledStructure compiled;
  std::size_t iterations{0};
  // Hit the iteration cap while recompiles were still being requested.
  bool forcedStable{false};
  std::vector<std::string> recompileReasons;
};

} // namespace prompt
