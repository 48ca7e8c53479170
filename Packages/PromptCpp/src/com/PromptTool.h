#pragma once

#include "content/PromptContentBlock.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace prompt {

enum class ToolExecutionType : uint8_t {
  Server,
  Client,
  Provider,
  Mcp,
};

const char* toolExecutionTypeName(ToolExecutionType type);

struct ToolMetadata {
  std::string name;
  std::string description;
  // JSON-schema shaped description of the input.
  Value parameters;
  ToolExecutionType type{ToolExecutionType::Server};
  Props providerOptions;
};

using ToolRunFunction = std::function<ContentBlockList(const Value& input)>;

struct ExecutableTool {
  ToolMetadata metadata;
  ToolRunFunction run;
};

// Provider-facing declaration of a tool, without its implementation.
struct ToolDefinition {
  std::string name;
  std::string description;
  Value parameters;
  ToolExecutionType type{ToolExecutionType::Server};
  Props providerOptions;
};

ExecutableToolPtr createTool(ToolMetadata metadata, ToolRunFunction run);
ToolDefinition toToolDefinition(const ExecutableTool& tool);

} // namespace prompt
