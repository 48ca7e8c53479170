#include "com/PromptTool.h"

#include <stdexcept>

namespace prompt {

const char* toolExecutionTypeName(ToolExecutionType type) {
  switch (type) {
    case ToolExecutionType::Server:
      return "server";
    case ToolExecutionType::Client:
      return "client";
    case ToolExecutionType::Provider:
      return "provider";
    case ToolExecutionType::Mcp:
      return "mcp";
  }
  return "server";
}

ExecutableToolPtr createTool(ToolMetadata metadata, ToolRunFunction run) {
  if (metadata.name.empty()) {
    throw std::invalid_argument("Tool metadata requires a name");
  }
  auto tool = std::make_shared<ExecutableTool>();
  tool->metadata = std::move(metadata);
  tool->run = std::move(run);
  return tool;
}

ToolDefinition toToolDefinition(const ExecutableTool& tool) {
  ToolDefinition definition;
  definition.name = tool.metadata.name;
  definition.description = tool.metadata.description;
  definition.parameters = tool.metadata.parameters;
  definition.type = tool.metadata.type;
  definition.providerOptions = tool.metadata.providerOptions;
  return definition;
}

} // namespace prompt
