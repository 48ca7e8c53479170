#include "com/PromptObjectModel.h"
#include "com/PromptTool.h"

#include <cassert>
#include <memory>
#include <stdexcept>

namespace prompt::test {

namespace {

ExecutableToolPtr makeTool(const std::string& name, const std::string& description = {}) {
  ToolMetadata metadata;
  metadata.name = name;
  metadata.description = description;
  return createTool(std::move(metadata), [](const Value&) { return ContentBlockList{}; });
}

} // namespace

bool runPromptObjectModelTests() {
  // Section content merge rules.
  assert(mergeSectionContent(Value("A"), Value("B")) == Value("A\nB"));
  assert(
      mergeSectionContent(Value::array({"a"}), Value::array({"b", "c"})) == Value::array({"a", "b", "c"}));
  Value mergedObject = mergeSectionContent(
      Value::object(Props{{"x", "1"}, {"y", "1"}}), Value::object(Props{{"y", "2"}}));
  assert(mergedObject.asObject().get("x") == Value("1"));
  assert(mergedObject.asObject().get("y") == Value("2"));
  assert(mergeSectionContent(Value("A"), Value::number(1)) == Value::array({"A", Value::number(1)}));

  ContextObjectModel com(Props{{"agent", "demo"}});
  assert(com.getMetadata().get("agent") == Value("demo"));

  // Sections keep first-insertion order and merge on repeat.
  com.addSection(COMSection{"intro", Value("hello"), std::string("Intro"), std::nullopt, std::nullopt, std::nullopt, std::nullopt});
  com.addSection(COMSection{"rules", Value("be brief"), std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt});
  com.addSection(COMSection{"intro", Value("again"), std::nullopt, Visibility::Observer, std::nullopt, std::nullopt, std::nullopt});
  auto sections = com.getSections();
  assert(sections.size() == 2);
  assert(sections[0].id == "intro");
  assert(sections[0].content == Value("hello\nagain"));
  assert(sections[0].title == std::optional<std::string>("Intro"));
  assert(sections[0].visibility == Visibility::Observer);
  assert(com.getSection("missing") == nullptr);

  // Messages route by role.
  Message user;
  user.content.push_back(ContentBlock::text("hi"));
  com.addMessage(user, MessageOptions{{"greeting"}, Visibility::Model, Props{}});
  Message system;
  system.role = MessageRole::System;
  com.addMessage(system);
  assert(com.getTimeline().size() == 1);
  assert(com.getTimeline()[0].tags == (std::vector<std::string>{"greeting"}));
  assert(com.getSystemMessages().size() == 1);

  // Tools are unique by name and keep their first position.
  com.addTool(makeTool("search", "v1"));
  com.addTool(makeTool("calc"));
  com.addTool(makeTool("search", "v2"));
  com.addTool(std::make_shared<const ExecutableTool>());
  bool rejected = false;
  try {
    makeTool("");
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  assert(rejected);
  auto tools = com.getTools();
  assert(tools.size() == 2);
  assert(tools[0]->metadata.name == "search");
  assert(tools[0]->metadata.description == "v2");
  assert(com.getToolDefinition("calc").has_value());
  com.removeTool("search");
  assert(com.getTool("search") == nullptr);
  assert(com.getTools().size() == 1);

  ToolDefinition clientTool;
  clientTool.name = "confirm";
  clientTool.type = ToolExecutionType::Client;
  com.addToolDefinition(clientTool);
  assert(com.getTool("confirm") == nullptr);
  assert(com.getToolDefinition("confirm")->type == ToolExecutionType::Client);

  // Shared state notifies subscribers.
  int notified = 0;
  auto subscription = com.subscribeState([&](const std::string& key, const Value& next, const Value& previous) {
    assert(key == "count");
    assert(previous.isUndefined() || previous.isNumber());
    assert(next.isNumber());
    ++notified;
  });
  com.setState("count", Value::number(1));
  com.setStatePartial(Props{{"count", Value::number(2)}});
  com.unsubscribeState(subscription);
  com.setState("count", Value::number(3));
  assert(notified == 2);
  assert(com.getStateAll().get("count") == Value::number(3));

  // Recompile tracking.
  assert(!com.wasRecompileRequested());
  com.requestRecompile("first");
  com.requestRecompile();
  assert(com.wasRecompileRequested());
  assert(com.getRecompileReasons() == (std::vector<std::string>{"first"}));
  com.resetRecompileRequest();
  assert(!com.wasRecompileRequested());
  assert(com.getRecompileReasons().empty());

  // Queued messages and abort state.
  com.queueMessage(ExecutionMessage{"m1", "user_input", Value("stop"), Props{}});
  assert(com.getQueuedMessages().size() == 1);
  com.clearQueuedMessages();
  assert(com.getQueuedMessages().empty());
  com.abort("user cancelled");
  assert(com.shouldAbort());
  assert(com.abortReason() == std::optional<std::string>("user cancelled"));
  com.resetAbortState();
  assert(!com.shouldAbort());

  // Snapshot and clear.
  com.addEphemeral(EphemeralEntry{});
  COMInput input = com.toInput();
  assert(input.timeline.size() == 1);
  assert(input.sections.size() == 2);
  assert(input.system.size() == 1);
  assert(input.tools.size() == 2);
  assert(input.ephemeral.size() == 1);

  com.clear();
  assert(com.getTimeline().empty());
  assert(com.getSections().empty());
  assert(com.getTools().empty());
  assert(com.getMetadata().empty());
  assert(com.getStateAll().get("count") == Value::number(3));

  return true;
}

} // namespace prompt::test
