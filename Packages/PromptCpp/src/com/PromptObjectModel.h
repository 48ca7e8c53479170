#pragma once

#include "com/PromptTool.h"
#include "content/PromptContentBlock.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace prompt {

enum class MessageRole : uint8_t {
  User,
  Assistant,
  System,
  Tool,
  Event,
};

const char* messageRoleName(MessageRole role);
std::optional<MessageRole> messageRoleFromName(std::string_view name);

enum class Visibility : uint8_t {
  Model,
  Observer,
  Log,
};

const char* visibilityName(Visibility visibility);
std::optional<Visibility> visibilityFromName(std::string_view name);

enum class Audience : uint8_t {
  Model,
  Human,
  System,
};

const char* audienceName(Audience audience);
std::optional<Audience> audienceFromName(std::string_view name);

enum class EphemeralPosition : uint8_t {
  Start,
  End,
  BeforeUser,
  AfterSystem,
  Flow,
};

const char* ephemeralPositionName(EphemeralPosition position);
std::optional<EphemeralPosition> ephemeralPositionFromName(std::string_view name);

struct Message {
  MessageRole role{MessageRole::User};
  ContentBlockList content;
  std::optional<std::string> id;
  Props metadata;
};

struct COMTimelineEntry {
  std::string kind{"message"};
  Message message;
  std::vector<std::string> tags;
  std::optional<Visibility> visibility;
  Props metadata;
};

struct COMSection {
  std::string id;
  Value content;
  std::optional<std::string> title;
  std::optional<Visibility> visibility;
  std::optional<Audience> audience;
  std::optional<std::vector<std::string>> tags;
  std::optional<Props> metadata;
  // Content as formatted when the section was applied, and by which renderer.
  std::optional<ContentBlockList> formattedContent;
  std::optional<std::string> formattedWith;
  ContentRendererPtr renderer;
};

struct EphemeralEntry {
  std::optional<std::string> type;
  ContentBlockList content;
  EphemeralPosition position{EphemeralPosition::End};
  int order{0};
  std::optional<std::string> id;
  std::vector<std::string> tags;
  Props metadata;
};

// A message delivered to a running execution from outside.
struct ExecutionMessage {
  std::string id;
  std::string type;
  Value content;
  Props metadata;
};

struct MessageOptions {
  std::vector<std::string> tags;
  std::optional<Visibility> visibility;
  Props metadata;
};

// Snapshot handed to the model-invocation layer.
struct COMInput {
  std::vector<COMTimelineEntry> timeline;
  std::vector<COMSection> sections;
  std::vector<EphemeralEntry> ephemeral;
  std::vector<COMTimelineEntry> system;
  std::vector<ToolDefinition> tools;
  Props metadata;
};

using StateListener = std::function<void(const std::string& key, const Value& next, const Value& previous)>;
using StateSubscription = std::uint64_t;

// Merge rule for two contents published under one section id.
Value mergeSectionContent(const Value& existing, const Value& incoming);

// Shared object model mutated by components during a tick. Single writer.
class ContextObjectModel {
public:
  ContextObjectModel() = default;
  explicit ContextObjectModel(Props initialMetadata);

  ContextObjectModel(const ContextObjectModel&) = delete;
  ContextObjectModel& operator=(const ContextObjectModel&) = delete;

  // Drops per-tick content. State, refs and queued messages survive.
  void clear();

  void addMessage(Message message, MessageOptions options = {});
  void addSystemMessage(Message message);
  void addTimelineEntry(COMTimelineEntry entry);
  const std::vector<COMTimelineEntry>& getTimeline() const {
    return timeline_;
  }
  const std::vector<COMTimelineEntry>& getSystemMessages() const {
    return systemMessages_;
  }

  void addSection(COMSection section);
  const COMSection* getSection(const std::string& id) const;
  std::vector<COMSection> getSections() const;

  void addTool(ExecutableToolPtr tool);
  void removeTool(const std::string& name);
  ExecutableToolPtr getTool(const std::string& name) const;
  std::vector<ExecutableToolPtr> getTools() const;
  std::optional<ToolDefinition> getToolDefinition(const std::string& name) const;
  void addToolDefinition(ToolDefinition definition);

  void addMetadata(const std::string& key, Value value);
  const Props& getMetadata() const {
    return metadata_;
  }

  void addEphemeral(EphemeralEntry entry);
  const std::vector<EphemeralEntry>& getEphemeral() const {
    return ephemeral_;
  }

  Value getState(const std::string& key) const;
  void setState(const std::string& key, Value value);
  void setStatePartial(const Props& partial);
  const Props& getStateAll() const {
    return state_;
  }
  StateSubscription subscribeState(StateListener listener);
  void unsubscribeState(StateSubscription subscription);

  ComponentPtr getRef(const std::string& name) const;
  void setRef(const std::string& name, ComponentPtr instance);
  void removeRef(const std::string& name);
  std::vector<std::string> getRefNames() const;

  void requestRecompile(const std::string& reason = {});
  bool wasRecompileRequested() const {
    return recompileRequested_;
  }
  const std::vector<std::string>& getRecompileReasons() const {
    return recompileReasons_;
  }
  void resetRecompileRequest();

  void queueMessage(ExecutionMessage message);
  const std::vector<ExecutionMessage>& getQueuedMessages() const {
    return queuedMessages_;
  }
  void clearQueuedMessages();

  void abort(const std::string& reason = {});
  bool shouldAbort() const {
    return abortRequested_;
  }
  const std::optional<std::string>& abortReason() const {
    return abortReason_;
  }
  void resetAbortState();

  COMInput toInput() const;

private:
  std::vector<COMTimelineEntry> timeline_;
  std::vector<COMTimelineEntry> systemMessages_;
  std::vector<std::string> sectionOrder_;
  std::unordered_map<std::string, COMSection> sections_;
  std::vector<std::string> toolOrder_;
  std::unordered_map<std::string, ExecutableToolPtr> tools_;
  std::unordered_map<std::string, ToolDefinition> toolDefinitions_;
  Props metadata_;
  std::vector<EphemeralEntry> ephemeral_;

  Props state_;
  std::map<StateSubscription, StateListener> stateListeners_;
  StateSubscription nextSubscription_{1};

  std::map<std::string, ComponentPtr> refs_;

  bool recompileRequested_{false};
  std::vector<std::string> recompileReasons_;

  std::vector<ExecutionMessage> queuedMessages_;
  bool abortRequested_{false};
  std::optional<std::string> abortReason_;
};

using COM = ContextObjectModel;

} // namespace prompt
