#include "com/PromptObjectModel.h"

#include "shared/PromptLogger.h"

#include <algorithm>
#include <array>

namespace prompt {

namespace {

const Logger& comLog() {
  static const Logger log = Logger::forComponent("ContextObjectModel");
  return log;
}

template <typename Enum, std::size_t N>
std::optional<Enum> enumFromName(std::string_view name, const std::array<const char*, N>& names) {
  for (std::size_t i = 0; i < N; ++i) {
    if (name == names[i]) {
      return static_cast<Enum>(i);
    }
  }
  return std::nullopt;
}

constexpr std::array<const char*, 5> kRoleNames{"user", "assistant", "system", "tool", "event"};
constexpr std::array<const char*, 3> kVisibilityNames{"model", "observer", "log"};
constexpr std::array<const char*, 3> kAudienceNames{"model", "human", "system"};
constexpr std::array<const char*, 5> kPositionNames{"start", "end", "before-user", "after-system", "flow"};

void removeName(std::vector<std::string>& names, const std::string& name) {
  names.erase(std::remove(names.begin(), names.end(), name), names.end());
}

} // namespace

const char* messageRoleName(MessageRole role) {
  return kRoleNames[static_cast<std::size_t>(role)];
}

std::optional<MessageRole> messageRoleFromName(std::string_view name) {
  return enumFromName<MessageRole>(name, kRoleNames);
}

const char* visibilityName(Visibility visibility) {
  return kVisibilityNames[static_cast<std::size_t>(visibility)];
}

std::optional<Visibility> visibilityFromName(std::string_view name) {
  return enumFromName<Visibility>(name, kVisibilityNames);
}

const char* audienceName(Audience audience) {
  return kAudienceNames[static_cast<std::size_t>(audience)];
}

std::optional<Audience> audienceFromName(std::string_view name) {
  return enumFromName<Audience>(name, kAudienceNames);
}

const char* ephemeralPositionName(EphemeralPosition position) {
  return kPositionNames[static_cast<std::size_t>(position)];
}

std::optional<EphemeralPosition> ephemeralPositionFromName(std::string_view name) {
  return enumFromName<EphemeralPosition>(name, kPositionNames);
}

Value mergeSectionContent(const Value& existing, const Value& incoming) {
  if (existing.isString() && incoming.isString()) {
    return Value::string(existing.asString() + "\n" + incoming.asString());
  }
  if (existing.isArray() && incoming.isArray()) {
    Value::Array combined = existing.asArray();
    const auto& tail = incoming.asArray();
    combined.insert(combined.end(), tail.begin(), tail.end());
    return Value::array(std::move(combined));
  }
  if (existing.isObject() && incoming.isObject()) {
    Props merged = existing.asObject();
    merged.merge(incoming.asObject());
    return Value::object(std::move(merged));
  }
  return Value::array({existing, incoming});
}

ContextObjectModel::ContextObjectModel(Props initialMetadata) : metadata_(std::move(initialMetadata)) {}

void ContextObjectModel::clear() {
  timeline_.clear();
  systemMessages_.clear();
  sectionOrder_.clear();
  sections_.clear();
  toolOrder_.clear();
  tools_.clear();
  toolDefinitions_.clear();
  metadata_ = Props{};
  ephemeral_.clear();
}

void ContextObjectModel::addMessage(Message message, MessageOptions options) {
  if (message.role == MessageRole::System) {
    addSystemMessage(std::move(message));
    return;
  }
  COMTimelineEntry entry;
  entry.message = std::move(message);
  entry.tags = std::move(options.tags);
  entry.visibility = options.visibility;
  entry.metadata = std::move(options.metadata);
  addTimelineEntry(std::move(entry));
}

void ContextObjectModel::addSystemMessage(Message message) {
  if (message.role != MessageRole::System) {
    comLog().warn("addSystemMessage called with a {} message, adding anyway", messageRoleName(message.role));
  }
  COMTimelineEntry entry;
  entry.message = std::move(message);
  systemMessages_.push_back(std::move(entry));
}

void ContextObjectModel::addTimelineEntry(COMTimelineEntry entry) {
  timeline_.push_back(std::move(entry));
}

void ContextObjectModel::addSection(COMSection section) {
  auto existing = sections_.find(section.id);
  if (existing == sections_.end()) {
    sectionOrder_.push_back(section.id);
    sections_.emplace(section.id, std::move(section));
    return;
  }

  COMSection& current = existing->second;
  current.content = mergeSectionContent(current.content, section.content);
  if (section.title) {
    current.title = std::move(section.title);
  }
  if (section.tags) {
    current.tags = std::move(section.tags);
  }
  if (section.visibility) {
    current.visibility = section.visibility;
  }
  if (section.audience) {
    current.audience = section.audience;
  }
  if (section.metadata) {
    current.metadata = std::move(section.metadata);
  }
  if (section.formattedContent) {
    if (current.formattedContent) {
      current.formattedContent->insert(
          current.formattedContent->end(), section.formattedContent->begin(), section.formattedContent->end());
    } else {
      current.formattedContent = std::move(section.formattedContent);
    }
    current.formattedWith = std::move(section.formattedWith);
  }
  if (section.renderer) {
    current.renderer = std::move(section.renderer);
  }
}

const COMSection* ContextObjectModel::getSection(const std::string& id) const {
  auto it = sections_.find(id);
  return it == sections_.end() ? nullptr : &it->second;
}

std::vector<COMSection> ContextObjectModel::getSections() const {
  std::vector<COMSection> sections;
  sections.reserve(sectionOrder_.size());
  for (const auto& id : sectionOrder_) {
    sections.push_back(sections_.at(id));
  }
  return sections;
}

void ContextObjectModel::addTool(ExecutableToolPtr tool) {
  if (!tool || tool->metadata.name.empty()) {
    comLog().warn("Ignoring tool without a name");
    return;
  }
  const std::string name = tool->metadata.name;
  if (tools_.find(name) == tools_.end() && toolDefinitions_.find(name) == toolDefinitions_.end()) {
    toolOrder_.push_back(name);
  }
  toolDefinitions_[name] = toToolDefinition(*tool);
  tools_[name] = std::move(tool);
}

void ContextObjectModel::removeTool(const std::string& name) {
  tools_.erase(name);
  toolDefinitions_.erase(name);
  removeName(toolOrder_, name);
}

ExecutableToolPtr ContextObjectModel::getTool(const std::string& name) const {
  auto it = tools_.find(name);
  return it == tools_.end() ? nullptr : it->second;
}

std::vector<ExecutableToolPtr> ContextObjectModel::getTools() const {
  std::vector<ExecutableToolPtr> tools;
  for (const auto& name : toolOrder_) {
    auto it = tools_.find(name);
    if (it != tools_.end()) {
      tools.push_back(it->second);
    }
  }
  return tools;
}

std::optional<ToolDefinition> ContextObjectModel::getToolDefinition(const std::string& name) const {
  auto it = toolDefinitions_.find(name);
  if (it == toolDefinitions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void ContextObjectModel::addToolDefinition(ToolDefinition definition) {
  const std::string name = definition.name;
  if (toolDefinitions_.find(name) == toolDefinitions_.end() && tools_.find(name) == tools_.end()) {
    toolOrder_.push_back(name);
  }
  toolDefinitions_[name] = std::move(definition);
}

void ContextObjectModel::addMetadata(const std::string& key, Value value) {
  metadata_.set(key, std::move(value));
}

void ContextObjectModel::addEphemeral(EphemeralEntry entry) {
  ephemeral_.push_back(std::move(entry));
}

Value ContextObjectModel::getState(const std::string& key) const {
  return state_.get(key);
}

void ContextObjectModel::setState(const std::string& key, Value value) {
  Value previous = state_.get(key);
  state_.set(key, value);
  auto listeners = stateListeners_;
  for (const auto& entry : listeners) {
    entry.second(key, value, previous);
  }
}

void ContextObjectModel::setStatePartial(const Props& partial) {
  for (const auto& entry : partial) {
    setState(entry.first, entry.second);
  }
}

StateSubscription ContextObjectModel::subscribeState(StateListener listener) {
  StateSubscription id = nextSubscription_++;
  stateListeners_.emplace(id, std::move(listener));
  return id;
}

void ContextObjectModel::unsubscribeState(StateSubscription subscription) {
  stateListeners_.erase(subscription);
}

ComponentPtr ContextObjectModel::getRef(const std::string& name) const {
  auto it = refs_.find(name);
  return it == refs_.end() ? nullptr : it->second;
}

void ContextObjectModel::setRef(const std::string& name, ComponentPtr instance) {
  refs_[name] = std::move(instance);
}

void ContextObjectModel::removeRef(const std::string& name) {
  refs_.erase(name);
}

std::vector<std::string> ContextObjectModel::getRefNames() const {
  std::vector<std::string> names;
  names.reserve(refs_.size());
  for (const auto& entry : refs_) {
    names.push_back(entry.first);
  }
  return names;
}

void ContextObjectModel::requestRecompile(const std::string& reason) {
  recompileRequested_ = true;
  if (!reason.empty()) {
    recompileReasons_.push_back(reason);
  }
}

void ContextObjectModel::resetRecompileRequest() {
  recompileRequested_ = false;
  recompileReasons_.clear();
}

void ContextObjectModel::queueMessage(ExecutionMessage message) {
  queuedMessages_.push_back(std::move(message));
}

void ContextObjectModel::clearQueuedMessages() {
  queuedMessages_.clear();
}

void ContextObjectModel::abort(const std::string& reason) {
  abortRequested_ = true;
  if (!reason.empty()) {
    abortReason_ = reason;
  }
  comLog().info("Abort requested{}", reason.empty() ? std::string() : ": " + reason);
}

void ContextObjectModel::resetAbortState() {
  abortRequested_ = false;
  abortReason_.reset();
}

COMInput ContextObjectModel::toInput() const {
  COMInput input;
  input.timeline = timeline_;
  input.sections = getSections();
  input.ephemeral = ephemeral_;
  input.system = systemMessages_;
  for (const auto& name : toolOrder_) {
    auto it = toolDefinitions_.find(name);
    if (it != toolDefinitions_.end()) {
      input.tools.push_back(it->second);
    }
  }
  input.metadata = metadata_;
  return input;
}

} // namespace prompt
