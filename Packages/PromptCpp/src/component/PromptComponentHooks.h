#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace prompt {

class Component;
struct ComponentClass;

enum class ComponentHookName : uint8_t {
  OnMount,
  OnUnmount,
  OnStart,
  OnTickStart,
  Render,
  OnAfterCompile,
  OnTickEnd,
  OnMessage,
  OnComplete,
  OnError,
};

const char* componentHookName(ComponentHookName hook);

struct ComponentHookInvocation {
  ComponentHookName hook;
  const std::string& componentName;
  const std::vector<std::string>& tags;
  Component& instance;
};

using ComponentHookNext = std::function<void()>;
// Runs around one lifecycle call. Skipping next() skips the call.
using ComponentHookMiddleware = std::function<void(const ComponentHookInvocation& invocation, const ComponentHookNext& next)>;

// Empty selector matches every component.
struct ComponentSelector {
  const ComponentClass* componentClass{nullptr};
  std::optional<std::string> name;
  std::vector<std::string> tags;

  static ComponentSelector all() {
    return {};
  }
  static ComponentSelector forClass(const ComponentClass& componentClass);
  static ComponentSelector forName(std::string name);
  static ComponentSelector forTags(std::vector<std::string> tags);

  bool isGlobal() const {
    return componentClass == nullptr && !name && tags.empty();
  }
};

class ComponentHookRegistry {
public:
  void use(ComponentHookName hook, ComponentHookMiddleware middleware, ComponentSelector selector = {});

  // Class-defined middleware first, then class, tag, name and global matches
  // in registration order within each group.
  std::vector<ComponentHookMiddleware> getMiddleware(
      ComponentHookName hook,
      const ComponentClass* componentClass,
      const std::string& componentName,
      const std::vector<std::string>& componentTags) const;

  bool empty() const {
    return entries_.empty();
  }

private:
  struct Entry {
    ComponentHookName hook;
    ComponentSelector selector;
    ComponentHookMiddleware middleware;
  };

  std::vector<Entry> entries_;
};

// "TimelineManager" -> {"timeline", "manager"}
std::vector<std::string> autoGenerateTags(const std::string& componentName);

// Builds next() chains so middleware[0] runs outermost.
void runWithMiddleware(
    const std::vector<ComponentHookMiddleware>& middleware,
    const ComponentHookInvocation& invocation,
    const ComponentHookNext& call);

} // namespace prompt
