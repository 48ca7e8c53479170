#include "component/PromptComponentHooks.h"

#include "component/PromptComponent.h"

#include <algorithm>
#include <cctype>

namespace prompt {

const char* componentHookName(ComponentHookName hook) {
  switch (hook) {
    case ComponentHookName::OnMount:
      return "onMount";
    case ComponentHookName::OnUnmount:
      return "onUnmount";
    case ComponentHookName::OnStart:
      return "onStart";
    case ComponentHookName::OnTickStart:
      return "onTickStart";
    case ComponentHookName::Render:
      return "render";
    case ComponentHookName::OnAfterCompile:
      return "onAfterCompile";
    case ComponentHookName::OnTickEnd:
      return "onTickEnd";
    case ComponentHookName::OnMessage:
      return "onMessage";
    case ComponentHookName::OnComplete:
      return "onComplete";
    case ComponentHookName::OnError:
      return "onError";
  }
  return "unknown";
}

ComponentSelector ComponentSelector::forClass(const ComponentClass& componentClass) {
  ComponentSelector selector;
  selector.componentClass = &componentClass;
  return selector;
}

ComponentSelector ComponentSelector::forName(std::string name) {
  ComponentSelector selector;
  selector.name = std::move(name);
  return selector;
}

ComponentSelector ComponentSelector::forTags(std::vector<std::string> tags) {
  ComponentSelector selector;
  selector.tags = std::move(tags);
  return selector;
}

void ComponentHookRegistry::use(ComponentHookName hook, ComponentHookMiddleware middleware, ComponentSelector selector) {
  if (!middleware) {
    return;
  }
  entries_.push_back(Entry{hook, std::move(selector), std::move(middleware)});
}

std::vector<ComponentHookMiddleware> ComponentHookRegistry::getMiddleware(
    ComponentHookName hook,
    const ComponentClass* componentClass,
    const std::string& componentName,
    const std::vector<std::string>& componentTags) const {
  std::vector<ComponentHookMiddleware> result;

  if (componentClass != nullptr) {
    auto defined = componentClass->hooks.find(hook);
    if (defined != componentClass->hooks.end()) {
      result.insert(result.end(), defined->second.begin(), defined->second.end());
    }
  }

  auto append = [&](auto matches) {
    for (const auto& entry : entries_) {
      if (entry.hook == hook && matches(entry.selector)) {
        result.push_back(entry.middleware);
      }
    }
  };

  append([&](const ComponentSelector& selector) {
    return componentClass != nullptr && selector.componentClass == componentClass;
  });
  append([&](const ComponentSelector& selector) {
    return selector.componentClass == nullptr && !selector.tags.empty() &&
        std::any_of(selector.tags.begin(), selector.tags.end(), [&](const std::string& tag) {
             return std::find(componentTags.begin(), componentTags.end(), tag) != componentTags.end();
           });
  });
  append([&](const ComponentSelector& selector) {
    return selector.componentClass == nullptr && selector.tags.empty() && selector.name &&
        *selector.name == componentName;
  });
  append([](const ComponentSelector& selector) { return selector.isGlobal(); });

  return result;
}

std::vector<std::string> autoGenerateTags(const std::string& componentName) {
  std::vector<std::string> tags;
  std::string current;
  for (char c : componentName) {
    if (std::isupper(static_cast<unsigned char>(c)) && !current.empty()) {
      tags.push_back(current);
      current.clear();
    }
    current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (!current.empty()) {
    tags.push_back(current);
  }
  return tags;
}

void runWithMiddleware(
    const std::vector<ComponentHookMiddleware>& middleware,
    const ComponentHookInvocation& invocation,
    const ComponentHookNext& call) {
  std::function<void(std::size_t)> dispatch = [&](std::size_t index) {
    if (index == middleware.size()) {
      call();
      return;
    }
    middleware[index](invocation, [&dispatch, index]() { dispatch(index + 1); });
  };
  dispatch(0);
}

} // namespace prompt
