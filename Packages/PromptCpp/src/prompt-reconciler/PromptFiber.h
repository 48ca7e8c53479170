#pragma once

#include "component/PromptComponent.h"
#include "component/PromptComponentHooks.h"
#include "prompt-reconciler/PromptArena.h"
#include "prompt-reconciler/PromptFiberHooks.h"
#include "runtime/PromptJSXRuntime.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace prompt {

struct FiberNode;
struct InstanceRecord;

using FiberId = ArenaHandle<FiberNode>;
using InstanceId = ArenaHandle<InstanceRecord>;

using FiberFlags = uint8_t;

inline constexpr FiberFlags NoFlags = 0b0000;
inline constexpr FiberFlags Placement = 0b0001;
inline constexpr FiberFlags Update = 0b0010;
inline constexpr FiberFlags Deletion = 0b0100;

struct FiberNode {
  ElementType type;
  Props props;
  std::optional<std::string> key;
  std::optional<std::string> ref;

  InstanceId instance;
  HookList hooks;

  // Leaf payloads for normalized children.
  ContentBlockPtr block;
  std::string text;

  FiberId parent;
  FiberId child;
  FiberId sibling;
  uint32_t index{0};

  FiberFlags flags{NoFlags};

  FiberNode(ElementType type, Props props, std::optional<std::string> key);
};

// Stateful component attached to a fiber for its whole mounted lifetime.
struct InstanceRecord {
  ComponentPtr component;
  ComponentClassPtr componentClass;
  std::string name;
  std::vector<std::string> tags;
  std::map<std::string, PropSignalPtr> propSignals;
  // Middleware resolved on mount, per lifecycle hook.
  std::map<ComponentHookName, std::vector<ComponentHookMiddleware>> middleware;
  std::optional<std::string> ref;
};

// Arena-backed fiber tree. Parent and sibling links are handles, so a
// released fiber can never be reached through a stale link.
class FiberTree {
public:
  FiberId create(ElementType type, Props props, std::optional<std::string> key);
  bool destroy(FiberId id);

  FiberNode& node(FiberId id) {
    return fibers_.at(id);
  }
  const FiberNode& node(FiberId id) const {
    return fibers_.at(id);
  }
  bool contains(FiberId id) const {
    return fibers_.contains(id);
  }

  std::vector<FiberId> children(FiberId id) const;
  // Relinks parent, index and sibling pointers for the given order.
  void setChildren(FiberId parent, const std::vector<FiberId>& children);
  void detach(FiberId id);

  std::size_t size() const {
    return fibers_.size();
  }
  void clear() {
    fibers_.clear();
  }

private:
  GenerationalArena<FiberNode> fibers_;
};

class InstanceTable {
public:
  InstanceId insert(InstanceRecord record) {
    return records_.insert(std::move(record));
  }
  bool erase(InstanceId id) {
    return records_.erase(id);
  }
  InstanceRecord& at(InstanceId id) {
    return records_.at(id);
  }
  const InstanceRecord& at(InstanceId id) const {
    return records_.at(id);
  }
  InstanceRecord* find(InstanceId id) {
    return records_.find(id);
  }
  const InstanceRecord* find(InstanceId id) const {
    return records_.find(id);
  }
  std::size_t size() const {
    return records_.size();
  }

private:
  GenerationalArena<InstanceRecord> records_;
};

// Depth-first, parents before children. Returning false skips the subtree.
void traverseFiber(const FiberTree& tree, FiberId root, const std::function<bool(FiberId, const FiberNode&)>& visit);

// First fiber in depth-first order whose key equals `key`.
FiberId findFiberByKey(const FiberTree& tree, FiberId root, const std::string& key);

} // namespace prompt
