#include "prompt-reconciler/PromptFiber.h"

namespace prompt {

FiberNode::FiberNode(ElementType type, Props props, std::optional<std::string> key)
    : type(std::move(type)), props(std::move(props)), key(std::move(key)) {}

FiberId FiberTree::create(ElementType type, Props props, std::optional<std::string> key) {
  return fibers_.insert(FiberNode(std::move(type), std::move(props), std::move(key)));
}

bool FiberTree::destroy(FiberId id) {
  return fibers_.erase(id);
}

std::vector<FiberId> FiberTree::children(FiberId id) const {
  std::vector<FiberId> result;
  const FiberNode* parent = fibers_.find(id);
  if (parent == nullptr) {
    return result;
  }
  FiberId cursor = parent->child;
  while (cursor && fibers_.contains(cursor)) {
    result.push_back(cursor);
    cursor = fibers_.at(cursor).sibling;
  }
  return result;
}

void FiberTree::setChildren(FiberId parent, const std::vector<FiberId>& children) {
  FiberNode& parentNode = fibers_.at(parent);
  parentNode.child = children.empty() ? FiberId{} : children.front();
  for (std::size_t i = 0; i < children.size(); ++i) {
    FiberNode& childNode = fibers_.at(children[i]);
    childNode.parent = parent;
    childNode.index = static_cast<uint32_t>(i);
    childNode.sibling = i + 1 < children.size() ? children[i + 1] : FiberId{};
  }
}

void FiberTree::detach(FiberId id) {
  FiberNode* node = fibers_.find(id);
  if (node == nullptr) {
    return;
  }
  node->parent = FiberId{};
  node->sibling = FiberId{};
}

void traverseFiber(const FiberTree& tree, FiberId root, const std::function<bool(FiberId, const FiberNode&)>& visit) {
  if (!root || !tree.contains(root)) {
    return;
  }
  if (!visit(root, tree.node(root))) {
    return;
  }
  for (FiberId child : tree.children(root)) {
    traverseFiber(tree, child, visit);
  }
}

FiberId findFiberByKey(const FiberTree& tree, FiberId root, const std::string& key) {
  FiberId found;
  traverseFiber(tree, root, [&](FiberId id, const FiberNode& node) {
    if (found) {
      return false;
    }
    if (node.key && *node.key == key) {
      found = id;
      return false;
    }
    return true;
  });
  return found;
}

} // namespace prompt
