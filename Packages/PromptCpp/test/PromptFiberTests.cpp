#include "prompt-reconciler/PromptArena.h"
#include "prompt-reconciler/PromptFiber.h"

#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

namespace prompt::test {

namespace {

struct Slot {};

} // namespace

bool runPromptFiberTests() {
  // Arena slots are recycled with a new generation.
  GenerationalArena<std::string> arena;
  auto first = arena.insert("first");
  auto second = arena.insert("second");
  assert(arena.size() == 2);
  assert(arena.at(first) == "first");
  assert(arena.erase(first));
  assert(!arena.erase(first));
  assert(!arena.contains(first));
  assert(arena.find(first) == nullptr);

  auto reused = arena.insert("reused");
  assert(reused.index == first.index);
  assert(reused.generation != first.generation);
  assert(reused != first);
  assert(arena.at(reused) == "reused");

  bool staleThrew = false;
  try {
    arena.at(first);
  } catch (const std::out_of_range&) {
    staleThrew = true;
  }
  assert(staleThrew);

  std::string* stable = arena.find(second);
  for (int i = 0; i < 100; ++i) {
    arena.insert(std::to_string(i));
  }
  assert(stable == arena.find(second));

  arena.clear();
  assert(arena.size() == 0);
  assert(!arena.contains(second));

  ArenaHandle<Slot> empty;
  assert(!empty);

  // Fiber tree links.
  FiberTree tree;
  FiberId root = tree.create(ElementType::host("root"), Props{}, std::nullopt);
  FiberId a = tree.create(ElementType::host("a"), Props{}, std::string("a"));
  FiberId b = tree.create(ElementType::host("b"), Props{}, std::string("b"));
  FiberId c = tree.create(ElementType::host("c"), Props{}, std::string("c"));
  tree.setChildren(root, {a, b});
  tree.setChildren(b, {c});

  assert(tree.children(root) == (std::vector<FiberId>{a, b}));
  assert(tree.node(a).sibling == b);
  assert(tree.node(b).index == 1);
  assert(tree.node(c).parent == b);

  std::vector<std::string> visited;
  traverseFiber(tree, root, [&](FiberId, const FiberNode& node) {
    visited.push_back(node.type.hostTag());
    return true;
  });
  assert(visited == (std::vector<std::string>{"root", "a", "b", "c"}));

  visited.clear();
  traverseFiber(tree, root, [&](FiberId, const FiberNode& node) {
    visited.push_back(node.type.hostTag());
    return node.type.hostTag() != "b";
  });
  assert(visited == (std::vector<std::string>{"root", "a", "b"}));

  assert(findFiberByKey(tree, root, "c") == c);
  assert(!findFiberByKey(tree, root, "missing"));

  // Reordering relinks siblings; destroyed fibers drop out of the chain.
  tree.setChildren(root, {b, a});
  assert(tree.node(a).index == 1);
  assert(!tree.node(a).sibling);
  assert(tree.destroy(a));
  assert(!tree.contains(a));
  assert(tree.children(root) == (std::vector<FiberId>{b}));

  tree.detach(c);
  assert(!tree.node(c).parent);
  assert(tree.size() == 3);

  bool threw = false;
  try {
    tree.node(a);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);

  return true;
}

} // namespace prompt::test
