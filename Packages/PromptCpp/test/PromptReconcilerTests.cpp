#include "com/PromptTool.h"
#include "component/PromptComponent.h"
#include "prompt-reconciler/PromptFiberCompiler.h"
#include "shared/PromptErrors.h"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace prompt::test {

namespace {

using Journal = std::vector<std::string>;

class Tracked : public Component {
public:
  Tracked(Props props, Journal& journal) : Component(std::move(props)), journal_(journal) {
    title_ = bindProp("title", Value("none"));
  }

  void onMount(ContextObjectModel&) override {
    journal_.push_back("mount " + label());
  }

  void onUnmount(ContextObjectModel&) override {
    journal_.push_back("unmount " + label());
    if (props().get("abortOnUnmount").isTruthy()) {
      throw AbortError("cancelled " + label());
    }
    if (props().get("failOnUnmount").isTruthy()) {
      throw std::runtime_error("unmount failed " + label());
    }
  }

  ElementPtr render(ContextObjectModel&, const TickState&) override {
    ++renders_;
    if (props().get("explode").isTruthy()) {
      throw std::runtime_error("exploded while rendering " + label());
    }
    return nullptr;
  }

  std::string label() const {
    return props().get("label").toDisplayString();
  }
  int renders() const {
    return renders_;
  }
  const PropSignalPtr& title() const {
    return title_;
  }

private:
  Journal& journal_;
  PropSignalPtr title_;
  int renders_{0};
};

ComponentClassPtr trackedClass(const std::string& name, Journal& journal, ExecutableToolPtr tool = nullptr) {
  ComponentClass definition;
  definition.name = name;
  definition.construct = [&journal](const Props& props) -> ComponentPtr {
    return std::make_shared<Tracked>(props, journal);
  };
  definition.tool = std::move(tool);
  return defineComponentClass(std::move(definition));
}

ElementPtr agent(const std::vector<ElementPtr>& items) {
  return jsx("agent", Props{{"children", children(items)}});
}

std::shared_ptr<Tracked> trackedAt(const FiberCompiler& compiler, std::size_t index) {
  const auto fibers = compiler.tree().children(compiler.root());
  assert(index < fibers.size());
  return std::static_pointer_cast<Tracked>(compiler.instanceAt(fibers[index]));
}

} // namespace

bool runPromptReconcilerTests() {
  const TickState tick = makeTickState();

  {
    // Instances persist across compiles; removed children unmount alone.
    ContextObjectModel com;
    Journal journal;
    auto item = trackedClass("Item", journal);
    FiberCompiler compiler(com);

    compiler.compile(agent({jsx(item, Props{{"label", "A"}}), jsx(item, Props{{"label", "B"}})}), tick);
    assert(journal == (Journal{"mount A", "mount B"}));
    auto a = trackedAt(compiler, 0);
    assert(a->displayName() == "Item");

    compiler.compile(agent({jsx(item, Props{{"label", "A"}})}), tick);
    assert(journal == (Journal{"mount A", "mount B", "unmount B"}));
    assert(trackedAt(compiler, 0) == a);
    assert(a->renders() == 2);
    assert(compiler.tree().children(compiler.root()).size() == 1);

    compiler.unmount();
    assert(journal.back() == "unmount A");
    assert(!compiler.root());
  }

  {
    // Keys follow elements when siblings reorder.
    ContextObjectModel com;
    Journal journal;
    auto item = trackedClass("Item", journal);
    auto other = trackedClass("Other", journal);
    FiberCompiler compiler(com);

    compiler.compile(
        agent({jsx(item, Props{{"label", "X"}}, std::string("x")), jsx(item, Props{{"label", "Y"}}, std::string("y"))}),
        tick);
    auto x = trackedAt(compiler, 0);
    auto y = trackedAt(compiler, 1);

    compiler.compile(
        agent({jsx(item, Props{{"label", "Y"}}, std::string("y")), jsx(item, Props{{"label", "X"}}, std::string("x"))}),
        tick);
    assert(journal.size() == 2);
    assert(trackedAt(compiler, 0) == y);
    assert(trackedAt(compiler, 1) == x);
    assert(compiler.instanceAt(compiler.findFiberByKey("x")) == x);

    // A keyed child that is not reused unmounts at commit, after the new
    // instance at its position has mounted.
    compiler.compile(agent({jsx(other, Props{{"label", "O"}})}), tick);
    assert(journal == (Journal{"mount X", "mount Y", "mount O", "unmount Y", "unmount X"}));
  }

  {
    // Refs, prop signals and class tools follow the mounted instance.
    ContextObjectModel com;
    Journal journal;
    ToolMetadata metadata;
    metadata.name = "lookup";
    auto lookup = createTool(metadata, [](const Value&) { return ContentBlockList{}; });
    auto item = trackedClass("Item", journal, lookup);
    FiberCompiler compiler(com);

    compiler.compile(agent({jsx(item, Props{{"label", "R"}, {"ref", "main"}})}), tick);
    auto mounted = trackedAt(compiler, 0);
    assert(com.getRef("main") == mounted);
    assert(com.getTool("lookup") == lookup);
    assert(mounted->title()->get() == Value("none"));

    compiler.compile(agent({jsx(item, Props{{"label", "R"}, {"ref", "main"}, {"title", "One"}})}), tick);
    assert(mounted->title()->get() == Value("One"));
    compiler.compile(agent({jsx(item, Props{{"label", "R"}, {"ref", "main"}, {"title", "Two"}})}), tick);
    assert(mounted->title()->get() == Value("Two"));

    compiler.unmount();
    assert(com.getRef("main") == nullptr);
    assert(com.getTool("lookup") == nullptr);
    assert(mounted->title()->isDisposed());
  }

  {
    // A class tool survives while any instance of the class is mounted.
    ContextObjectModel com;
    Journal journal;
    ToolMetadata metadata;
    metadata.name = "calc";
    auto calc = createTool(metadata, [](const Value&) { return ContentBlockList{}; });
    auto owner = trackedClass("Owner", journal, calc);
    auto other = trackedClass("Other", journal);
    FiberCompiler compiler(com);

    const std::string a = "a";
    const std::string b = "b";
    compiler.compile(agent({jsx(owner, Props{{"label", "O1"}}, a)}), tick);
    assert(com.getTool("calc") == calc);

    // The dropped keyed owner unmounts after its replacement has mounted.
    compiler.compile(agent({jsx(other, Props{{"label", "X"}}), jsx(owner, Props{{"label", "O2"}}, b)}), tick);
    assert(journal == (Journal{"mount O1", "mount X", "mount O2", "unmount O1"}));
    assert(com.getTool("calc") == calc);

    compiler.compile(
        agent(
            {jsx(other, Props{{"label", "X"}}),
             jsx(owner, Props{{"label", "O2"}}, b),
             jsx(owner, Props{{"label", "O3"}})}),
        tick);
    compiler.compile(agent({jsx(other, Props{{"label", "X"}}), jsx(owner, Props{{"label", "O2"}}, b)}), tick);
    assert(journal.back() == "unmount O3");
    assert(com.getTool("calc") == calc);

    compiler.compile(agent({jsx(other, Props{{"label", "X"}})}), tick);
    assert(journal.back() == "unmount O2");
    assert(com.getTool("calc") == nullptr);
  }

  {
    // An old instance replaced at its own position unmounts before the new
    // one is constructed.
    ContextObjectModel com;
    Journal journal;
    ToolMetadata metadata;
    metadata.name = "calc";
    auto calc = createTool(metadata, [](const Value&) { return ContentBlockList{}; });
    auto item = trackedClass("Item", journal, calc);
    auto other = trackedClass("Other", journal);
    FiberCompiler compiler(com);

    compiler.compile(jsx(item, Props{{"label", "A"}}), tick);
    compiler.compile(jsx(other, Props{{"label", "B"}}), tick);
    assert(journal == (Journal{"mount A", "unmount A", "mount B"}));
    assert(com.getTool("calc") == nullptr);

    journal.clear();
    compiler.compile(agent({jsx(other, Props{{"label", "C"}}), jsx(other, Props{{"label", "D"}})}), tick);
    compiler.compile(agent({jsx(item, Props{{"label", "E"}}), jsx(other, Props{{"label", "D"}})}), tick);
    assert(journal == (Journal{"unmount B", "mount C", "mount D", "unmount C", "mount E"}));
    assert(com.getTool("calc") == calc);
    assert(compiler.tree().children(compiler.root()).size() == 2);

    compiler.unmount();
    assert(journal.size() == 7);
    assert(journal[5] == "unmount E");
    assert(journal[6] == "unmount D");
    assert(com.getTool("calc") == nullptr);
  }

  {
    // Instances keep props set on them when the element carries none.
    ContextObjectModel com;
    Journal journal;
    auto item = trackedClass("Item", journal);
    FiberCompiler compiler(com);

    compiler.compile(agent({jsx(item, Props{{"label", "M"}})}), tick);
    auto mounted = trackedAt(compiler, 0);
    mounted->mergeProps(Props{{"note", "kept"}});

    compiler.compile(agent({jsx(item)}), tick);
    assert(trackedAt(compiler, 0) == mounted);
    assert(mounted->label() == "M");
    assert(mounted->props().get("note") == Value("kept"));

    compiler.compile(agent({jsx(item, Props{{"label", "N"}})}), tick);
    assert(mounted->label() == "N");
    assert(mounted->props().get("note") == Value("kept"));
  }

  {
    // Cancellation during unmount is ignored; other failures surface once
    // the whole subtree is released.
    ContextObjectModel com;
    Journal journal;
    auto item = trackedClass("Item", journal);
    FiberCompiler compiler(com);

    compiler.compile(agent({jsx(item, Props{{"label", "C"}, {"abortOnUnmount", Value::boolean(true)}})}), tick);
    compiler.compile(agent({}), tick);
    assert(journal == (Journal{"mount C", "unmount C"}));

    compiler.compile(
        agent({jsx(item, Props{{"label", "A"}, {"abortOnUnmount", Value::boolean(true)}}),
               jsx(item, Props{{"label", "B"}, {"failOnUnmount", Value::boolean(true)}}),
               jsx(item, Props{{"label", "D"}})}),
        tick);
    journal.clear();
    bool threw = false;
    try {
      compiler.unmount();
    } catch (const std::runtime_error& error) {
      threw = std::string(error.what()) == "unmount failed B";
    }
    assert(threw);
    assert(journal == (Journal{"unmount A", "unmount B", "unmount D"}));
    assert(!compiler.root());
    assert(compiler.tree().size() == 0);
  }

  {
    // Prebuilt instances take element props on mount only.
    ContextObjectModel com;
    Journal journal;
    auto prebuilt = std::make_shared<Tracked>(Props{{"label", "orig"}}, journal);
    FiberCompiler compiler(com);

    compiler.compile(agent({jsx(ComponentPtr(prebuilt), Props{{"label", "P"}})}), tick);
    assert(prebuilt->label() == "P");
    assert(trackedAt(compiler, 0) == prebuilt);
    compiler.compile(agent({jsx(ComponentPtr(prebuilt), Props{{"label", "Q"}})}), tick);
    assert(prebuilt->label() == "P");
    assert(prebuilt->renders() == 2);
  }

  {
    // Lifecycle middleware wraps render and can skip a call.
    ContextObjectModel com;
    Journal journal;
    ComponentHookRegistry hooks;
    int wrappedRenders = 0;
    hooks.use(
        ComponentHookName::Render,
        [&wrappedRenders](const ComponentHookInvocation& invocation, const ComponentHookNext& next) {
          assert(invocation.componentName == "QuietItem");
          ++wrappedRenders;
          next();
        },
        ComponentSelector::forName("QuietItem"));
    hooks.use(
        ComponentHookName::OnMount,
        [](const ComponentHookInvocation&, const ComponentHookNext&) {},
        ComponentSelector::forTags({"quiet"}));
    auto quiet = trackedClass("QuietItem", journal);
    auto loud = trackedClass("LoudItem", journal);
    FiberCompiler compiler(com, &hooks);

    compiler.compile(agent({jsx(quiet, Props{{"label", "Q"}}), jsx(loud, Props{{"label", "L"}})}), tick);
    assert(journal == (Journal{"mount L"}));
    assert(wrappedRenders == 1);
    assert(trackedAt(compiler, 0)->renders() == 1);
  }

  {
    // Function components: rendered children, fragments and self-returns.
    ContextObjectModel com;
    Journal journal;
    auto item = trackedClass("Item", journal);
    auto wrapper = defineFunctionComponent("Wrapper", [item](const Props& props, ContextObjectModel&, const TickState&) {
      return jsx(item, Props{{"label", props.get("label")}});
    });
    auto pair = defineFunctionComponent("Pair", [item](const Props&, ContextObjectModel&, const TickState&) {
      return fragment({Value::element(jsx(item, Props{{"label", "F1"}})), Value::element(jsx(item, Props{{"label", "F2"}}))});
    });
    auto empty = defineFunctionComponent("Empty", [](const Props&, ContextObjectModel&, const TickState&) {
      return ElementPtr{};
    });
    FunctionComponentPtr self;
    self = defineFunctionComponent("Self", [&self](const Props& props, ContextObjectModel&, const TickState&) {
      return jsx(self, props);
    });
    FiberCompiler compiler(com);

    compiler.compile(
        agent({jsx(wrapper, Props{{"label", "W"}}),
               jsx(pair),
               jsx(empty),
               jsx(self, Props{{"children", children({jsx(item, Props{{"label", "S"}})})}})}),
        tick);
    assert(journal == (Journal{"mount W", "mount F1", "mount F2", "mount S"}));

    const auto fibers = compiler.tree().children(compiler.root());
    assert(fibers.size() == 4);
    assert(compiler.tree().children(fibers[1]).size() == 2);
    assert(compiler.tree().children(fibers[2]).empty());
    assert(compiler.tree().children(fibers[3]).size() == 1);
  }

  {
    // A failing render rethrows after the completed work is committed.
    ContextObjectModel com;
    Journal journal;
    auto item = trackedClass("Item", journal);
    FiberCompiler compiler(com);

    compiler.compile(agent({jsx(item, Props{{"label", "A"}})}), tick);
    auto a = trackedAt(compiler, 0);

    bool threw = false;
    try {
      compiler.compile(
          agent({jsx(item, Props{{"label", "A"}}), jsx(item, Props{{"label", "Bomb"}, {"explode", Value::boolean(true)}})}),
          tick);
    } catch (const std::runtime_error& error) {
      threw = std::string(error.what()) == "exploded while rendering Bomb";
    }
    assert(threw);
    assert(journal == (Journal{"mount A", "mount Bomb", "unmount Bomb"}));
    assert(compiler.root());

    compiler.compile(agent({jsx(item, Props{{"label", "A"}})}), tick);
    assert(trackedAt(compiler, 0) == a);
    assert(a->renders() == 3);
    assert(compiler.tree().size() == 2);
  }

  return true;
}

} // namespace prompt::test
