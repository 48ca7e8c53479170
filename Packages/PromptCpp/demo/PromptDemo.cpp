#include "com/PromptTool.h"
#include "component/PromptComponent.h"
#include "component/PromptPrimitives.h"
#include "prompt-reconciler/PromptFiberCompiler.h"
#include "prompt-reconciler/PromptFiberHooks.h"
#include "prompt-reconciler/PromptStructureRenderer.h"
#include "shared/PromptCompilerConfig.h"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

namespace prompt::demo {

using namespace primitives;

ExecutableToolPtr makeClockTool() {
  ToolMetadata metadata;
  metadata.name = "clock";
  metadata.description = "Returns the current tick";
  return createTool(std::move(metadata), [](const Value& input) {
    return ContentBlockList{ContentBlock::text("tick " + input.toDisplayString())};
  });
}

// Keeps a running summary of every tick it has seen.
class TickJournal : public Component {
public:
  using Component::Component;

  void onTickStart(ContextObjectModel& com, const TickState& state) override {
    com.setState("lastTick", Value::number(state.tick));
  }

  ElementPtr render(ContextObjectModel& com, const TickState& state) override {
    Value last = com.getState("lastTick");
    return jsx(
        section(),
        Props{{"id", "journal"},
              {"title", "Journal"},
              {"children",
               children(
                   {jsx(h2(), Props{{"children", "Progress"}}),
                    jsx(list(),
                        Props{{"children",
                               children(
                                   {jsx(listItem(), Props{{"children", "tick " + std::to_string(state.tick)}}),
                                    jsx(listItem(), Props{{"children", "last seen " + last.toDisplayString()}})})}})})}});
  }
};

ElementPtr agent(const ComponentClassPtr& journal, const FunctionComponentPtr& planner) {
  return jsx(
      "agent",
      Props{{"children",
             children(
                 {jsx(section(), Props{{"id", "rules"}, {"title", "Rules"}, {"content", "Answer briefly."}}),
                  jsx(journal),
                  jsx(planner),
                  jsx(user(), Props{{"content", "What time is it?"}}),
                  jsx(tool(), Props{{"definition", "clock"}})})}});
}

int run() {
  CompilerOptions options = loadCompilerOptionsFromEnvironment();
  ContextObjectModel com(Props{{"agent", "demo"}});
  const ExecutableToolPtr clock = makeClockTool();

  auto journal = defineComponent<TickJournal>("TickJournal");
  auto planner = defineFunctionComponent("Planner", [](const Props&, ContextObjectModel&, const TickState&) {
    auto steps = useState(Value::number(1));
    auto set = steps.set;
    useEffect(
        [set](ContextObjectModel&) -> EffectCleanup {
          set(Value::number(2));
          return nullptr;
        },
        std::vector<Value>{});
    return jsx(
        section(),
        Props{{"id", "plan"}, {"content", "Plan with " + steps.value.toDisplayString() + " step(s)"}});
  });

  FiberCompiler compiler(com, nullptr, options);
  StructureRenderer structure(com, options.defaultRenderer);

  for (int tick = 1; tick <= 2; ++tick) {
    com.clear();
    com.addTool(clock);
    com.addMetadata("agent", Value("demo"));

    TickState state = makeTickState(tick);
    compiler.notifyTickStart(state);
    if (tick == 1) {
      compiler.notifyStart();
    }

    CompileStabilizationResult result = compiler.compileUntilStable(agent(journal, planner), state);
    structure.apply(result.compiled);
    const COMInput input = structure.formatInput(com.toInput());

    fmt::print("== tick {} ({} iteration(s){})\n", tick, result.iterations, result.forcedStable ? ", forced" : "");
    for (const auto& entry : input.system) {
      for (const auto& block : entry.message.content) {
        fmt::print("[system]\n{}\n", contentBlockText(block));
      }
    }
    for (const auto& entry : input.timeline) {
      for (const auto& block : entry.message.content) {
        fmt::print("[{}] {}\n", messageRoleName(entry.message.role), contentBlockText(block));
      }
    }
    fmt::print("{}", describeCompiledStructure(result.compiled));
    compiler.notifyTickEnd(state);
  }

  compiler.notifyComplete(com.toInput());
  return EXIT_SUCCESS;
}

} // namespace prompt::demo

int main() {
  try {
    return prompt::demo::run();
  } catch (const std::exception& error) {
    fmt::print(stderr, "prompt-demo failed: {}\n", error.what());
    return EXIT_FAILURE;
  }
}
