#include "prompt-reconciler/PromptFiberCompiler.h"
#include "prompt-reconciler/PromptFiberHooks.h"
#include "shared/PromptLogger.h"

#include <cassert>
#include <string>
#include <vector>

namespace prompt::test {

bool runPromptStabilizerTests() {
  const TickState tick = makeTickState();

  {
    // Settles once afterCompile stops asking for another pass.
    ContextObjectModel com;
    int requests = 0;
    std::vector<std::size_t> seenIterations;
    auto settler = defineFunctionComponent("Settler", [&](const Props&, ContextObjectModel&, const TickState&) {
      useAfterCompile([&](ContextObjectModel& model, const CompiledStructure&, const TickState&, const AfterCompileContext& context) {
        seenIterations.push_back(context.iteration);
        assert(context.maxIterations == kDefaultMaxCompileIterations);
        if (requests < 2) {
          ++requests;
          model.requestRecompile("settling");
        }
      });
      return ElementPtr{};
    });
    FiberCompiler compiler(com);

    CompileStabilizationResult result = compiler.compileUntilStable(jsx(settler), tick);
    assert(result.iterations == 3);
    assert(!result.forcedStable);
    assert(seenIterations == (std::vector<std::size_t>{0, 1, 2}));
    assert(result.recompileReasons == (std::vector<std::string>{"[iteration 0] settling", "[iteration 1] settling"}));
  }

  {
    // A component that always asks again is cut off at the cap.
    ContextObjectModel com;
    auto restless = defineFunctionComponent("Restless", [](const Props&, ContextObjectModel&, const TickState&) {
      useAfterCompile([](ContextObjectModel& model, const CompiledStructure&, const TickState&, const AfterCompileContext&) {
        model.requestRecompile("again");
      });
      return ElementPtr{};
    });
    FiberCompiler compiler(com);

    CompileStabilizationOptions options;
    options.maxIterations = 4;
    CompileStabilizationResult capped = compiler.compileUntilStable(jsx(restless), tick, options);
    assert(capped.iterations == 4);
    assert(capped.forcedStable);
    assert(capped.recompileReasons.size() == 4);
    assert(capped.recompileReasons.back() == "[iteration 3] again");

    options.maxIterations = 0;
    CompileStabilizationResult single = compiler.compileUntilStable(jsx(restless), tick, options);
    assert(single.iterations == 1);
    assert(single.forcedStable);

    CompilerOptions compilerOptions;
    compilerOptions.maxCompileIterations = 2;
    FiberCompiler configured(com, nullptr, compilerOptions);
    assert(configured.compileUntilStable(jsx(restless), tick).iterations == 2);
  }

  {
    // State set by an effect triggers exactly one more pass.
    ContextObjectModel com;
    std::vector<bool> renders;
    auto loader = defineFunctionComponent("Loader", [&renders](const Props&, ContextObjectModel&, const TickState&) {
      auto loaded = useState(Value::boolean(false));
      renders.push_back(loaded.value.asBoolean());
      auto set = loaded.set;
      useEffect(
          [set](ContextObjectModel&) -> EffectCleanup {
            set(Value::boolean(true));
            return nullptr;
          },
          std::vector<Value>{});
      return ElementPtr{};
    });
    FiberCompiler compiler(com);

    CompileStabilizationResult result = compiler.compileUntilStable(jsx(loader), tick);
    assert(result.iterations == 2);
    assert(!result.forcedStable);
    assert(renders == (std::vector<bool>{false, true}));
    assert(result.recompileReasons == (std::vector<std::string>{"[iteration 0] fiber state update"}));
  }

  {
    // Mutation tracking warns about object model changes made without a
    // recompile request.
    ContextObjectModel com;
    auto sneaky = defineFunctionComponent("Sneaky", [](const Props&, ContextObjectModel&, const TickState&) {
      useAfterCompile([](ContextObjectModel& model, const CompiledStructure&, const TickState&, const AfterCompileContext&) {
        COMSection section;
        section.id = "late";
        section.content = Value("added after compile");
        model.addSection(section);
      });
      return ElementPtr{};
    });
    FiberCompiler compiler(com);

    const LogLevel previousLevel = Logger::level();
    std::vector<std::string> warnings;
    Logger::setSink([&warnings](LogLevel level, const std::string& component, const std::string& message) {
      if (level == LogLevel::Warn && component == "FiberCompiler") {
        warnings.push_back(message);
      }
    });
    Logger::setLevel(LogLevel::Warn);

    CompileStabilizationOptions tracked;
    tracked.trackMutations = true;
    CompileStabilizationResult result = compiler.compileUntilStable(jsx(sneaky), tick, tracked);
    assert(result.iterations == 1);
    assert(warnings.size() == 1);
    assert(warnings[0].find("iteration 0") != std::string::npos);

    CompileStabilizationOptions untracked;
    untracked.trackMutations = false;
    compiler.compileUntilStable(jsx(sneaky), tick, untracked);
    assert(warnings.size() == 1);

    Logger::resetSink();
    Logger::setLevel(previousLevel);
  }

  return true;
}

} // namespace prompt::test
