#include "shared/PromptLogger.h"

#include <cstdlib>

namespace prompt::test {
bool runPromptValueTests();
bool runPromptJSXRuntimeTests();
bool runPromptSignalTests();
bool runPromptObjectModelTests();
bool runPromptContentTests();
bool runPromptConfigTests();
bool runPromptComponentHooksTests();
bool runPromptFiberTests();
bool runPromptHooksTests();
bool runPromptReconcilerTests();
bool runPromptCollectorTests();
bool runPromptStabilizerTests();
bool runPromptLifecycleTests();
bool runPromptStructureRendererTests();
}

int main() {
    prompt::Logger::setLevel(prompt::LogLevel::Off);

    bool allPassed = true;
    allPassed &= prompt::test::runPromptValueTests();
    allPassed &= prompt::test::runPromptJSXRuntimeTests();
    allPassed &= prompt::test::runPromptSignalTests();
    allPassed &= prompt::test::runPromptObjectModelTests();
    allPassed &= prompt::test::runPromptContentTests();
    allPassed &= prompt::test::runPromptConfigTests();
    allPassed &= prompt::test::runPromptComponentHooksTests();
    allPassed &= prompt::test::runPromptFiberTests();
    allPassed &= prompt::test::runPromptHooksTests();
    allPassed &= prompt::test::runPromptReconcilerTests();
    allPassed &= prompt::test::runPromptCollectorTests();
    allPassed &= prompt::test::runPromptStabilizerTests();
    allPassed &= prompt::test::runPromptLifecycleTests();
    allPassed &= prompt::test::runPromptStructureRendererTests();
    return allPassed ? EXIT_SUCCESS : EXIT_FAILURE;
}
