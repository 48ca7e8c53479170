#pragma once

#include "runtime/PromptJSXRuntime.h"

namespace prompt::primitives {

// Structural primitives. Each accessor returns the same registration for the
// lifetime of the process, so fibers keep their identity across compiles.
FunctionComponentPtr timeline();
FunctionComponentPtr section();
FunctionComponentPtr entry();
FunctionComponentPtr tool();
FunctionComponentPtr ephemeral();
FunctionComponentPtr renderer();

// Message helpers. Message renders an Entry of kind "message".
FunctionComponentPtr message();
FunctionComponentPtr user();
FunctionComponentPtr assistant();
FunctionComponentPtr system();
FunctionComponentPtr toolResult();
FunctionComponentPtr event();
FunctionComponentPtr grounding();
FunctionComponentPtr markdown();

// Content primitives.
FunctionComponentPtr text();
FunctionComponentPtr image();
FunctionComponentPtr document();
FunctionComponentPtr audio();
FunctionComponentPtr video();
FunctionComponentPtr code();
FunctionComponentPtr json();

// Semantic primitives.
FunctionComponentPtr h1();
FunctionComponentPtr h2();
FunctionComponentPtr h3();
FunctionComponentPtr header();
FunctionComponentPtr paragraph();
FunctionComponentPtr list();
FunctionComponentPtr listItem();
FunctionComponentPtr table();
FunctionComponentPtr row();
FunctionComponentPtr column();

// Event primitives.
FunctionComponentPtr userAction();
FunctionComponentPtr systemEvent();
FunctionComponentPtr stateChange();

} // namespace prompt::primitives
