#pragma once

#include "content/PromptContentBlock.h"
#include "runtime/PromptJSXRuntime.h"

#include <functional>
#include <string>
#include <vector>

namespace prompt {

// Evaluates a non-terminal function component outside of a render pass.
// Returns nullptr when the component cannot be evaluated standalone.
using ElementExpander = std::function<ElementPtr(const Element& element)>;

// Host tag, or the lower-cased name of a function or class component.
// Fragments and unknown types have no name.
std::string elementTypeName(const ElementType& type);

// Flattens nested arrays and drops null, undefined and booleans.
std::vector<Value> flattenChildValues(const Value& children);

SemanticNode extractSemanticNodeFromElement(
    const Element& element,
    const ContentRendererPtr& renderer,
    const ElementExpander& expand = nullptr);

std::string extractTextFromElement(const Element& element);

// From `headers`/`rows` props when both are set, otherwise from Row and
// Column children. A Row with a truthy `header` prop supplies the headers.
TableStructure extractTableStructure(const Element& element);

ListStructure extractListStructure(const Element& element);

} // namespace prompt
