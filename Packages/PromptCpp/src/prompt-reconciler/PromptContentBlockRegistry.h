#pragma once

#include "content/PromptContentBlock.h"
#include "prompt-reconciler/PromptContentExtractors.h"
#include "runtime/PromptJSXRuntime.h"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace prompt {

using ContentBlockMapper = std::function<std::optional<ContentBlock>(
    const Element& element,
    const ContentRendererPtr& renderer,
    const ElementExpander& expand)>;

// Maps content elements to blocks. Function components are looked up by
// their lower-cased name, so `Text` and the host tag "text" share a mapper.
class ContentBlockRegistry {
public:
  void registerMapper(const std::string& typeName, ContentBlockMapper mapper);

  const ContentBlockMapper* find(const ElementType& type) const;
  bool has(const ElementType& type) const {
    return find(type) != nullptr;
  }

  // Registry holding the built-in primitive and host tag mappers.
  static ContentBlockRegistry withDefaults();

private:
  std::unordered_map<std::string, ContentBlockMapper> mappers_;
};

} // namespace prompt
