#include "com/PromptTool.h"
#include "component/PromptPrimitives.h"
#include "prompt-reconciler/PromptFiberCompiler.h"
#include "prompt-reconciler/PromptStructureRenderer.h"

#include <cassert>
#include <string>

namespace prompt::test {

namespace {

std::string onlyText(const ContentBlockList& blocks) {
  assert(blocks.size() == 1);
  const auto* text = blocks.front().as<TextBlock>();
  assert(text != nullptr);
  return text->text;
}

} // namespace

bool runPromptStructureRendererTests() {
  using namespace primitives;

  // Runs of text collapse; other blocks split them.
  ContentBlockList mixed{
      ContentBlock::text("a"), ContentBlock::text("b"), ContentBlock::code("cpp", "int x;"), ContentBlock::text("c")};
  ContentBlockList consolidated = consolidateTextBlocks(mixed);
  assert(consolidated.size() == 3);
  assert(consolidated[0].as<TextBlock>()->text == "a\n\nb");
  assert(consolidated[1].type() == ContentBlockType::Code);
  assert(consolidated[2].as<TextBlock>()->text == "c");
  assert(consolidateTextBlocks({}).empty());

  ContextObjectModel com(Props{{"agent", "structure"}});
  ToolMetadata metadata;
  metadata.name = "search";
  auto search = createTool(metadata, [](const Value&) { return ContentBlockList{}; });
  com.addTool(search);
  const TickState tick = makeTickState();
  FiberCompiler compiler(com);

  CompiledStructure compiled = compiler.compile(
      jsx("agent",
          Props{{"children",
                 children(
                     {jsx(section(), Props{{"id", "rules"}, {"title", "Rules"}, {"content", "Be brief"}}),
                      jsx(system(), Props{{"content", "Be kind"}}),
                      jsx(section(), Props{{"id", "notes"}, {"children", children({jsx(paragraph(), Props{{"children", "Note one"}})})}}),
                      jsx(user(), Props{{"content", "Hi"}}),
                      jsx(markdown(), Props{{"children", children({jsx(user(), Props{{"content", "Styled"}})})}}),
                      jsx(tool(), Props{{"definition", "search"}}),
                      jsx(ephemeral(), Props{{"position", "end"}, {"content", "ctx"}})})}}),
      tick);

  com.clear();
  StructureRenderer structure(com);
  structure.apply(compiled);

  // Sections are cached in formatted form when their content is a list.
  const COMSection* rules = com.getSection("rules");
  assert(rules != nullptr);
  assert(rules->content == Value("Be brief"));
  assert(!rules->formattedContent);
  const COMSection* notes = com.getSection("notes");
  assert(notes != nullptr);
  assert(notes->formattedContent.has_value());
  assert(onlyText(*notes->formattedContent) == "Note one");
  assert(notes->formattedWith == std::optional<std::string>("markdown"));

  // All system content becomes one message, in declaration order.
  assert(com.getSystemMessages().size() == 1);
  assert(com.getSystemMessages()[0].message.role == MessageRole::System);
  assert(onlyText(com.getSystemMessages()[0].message.content) == "## Rules\nBe brief\n\nBe kind\n\nNote one");

  // Timeline entries keep their blocks; an explicit renderer is remembered.
  const auto& entries = com.getTimeline();
  assert(entries.size() == 2);
  assert(entries[0].message.role == MessageRole::User);
  assert(entries[0].metadata.get("renderer").isUndefined());
  assert(entries[1].metadata.get("renderer").isRenderer());

  assert(com.getTool("search") == search);
  assert(com.getEphemeral().size() == 1);
  assert(onlyText(com.getEphemeral()[0].content) == "ctx");
  assert(com.getEphemeral()[0].position == EphemeralPosition::End);
  assert(com.getMetadata().get("agent") == Value("structure"));

  // Model input: sections carry their formatted blocks, event blocks become
  // text and plain blocks pass through.
  ContentBlock action;
  action.payload = UserActionBlock{"click", std::nullopt, std::nullopt, Value(), std::string("Clicked save")};
  Message event;
  event.content.push_back(action);
  com.addMessage(event);

  COMInput input = structure.formatInput(com.toInput());
  assert(input.timeline.size() == 3);
  assert(onlyText(input.timeline[0].message.content) == "Hi");
  assert(onlyText(input.timeline[1].message.content) == "Styled");
  assert(onlyText(input.timeline[2].message.content) == "Clicked save");
  assert(com.getTimeline()[2].message.content.front().type() == ContentBlockType::UserAction);

  bool sawNotes = false;
  for (const auto& section : input.sections) {
    assert(!section.formattedContent);
    assert(!section.formattedWith);
    if (section.id == "notes") {
      sawNotes = true;
      assert(section.content.isArray());
      assert(contentBlockText(*section.content.asArray()[0].asBlock()) == "Note one");
    }
    if (section.id == "rules") {
      assert(section.content == Value("Be brief"));
    }
  }
  assert(sawNotes);
  assert(input.system.size() == 1);
  assert(input.tools.size() == 1);

  return true;
}

} // namespace prompt::test
