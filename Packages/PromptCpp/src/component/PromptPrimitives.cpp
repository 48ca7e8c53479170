#include "component/PromptPrimitives.h"

#include "renderers/ContentRenderer.h"

#include <memory>

namespace prompt::primitives {

namespace {

Props withoutKeys(const Props& props, std::initializer_list<const char*> keys) {
  Props result = props;
  for (const char* key : keys) {
    result.erase(key);
  }
  return result;
}

// Copies the role-message props onto a Message element with a fixed role.
ElementPtr roleMessage(const char* role, const Props& props, const Props& extraMetadata = {}) {
  Props messageProps = withoutKeys(props, {"role"});
  messageProps.set("role", role);
  if (!extraMetadata.empty()) {
    Props metadata = optionalObjectProp(props, "metadata").value_or(Props{});
    metadata.merge(extraMetadata);
    messageProps.set("metadata", Value::object(std::move(metadata)));
  }
  return jsx(message(), std::move(messageProps));
}

} // namespace

FunctionComponentPtr timeline() {
  static const FunctionComponentPtr component = defineTerminalComponent("Timeline");
  return component;
}

FunctionComponentPtr section() {
  static const FunctionComponentPtr component = defineTerminalComponent("Section");
  return component;
}

FunctionComponentPtr entry() {
  static const FunctionComponentPtr component = defineTerminalComponent("Entry");
  return component;
}

FunctionComponentPtr tool() {
  static const FunctionComponentPtr component = defineTerminalComponent("Tool");
  return component;
}

FunctionComponentPtr ephemeral() {
  static const FunctionComponentPtr component = defineTerminalComponent("Ephemeral");
  return component;
}

FunctionComponentPtr renderer() {
  static const FunctionComponentPtr component = defineTerminalComponent("Renderer");
  return component;
}

FunctionComponentPtr text() {
  static const FunctionComponentPtr component = defineTerminalComponent("Text");
  return component;
}

FunctionComponentPtr image() {
  static const FunctionComponentPtr component = defineTerminalComponent("Image");
  return component;
}

FunctionComponentPtr document() {
  static const FunctionComponentPtr component = defineTerminalComponent("Document");
  return component;
}

FunctionComponentPtr audio() {
  static const FunctionComponentPtr component = defineTerminalComponent("Audio");
  return component;
}

FunctionComponentPtr video() {
  static const FunctionComponentPtr component = defineTerminalComponent("Video");
  return component;
}

FunctionComponentPtr code() {
  static const FunctionComponentPtr component = defineTerminalComponent("Code");
  return component;
}

FunctionComponentPtr json() {
  static const FunctionComponentPtr component = defineTerminalComponent("Json");
  return component;
}

FunctionComponentPtr h1() {
  static const FunctionComponentPtr component = defineTerminalComponent("H1");
  return component;
}

FunctionComponentPtr h2() {
  static const FunctionComponentPtr component = defineTerminalComponent("H2");
  return component;
}

FunctionComponentPtr h3() {
  static const FunctionComponentPtr component = defineTerminalComponent("H3");
  return component;
}

FunctionComponentPtr header() {
  static const FunctionComponentPtr component = defineTerminalComponent("Header");
  return component;
}

FunctionComponentPtr paragraph() {
  static const FunctionComponentPtr component = defineTerminalComponent("Paragraph");
  return component;
}

FunctionComponentPtr list() {
  static const FunctionComponentPtr component = defineTerminalComponent("List");
  return component;
}

FunctionComponentPtr listItem() {
  static const FunctionComponentPtr component = defineTerminalComponent("ListItem");
  return component;
}

FunctionComponentPtr table() {
  static const FunctionComponentPtr component = defineTerminalComponent("Table");
  return component;
}

FunctionComponentPtr row() {
  static const FunctionComponentPtr component = defineTerminalComponent("Row");
  return component;
}

FunctionComponentPtr column() {
  static const FunctionComponentPtr component = defineTerminalComponent("Column");
  return component;
}

FunctionComponentPtr userAction() {
  static const FunctionComponentPtr component = defineTerminalComponent("UserAction");
  return component;
}

FunctionComponentPtr systemEvent() {
  static const FunctionComponentPtr component = defineTerminalComponent("SystemEvent");
  return component;
}

FunctionComponentPtr stateChange() {
  static const FunctionComponentPtr component = defineTerminalComponent("StateChange");
  return component;
}

FunctionComponentPtr message() {
  static const FunctionComponentPtr component = defineFunctionComponent(
      "Message", [](const Props& props, ContextObjectModel&, const TickState&) -> ElementPtr {
        Props messageObject;
        messageObject.set("role", props.has("role") ? props.get("role") : Value("user"));
        Value content = props.get("content");
        messageObject.set("content", content.isNullish() ? Value::array({}) : std::move(content));
        if (auto id = optionalStringProp(props, "id")) {
          messageObject.set("id", *id);
        }
        if (auto metadata = optionalObjectProp(props, "metadata")) {
          messageObject.set("metadata", Value::object(std::move(*metadata)));
        }

        Props entryProps{{"kind", "message"}, {"message", Value::object(std::move(messageObject))}};
        for (const auto& [key, value] : props) {
          if (key == "role" || key == "content" || key == "id" || key == "metadata" || key == "ref") {
            continue;
          }
          entryProps.set(key, value);
        }
        return jsx(entry(), std::move(entryProps));
      });
  return component;
}

FunctionComponentPtr user() {
  static const FunctionComponentPtr component = defineFunctionComponent(
      "User", [](const Props& props, ContextObjectModel&, const TickState&) { return roleMessage("user", props); });
  return component;
}

FunctionComponentPtr assistant() {
  static const FunctionComponentPtr component = defineFunctionComponent(
      "Assistant",
      [](const Props& props, ContextObjectModel&, const TickState&) { return roleMessage("assistant", props); });
  return component;
}

FunctionComponentPtr system() {
  static const FunctionComponentPtr component = defineFunctionComponent(
      "System", [](const Props& props, ContextObjectModel&, const TickState&) { return roleMessage("system", props); });
  return component;
}

FunctionComponentPtr toolResult() {
  static const FunctionComponentPtr component = defineFunctionComponent(
      "ToolResult", [](const Props& props, ContextObjectModel&, const TickState&) {
        Props metadata{
            {"tool_call_id", props.get("toolCallId")},
            {"tool_name", props.get("name")},
            {"isError", props.get("isError")}};
        return roleMessage("tool", withoutKeys(props, {"toolCallId", "name", "isError"}), metadata);
      });
  return component;
}

FunctionComponentPtr event() {
  static const FunctionComponentPtr component = defineFunctionComponent(
      "Event", [](const Props& props, ContextObjectModel&, const TickState&) {
        Props metadata{{"event_type", props.get("eventType")}};
        return roleMessage("event", withoutKeys(props, {"eventType"}), metadata);
      });
  return component;
}

FunctionComponentPtr grounding() {
  static const FunctionComponentPtr component = defineFunctionComponent(
      "Grounding", [](const Props& props, ContextObjectModel&, const TickState&) {
        Props ephemeralProps = withoutKeys(props, {"audience"});
        if (!ephemeralProps.has("position")) {
          ephemeralProps.set("position", "start");
        }
        Props metadata = optionalObjectProp(props, "metadata").value_or(Props{});
        Value audience = props.has("audience") ? props.get("audience") : Value("model");
        metadata.set("_grounding", Value::object(Props{{"audience", std::move(audience)}}));
        ephemeralProps.set("metadata", Value::object(std::move(metadata)));
        return jsx(ephemeral(), std::move(ephemeralProps));
      });
  return component;
}

FunctionComponentPtr markdown() {
  static const FunctionComponentPtr component = defineFunctionComponent(
      "Markdown", [](const Props& props, ContextObjectModel&, const TickState&) {
        static const ContentRendererPtr markdownRenderer = std::make_shared<MarkdownRenderer>();
        Props rendererProps{{"instance", Value::renderer(markdownRenderer)}};
        if (props.has("children")) {
          rendererProps.set("children", props.get("children"));
        }
        return jsx(renderer(), std::move(rendererProps));
      });
  return component;
}

} // namespace prompt::primitives
