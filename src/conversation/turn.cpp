#include "conversation/turn.hpp"

namespace acp {

std::string to_string(TextKind kind) {
  return kind == TextKind::Thought ? "agent_thought_chunk" : "agent_message_chunk";
}

std::vector<const Turn*> BuildResult::turns() const {
  std::vector<const Turn*> result;
  for (const auto& item : items) {
    if (auto* turn = std::get_if<Turn>(&item)) {
      result.push_back(turn);
    }
  }
  return result;
}

json to_json(const Turn& turn) {
  json items = json::array();
  for (const auto& item : turn.items) {
    if (auto* text = std::get_if<TextBlock>(&item)) {
      items.push_back({{"sessionUpdate", to_string(text->kind)}, {"content", {{"type", "text"}, {"text", text->text}}}});
    } else if (auto* ref = std::get_if<ToolCallRef>(&item)) {
      json call = turn.tool_call(*ref).to_json();
      call["sessionUpdate"] = "tool_call";
      items.push_back(std::move(call));
    } else if (auto* opaque = std::get_if<OpaqueUpdate>(&item)) {
      json payload = opaque->payload.is_object() ? opaque->payload : json{{"payload", opaque->payload}};
      payload["sessionUpdate"] = opaque->kind;
      items.push_back(std::move(payload));
    } else if (auto* console = std::get_if<ConsoleRecord>(&item)) {
      items.push_back({{"sessionUpdate", "console"}, {"level", console->level}, {"message", console->message}, {"timestamp", console->timestamp}});
    }
  }

  json j = {{"type", "turn"},
            {"id", turn.id},
            {"promptId", turn.prompt_id},
            {"userContent", turn.user_content},
            {"items", items},
            {"isComplete", turn.complete},
            {"cancelled", turn.cancelled},
            {"durationMs", turn.duration_ms}};
  if (turn.stop_reason) j["stopReason"] = *turn.stop_reason;
  if (turn.interrupt_reason) j["interruptReason"] = *turn.interrupt_reason;
  return j;
}

json to_json(const ConversationItem& item) {
  if (auto* turn = std::get_if<Turn>(&item)) {
    return to_json(*turn);
  }
  const auto& shell = std::get<ShellExecution>(item);
  return {{"type", "user_shell_execute"}, {"id", shell.id}, {"command", shell.command}, {"cwd", shell.cwd}, {"result", shell.result}};
}

json to_json(const BuildResult& result) {
  json items = json::array();
  for (const auto& item : result.items) {
    items.push_back(to_json(item));
  }

  json j = {{"items", items}, {"lastTurnInfo", nullptr}};
  if (result.last_turn) {
    j["lastTurnInfo"] = {{"isComplete", result.last_turn->complete}, {"durationMs", result.last_turn->duration_ms}};
    if (result.last_turn->stop_reason) j["lastTurnInfo"]["stopReason"] = *result.last_turn->stop_reason;
  }
  return j;
}

}  // namespace acp
