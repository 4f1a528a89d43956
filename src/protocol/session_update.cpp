#include "protocol/session_update.hpp"

#include <utility>

#include "core/json_util.hpp"
#include "protocol/methods.hpp"

namespace acp {

namespace {

const std::pair<UpdateKind, const char*> kUpdateNames[] = {
    {UpdateKind::UserMessage, "user_message"},
    {UpdateKind::UserMessageChunk, "user_message_chunk"},
    {UpdateKind::AgentMessage, "agent_message"},
    {UpdateKind::AgentMessageChunk, "agent_message_chunk"},
    {UpdateKind::AgentThoughtChunk, "agent_thought_chunk"},
    {UpdateKind::ToolCall, "tool_call"},
    {UpdateKind::ToolCallUpdate, "tool_call_update"},
    {UpdateKind::ToolResult, "tool_result"},
    {UpdateKind::Plan, "plan"},
    {UpdateKind::AvailableCommandsUpdate, "available_commands_update"},
    {UpdateKind::CurrentModeUpdate, "current_mode_update"},
    {UpdateKind::ConfigOptionUpdate, "config_option_update"},
    {UpdateKind::Status, "status"},
    {UpdateKind::Error, "error"},
};

}  // namespace

std::string to_string(UpdateKind kind) {
  for (const auto& [k, name] : kUpdateNames) {
    if (k == kind) return name;
  }
  return "unknown";
}

UpdateKind update_kind_from_string(const std::string& str) {
  for (const auto& [k, name] : kUpdateNames) {
    if (str == name) return k;
  }
  return UpdateKind::Unknown;
}

std::optional<std::string> SessionUpdate::text() const {
  const json* content = find_object(body, "content");
  if (!content || get_string_or(*content, "type", "") != "text") return std::nullopt;
  return get_string(*content, "text");
}

std::string SessionUpdate::tool_call_id() const {
  return get_string_or(body, "toolCallId", "");
}

std::optional<SessionUpdate> parse_session_update(const json& params) {
  if (!params.is_object()) return std::nullopt;

  auto update = params.find("update");
  if (update == params.end() || !update->is_object()) return std::nullopt;

  auto discriminator = update->find("sessionUpdate");
  if (discriminator == update->end() || !discriminator->is_string()) return std::nullopt;

  SessionUpdate result;
  result.name = discriminator->get<std::string>();
  result.kind = update_kind_from_string(result.name);
  result.body = *update;
  return result;
}

SessionEvent make_session_event(const json& message, int64_t ts) {
  SessionEvent event{classify(message), ts, std::nullopt};
  if (auto* note = std::get_if<Notification>(&event.message); note && note->method == methods::kSessionUpdate) {
    event.update = parse_session_update(note->params);
  }
  return event;
}

}  // namespace acp
