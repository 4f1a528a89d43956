#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/types.hpp"
#include "protocol/wire_message.hpp"

namespace acp {

// Discriminator of a `session/update` payload (its `sessionUpdate` field)
enum class UpdateKind {
  UserMessage,
  UserMessageChunk,
  AgentMessage,
  AgentMessageChunk,
  AgentThoughtChunk,
  ToolCall,
  ToolCallUpdate,
  ToolResult,
  Plan,
  AvailableCommandsUpdate,
  CurrentModeUpdate,
  ConfigOptionUpdate,
  Status,
  Error,
  Unknown
};

std::string to_string(UpdateKind kind);

UpdateKind update_kind_from_string(const std::string& str);

struct SessionUpdate {
  UpdateKind kind = UpdateKind::Unknown;
  std::string name;  // raw discriminator, kept for kinds we don't model
  json body;         // the whole update object

  // Text of `content` when it is a text block
  std::optional<std::string> text() const;

  // `toolCallId`, empty when absent
  std::string tool_call_id() const;
};

// Reads `params.update`. Returns nullopt when there is no update object or no discriminator.
std::optional<SessionUpdate> parse_session_update(const json& params);

// One entry of the live event stream
struct SessionEvent {
  WireMessage message;
  int64_t ts = 0;  // milliseconds, monotonic within a session
  std::optional<SessionUpdate> update;
};

// Classifies `message` and, for `session/update` notifications, parses the payload
SessionEvent make_session_event(const json& message, int64_t ts);

}  // namespace acp
