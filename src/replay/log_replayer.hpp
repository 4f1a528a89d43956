#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "replay/stored_log.hpp"

namespace acp {

struct ToolCallInfo {
  ToolCallId tool_call_id;
  std::string tool_name;
  json input;
  std::optional<json> result;
};

// Role-tagged turn rebuilt from a persisted log
struct ConversationTurn {
  Role role = Role::Assistant;
  std::vector<json> content;  // content blocks
  std::vector<ToolCallInfo> tool_calls;
};

// Fold a persisted, already terminated batch into turns.
//
// Persisted logs don't keep request/response pairs reliably, so turn
// boundaries are inferred: every user message closes the assistant turn
// accumulated so far and starts a user turn of its own.
std::vector<ConversationTurn> rebuild_conversation(const std::vector<StoredLogEntry>& entries);

json to_json(const ConversationTurn& turn);

}  // namespace acp
