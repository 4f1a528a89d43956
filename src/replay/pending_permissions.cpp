#include "replay/pending_permissions.hpp"

#include <set>

#include "core/json_util.hpp"
#include "protocol/methods.hpp"

namespace acp {

namespace {

bool is_settled_status(const std::string& status) {
  return status == "in_progress" || status == "completed" || status == "failed";
}

std::optional<ToolCallId> permission_tool_call_id(const StoredLogEntry& entry) {
  if (entry.method() != methods::kRequestPermission) return std::nullopt;
  const json* params = find_object(entry.notification, "params");
  const json* tool_call = params ? find_object(*params, "toolCall") : nullptr;
  if (!tool_call) return std::nullopt;
  return get_string(*tool_call, "toolCallId");
}

}  // namespace

std::map<ToolCallId, PendingPermission> find_pending_permissions(const std::vector<StoredLogEntry>& entries) {
  std::map<ToolCallId, size_t> requests;
  std::set<ToolCallId> settled;
  std::optional<size_t> last_assistant_message;

  for (size_t i = 0; i < entries.size(); ++i) {
    if (auto id = permission_tool_call_id(entries[i])) {
      requests[*id] = i;
    }

    auto update = entries[i].session_update();
    if (!update) continue;

    if (update->kind == UpdateKind::ToolCallUpdate && is_settled_status(get_string_or(update->body, "status", ""))) {
      auto id = update->tool_call_id();
      if (!id.empty()) settled.insert(id);
    }

    if (update->name == "assistant_message") {
      last_assistant_message = i;
    }
  }

  std::map<ToolCallId, PendingPermission> pending;
  for (const auto& [id, index] : requests) {
    if (settled.count(id)) continue;
    if (last_assistant_message && *last_assistant_message > index) continue;

    const auto& entry = entries[index];
    json request = entry.notification.at("params");
    std::string task_run_id = get_string_or(request, "sessionId", "");
    request.erase("sessionId");

    pending[id] = PendingPermission{id, std::move(request), std::move(task_run_id), entry.timestamp_ms().value_or(now_ms())};
  }
  return pending;
}

}  // namespace acp
