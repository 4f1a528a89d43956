#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "replay/stored_log.hpp"

namespace acp {

// A permission prompt the agent raised that nobody answered before the log ended
struct PendingPermission {
  ToolCallId tool_call_id;
  json request;  // request params without `sessionId`
  std::string task_run_id;
  int64_t received_at_ms = 0;
};

// Permission requests that are still open at the end of the log. A request is
// settled once its tool call reaches in_progress/completed/failed anywhere in
// the log, and stale once the assistant has spoken again after it.
std::map<ToolCallId, PendingPermission> find_pending_permissions(const std::vector<StoredLogEntry>& entries);

}  // namespace acp
