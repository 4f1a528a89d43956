#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/types.hpp"
#include "protocol/session_update.hpp"

namespace acp {

// One line of a persisted session log:
//   {"type":"notification","timestamp":"2024-01-15T10:30:00Z","notification":{...}}
struct StoredLogEntry {
  std::string type;
  std::optional<std::string> timestamp;
  json notification;  // JSON-RPC message: id / method / params / result / error
  Direction direction = Direction::Unknown;

  std::optional<std::string> method() const;

  // `notification.params.update` when this is a `session/update`
  std::optional<SessionUpdate> session_update() const;

  // Timestamp in epoch milliseconds, nullopt when missing or unparseable
  std::optional<int64_t> timestamp_ms() const;
};

// Parse newline-delimited log content. Blank and malformed lines are skipped
// one by one; the rest of the batch is kept.
std::vector<StoredLogEntry> parse_log(std::string_view content);

// Decode a single line. nullopt for anything that is not a JSON object.
std::optional<StoredLogEntry> parse_log_line(std::string_view line);

struct LogSummary {
  std::optional<SessionId> session_id;
  std::optional<std::string> adapter;  // "claude" or "codex"
  std::optional<std::string> model;
  size_t session_update_count = 0;
};

// Session id and adapter from the SDK session announcement, model from config updates
LogSummary summarize_log(const std::vector<StoredLogEntry>& entries);

// Feed a persisted batch into the live Turn Builder
std::vector<SessionEvent> to_session_events(const std::vector<StoredLogEntry>& entries);

}  // namespace acp
