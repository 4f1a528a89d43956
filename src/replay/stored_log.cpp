#include "replay/stored_log.hpp"

#include <spdlog/spdlog.h>

#include "core/json_util.hpp"
#include "protocol/methods.hpp"

namespace acp {

std::optional<std::string> StoredLogEntry::method() const {
  return get_string(notification, "method");
}

std::optional<SessionUpdate> StoredLogEntry::session_update() const {
  if (method() != methods::kSessionUpdate) return std::nullopt;
  const json* params = find_field(notification, "params");
  return params ? parse_session_update(*params) : std::nullopt;
}

std::optional<int64_t> StoredLogEntry::timestamp_ms() const {
  if (!timestamp) return std::nullopt;
  return parse_iso8601_ms(*timestamp);
}

std::optional<StoredLogEntry> parse_log_line(std::string_view line) {
  json j = json::parse(line.begin(), line.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }

  StoredLogEntry entry;
  entry.type = get_string_or(j, "type", "");
  entry.timestamp = get_string(j, "timestamp");
  if (const json* notification = find_object(j, "notification")) {
    entry.notification = *notification;

    // Direction is not stored; infer it from the message shape
    entry.direction = infer_direction(entry.notification);
  }
  return entry;
}

std::vector<StoredLogEntry> parse_log(std::string_view content) {
  std::vector<StoredLogEntry> entries;

  size_t line_no = 0;
  size_t pos = 0;
  while (pos <= content.size()) {
    size_t end = content.find('\n', pos);
    if (end == std::string_view::npos) end = content.size();

    std::string_view line = content.substr(pos, end - pos);
    ++line_no;
    pos = end + 1;

    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (line.find_first_not_of(" \t") == std::string_view::npos) {
      continue;
    }

    auto entry = parse_log_line(line);
    if (!entry) {
      spdlog::debug("[StoredLog] Skipping malformed line {}", line_no);
      continue;
    }
    entries.push_back(std::move(*entry));
  }

  return entries;
}

LogSummary summarize_log(const std::vector<StoredLogEntry>& entries) {
  LogSummary summary;

  for (const auto& entry : entries) {
    if (entry.type != "notification") continue;

    auto method = entry.method();
    const json* params = find_object(entry.notification, "params");
    if (!method || !params) continue;

    if (*method == methods::kSessionUpdate) {
      ++summary.session_update_count;

      auto update = parse_session_update(*params);
      if (!update || update->kind != UpdateKind::ConfigOptionUpdate) continue;

      const json* options = find_field(update->body, "configOptions");
      if (!options || !options->is_array()) continue;
      for (const auto& option : *options) {
        if (get_string_or(option, "id", "") != "model") continue;
        auto value = get_string(option, "currentValue");
        if (value && !value->empty()) summary.model = *value;
      }
    } else if (method->ends_with("posthog/sdk_session")) {
      if (auto id = get_string(*params, "sessionId")) {
        summary.session_id = *id;
      } else if (auto sdk_id = get_string(*params, "sdkSessionId")) {
        summary.session_id = *sdk_id;
      }

      if (auto adapter = get_string(*params, "adapter")) {
        summary.adapter = *adapter;
      } else if (summary.session_id) {
        summary.adapter = "claude";
      }
    }
  }

  return summary;
}

std::vector<SessionEvent> to_session_events(const std::vector<StoredLogEntry>& entries) {
  std::vector<SessionEvent> events;
  events.reserve(entries.size());

  for (const auto& entry : entries) {
    if (entry.notification.is_null()) continue;
    events.push_back(make_session_event(entry.notification, entry.timestamp_ms().value_or(0)));
  }
  return events;
}

}  // namespace acp
