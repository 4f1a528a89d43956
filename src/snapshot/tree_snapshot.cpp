#include "snapshot/tree_snapshot.hpp"

#include "core/json_util.hpp"
#include "protocol/methods.hpp"

namespace acp {

std::string to_string(FileStatus status) {
  switch (status) {
    case FileStatus::Added:
      return "A";
    case FileStatus::Modified:
      return "M";
    case FileStatus::Deleted:
      return "D";
  }
  return "M";
}

std::optional<FileStatus> file_status_from_string(const std::string& str) {
  if (str == "A") return FileStatus::Added;
  if (str == "M") return FileStatus::Modified;
  if (str == "D") return FileStatus::Deleted;
  return std::nullopt;
}

std::optional<TreeSnapshotEvent> TreeSnapshotEvent::from_json(const json& params) {
  auto hash = get_string(params, "treeHash");
  if (!hash || hash->empty()) {
    return std::nullopt;
  }

  TreeSnapshotEvent event;
  event.tree_hash = *hash;
  event.base_commit = get_string(params, "baseCommit");
  event.archive_url = get_string(params, "archiveUrl");
  event.timestamp = get_string_or(params, "timestamp", "");
  event.interrupted = get_bool_or(params, "interrupted", false);

  if (const json* changes = find_field(params, "changes"); changes && changes->is_array()) {
    for (const auto& change : *changes) {
      auto path = get_string(change, "path");
      auto status = file_status_from_string(get_string_or(change, "status", ""));
      if (path && !path->empty() && status) {
        event.changes.push_back(FileChange{*path, *status});
      }
    }
  }

  if (const json* device = find_field(params, "device"); device && !device->is_null()) {
    event.device = *device;
  }
  return event;
}

json TreeSnapshotEvent::to_json() const {
  json changes_json = json::array();
  for (const auto& change : changes) {
    changes_json.push_back({{"path", change.path}, {"status", acp::to_string(change.status)}});
  }

  json j = {{"treeHash", tree_hash},
            {"baseCommit", base_commit ? json(*base_commit) : json()},
            {"changes", changes_json},
            {"timestamp", timestamp},
            {"interrupted", interrupted}};
  if (archive_url) j["archiveUrl"] = *archive_url;
  if (device) j["device"] = *device;
  return j;
}

std::optional<TreeSnapshotEvent> find_latest_snapshot(const std::vector<StoredLogEntry>& entries) {
  for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
    auto method = it->method();
    if (!method || !methods::is_extension(*method, methods::kTreeSnapshot)) continue;

    const json* params = find_object(it->notification, "params");
    if (!params) continue;

    if (auto snapshot = TreeSnapshotEvent::from_json(*params)) {
      return snapshot;
    }
  }
  return std::nullopt;
}

std::optional<json> find_last_device(const std::vector<StoredLogEntry>& entries) {
  for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
    const json* params = find_object(it->notification, "params");
    if (!params) continue;

    const json* device = find_field(*params, "device");
    if (device && !device->is_null()) {
      return *device;
    }
  }
  return std::nullopt;
}

}  // namespace acp
