#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "replay/stored_log.hpp"

namespace acp {

enum class FileStatus { Added, Modified, Deleted };

std::string to_string(FileStatus status);

std::optional<FileStatus> file_status_from_string(const std::string& str);

struct FileChange {
  std::string path;  // relative to the repository root
  FileStatus status = FileStatus::Modified;
};

// Working-tree state recorded during a run
struct TreeSnapshotEvent {
  std::string tree_hash;
  std::optional<std::string> base_commit;
  std::optional<std::string> archive_url;  // absent: the snapshot cannot be restored
  std::vector<FileChange> changes;
  std::string timestamp;
  bool interrupted = false;
  std::optional<json> device;

  bool restorable() const {
    return archive_url.has_value() && !archive_url->empty();
  }

  // Lenient: unknown change statuses and malformed optional fields are dropped
  static std::optional<TreeSnapshotEvent> from_json(const json& params);

  json to_json() const;
};

// Most recent snapshot notification with a non-empty tree hash, whether or not
// it carries an archive.
std::optional<TreeSnapshotEvent> find_latest_snapshot(const std::vector<StoredLogEntry>& entries);

// `params.device` of the last notification that has one
std::optional<json> find_last_device(const std::vector<StoredLogEntry>& entries);

}  // namespace acp
