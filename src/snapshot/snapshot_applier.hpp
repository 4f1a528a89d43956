#pragma once

#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "snapshot/tree_snapshot.hpp"

namespace acp {

// Where snapshot archives come from (run artifact storage, local files, ...)
class ArtifactFetcher {
 public:
  virtual ~ArtifactFetcher() = default;

  // Raw bytes of the archive. The future throws when the download fails.
  virtual std::future<std::string> download(const std::string& archive_ref) = 0;
};

struct ApplyResult {
  std::string tree_hash;
  bool checkout_performed = false;
};

class SnapshotApplier {
 public:
  virtual ~SnapshotApplier() = default;

  // Bring the working tree to `snapshot`. On failure the applier undoes its own
  // partial changes and the future throws.
  virtual std::future<ApplyResult> apply(const TreeSnapshotEvent& snapshot) = 0;

  // Tree hash of the last snapshot applied successfully
  virtual std::optional<std::string> last_tree_hash() const = 0;
};

// Restores snapshots into a git working tree:
// checkout the base commit when HEAD differs (clean tree only), extract the
// gzipped tar archive over the tree, delete files the snapshot removed.
// Every step is undone in reverse order if a later one fails.
class GitSnapshotApplier : public SnapshotApplier {
 public:
  GitSnapshotApplier(std::filesystem::path repository, std::shared_ptr<ArtifactFetcher> fetcher, std::filesystem::path tmp_dir = {});

  std::future<ApplyResult> apply(const TreeSnapshotEvent& snapshot) override;

  std::optional<std::string> last_tree_hash() const override;

  void set_last_tree_hash(std::string hash);

  void set_command_timeout(std::chrono::milliseconds timeout) {
    command_timeout_ = timeout;
  }

 private:
  ApplyResult apply_sync(const TreeSnapshotEvent& snapshot);

  std::filesystem::path repository_;
  std::shared_ptr<ArtifactFetcher> fetcher_;
  std::filesystem::path tmp_dir_;
  std::chrono::milliseconds command_timeout_{60000};

  mutable std::mutex mutex_;
  std::optional<std::string> last_tree_hash_;
};

}  // namespace acp
