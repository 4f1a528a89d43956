#pragma once

#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <vector>

#include "replay/log_replayer.hpp"
#include "resume/run_source.hpp"
#include "saga/saga.hpp"
#include "snapshot/snapshot_applier.hpp"
#include "snapshot/tree_snapshot.hpp"

namespace acp {

struct ResumeInput {
  TaskId task_id;
  RunId run_id;
  std::filesystem::path repository_path;
  std::filesystem::path tmp_dir;  // empty: <repository>/.acp-session/tmp
};

// State recovered from a finished or interrupted run
struct ResumeOutput {
  std::vector<ConversationTurn> conversation;
  std::optional<TreeSnapshotEvent> latest_snapshot;
  bool snapshot_applied = false;
  bool interrupted = false;
  std::optional<json> last_device;
  size_t log_entry_count = 0;

  // Nothing to resume: no log, or an empty one
  static ResumeOutput empty() {
    return {};
  }

  json to_json() const;
};

class ResumeOrchestrator {
 public:
  // Without `applier`, a GitSnapshotApplier over the input repository is
  // created per run, fetching archives from `source`.
  explicit ResumeOrchestrator(std::shared_ptr<RunSource> source, std::shared_ptr<SnapshotApplier> applier = nullptr);

  // Fetch, restore and rebuild. Fails only when the run or its log cannot be read;
  // a snapshot that cannot be applied leaves `snapshot_applied` false.
  saga::SagaResult<ResumeOutput> run(const ResumeInput& input);

  std::future<saga::SagaResult<ResumeOutput>> run_async(ResumeInput input);

 private:
  std::shared_ptr<SnapshotApplier> applier_for(const ResumeInput& input) const;

  std::shared_ptr<RunSource> source_;
  std::shared_ptr<SnapshotApplier> applier_;
};

}  // namespace acp
