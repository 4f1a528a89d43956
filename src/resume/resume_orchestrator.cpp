#include "resume/resume_orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace acp {

json ResumeOutput::to_json() const {
  json turns = json::array();
  for (const auto& turn : conversation) {
    turns.push_back(acp::to_json(turn));
  }

  json j = {
      {"conversation", turns},
      {"latestSnapshot", latest_snapshot ? latest_snapshot->to_json() : json(nullptr)},
      {"snapshotApplied", snapshot_applied},
      {"interrupted", interrupted},
      {"lastDevice", last_device ? *last_device : json(nullptr)},
      {"logEntryCount", log_entry_count},
  };
  return j;
}

ResumeOrchestrator::ResumeOrchestrator(std::shared_ptr<RunSource> source, std::shared_ptr<SnapshotApplier> applier)
    : source_(std::move(source)), applier_(std::move(applier)) {
  if (!source_) {
    throw std::invalid_argument("ResumeOrchestrator requires a run source");
  }
}

std::shared_ptr<SnapshotApplier> ResumeOrchestrator::applier_for(const ResumeInput& input) const {
  if (applier_) {
    return applier_;
  }
  return std::make_shared<GitSnapshotApplier>(input.repository_path, source_->artifacts(input.task_id, input.run_id), input.tmp_dir);
}

saga::SagaResult<ResumeOutput> ResumeOrchestrator::run(const ResumeInput& input) {
  spdlog::info("[Resume] Resuming task {} run {}", input.task_id, input.run_id);

  ResumeOutput output;
  bool empty = false;
  RunMetadata run;
  std::vector<StoredLogEntry> entries;

  std::vector<saga::Step> steps;

  steps.push_back(saga::read_only("fetch_run", [&]() {
    run = source_->fetch_run(input.task_id, input.run_id).get();
    if (!run.log_url) {
      spdlog::info("[Resume] Run {} has no log, nothing to resume", input.run_id);
      empty = true;
      return saga::Flow::Finish;
    }
    return saga::Flow::Continue;
  }));

  steps.push_back(saga::read_only("fetch_logs", [&]() {
    std::string content = source_->fetch_log(run).get();
    if (content.empty()) {
      spdlog::info("[Resume] Log of run {} is empty", input.run_id);
      empty = true;
      return saga::Flow::Finish;
    }
    entries = parse_log(content);
    if (entries.empty()) {
      spdlog::info("[Resume] Log of run {} has no readable entries", input.run_id);
      empty = true;
      return saga::Flow::Finish;
    }
    spdlog::debug("[Resume] Read {} log entries", entries.size());
    return saga::Flow::Continue;
  }));

  steps.push_back(saga::read_only("find_snapshot", [&]() {
    output.latest_snapshot = find_latest_snapshot(entries);
    if (output.latest_snapshot) {
      output.interrupted = output.latest_snapshot->interrupted;
      spdlog::debug("[Resume] Latest snapshot: {}", output.latest_snapshot->tree_hash);
    }
    return saga::Flow::Continue;
  }));

  steps.push_back(saga::compensating(
      "apply_snapshot",
      [&]() {
        const auto& snapshot = output.latest_snapshot;
        if (!snapshot) {
          return saga::Flow::Continue;
        }
        if (!snapshot->restorable()) {
          spdlog::warn("[Resume] Snapshot {} has no archive URL, files cannot be restored ({} change(s))",
                       snapshot->tree_hash, snapshot->changes.size());
          return saga::Flow::Continue;
        }
        try {
          ApplyResult applied = applier_for(input)->apply(*snapshot).get();
          output.snapshot_applied = true;
          spdlog::info("[Resume] Restored tree {}{}", applied.tree_hash, applied.checkout_performed ? " (base checked out)" : "");
        } catch (const std::exception& e) {
          spdlog::warn("[Resume] Failed to apply snapshot {}: {}", snapshot->tree_hash, e.what());
        } catch (...) {
          spdlog::warn("[Resume] Failed to apply snapshot {}: unknown error", snapshot->tree_hash);
        }
        return saga::Flow::Continue;
      },
      [&]() {
        // The applier rolls back its own partial work
        spdlog::debug("[Resume] Nothing to undo for apply_snapshot");
      }));

  steps.push_back(saga::read_only("rebuild_conversation", [&]() {
    output.conversation = rebuild_conversation(entries);
    return saga::Flow::Continue;
  }));

  steps.push_back(saga::read_only("find_device", [&]() {
    output.last_device = find_last_device(entries);
    return saga::Flow::Continue;
  }));

  saga::Executor executor("resume");
  saga::Outcome outcome = executor.run(steps);

  if (!outcome.success) {
    spdlog::error("[Resume] Failed at {}: {}", outcome.failed_step, outcome.error);
    return saga::SagaResult<ResumeOutput>::failure(outcome.error, outcome.failed_step);
  }
  if (empty) {
    return saga::SagaResult<ResumeOutput>::success(ResumeOutput::empty());
  }

  output.log_entry_count = entries.size();
  spdlog::info("[Resume] Rebuilt {} turn(s) from {} entries", output.conversation.size(), output.log_entry_count);
  return saga::SagaResult<ResumeOutput>::success(std::move(output));
}

std::future<saga::SagaResult<ResumeOutput>> ResumeOrchestrator::run_async(ResumeInput input) {
  return std::async(std::launch::async, [this, input = std::move(input)]() {
    return run(input);
  });
}

}  // namespace acp
