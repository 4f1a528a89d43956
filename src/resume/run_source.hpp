#pragma once

#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "core/types.hpp"
#include "snapshot/snapshot_applier.hpp"

namespace acp {

// What the run store knows about one run of a task
struct RunMetadata {
  RunId id;
  TaskId task_id;
  std::optional<std::string> log_url;  // absent: the run never produced a log
  std::string status;
  json environment;

  static RunMetadata from_json(const json& j);
};

// Where runs, their logs and their artifacts are kept. Futures throw on failure.
class RunSource {
 public:
  virtual ~RunSource() = default;

  virtual std::future<RunMetadata> fetch_run(const TaskId& task_id, const RunId& run_id) = 0;

  // Raw newline-delimited log content behind `run.log_url`
  virtual std::future<std::string> fetch_log(const RunMetadata& run) = 0;

  // Artifacts (snapshot archives) uploaded by one run
  virtual std::shared_ptr<ArtifactFetcher> artifacts(const TaskId& task_id, const RunId& run_id) = 0;
};

// Runs kept on disk:
//   <runs_dir>/<task>/<run>.json       run metadata
//   log_url / archive refs             "file://" URLs or paths relative to <runs_dir>/<task>
class LocalRunSource : public RunSource {
 public:
  explicit LocalRunSource(std::filesystem::path runs_dir);

  std::future<RunMetadata> fetch_run(const TaskId& task_id, const RunId& run_id) override;

  std::future<std::string> fetch_log(const RunMetadata& run) override;

  std::shared_ptr<ArtifactFetcher> artifacts(const TaskId& task_id, const RunId& run_id) override;

  // Resolve a log or artifact reference of `task_id` to a file
  std::filesystem::path resolve(const TaskId& task_id, const std::string& ref) const;

 private:
  std::filesystem::path runs_dir_;
};

}  // namespace acp
