#include "resume/run_source.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <stdexcept>

#include "core/json_util.hpp"

namespace acp {

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

class LocalArtifactFetcher : public ArtifactFetcher {
 public:
  LocalArtifactFetcher(LocalRunSource source, TaskId task_id) : source_(std::move(source)), task_id_(std::move(task_id)) {}

  std::future<std::string> download(const std::string& archive_ref) override {
    fs::path path = source_.resolve(task_id_, archive_ref);
    return std::async(std::launch::async, [path]() {
      return read_file(path);
    });
  }

 private:
  LocalRunSource source_;
  TaskId task_id_;
};

}  // namespace

RunMetadata RunMetadata::from_json(const json& j) {
  RunMetadata run;
  run.id = get_string_or(j, "id", "");
  run.task_id = get_string_or(j, "task", get_string_or(j, "task_id", ""));
  run.status = get_string_or(j, "status", "");

  auto log_url = get_string(j, "log_url");
  if (log_url && !log_url->empty()) {
    run.log_url = *log_url;
  }
  if (const json* env = find_field(j, "environment")) {
    run.environment = *env;
  }
  return run;
}

LocalRunSource::LocalRunSource(fs::path runs_dir) : runs_dir_(std::move(runs_dir)) {}

fs::path LocalRunSource::resolve(const TaskId& task_id, const std::string& ref) const {
  static const std::string kFileScheme = "file://";
  if (ref.starts_with(kFileScheme)) {
    return fs::path(ref.substr(kFileScheme.size()));
  }
  fs::path path(ref);
  if (path.is_absolute()) {
    return path;
  }
  return runs_dir_ / task_id / path;
}

std::future<RunMetadata> LocalRunSource::fetch_run(const TaskId& task_id, const RunId& run_id) {
  fs::path path = runs_dir_ / task_id / (run_id + ".json");
  return std::async(std::launch::async, [path, task_id, run_id]() {
    if (!fs::exists(path)) {
      throw std::runtime_error("Run " + run_id + " of task " + task_id + " not found at " + path.string());
    }

    RunMetadata run = RunMetadata::from_json(json::parse(read_file(path)));
    if (run.id.empty()) run.id = run_id;
    if (run.task_id.empty()) run.task_id = task_id;

    spdlog::debug("[LocalRunSource] Loaded run {} (log: {})", run.id, run.log_url.value_or("<none>"));
    return run;
  });
}

std::future<std::string> LocalRunSource::fetch_log(const RunMetadata& run) {
  if (!run.log_url) {
    throw std::invalid_argument("Run " + run.id + " has no log");
  }
  fs::path path = resolve(run.task_id, *run.log_url);
  return std::async(std::launch::async, [path]() {
    return read_file(path);
  });
}

std::shared_ptr<ArtifactFetcher> LocalRunSource::artifacts(const TaskId& task_id, const RunId&) {
  return std::make_shared<LocalArtifactFetcher>(*this, task_id);
}

}  // namespace acp
