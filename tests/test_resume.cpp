#include <gtest/gtest.h>

#include <stdexcept>

#include "resume/resume_orchestrator.hpp"
#include "resume/run_source.hpp"
#include "test_util.hpp"

using namespace acp;
namespace fs = std::filesystem;

namespace {

template <typename T>
std::future<T> ready(T value) {
  std::promise<T> promise;
  promise.set_value(std::move(value));
  return promise.get_future();
}

template <typename T>
std::future<T> failed(const std::string& message) {
  std::promise<T> promise;
  promise.set_exception(std::make_exception_ptr(std::runtime_error(message)));
  return promise.get_future();
}

class FakeRunSource : public RunSource {
 public:
  std::optional<std::string> log_url = "log.jsonl";
  std::string log;
  bool fail_run = false;
  bool fail_log = false;
  int run_fetches = 0;
  int log_fetches = 0;

  std::future<RunMetadata> fetch_run(const TaskId& task_id, const RunId& run_id) override {
    ++run_fetches;
    if (fail_run) return failed<RunMetadata>("run lookup failed");
    RunMetadata run;
    run.id = run_id;
    run.task_id = task_id;
    run.log_url = log_url;
    return ready(run);
  }

  std::future<std::string> fetch_log(const RunMetadata&) override {
    ++log_fetches;
    if (fail_log) return failed<std::string>("log unavailable");
    return ready(log);
  }

  std::shared_ptr<ArtifactFetcher> artifacts(const TaskId&, const RunId&) override {
    return nullptr;
  }
};

class FakeApplier : public SnapshotApplier {
 public:
  bool fail = false;
  bool fail_unknown = false;
  std::vector<std::string> applied;

  std::future<ApplyResult> apply(const TreeSnapshotEvent& snapshot) override {
    if (fail) return failed<ApplyResult>("dirty tree");
    if (fail_unknown) {
      std::promise<ApplyResult> promise;
      promise.set_exception(std::make_exception_ptr(42));
      return promise.get_future();
    }
    applied.push_back(snapshot.tree_hash);
    return ready(ApplyResult{snapshot.tree_hash, false});
  }

  std::optional<std::string> last_tree_hash() const override {
    return applied.empty() ? std::nullopt : std::optional<std::string>(applied.back());
  }
};

std::string log_line(const json& notification) {
  return json{{"type", "notification"}, {"timestamp", "2024-01-15T10:30:00Z"}, {"notification", notification}}.dump() + "\n";
}

std::string update_line(const json& update) {
  return log_line({{"jsonrpc", "2.0"}, {"method", "session/update"}, {"params", {{"sessionId", "s"}, {"update", update}}}});
}

std::string conversation_log() {
  return update_line({{"sessionUpdate", "user_message"}, {"content", {{"type", "text"}, {"text", "fix the bug"}}}}) +
         update_line({{"sessionUpdate", "agent_message_chunk"}, {"content", {{"type", "text"}, {"text", "Done"}}}});
}

std::string snapshot_line(const std::string& hash, bool archive, bool interrupted = false) {
  json params = {{"treeHash", hash}, {"interrupted", interrupted}, {"changes", json::array({json{{"path", "a.txt"}, {"status", "M"}}})}};
  if (archive) params["archiveUrl"] = hash + ".tar.gz";
  return log_line({{"jsonrpc", "2.0"}, {"method", "_posthog/tree_snapshot"}, {"params", params}});
}

ResumeInput input() {
  return ResumeInput{"task-1", "run-1", fs::temp_directory_path(), {}};
}

}  // namespace

class ResumeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    source_ = std::make_shared<FakeRunSource>();
    applier_ = std::make_shared<FakeApplier>();
  }

  saga::SagaResult<ResumeOutput> resume() {
    return ResumeOrchestrator(source_, applier_).run(input());
  }

  std::shared_ptr<FakeRunSource> source_;
  std::shared_ptr<FakeApplier> applier_;
};

TEST_F(ResumeTest, NoLogLocationIsEmptyResult) {
  source_->log_url.reset();

  auto result = resume();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->log_entry_count, 0u);
  EXPECT_TRUE(result.value->conversation.empty());
  EXPECT_FALSE(result.value->latest_snapshot.has_value());
  EXPECT_EQ(source_->log_fetches, 0);
}

TEST_F(ResumeTest, EmptyLogIsEmptyResult) {
  auto result = resume();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->log_entry_count, 0u);
  EXPECT_EQ(source_->log_fetches, 1);
}

TEST_F(ResumeTest, UnreadableLogIsEmptyResult) {
  source_->log = "garbage\n{also garbage\n";

  auto result = resume();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->log_entry_count, 0u);
}

TEST_F(ResumeTest, RebuildsConversation) {
  source_->log = conversation_log() + log_line({{"method", "_posthog/status"}, {"params", {{"device", {{"type", "cloud"}}}}}});

  auto result = resume();
  ASSERT_TRUE(result.ok());

  const auto& output = *result.value;
  EXPECT_EQ(output.log_entry_count, 3u);
  ASSERT_EQ(output.conversation.size(), 2u);
  EXPECT_EQ(output.conversation[0].role, Role::User);
  EXPECT_EQ(output.conversation[1].content[0]["text"], "Done");
  ASSERT_TRUE(output.last_device.has_value());
  EXPECT_EQ((*output.last_device)["type"], "cloud");
  EXPECT_FALSE(output.latest_snapshot.has_value());
  EXPECT_FALSE(output.snapshot_applied);
}

TEST_F(ResumeTest, AppliesLatestSnapshot) {
  source_->log = snapshot_line("old", true) + conversation_log() + snapshot_line("new", true, true);

  auto result = resume();
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.value->snapshot_applied);
  EXPECT_TRUE(result.value->interrupted);
  EXPECT_EQ(result.value->latest_snapshot->tree_hash, "new");
  EXPECT_EQ(applier_->applied, (std::vector<std::string>{"new"}));
}

TEST_F(ResumeTest, SnapshotWithoutArchiveIsNotApplied) {
  source_->log = conversation_log() + snapshot_line("h", false);

  auto result = resume();
  ASSERT_TRUE(result.ok());
  ASSERT_TRUE(result.value->latest_snapshot.has_value());
  EXPECT_FALSE(result.value->snapshot_applied);
  EXPECT_TRUE(applier_->applied.empty());
}

TEST_F(ResumeTest, SnapshotFailureIsNotFatal) {
  source_->log = conversation_log() + snapshot_line("h", true);
  applier_->fail = true;

  auto result = resume();
  ASSERT_TRUE(result.ok());
  EXPECT_FALSE(result.value->snapshot_applied);
  EXPECT_TRUE(result.value->latest_snapshot.has_value());
  EXPECT_EQ(result.value->conversation.size(), 2u);
}

TEST_F(ResumeTest, UnknownSnapshotErrorIsNotFatal) {
  source_->log = conversation_log() + snapshot_line("h", true);
  applier_->fail_unknown = true;

  auto result = resume();
  ASSERT_TRUE(result.ok());
  EXPECT_FALSE(result.value->snapshot_applied);
  EXPECT_EQ(result.value->conversation.size(), 2u);
}

TEST_F(ResumeTest, RunLookupFailurePropagates) {
  source_->fail_run = true;

  auto result = resume();
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.failed_step, "fetch_run");
  EXPECT_EQ(result.error, "run lookup failed");
  EXPECT_EQ(source_->log_fetches, 0);
}

TEST_F(ResumeTest, LogFetchFailurePropagates) {
  source_->fail_log = true;

  auto result = resume();
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.failed_step, "fetch_logs");
  EXPECT_EQ(result.error, "log unavailable");
}

TEST_F(ResumeTest, RunAsync) {
  source_->log = conversation_log();

  ResumeOrchestrator orchestrator(source_, applier_);
  auto result = orchestrator.run_async(input()).get();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->conversation.size(), 2u);
}

TEST_F(ResumeTest, OutputJson) {
  source_->log = conversation_log() + snapshot_line("h", true);

  json j = resume().value->to_json();
  EXPECT_EQ(j["logEntryCount"], 3);
  EXPECT_EQ(j["snapshotApplied"], true);
  EXPECT_EQ(j["latestSnapshot"]["treeHash"], "h");
  EXPECT_TRUE(j["lastDevice"].is_null());
  EXPECT_EQ(j["conversation"][0]["role"], "user");
}

TEST(ResumeOrchestratorTest, RequiresSource) {
  EXPECT_THROW({ ResumeOrchestrator orchestrator(nullptr); }, std::invalid_argument);
}

// --- LocalRunSource ---

class LocalRunSourceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    runs_dir_ = test::make_temp_dir("acp_runs_");
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(runs_dir_, ec);
  }

  fs::path runs_dir_;
};

TEST_F(LocalRunSourceTest, FetchesRunAndLog) {
  test::write_file(runs_dir_ / "task-1" / "run-1.json", json{{"status", "completed"}, {"log_url", "logs/run-1.jsonl"}}.dump());
  test::write_file(runs_dir_ / "task-1" / "logs" / "run-1.jsonl", conversation_log());

  LocalRunSource source(runs_dir_);
  auto run = source.fetch_run("task-1", "run-1").get();
  EXPECT_EQ(run.id, "run-1");
  EXPECT_EQ(run.task_id, "task-1");
  EXPECT_EQ(run.status, "completed");
  ASSERT_TRUE(run.log_url.has_value());

  EXPECT_EQ(source.fetch_log(run).get(), conversation_log());
}

TEST_F(LocalRunSourceTest, MissingRunThrows) {
  LocalRunSource source(runs_dir_);
  auto future = source.fetch_run("task-1", "nope");
  EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(LocalRunSourceTest, EmptyLogUrlMeansNoLog) {
  test::write_file(runs_dir_ / "task-1" / "run-2.json", json{{"id", "run-2"}, {"log_url", ""}}.dump());

  LocalRunSource source(runs_dir_);
  auto run = source.fetch_run("task-1", "run-2").get();
  EXPECT_FALSE(run.log_url.has_value());
  EXPECT_THROW(source.fetch_log(run), std::invalid_argument);
}

TEST_F(LocalRunSourceTest, ResolvesReferences) {
  LocalRunSource source(runs_dir_);
  EXPECT_EQ(source.resolve("t", "file:///var/log/x.jsonl"), fs::path("/var/log/x.jsonl"));
  EXPECT_EQ(source.resolve("t", "/abs/a.tar.gz"), fs::path("/abs/a.tar.gz"));
  EXPECT_EQ(source.resolve("t", "artifacts/a.tar.gz"), runs_dir_ / "t" / "artifacts/a.tar.gz");
}

TEST_F(LocalRunSourceTest, ArtifactsReadFiles) {
  test::write_file(runs_dir_ / "task-1" / "trees" / "h.tar.gz", "archive-bytes");

  LocalRunSource source(runs_dir_);
  auto fetcher = source.artifacts("task-1", "run-1");
  ASSERT_NE(fetcher, nullptr);
  EXPECT_EQ(fetcher->download("trees/h.tar.gz").get(), "archive-bytes");
  EXPECT_THROW(fetcher->download("trees/missing.tar.gz").get(), std::runtime_error);
}

TEST(RunMetadataTest, FromJson) {
  auto run = RunMetadata::from_json({{"id", "r"}, {"task", "t"}, {"status", "failed"}, {"environment", "cloud"}, {"log_url", "https://x/log"}});
  EXPECT_EQ(run.id, "r");
  EXPECT_EQ(run.task_id, "t");
  EXPECT_EQ(run.status, "failed");
  EXPECT_EQ(run.environment, "cloud");
  EXPECT_EQ(run.log_url, "https://x/log");

  auto legacy = RunMetadata::from_json({{"task_id", "t2"}, {"log_url", nullptr}});
  EXPECT_EQ(legacy.task_id, "t2");
  EXPECT_FALSE(legacy.log_url.has_value());
}
