#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>

#include "core/config.hpp"
#include "test_util.hpp"

using namespace acp;

namespace fs = std::filesystem;

// --- ConfigTest ---

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = test::make_temp_dir("acp_config_");
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  fs::path test_dir_;
};

TEST_F(ConfigTest, Defaults) {
  Config config;

  EXPECT_EQ(config.log_level, "info");
  EXPECT_FALSE(config.log_file.has_value());
  EXPECT_EQ(config.api.timeout_seconds, 30);
  EXPECT_FALSE(config.replay.finalize_pending_turns);
  EXPECT_EQ(config.repository_path, fs::current_path());
}

TEST_F(ConfigTest, SaveAndLoad) {
  Config config;
  config.repository_path = "/work/repo";
  config.api.base_url = "https://api.example.com";
  config.api.api_key = "secret";
  config.api.timeout_seconds = 5;
  config.local.runs_dir = "/data/runs";
  config.replay.finalize_pending_turns = true;
  config.replay.snapshot_tmp_dir = "/tmp/snapshots";
  config.log_level = "debug";
  config.log_file = "/tmp/acp.log";

  auto path = test_dir_ / "config.json";
  config.save(path);

  auto loaded = Config::load(path);
  EXPECT_EQ(loaded.repository_path, fs::path("/work/repo"));
  EXPECT_EQ(loaded.api.base_url, "https://api.example.com");
  EXPECT_EQ(loaded.api.api_key, "secret");
  EXPECT_EQ(loaded.api.timeout_seconds, 5);
  EXPECT_EQ(loaded.local.runs_dir, fs::path("/data/runs"));
  EXPECT_TRUE(loaded.replay.finalize_pending_turns);
  EXPECT_EQ(loaded.replay.snapshot_tmp_dir, fs::path("/tmp/snapshots"));
  EXPECT_EQ(loaded.log_level, "debug");
  ASSERT_TRUE(loaded.log_file.has_value());
  EXPECT_EQ(*loaded.log_file, fs::path("/tmp/acp.log"));
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
  auto path = test_dir_ / "partial.json";
  test::write_file(path, R"({"api": {"base_url": "http://localhost:8000"}})");

  auto config = Config::load(path);
  EXPECT_EQ(config.api.base_url, "http://localhost:8000");
  EXPECT_EQ(config.api.timeout_seconds, 30);
  EXPECT_EQ(config.log_level, "info");
}

TEST_F(ConfigTest, MissingOrInvalidFileGivesDefaults) {
  auto missing = Config::load(test_dir_ / "nope.json");
  EXPECT_EQ(missing.log_level, "info");

  auto path = test_dir_ / "broken.json";
  test::write_file(path, "{ not json");
  auto broken = Config::load(path);
  EXPECT_EQ(broken.log_level, "info");
  EXPECT_TRUE(broken.api.base_url.empty());
}

TEST_F(ConfigTest, SnapshotTmpPath) {
  Config config;
  config.repository_path = "/work/repo";
  EXPECT_EQ(config.snapshot_tmp_path(), fs::path("/work/repo/.acp-session/tmp"));

  config.replay.snapshot_tmp_dir = "/var/tmp/acp";
  EXPECT_EQ(config.snapshot_tmp_path(), fs::path("/var/tmp/acp"));
}

TEST_F(ConfigTest, FromEnv) {
  ::setenv("ACP_API_URL", "https://env.example.com", 1);
  ::setenv("ACP_API_KEY", "env-key", 1);
  ::setenv("ACP_RUNS_DIR", "/env/runs", 1);
  ::setenv("ACP_REPOSITORY", "/env/repo", 1);
  ::setenv("ACP_LOG_LEVEL", "trace", 1);

  auto config = Config::from_env();

  ::unsetenv("ACP_API_URL");
  ::unsetenv("ACP_API_KEY");
  ::unsetenv("ACP_RUNS_DIR");
  ::unsetenv("ACP_REPOSITORY");
  ::unsetenv("ACP_LOG_LEVEL");

  EXPECT_EQ(config.api.base_url, "https://env.example.com");
  EXPECT_EQ(config.api.api_key, "env-key");
  EXPECT_EQ(config.local.runs_dir, fs::path("/env/runs"));
  EXPECT_EQ(config.repository_path, fs::path("/env/repo"));
  EXPECT_EQ(config.log_level, "trace");
}

// --- ConfigPathsTest ---

TEST(ConfigPathsTest, HomeDir) {
  auto home = config_paths::home_dir();

  EXPECT_FALSE(home.empty());
  EXPECT_TRUE(fs::exists(home));
}

TEST(ConfigPathsTest, ConfigDir) {
  auto config_dir = config_paths::config_dir();

  // 配置目录应以 "acp-session" 结尾，父目录为 ".config"
  EXPECT_EQ(config_dir.filename(), "acp-session");
  EXPECT_EQ(config_dir.parent_path().filename(), ".config");
  EXPECT_EQ(config_paths::default_config_file().filename(), "config.json");
}

TEST(ConfigPathsTest, FindGitRoot) {
  fs::path root = test::make_temp_dir("acp_gitroot_");
  fs::create_directories(root / ".git");
  fs::create_directories(root / "a" / "b");

  auto found = config_paths::find_git_root(root / "a" / "b");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, root);

  std::error_code ec;
  fs::remove_all(root, ec);
}
