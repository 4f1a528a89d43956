#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "types.hpp"

namespace acp {

// Remote run/artifact API
struct ApiConfig {
  std::string base_url;
  std::string api_key;
  int timeout_seconds = 30;
};

// Run metadata and logs kept on the local filesystem
struct LocalRunsConfig {
  std::filesystem::path runs_dir;
};

// Reconstruction behaviour
struct ReplayConfig {
  // Close turns still waiting for a prompt response as "cancelled"
  bool finalize_pending_turns = false;

  // Where downloaded snapshot archives are staged (relative to the repository when not absolute)
  std::filesystem::path snapshot_tmp_dir = ".acp-session/tmp";
};

// Application configuration
struct Config {
  // Working tree that snapshots are restored into
  std::filesystem::path repository_path = std::filesystem::current_path();

  ApiConfig api;
  LocalRunsConfig local;
  ReplayConfig replay;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: ACP_API_URL, ACP_API_KEY, ACP_RUNS_DIR, ACP_REPOSITORY, ACP_LOG_LEVEL
  static Config from_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  // Absolute staging directory for snapshot archives
  std::filesystem::path snapshot_tmp_path() const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();

// Find the git worktree root from a starting directory (returns nullopt if not in a git repo)
std::optional<std::filesystem::path> find_git_root(const std::filesystem::path& start_dir);
}  // namespace config_paths

}  // namespace acp
