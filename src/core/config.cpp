#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace acp {

namespace fs = std::filesystem;

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot open {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    if (j.contains("repository_path")) {
      config.repository_path = j["repository_path"].get<std::string>();
    }

    if (j.contains("api")) {
      const auto& api = j["api"];
      config.api.base_url = api.value("base_url", "");
      config.api.api_key = api.value("api_key", "");
      config.api.timeout_seconds = api.value("timeout_seconds", 30);
    }

    if (j.contains("local")) {
      config.local.runs_dir = j["local"].value("runs_dir", "");
    }

    if (j.contains("replay")) {
      const auto& replay = j["replay"];
      config.replay.finalize_pending_turns = replay.value("finalize_pending_turns", false);
      config.replay.snapshot_tmp_dir = replay.value("snapshot_tmp_dir", ".acp-session/tmp");
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const std::exception& e) {
    spdlog::warn("[Config] Failed to parse {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  if (const char* url = std::getenv("ACP_API_URL")) {
    config.api.base_url = url;
  }
  if (const char* key = std::getenv("ACP_API_KEY")) {
    config.api.api_key = key;
  }
  if (const char* runs_dir = std::getenv("ACP_RUNS_DIR")) {
    config.local.runs_dir = runs_dir;
  }
  if (const char* repo = std::getenv("ACP_REPOSITORY")) {
    config.repository_path = repo;
  }
  if (const char* level = std::getenv("ACP_LOG_LEVEL")) {
    config.log_level = level;
  }

  return config;
}

void Config::save(const fs::path& path) const {
  json j;

  j["repository_path"] = repository_path.string();
  j["api"] = {{"base_url", api.base_url}, {"api_key", api.api_key}, {"timeout_seconds", api.timeout_seconds}};
  j["local"] = {{"runs_dir", local.runs_dir.string()}};
  j["replay"] = {{"finalize_pending_turns", replay.finalize_pending_turns}, {"snapshot_tmp_dir", replay.snapshot_tmp_dir.string()}};

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  // Write to file
  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot write {}", path.string());
    return;
  }
  file << j.dump(2);
}

fs::path Config::snapshot_tmp_path() const {
  if (replay.snapshot_tmp_dir.is_absolute()) {
    return replay.snapshot_tmp_dir;
  }
  return repository_path / replay.snapshot_tmp_dir;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "acp-session";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".acp-session" / "config.json";
}

std::optional<fs::path> find_git_root(const fs::path& start_dir) {
  fs::path current = start_dir;
  while (true) {
    if (fs::exists(current / ".git")) {
      return current;
    }
    auto parent = current.parent_path();
    if (parent == current) break;
    current = parent;
  }
  return std::nullopt;
}

}  // namespace config_paths

}  // namespace acp
