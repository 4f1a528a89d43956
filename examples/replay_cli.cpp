// Rebuild a session from a stored log, or resume a run
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "acp/acp.hpp"
#include "spdlog/cfg/env.h"
#include "spdlog/spdlog.h"

using namespace acp;

static void print_usage(const char* prog) {
  std::cerr << "acp_replay v" << acp::version() << "\n\n"
            << "Usage:\n"
            << "  " << prog << " live <log.jsonl>\n"
            << "  " << prog << " resume <task> <run> [--repo DIR] [--runs-dir DIR | --api URL]\n\n"
            << "Options:\n"
            << "  --log-level LEVEL   trace, debug, info, warn, error, off\n"
            << "  --log-file PATH     log file (default ~/.config/acp-session/log/acp_session.log)\n";
}

static int run_live(const std::string& path, const Config& config) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "Error: cannot open " << path << "\n";
    return 1;
  }
  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

  auto entries = parse_log(content);
  auto summary = summarize_log(entries);

  BuildOptions options;
  options.prompt_pending = !config.replay.finalize_pending_turns;
  BuildResult result = build_conversation(to_session_events(entries), options);

  json pending = json::object();
  for (const auto& [id, permission] : find_pending_permissions(entries)) {
    pending[id] = {{"request", permission.request}, {"receivedAt", permission.received_at_ms}};
  }

  json out = {
      {"sessionId", summary.session_id ? json(*summary.session_id) : json(nullptr)},
      {"adapter", summary.adapter ? json(*summary.adapter) : json(nullptr)},
      {"model", summary.model ? json(*summary.model) : json(nullptr)},
      {"entries", entries.size()},
      {"turns", result.turns().size()},
      {"pendingPermissions", pending},
      {"conversation", to_json(result)},
  };
  std::cout << out.dump(2) << "\n";
  return 0;
}

static int run_resume(const ResumeInput& input, const Config& config) {
  std::shared_ptr<RunSource> source;
  if (!config.api.base_url.empty()) {
    source = std::make_shared<HttpRunSource>(config.api);
  } else if (!config.local.runs_dir.empty()) {
    source = std::make_shared<LocalRunSource>(config.local.runs_dir);
  } else {
    std::cerr << "Error: no run source. Pass --runs-dir or --api, or set ACP_RUNS_DIR or ACP_API_URL\n";
    return 1;
  }

  ResumeOrchestrator orchestrator(source);
  auto result = orchestrator.run(input);
  if (!result.ok()) {
    std::cerr << "Error: resume failed at " << result.failed_step.value_or("?") << ": " << result.error.value_or("") << "\n";
    return 1;
  }

  const ResumeOutput& output = *result.value;
  if (output.latest_snapshot && !output.snapshot_applied) {
    std::cerr << "Warning: working tree was not restored from snapshot " << output.latest_snapshot->tree_hash << "\n";
  }
  std::cout << output.to_json().dump(2) << "\n";
  return 0;
}

int main(int argc, char* argv[]) {
  spdlog::cfg::load_env_levels();

  Config config = Config::from_env();

  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument("missing value for " + arg);
      }
      return argv[++i];
    };

    try {
      if (arg == "--repo") {
        config.repository_path = next();
      } else if (arg == "--runs-dir") {
        config.local.runs_dir = next();
        config.api.base_url.clear();
      } else if (arg == "--api") {
        config.api.base_url = next();
      } else if (arg == "--log-level") {
        config.log_level = next();
      } else if (arg == "--log-file") {
        config.log_file = next();
      } else if (arg == "-h" || arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg.starts_with("--")) {
        std::cerr << "Error: unknown option " << arg << "\n";
        print_usage(argv[0]);
        return 1;
      } else {
        positional.push_back(arg);
      }
    } catch (const std::invalid_argument& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }

  acp::init(config);

  if (positional.size() == 2 && positional[0] == "live") {
    return run_live(positional[1], config);
  }

  if (positional.size() == 3 && positional[0] == "resume") {
    ResumeInput input;
    input.task_id = positional[1];
    input.run_id = positional[2];
    input.repository_path = config.repository_path;
    input.tmp_dir = config.snapshot_tmp_path();
    return run_resume(input, config);
  }

  print_usage(argv[0]);
  return 1;
}
