#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace acp::util {

struct ProcessResult {
  int exit_code = -1;
  std::string out;
  std::string err;
  bool timed_out = false;

  bool ok() const {
    return exit_code == 0 && !timed_out;
  }
};

struct ProcessOptions {
  std::filesystem::path workdir;
  std::chrono::milliseconds timeout{120000};
};

// Run argv[0] (looked up in PATH) without a shell and collect its output.
// Throws std::runtime_error when the process cannot be started at all.
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options = {});

// run_process + throw std::runtime_error with stderr when the exit code is not 0
std::string check_output(const std::vector<std::string>& argv, const ProcessOptions& options = {});

}  // namespace acp::util
