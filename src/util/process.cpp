#include "util/process.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace acp::util {

namespace {

std::string join_args(const std::vector<std::string>& argv) {
  std::string joined;
  for (const auto& arg : argv) {
    if (!joined.empty()) joined += ' ';
    joined += arg;
  }
  return joined;
}

// Read whatever is available on a non-blocking fd. Returns false once the fd hit EOF.
bool drain(int fd, std::string& target) {
  std::array<char, 4096> buffer;
  while (true) {
    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      target.append(buffer.data(), static_cast<size_t>(n));
      continue;
    }
    if (n == 0) return false;
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

}  // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
  if (argv.empty()) {
    throw std::invalid_argument("run_process: empty command");
  }

  spdlog::debug("[Process] Executing: {} (workdir=\"{}\")", join_args(argv), options.workdir.string());

  int out_pipe[2];
  int err_pipe[2];
  if (pipe(out_pipe) == -1) {
    throw std::runtime_error("Failed to create pipe: " + std::string(strerror(errno)));
  }
  if (pipe(err_pipe) == -1) {
    int saved = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    throw std::runtime_error("Failed to create pipe: " + std::string(strerror(saved)));
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);
  const std::string workdir = options.workdir.string();

  pid_t pid = fork();
  if (pid == -1) {
    int saved = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    throw std::runtime_error("Failed to fork process: " + std::string(strerror(saved)));
  }

  if (pid == 0) {
    // ---- Child process ----
    close(out_pipe[0]);
    close(err_pipe[0]);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[1]);
    close(err_pipe[1]);

    if (!workdir.empty() && chdir(workdir.c_str()) != 0) {
      _exit(127);
    }

    execvp(args[0], args.data());
    _exit(127);  // exec failed
  }

  // ---- Parent process ----
  close(out_pipe[1]);
  close(err_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, fcntl(out_pipe[0], F_GETFL, 0) | O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, fcntl(err_pipe[0], F_GETFL, 0) | O_NONBLOCK);

  ProcessResult result;
  bool out_open = true;
  bool err_open = true;
  bool reaped = false;
  auto start_time = std::chrono::steady_clock::now();

  while (out_open || err_open || !reaped) {
    if (std::chrono::steady_clock::now() - start_time >= options.timeout) {
      result.timed_out = true;
      if (!reaped) {
        // Graceful termination first, then force
        kill(pid, SIGTERM);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (waitpid(pid, nullptr, WNOHANG) == 0) {
          kill(pid, SIGKILL);
          waitpid(pid, nullptr, 0);
        }
        reaped = true;
      }
      result.exit_code = 124;  // same as GNU timeout
      break;
    }

    size_t before = result.out.size() + result.err.size();
    if (out_open) out_open = drain(out_pipe[0], result.out);
    if (err_open) err_open = drain(err_pipe[0], result.err);

    if (!reaped) {
      int status = 0;
      pid_t ret = waitpid(pid, &status, WNOHANG);
      if (ret == pid) {
        reaped = true;
        result.exit_code = decode_status(status);
      } else if (ret == -1) {
        reaped = true;
      }
    }

    // Child gone: whatever is still buffered in the pipes is picked up next round,
    // then both ends report EOF
    if (before == result.out.size() + result.err.size() && (out_open || err_open || !reaped)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  close(out_pipe[0]);
  close(err_pipe[0]);

  if (result.timed_out) {
    spdlog::warn("[Process] {} timed out after {}ms", argv[0], options.timeout.count());
  } else {
    spdlog::debug("[Process] {} exited with code {}", argv[0], result.exit_code);
  }
  return result;
}

std::string check_output(const std::vector<std::string>& argv, const ProcessOptions& options) {
  auto result = run_process(argv, options);
  if (result.timed_out) {
    throw std::runtime_error(join_args(argv) + ": timed out");
  }
  if (result.exit_code != 0) {
    std::string message = result.err.empty() ? result.out : result.err;
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
      message.pop_back();
    }
    throw std::runtime_error(join_args(argv) + " failed (exit " + std::to_string(result.exit_code) + "): " + message);
  }
  return result.out;
}

}  // namespace acp::util
