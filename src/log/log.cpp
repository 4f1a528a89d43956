#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "core/config.hpp"

namespace acp {

namespace {

namespace fs = std::filesystem;

fs::path numbered_log(const fs::path& log_dir, const std::string& stem, size_t index) {
  return log_dir / (stem + "." + std::to_string(index) + ".log");
}

// 每次启动时轮转日志文件
// 策略：acp_session.log -> acp_session.0.log -> ...（最旧的被删除）
void rotate_logs_on_startup(const fs::path& current_log, size_t max_files) {
  std::error_code ec;
  if (max_files == 0 || !fs::exists(current_log, ec)) {
    return;
  }

  const fs::path log_dir = current_log.parent_path();
  const std::string stem = current_log.stem().string();

  fs::remove(numbered_log(log_dir, stem, max_files - 1), ec);

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    auto old_name = numbered_log(log_dir, stem, static_cast<size_t>(i));
    if (fs::exists(old_name, ec)) {
      fs::rename(old_name, numbered_log(log_dir, stem, static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(current_log, numbered_log(log_dir, stem, 0), ec);
  if (ec) {
    std::cerr << "Failed to rotate " << current_log.string() << ": " << ec.message() << "\n";
  }
}

spdlog::level::level_enum level_from_string(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "warn") return spdlog::level::warn;
  if (level == "err" || level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "acp_session.log" : fs::path(log_path);

    // 确保日志目录存在
    std::error_code ec;
    if (actual_path.has_parent_path()) {
      fs::create_directories(actual_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        return;
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("acp_session", file_sink);

    logger->set_level(level_from_string(level));

    // [时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // 每条日志都立即刷新
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("acp_session");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== acp-session started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

}  // namespace acp
