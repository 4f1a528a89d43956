// Library initialization
#include "acp.hpp"

#include "core/version.hpp"
#include "log/log.h"

namespace acp {

void init(const Config& config) {
  // 初始化日志系统
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);
}

std::string version() {
  return ACP_SESSION_VERSION_STRING;
}

}  // namespace acp
