#ifndef ACP_SESSION_LOG_H
#define ACP_SESSION_LOG_H

#include <string>

namespace acp {

/**
 * 初始化日志系统
 *
 * 日志轮转策略（按启动次数轮转）：
 * - 上次的 acp_session.log 重命名为 acp_session.0.log
 * - 历史日志依次向后移动：acp_session.0.log -> ... -> acp_session.{max_files-1}.log
 * - 最旧的日志被删除
 *
 * @param log_path 日志文件路径（可选，默认 ~/.config/acp-session/log/acp_session.log）
 * @param max_files 保留的历史日志文件数量
 * @param level 日志级别：trace / debug / info / warn / err / critical / off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

}  // namespace acp

#endif  // ACP_SESSION_LOG_H
