#pragma once

#include <string_view>

namespace acp::methods {

// Standard session protocol
inline constexpr std::string_view kSessionPrompt = "session/prompt";
inline constexpr std::string_view kSessionUpdate = "session/update";
inline constexpr std::string_view kRequestPermission = "session/request_permission";

// Extension notifications. The SDK re-emits extension methods with one extra
// leading underscore, so both spellings name the same event.
inline constexpr std::string_view kConsole = "_posthog/console";
inline constexpr std::string_view kTreeSnapshot = "_posthog/tree_snapshot";
inline constexpr std::string_view kSdkSession = "_posthog/sdk_session";
inline constexpr std::string_view kCompactBoundary = "_posthog/compact_boundary";
inline constexpr std::string_view kStatus = "_posthog/status";
inline constexpr std::string_view kTaskNotification = "_posthog/task_notification";
inline constexpr std::string_view kUserShellExecute = "_array/user_shell_execute";

// True when `method` is `name` or `name` with one extra leading underscore
inline bool is_extension(std::string_view method, std::string_view name) {
  if (method == name) return true;
  return method.size() == name.size() + 1 && method.front() == '_' && method.substr(1) == name;
}

}  // namespace acp::methods
