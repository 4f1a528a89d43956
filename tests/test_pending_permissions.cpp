#include <gtest/gtest.h>

#include "replay/pending_permissions.hpp"

using namespace acp;

namespace {

StoredLogEntry permission_request(const std::string& tool_call_id, const std::string& timestamp = "2024-01-15T10:30:00Z") {
  StoredLogEntry entry;
  entry.type = "notification";
  entry.timestamp = timestamp;
  entry.notification = {{"jsonrpc", "2.0"},
                        {"id", 5},
                        {"method", "session/request_permission"},
                        {"params",
                         {{"sessionId", "run-1"},
                          {"toolCall", {{"toolCallId", tool_call_id}, {"title", "Write file"}}},
                          {"options", json::array({json{{"optionId", "allow"}, {"kind", "allow_once"}}})}}}};
  return entry;
}

StoredLogEntry update(json body) {
  StoredLogEntry entry;
  entry.type = "notification";
  entry.notification = {{"method", "session/update"}, {"params", {{"sessionId", "run-1"}, {"update", body}}}};
  return entry;
}

StoredLogEntry status_update(const std::string& tool_call_id, const std::string& status) {
  return update({{"sessionUpdate", "tool_call_update"}, {"toolCallId", tool_call_id}, {"status", status}});
}

}  // namespace

TEST(PendingPermissionsTest, UnansweredRequestIsPending) {
  auto pending = find_pending_permissions({permission_request("tc-1")});

  ASSERT_EQ(pending.size(), 1u);
  const auto& permission = pending.at("tc-1");
  EXPECT_EQ(permission.tool_call_id, "tc-1");
  EXPECT_EQ(permission.task_run_id, "run-1");
  EXPECT_FALSE(permission.request.contains("sessionId"));
  EXPECT_EQ(permission.request["toolCall"]["title"], "Write file");
  EXPECT_EQ(permission.received_at_ms, 1705314600000);
}

TEST(PendingPermissionsTest, SettledStatusesClearRequests) {
  for (const std::string status : {"in_progress", "completed", "failed"}) {
    auto pending = find_pending_permissions({permission_request("tc-1"), status_update("tc-1", status)});
    EXPECT_TRUE(pending.empty()) << status;
  }
}

TEST(PendingPermissionsTest, PendingStatusDoesNotSettle) {
  auto pending = find_pending_permissions({permission_request("tc-1"), status_update("tc-1", "pending")});
  EXPECT_EQ(pending.size(), 1u);
}

TEST(PendingPermissionsTest, SettledAnywhereInLog) {
  // 状态更新在请求之前出现也算已处理
  auto pending = find_pending_permissions({status_update("tc-1", "completed"), permission_request("tc-1")});
  EXPECT_TRUE(pending.empty());
}

TEST(PendingPermissionsTest, StaleOnceAssistantSpeaksAgain) {
  auto assistant = update({{"sessionUpdate", "assistant_message"}, {"content", {{"type", "text"}, {"text", "moving on"}}}});

  EXPECT_TRUE(find_pending_permissions({permission_request("tc-1"), assistant}).empty());
  EXPECT_EQ(find_pending_permissions({assistant, permission_request("tc-1")}).size(), 1u);
}

TEST(PendingPermissionsTest, OtherToolCallsAreIndependent) {
  auto pending = find_pending_permissions({permission_request("tc-1"), permission_request("tc-2"), status_update("tc-1", "completed")});

  ASSERT_EQ(pending.size(), 1u);
  EXPECT_TRUE(pending.count("tc-2"));
}

TEST(PendingPermissionsTest, MissingTimestampUsesNow) {
  auto request = permission_request("tc-1");
  request.timestamp.reset();

  int64_t before = now_ms();
  auto pending = find_pending_permissions({request});
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_GE(pending.at("tc-1").received_at_ms, before);
}
