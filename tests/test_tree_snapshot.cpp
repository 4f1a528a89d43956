#include <gtest/gtest.h>

#include "snapshot/tree_snapshot.hpp"

using namespace acp;

namespace {

StoredLogEntry notification(const std::string& method, json params) {
  StoredLogEntry entry;
  entry.type = "notification";
  entry.notification = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
  entry.direction = Direction::Agent;
  return entry;
}

StoredLogEntry snapshot(const std::string& hash, std::optional<std::string> archive = std::nullopt, const std::string& method = "_posthog/tree_snapshot") {
  json params = {{"treeHash", hash}, {"changes", json::array()}};
  if (archive) params["archiveUrl"] = *archive;
  return notification(method, params);
}

}  // namespace

TEST(TreeSnapshotTest, FromJson) {
  json params = {{"treeHash", "abc123"},
                 {"baseCommit", "deadbeef"},
                 {"archiveUrl", "gs://bucket/abc123.tar.gz"},
                 {"timestamp", "2024-01-15T10:30:00Z"},
                 {"interrupted", true},
                 {"changes", json::array({json{{"path", "src/a.cpp"}, {"status", "M"}}, json{{"path", "old.txt"}, {"status", "D"}},
                                          json{{"path", "new.txt"}, {"status", "A"}}})}};

  auto event = TreeSnapshotEvent::from_json(params);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->tree_hash, "abc123");
  EXPECT_EQ(event->base_commit, "deadbeef");
  EXPECT_TRUE(event->restorable());
  EXPECT_TRUE(event->interrupted);
  ASSERT_EQ(event->changes.size(), 3u);
  EXPECT_EQ(event->changes[1].status, FileStatus::Deleted);
  EXPECT_EQ(event->changes[2].status, FileStatus::Added);
}

TEST(TreeSnapshotTest, FromJsonIsLenient) {
  json params = {{"treeHash", "h"},
                 {"baseCommit", 12},
                 {"changes", json::array({json{{"path", "a"}, {"status", "R"}}, json{{"status", "M"}}, json{{"path", "b"}, {"status", "M"}}})}};

  auto event = TreeSnapshotEvent::from_json(params);
  ASSERT_TRUE(event.has_value());
  EXPECT_FALSE(event->base_commit.has_value());
  EXPECT_FALSE(event->restorable());
  EXPECT_FALSE(event->interrupted);
  ASSERT_EQ(event->changes.size(), 1u);
  EXPECT_EQ(event->changes[0].path, "b");
}

TEST(TreeSnapshotTest, RequiresTreeHash) {
  EXPECT_FALSE(TreeSnapshotEvent::from_json({{"archiveUrl", "x"}}).has_value());
  EXPECT_FALSE(TreeSnapshotEvent::from_json({{"treeHash", ""}}).has_value());
}

TEST(TreeSnapshotTest, EmptyArchiveIsNotRestorable) {
  auto event = TreeSnapshotEvent::from_json({{"treeHash", "h"}, {"archiveUrl", ""}});
  ASSERT_TRUE(event.has_value());
  EXPECT_FALSE(event->restorable());
}

TEST(TreeSnapshotTest, LatestWinsEvenWithoutArchive) {
  // The tree returns to "A", and only the last record was captured on interrupt
  StoredLogEntry last = notification("_posthog/tree_snapshot",
                                     {{"treeHash", "A"},
                                      {"interrupted", true},
                                      {"changes", json::array({json{{"path", "late.txt"}, {"status", "A"}}})}});
  std::vector<StoredLogEntry> entries = {
      snapshot("A"),
      snapshot("B", "archive-b.tar.gz"),
      last,
  };

  auto latest = find_latest_snapshot(entries);
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->tree_hash, "A");
  EXPECT_FALSE(latest->restorable());
  EXPECT_TRUE(latest->interrupted);
  ASSERT_EQ(latest->changes.size(), 1u);
  EXPECT_EQ(latest->changes[0].path, "late.txt");
}

TEST(TreeSnapshotTest, BothMethodSpellingsAreRecognized) {
  std::vector<StoredLogEntry> entries = {
      snapshot("A", "a.tar.gz"),
      snapshot("B", "b.tar.gz", "__posthog/tree_snapshot"),
      notification("_posthog/console", {{"treeHash", "not-a-snapshot"}}),
  };

  auto latest = find_latest_snapshot(entries);
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->tree_hash, "B");
}

TEST(TreeSnapshotTest, InvalidSnapshotsAreSkipped) {
  std::vector<StoredLogEntry> entries = {
      snapshot("good"),
      notification("_posthog/tree_snapshot", {{"changes", json::array()}}),
      notification("_posthog/tree_snapshot", "not an object"),
  };

  auto latest = find_latest_snapshot(entries);
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->tree_hash, "good");
}

TEST(TreeSnapshotTest, NoSnapshot) {
  EXPECT_FALSE(find_latest_snapshot({}).has_value());
  EXPECT_FALSE(find_latest_snapshot({notification("session/update", json::object())}).has_value());
}

TEST(TreeSnapshotTest, ToJson) {
  TreeSnapshotEvent event;
  event.tree_hash = "h";
  event.archive_url = "h.tar.gz";
  event.changes.push_back({"x.txt", FileStatus::Deleted});

  json j = event.to_json();
  EXPECT_EQ(j["treeHash"], "h");
  EXPECT_TRUE(j["baseCommit"].is_null());
  EXPECT_EQ(j["archiveUrl"], "h.tar.gz");
  EXPECT_EQ(j["changes"][0]["status"], "D");
}

// --- find_last_device ---

TEST(DeviceTest, LastDeviceWins) {
  std::vector<StoredLogEntry> entries = {
      notification("_posthog/sdk_session", {{"device", {{"type", "local"}}}}),
      notification("_posthog/tree_snapshot", {{"treeHash", "h"}, {"device", {{"type", "cloud"}}}}),
      notification("session/update", {{"device", nullptr}}),
      notification("session/update", {{"update", {{"sessionUpdate", "plan"}}}}),
  };

  auto device = find_last_device(entries);
  ASSERT_TRUE(device.has_value());
  EXPECT_EQ((*device)["type"], "cloud");
}

TEST(DeviceTest, NoDevice) {
  EXPECT_FALSE(find_last_device({notification("session/update", json::object())}).has_value());
}
