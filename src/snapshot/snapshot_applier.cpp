#include "snapshot/snapshot_applier.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <map>
#include <sstream>
#include <stdexcept>

#include "saga/saga.hpp"
#include "util/process.hpp"

namespace acp {

namespace fs = std::filesystem;

namespace {

std::string trim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
    s.pop_back();
  }
  return s;
}

// Reject absolute paths and anything that climbs out of the repository
fs::path checked_relative(const std::string& path) {
  fs::path p(path);
  if (p.empty() || p.is_absolute()) {
    throw std::runtime_error("Refusing path outside the repository: " + path);
  }
  for (const auto& part : p) {
    if (part == "..") {
      throw std::runtime_error("Refusing path outside the repository: " + path);
    }
  }
  return p;
}

std::string read_file(const fs::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot read " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void write_file(const fs::path& path, const std::string& content) {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot write " + path.string());
  }
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!file) {
    throw std::runtime_error("Short write to " + path.string());
  }
}

size_t count_lines(const std::string& text) {
  size_t count = 0;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!trim(line).empty()) ++count;
  }
  return count;
}

// State shared by the steps of one apply
struct ApplyState {
  std::optional<std::string> original_head;
  std::optional<std::string> original_branch;
  bool checkout_needed = false;
  bool checkout_performed = false;
  fs::path archive_path;
  std::vector<fs::path> to_extract;
  std::map<fs::path, std::string> backups;
  std::vector<fs::path> extracted;
  std::map<fs::path, std::string> deleted;
};

}  // namespace

GitSnapshotApplier::GitSnapshotApplier(fs::path repository, std::shared_ptr<ArtifactFetcher> fetcher, fs::path tmp_dir)
    : repository_(std::move(repository)), fetcher_(std::move(fetcher)), tmp_dir_(std::move(tmp_dir)) {
  if (tmp_dir_.empty()) {
    tmp_dir_ = repository_ / ".acp-session" / "tmp";
  }
}

std::future<ApplyResult> GitSnapshotApplier::apply(const TreeSnapshotEvent& snapshot) {
  return std::async(std::launch::async, [this, snapshot]() {
    return apply_sync(snapshot);
  });
}

std::optional<std::string> GitSnapshotApplier::last_tree_hash() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_tree_hash_;
}

void GitSnapshotApplier::set_last_tree_hash(std::string hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_tree_hash_ = std::move(hash);
}

ApplyResult GitSnapshotApplier::apply_sync(const TreeSnapshotEvent& snapshot) {
  if (!snapshot.restorable()) {
    throw std::invalid_argument("Snapshot " + snapshot.tree_hash + " has no archive");
  }
  if (!fetcher_) {
    throw std::logic_error("GitSnapshotApplier has no artifact fetcher");
  }

  const util::ProcessOptions proc{repository_, command_timeout_};
  auto git = [proc](std::vector<std::string> args) {
    args.insert(args.begin(), "git");
    return util::run_process(args, proc);
  };

  ApplyState state;
  std::vector<saga::Step> steps;

  steps.push_back(saga::read_only("get_current_head", [&]() {
    auto head = git({"rev-parse", "HEAD"});
    if (head.ok()) state.original_head = trim(head.out);

    auto branch = git({"symbolic-ref", "--short", "HEAD"});
    if (branch.ok()) state.original_branch = trim(branch.out);

    state.checkout_needed = snapshot.base_commit && !snapshot.base_commit->empty() && snapshot.base_commit != state.original_head;
    return saga::Flow::Continue;
  }));

  steps.push_back(saga::read_only("check_working_tree", [&]() {
    if (!state.checkout_needed) return saga::Flow::Continue;

    auto status = util::check_output({"git", "status", "--porcelain", "--untracked-files=no"}, proc);
    size_t changed = count_lines(status);
    if (changed > 0) {
      throw std::runtime_error("Cannot apply tree: " + std::to_string(changed) +
                               " uncommitted change(s) exist. Commit or stash your changes first.");
    }
    return saga::Flow::Continue;
  }));

  steps.push_back(saga::compensating(
      "checkout_base",
      [&]() {
        if (!state.checkout_needed) return saga::Flow::Continue;

        util::check_output({"git", "checkout", "--quiet", *snapshot.base_commit}, proc);
        state.checkout_performed = true;
        spdlog::warn("[SnapshotApplier] Applied tree from a different commit, now in detached HEAD state (was {}, base {})",
                     state.original_branch.value_or(state.original_head.value_or("<none>")), *snapshot.base_commit);
        return saga::Flow::Continue;
      },
      [&]() {
        if (!state.checkout_performed) return;
        const auto& target = state.original_branch ? state.original_branch : state.original_head;
        if (target) {
          util::check_output({"git", "checkout", "--quiet", *target}, proc);
        }
      }));

  steps.push_back(saga::compensating(
      "download_archive",
      [&]() {
        std::string bytes = fetcher_->download(*snapshot.archive_url).get();
        state.archive_path = tmp_dir_ / (snapshot.tree_hash + ".tar.gz");
        write_file(state.archive_path, bytes);
        spdlog::debug("[SnapshotApplier] Downloaded archive {} ({} bytes)", *snapshot.archive_url, bytes.size());
        return saga::Flow::Continue;
      },
      [&]() {
        std::error_code ec;
        fs::remove(state.archive_path, ec);
      }));

  steps.push_back(saga::read_only("backup_existing_files", [&]() {
    for (const auto& change : snapshot.changes) {
      if (change.status == FileStatus::Deleted) continue;
      fs::path rel = checked_relative(change.path);
      state.to_extract.push_back(rel);
      if (fs::is_regular_file(repository_ / rel)) {
        state.backups[rel] = read_file(repository_ / rel);
      }
    }
    return saga::Flow::Continue;
  }));

  steps.push_back(saga::compensating(
      "extract_archive",
      [&]() {
        auto listing = util::check_output({"tar", "-tzf", state.archive_path.string()}, proc);
        std::istringstream entries(listing);
        std::string entry;
        while (std::getline(entries, entry)) {
          entry = trim(entry);
          if (!entry.empty()) checked_relative(entry);
        }

        util::check_output({"tar", "--no-same-owner", "-xzf", state.archive_path.string(), "-C", repository_.string()}, proc);
        state.extracted = state.to_extract;
        return saga::Flow::Continue;
      },
      [&]() {
        for (const auto& rel : state.extracted) {
          auto backup = state.backups.find(rel);
          if (backup != state.backups.end()) {
            write_file(repository_ / rel, backup->second);
          } else {
            std::error_code ec;
            fs::remove(repository_ / rel, ec);
          }
        }
      }));

  for (const auto& change : snapshot.changes) {
    if (change.status != FileStatus::Deleted) continue;

    steps.push_back(saga::compensating(
        "delete_" + change.path,
        [&, path = change.path]() {
          fs::path rel = checked_relative(path);
          fs::path full = repository_ / rel;
          if (fs::is_regular_file(full)) {
            state.deleted[rel] = read_file(full);
          }
          std::error_code ec;
          fs::remove(full, ec);
          if (ec) {
            throw std::runtime_error("Cannot delete " + full.string() + ": " + ec.message());
          }
          spdlog::debug("[SnapshotApplier] Deleted file: {}", path);
          return saga::Flow::Continue;
        },
        [&, path = change.path]() {
          fs::path rel(path);
          auto backup = state.deleted.find(rel);
          if (backup != state.deleted.end()) {
            write_file(repository_ / rel, backup->second);
          }
        }));
  }

  auto outcome = saga::Executor("ApplySnapshot").run(steps);

  // The staged archive never outlives the apply
  if (!state.archive_path.empty()) {
    std::error_code ec;
    fs::remove(state.archive_path, ec);
  }

  if (!outcome.success) {
    throw std::runtime_error(outcome.failed_step + ": " + outcome.error);
  }

  set_last_tree_hash(snapshot.tree_hash);

  spdlog::info("[SnapshotApplier] Tree applied: hash={}, changes={}, deleted={}, checkout={}", snapshot.tree_hash, snapshot.changes.size(),
               state.deleted.size(), state.checkout_performed);

  return ApplyResult{snapshot.tree_hash, state.checkout_performed};
}

}  // namespace acp
