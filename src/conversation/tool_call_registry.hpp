#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/types.hpp"

namespace acp {

// Latest known state of one agent tool invocation
struct ToolCall {
  ToolCallId id;
  std::string title;
  std::string kind;    // "read", "edit", "execute", ...
  std::string status;  // "pending", "in_progress", "completed", "failed"
  json raw_input;
  json raw_output;
  json content = json::array();
  json locations = json::array();
  json meta;   // `_meta`
  json extra = json::object();  // fields outside the protocol schema, kept verbatim

  // Overwrite every field present in `fields`. The `sessionUpdate`
  // discriminator and the id are never overwritten.
  void apply(const json& fields);

  json to_json() const;
};

// Index of a ToolCall inside its registry. Stable for the registry's lifetime.
using ToolCallKey = size_t;

// Tool calls of one turn, stored by value and addressed by key so that items
// referencing a call observe every later merge.
class ToolCallRegistry {
 public:
  struct Upsert {
    ToolCallKey key;
    bool created;
  };

  // Create the entry for `fields.toolCallId`, or merge into the existing one.
  // Returns nullopt when the update carries no tool-call id.
  std::optional<Upsert> upsert(const json& fields);

  // Merge into an existing entry only; unknown ids are ignored.
  std::optional<ToolCallKey> merge_existing(const json& fields);

  std::optional<ToolCallKey> find(const ToolCallId& id) const;

  const ToolCall& at(ToolCallKey key) const {
    return calls_.at(key);
  }

  size_t size() const {
    return calls_.size();
  }

  bool empty() const {
    return calls_.empty();
  }

  const std::vector<ToolCall>& all() const {
    return calls_;
  }

 private:
  std::vector<ToolCall> calls_;
  std::unordered_map<ToolCallId, ToolCallKey> index_;
};

}  // namespace acp
