#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "conversation/tool_call_registry.hpp"
#include "core/types.hpp"
#include "protocol/wire_message.hpp"

namespace acp {

class TurnBuilder;

enum class TextKind { Message, Thought };

// Streamed agent text. Adjacent chunks of the same kind are merged into one block.
struct TextBlock {
  TextKind kind = TextKind::Message;
  std::string text;
};

// Position of a tool call in the item list; the record itself lives in the turn
struct ToolCallRef {
  ToolCallKey key = 0;
};

// Plans, mode changes, command lists, status and error updates, kept verbatim
struct OpaqueUpdate {
  std::string kind;  // `sessionUpdate` value or extension method name
  json payload;
};

// Diagnostic line sent by the agent over the side channel
struct ConsoleRecord {
  std::string level;
  std::string message;
  std::string timestamp;  // ISO-8601
};

using TurnItem = std::variant<TextBlock, ToolCallRef, OpaqueUpdate, ConsoleRecord>;

// One user prompt and everything the agent produced for it
class Turn {
 public:
  std::string id;
  RequestId prompt_id;
  std::string user_content;
  std::vector<TurnItem> items;

  bool complete = false;
  bool cancelled = false;
  std::optional<std::string> stop_reason;
  std::optional<std::string> interrupt_reason;

  // Negative start timestamp while the prompt is pending (elapsed = now + duration_ms),
  // response ts - request ts once complete.
  int64_t duration_ms = 0;

  const ToolCall& tool_call(const ToolCallRef& ref) const {
    return tool_calls_.at(ref.key);
  }

  size_t tool_call_count() const {
    return tool_calls_.size();
  }

 private:
  friend class TurnBuilder;

  ToolCallRegistry tool_calls_;
};

// Shell command the user ran outside any prompt
struct ShellExecution {
  std::string id;
  std::string command;
  std::string cwd;
  json result;  // null until the command finishes
};

using ConversationItem = std::variant<Turn, ShellExecution>;

struct LastTurnInfo {
  bool complete = false;
  int64_t duration_ms = 0;
  std::optional<std::string> stop_reason;
};

struct BuildResult {
  std::vector<ConversationItem> items;
  std::optional<LastTurnInfo> last_turn;

  std::vector<const Turn*> turns() const;
};

std::string to_string(TextKind kind);

json to_json(const Turn& turn);

json to_json(const ConversationItem& item);

json to_json(const BuildResult& result);

}  // namespace acp
