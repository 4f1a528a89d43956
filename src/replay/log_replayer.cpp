#include "replay/log_replayer.hpp"

#include <map>

#include "conversation/tool_call_registry.hpp"
#include "core/json_util.hpp"

namespace acp {

namespace {

class Accumulator {
 public:
  explicit Accumulator(std::vector<ConversationTurn>& turns) : turns_(turns) {}

  void user_message(const json& update) {
    flush();

    ConversationTurn turn;
    turn.role = Role::User;
    if (const json* content = find_field(update, "content")) {
      if (content->is_array()) {
        turn.content.assign(content->begin(), content->end());
      } else if (!content->is_null()) {
        turn.content.push_back(*content);
      }
    }
    turns_.push_back(std::move(turn));
  }

  void agent_chunk(const json& update) {
    const json* content = find_object(update, "content");
    if (!content) return;

    if (is_text(*content) && !content_.empty() && is_text(content_.back())) {
      content_.back()["text"] = content_.back()["text"].get<std::string>() + get_string_or(*content, "text", "");
      return;
    }
    content_.push_back(*content);
  }

  // `tool_call` and `tool_call_update` carry the adapter's own record under _meta.claudeCode
  void tool_call(const json& update) {
    const json* meta = implementation_meta(update);
    if (!meta) return;

    auto id = get_string(*meta, "toolCallId");
    auto name = get_string(*meta, "toolName");
    if (!id || id->empty() || !name || name->empty()) return;

    if (!calls_.find(*id)) {
      const json* input = find_field(*meta, "toolInput");
      calls_.upsert({{"toolCallId", *id}, {"title", *name}, {"rawInput", input ? *input : json()}});
    }
    attach_response(*id, *meta);
  }

  // Result-shaped updates only complete calls we have already seen
  void tool_result(const json& update) {
    const json* meta = implementation_meta(update);
    if (!meta) return;

    auto id = get_string(*meta, "toolCallId");
    if (id && calls_.find(*id)) {
      attach_response(*id, *meta);
    }
  }

  void flush() {
    if (content_.empty() && calls_.empty()) return;

    ConversationTurn turn;
    turn.role = Role::Assistant;
    turn.content = std::move(content_);
    for (const auto& call : calls_.all()) {
      ToolCallInfo info{call.id, call.title, call.raw_input, std::nullopt};
      if (auto result = results_.find(call.id); result != results_.end()) info.result = result->second;
      turn.tool_calls.push_back(std::move(info));
    }
    turns_.push_back(std::move(turn));

    content_.clear();
    calls_ = ToolCallRegistry();
    results_.clear();
  }

 private:
  static bool is_text(const json& block) {
    return get_string_or(block, "type", "") == "text" && get_string(block, "text").has_value();
  }

  static const json* implementation_meta(const json& update) {
    const json* meta = find_object(update, "_meta");
    return meta ? find_object(*meta, "claudeCode") : nullptr;
  }

  // An explicit null response is still a result
  void attach_response(const ToolCallId& id, const json& meta) {
    if (const json* response = find_field(meta, "toolResponse")) {
      results_[id] = *response;
    }
  }

  std::vector<ConversationTurn>& turns_;
  std::vector<json> content_;
  ToolCallRegistry calls_;
  std::map<ToolCallId, json> results_;
};

}  // namespace

std::vector<ConversationTurn> rebuild_conversation(const std::vector<StoredLogEntry>& entries) {
  std::vector<ConversationTurn> turns;
  Accumulator acc(turns);

  for (const auto& entry : entries) {
    auto update = entry.session_update();
    if (!update) continue;

    switch (update->kind) {
      case UpdateKind::UserMessage:
      case UpdateKind::UserMessageChunk:
        acc.user_message(update->body);
        break;
      case UpdateKind::AgentMessageChunk:
        acc.agent_chunk(update->body);
        break;
      case UpdateKind::ToolCall:
      case UpdateKind::ToolCallUpdate:
        acc.tool_call(update->body);
        break;
      case UpdateKind::ToolResult:
        acc.tool_result(update->body);
        break;
      default:
        break;
    }
  }

  acc.flush();
  return turns;
}

json to_json(const ConversationTurn& turn) {
  json j = {{"role", to_string(turn.role)}, {"content", turn.content}};
  if (!turn.tool_calls.empty()) {
    json calls = json::array();
    for (const auto& call : turn.tool_calls) {
      json c = {{"toolCallId", call.tool_call_id}, {"toolName", call.tool_name}, {"input", call.input}};
      if (call.result) c["result"] = *call.result;
      calls.push_back(std::move(c));
    }
    j["toolCalls"] = calls;
  }
  return j;
}

}  // namespace acp
