#include "conversation/turn_builder.hpp"

#include <spdlog/spdlog.h>

#include "core/json_util.hpp"
#include "protocol/methods.hpp"

namespace acp {

struct TurnBuilder::State {
  std::vector<ConversationItem> items;

  // Turn that receives updates: the most recently opened one
  std::optional<size_t> current;

  // Prompt request id -> index of the turn awaiting its response
  std::map<std::string, size_t> pending;

  // Shell execution id -> index
  std::map<std::string, size_t> shells;

  // Index of the turn that received the most recent item, reset by any other push.
  // Text only merges into a block that is still the last item of the stream.
  std::optional<size_t> last_item_owner;
};

TurnBuilder::TurnBuilder(BuildOptions options) : options_(options) {}

BuildResult TurnBuilder::build(const std::vector<SessionEvent>& events) const {
  State state;

  for (const auto& event : events) {
    if (auto* note = std::get_if<Notification>(&event.message)) {
      on_notification(state, *note, event.update, event.ts);
    } else if (auto* request = std::get_if<Request>(&event.message)) {
      if (request->method == methods::kSessionPrompt) {
        on_prompt_request(state, *request, event.ts);
      }
    } else if (auto* response = std::get_if<Response>(&event.message)) {
      on_prompt_response(state, *response, event.ts);
    }
  }

  if (!options_.prompt_pending) {
    for (const auto& [id, index] : state.pending) {
      auto& turn = std::get<Turn>(state.items[index]);
      turn.complete = true;
      turn.cancelled = true;
      turn.stop_reason = "cancelled";
    }
    state.pending.clear();
  }

  BuildResult result;
  if (state.current) {
    const auto& turn = std::get<Turn>(state.items[*state.current]);
    result.last_turn = LastTurnInfo{turn.complete, turn.duration_ms, turn.stop_reason};
  }
  result.items = std::move(state.items);
  return result;
}

void TurnBuilder::on_prompt_request(State& state, const Request& request, int64_t ts) {
  Turn turn;
  turn.id = "turn-" + std::to_string(ts) + "-" + (request.id.is_string() ? request.id.get<std::string>() : request.id.dump());
  turn.prompt_id = request.id;
  turn.user_content = extract_user_content(request.params);
  turn.duration_ms = -ts;

  // A new request never closes the previous turn; its response still can.
  size_t index = state.items.size();
  state.items.emplace_back(std::move(turn));
  state.current = index;
  state.pending[id_key(request.id)] = index;
  state.last_item_owner.reset();
}

void TurnBuilder::on_prompt_response(State& state, const Response& response, int64_t ts) {
  auto it = state.pending.find(id_key(response.id));
  if (it == state.pending.end()) {
    return;
  }

  auto& turn = std::get<Turn>(state.items[it->second]);
  turn.complete = true;
  turn.duration_ms += ts;

  if (response.result.is_object()) {
    turn.stop_reason = get_string(response.result, "stopReason");
    if (const json* meta = find_object(response.result, "_meta")) {
      turn.interrupt_reason = get_string(*meta, "interruptReason");
    }
  }
  turn.cancelled = turn.stop_reason == "cancelled";

  state.pending.erase(it);
}

void TurnBuilder::on_notification(State& state, const Notification& note, const std::optional<SessionUpdate>& update, int64_t ts) {
  const std::string& method = note.method;

  if (methods::is_extension(method, methods::kUserShellExecute)) {
    auto id = get_string(note.params, "id");
    if (!id) {
      spdlog::debug("[TurnBuilder] Shell execution without id ignored");
      return;
    }
    const json* result = find_field(note.params, "result");

    auto existing = state.shells.find(*id);
    if (existing != state.shells.end()) {
      std::get<ShellExecution>(state.items[existing->second]).result = result ? *result : json();
      return;
    }

    ShellExecution shell{*id, get_string_or(note.params, "command", ""), get_string_or(note.params, "cwd", ""), result ? *result : json()};
    state.shells[*id] = state.items.size();
    state.items.emplace_back(std::move(shell));
    state.last_item_owner.reset();
    return;
  }

  if (!state.current) {
    return;
  }

  if (method == methods::kSessionUpdate) {
    if (update) {
      on_session_update(state, *update);
    }
    return;
  }

  if (methods::is_extension(method, methods::kConsole)) {
    auto message = get_string(note.params, "message");
    if (message && !message->empty()) {
      push_item(state, ConsoleRecord{get_string_or(note.params, "level", "info"), *message, format_iso8601(ts)});
    }
    return;
  }

  if (methods::is_extension(method, methods::kCompactBoundary) || methods::is_extension(method, methods::kStatus) ||
      methods::is_extension(method, methods::kTaskNotification)) {
    push_item(state, OpaqueUpdate{method, note.params});
  }
}

void TurnBuilder::on_session_update(State& state, const SessionUpdate& update) {
  Turn* turn = current_turn(state);

  switch (update.kind) {
    case UpdateKind::UserMessageChunk:
      // Already captured from the prompt request
      break;

    case UpdateKind::AgentMessageChunk:
    case UpdateKind::AgentThoughtChunk:
    case UpdateKind::AgentMessage: {
      auto text = update.text();
      if (text) {
        append_text(state, update.kind == UpdateKind::AgentThoughtChunk ? TextKind::Thought : TextKind::Message, *text);
      }
      break;
    }

    case UpdateKind::ToolCall: {
      auto upsert = turn->tool_calls_.upsert(update.body);
      if (upsert && upsert->created) {
        push_item(state, ToolCallRef{upsert->key});
      }
      break;
    }

    case UpdateKind::ToolCallUpdate:
      if (!turn->tool_calls_.merge_existing(update.body)) {
        spdlog::debug("[TurnBuilder] Dropping update for unknown tool call {}", update.tool_call_id());
      }
      break;

    case UpdateKind::Plan:
    case UpdateKind::AvailableCommandsUpdate:
    case UpdateKind::CurrentModeUpdate:
    case UpdateKind::Status:
    case UpdateKind::Error:
      push_item(state, OpaqueUpdate{update.name, update.body});
      break;

    default:
      break;
  }
}

void TurnBuilder::append_text(State& state, TextKind kind, const std::string& text) {
  Turn* turn = current_turn(state);

  if (state.last_item_owner == state.current && !turn->items.empty()) {
    if (auto* last = std::get_if<TextBlock>(&turn->items.back()); last && last->kind == kind) {
      // Replace rather than mutate: the previous block may already be held by a renderer
      turn->items.back() = TextBlock{kind, last->text + text};
      return;
    }
  }

  push_item(state, TextBlock{kind, text});
}

void TurnBuilder::push_item(State& state, TurnItem item) {
  current_turn(state)->items.push_back(std::move(item));
  state.last_item_owner = state.current;
}

Turn* TurnBuilder::current_turn(State& state) {
  return &std::get<Turn>(state.items[*state.current]);
}

BuildResult build_conversation(const std::vector<SessionEvent>& events, const BuildOptions& options) {
  return TurnBuilder(options).build(events);
}

std::string extract_user_content(const json& prompt_params) {
  const json* prompt = find_field(prompt_params, "prompt");
  if (!prompt || !prompt->is_array()) {
    return "";
  }

  for (const auto& block : *prompt) {
    if (get_string_or(block, "type", "") != "text") continue;

    const json* meta = find_object(block, "_meta");
    const json* ui = meta ? find_object(*meta, "ui") : nullptr;
    if (ui && get_bool_or(*ui, "hidden", false)) continue;

    if (auto text = get_string(block, "text")) {
      return *text;
    }
  }
  return "";
}

}  // namespace acp
