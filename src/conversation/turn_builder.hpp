#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "conversation/turn.hpp"
#include "protocol/session_update.hpp"

namespace acp {

struct BuildOptions {
  // False once the host knows no prompt is in flight any more (the agent went
  // away, the user cancelled). Turns still waiting for a response are then
  // closed as cancelled.
  bool prompt_pending = true;
};

// Folds the live event stream of one session into turns.
//
// build() always refolds the full history from scratch, so calling it again
// with a longer prefix of the same stream is safe and deterministic.
class TurnBuilder {
 public:
  explicit TurnBuilder(BuildOptions options = {});

  BuildResult build(const std::vector<SessionEvent>& events) const;

 private:
  struct State;

  static void on_prompt_request(State& state, const Request& request, int64_t ts);
  static void on_prompt_response(State& state, const Response& response, int64_t ts);
  static void on_notification(State& state, const Notification& note, const std::optional<SessionUpdate>& update, int64_t ts);
  static void on_session_update(State& state, const SessionUpdate& update);
  static void append_text(State& state, TextKind kind, const std::string& text);
  static void push_item(State& state, TurnItem item);
  static Turn* current_turn(State& state);

  BuildOptions options_;
};

BuildResult build_conversation(const std::vector<SessionEvent>& events, const BuildOptions& options = {});

// First visible text of a prompt, skipping blocks marked `_meta.ui.hidden`
std::string extract_user_content(const json& prompt_params);

}  // namespace acp
