#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace acp {

using json = nlohmann::json;

// Type aliases
using SessionId = std::string;
using ToolCallId = std::string;
using TaskId = std::string;
using RunId = std::string;

// Who sent a wire message
enum class Direction {
  Client,  // user-facing client -> agent
  Agent,   // agent -> client
  Unknown
};

std::string to_string(Direction direction);

// Speaker of a reconstructed turn
enum class Role {
  User,
  Assistant
};

std::string to_string(Role role);

// ISO-8601 timestamps ("2024-01-15T10:30:00.123Z", optional "+02:00" offset)
std::optional<int64_t> parse_iso8601_ms(const std::string &str);

std::string format_iso8601(int64_t epoch_ms);

int64_t now_ms();

}  // namespace acp
