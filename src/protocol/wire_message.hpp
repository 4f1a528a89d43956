#pragma once

#include <optional>
#include <string>
#include <variant>

#include "core/types.hpp"

namespace acp {

// JSON-RPC request ids are numbers or strings; compared by value
using RequestId = json;

struct Request {
  RequestId id;
  std::string method;
  json params;
};

struct Notification {
  std::string method;
  json params;
};

struct Response {
  RequestId id;
  json result;
  std::optional<json> error;

  bool is_error() const {
    return error.has_value();
  }
};

// Anything that is not a well-formed request, notification or response
struct Unknown {
  json raw;
};

using WireMessage = std::variant<Request, Notification, Response, Unknown>;

enum class MessageKind { Request, Notification, Response, Unknown };

std::string to_string(MessageKind kind);

// Classify one decoded wire message. Never throws; malformed shapes become Unknown.
//   id + method           -> Request
//   id + (result | error) -> Response
//   method, no id         -> Notification
WireMessage classify(const json& message);

MessageKind kind_of(const WireMessage& message);

std::optional<std::string> method_of(const WireMessage& message);

std::optional<RequestId> id_of(const WireMessage& message);

// Stable string key for a request id ("1" and 1 stay distinct)
std::string id_key(const RequestId& id);

// Encode back to the JSON-RPC shape
json to_json(const WireMessage& message);

// Requests come from the client; responses and notifications from the agent
Direction infer_direction(const WireMessage& message);

Direction infer_direction(const json& message);

}  // namespace acp
