#include "protocol/wire_message.hpp"

namespace acp {

namespace {

bool has_valid_id(const json& message) {
  auto it = message.find("id");
  return it != message.end() && (it->is_number() || it->is_string());
}

bool has_method(const json& message) {
  auto it = message.find("method");
  return it != message.end() && it->is_string();
}

json params_of(const json& message) {
  auto it = message.find("params");
  return it != message.end() ? *it : json();
}

}  // namespace

std::string to_string(MessageKind kind) {
  switch (kind) {
    case MessageKind::Request:
      return "request";
    case MessageKind::Notification:
      return "notification";
    case MessageKind::Response:
      return "response";
    case MessageKind::Unknown:
      return "unknown";
  }
  return "unknown";
}

WireMessage classify(const json& message) {
  if (!message.is_object()) {
    return Unknown{message};
  }

  const bool id = has_valid_id(message);
  const bool method = has_method(message);

  if (id && method) {
    return Request{message.at("id"), message.at("method").get<std::string>(), params_of(message)};
  }

  if (id && (message.contains("result") || message.contains("error"))) {
    Response response{message.at("id"), json(), std::nullopt};
    if (auto it = message.find("result"); it != message.end()) {
      response.result = *it;
    }
    if (auto it = message.find("error"); it != message.end() && !it->is_null()) {
      response.error = *it;
    }
    return response;
  }

  if (method && !message.contains("id")) {
    return Notification{message.at("method").get<std::string>(), params_of(message)};
  }

  return Unknown{message};
}

MessageKind kind_of(const WireMessage& message) {
  switch (message.index()) {
    case 0:
      return MessageKind::Request;
    case 1:
      return MessageKind::Notification;
    case 2:
      return MessageKind::Response;
    default:
      return MessageKind::Unknown;
  }
}

std::optional<std::string> method_of(const WireMessage& message) {
  if (auto* req = std::get_if<Request>(&message)) return req->method;
  if (auto* note = std::get_if<Notification>(&message)) return note->method;
  return std::nullopt;
}

std::optional<RequestId> id_of(const WireMessage& message) {
  if (auto* req = std::get_if<Request>(&message)) return req->id;
  if (auto* resp = std::get_if<Response>(&message)) return resp->id;
  return std::nullopt;
}

std::string id_key(const RequestId& id) {
  return id.dump();
}

json to_json(const WireMessage& message) {
  return std::visit(
      [](const auto& m) -> json {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Request>) {
          json j = {{"jsonrpc", "2.0"}, {"id", m.id}, {"method", m.method}};
          if (!m.params.is_null()) j["params"] = m.params;
          return j;
        } else if constexpr (std::is_same_v<T, Notification>) {
          json j = {{"jsonrpc", "2.0"}, {"method", m.method}};
          if (!m.params.is_null()) j["params"] = m.params;
          return j;
        } else if constexpr (std::is_same_v<T, Response>) {
          json j = {{"jsonrpc", "2.0"}, {"id", m.id}};
          if (m.error) {
            j["error"] = *m.error;
          } else {
            j["result"] = m.result;
          }
          return j;
        } else {
          return m.raw;
        }
      },
      message);
}

Direction infer_direction(const WireMessage& message) {
  switch (kind_of(message)) {
    case MessageKind::Request:
      return Direction::Client;
    case MessageKind::Response:
    case MessageKind::Notification:
      return Direction::Agent;
    case MessageKind::Unknown:
      return Direction::Unknown;
  }
  return Direction::Unknown;
}

Direction infer_direction(const json& message) {
  return infer_direction(classify(message));
}

}  // namespace acp
