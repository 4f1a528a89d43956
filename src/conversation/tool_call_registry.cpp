#include "conversation/tool_call_registry.hpp"

#include "core/json_util.hpp"

namespace acp {

namespace {

void assign_string(std::string& target, const json& value) {
  if (value.is_string()) {
    target = value.get<std::string>();
  } else if (value.is_null()) {
    target.clear();
  }
}

}  // namespace

void ToolCall::apply(const json& fields) {
  if (!fields.is_object()) return;

  for (auto it = fields.begin(); it != fields.end(); ++it) {
    const std::string& key = it.key();
    const json& value = it.value();

    if (key == "sessionUpdate" || key == "toolCallId") {
      continue;
    } else if (key == "title") {
      assign_string(title, value);
    } else if (key == "kind") {
      assign_string(kind, value);
    } else if (key == "status") {
      assign_string(status, value);
    } else if (key == "rawInput") {
      raw_input = value;
    } else if (key == "rawOutput") {
      raw_output = value;
    } else if (key == "content") {
      content = value;
    } else if (key == "locations") {
      locations = value;
    } else if (key == "_meta") {
      meta = value;
    } else {
      extra[key] = value;
    }
  }
}

json ToolCall::to_json() const {
  json j = extra;
  j["toolCallId"] = id;
  j["title"] = title;
  if (!kind.empty()) j["kind"] = kind;
  if (!status.empty()) j["status"] = status;
  if (!raw_input.is_null()) j["rawInput"] = raw_input;
  if (!raw_output.is_null()) j["rawOutput"] = raw_output;
  j["content"] = content;
  j["locations"] = locations;
  if (!meta.is_null()) j["_meta"] = meta;
  return j;
}

std::optional<ToolCallRegistry::Upsert> ToolCallRegistry::upsert(const json& fields) {
  auto id = get_string(fields, "toolCallId");
  if (!id || id->empty()) {
    return std::nullopt;
  }

  if (auto existing = find(*id)) {
    calls_[*existing].apply(fields);
    return Upsert{*existing, false};
  }

  ToolCall call;
  call.id = *id;
  call.apply(fields);

  ToolCallKey key = calls_.size();
  calls_.push_back(std::move(call));
  index_.emplace(*id, key);
  return Upsert{key, true};
}

std::optional<ToolCallKey> ToolCallRegistry::merge_existing(const json& fields) {
  auto id = get_string(fields, "toolCallId");
  if (!id) return std::nullopt;

  auto existing = find(*id);
  if (existing) {
    calls_[*existing].apply(fields);
  }
  return existing;
}

std::optional<ToolCallKey> ToolCallRegistry::find(const ToolCallId& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

}  // namespace acp
