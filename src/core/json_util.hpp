#pragma once

#include <optional>
#include <string>

#include "types.hpp"

namespace acp {

// Type-checked field access for untrusted JSON. None of these throw.

inline const json* find_field(const json& obj, const char* key) {
  if (!obj.is_object()) return nullptr;
  auto it = obj.find(key);
  return it != obj.end() ? &*it : nullptr;
}

inline const json* find_object(const json& obj, const char* key) {
  const json* field = find_field(obj, key);
  return field && field->is_object() ? field : nullptr;
}

inline std::optional<std::string> get_string(const json& obj, const char* key) {
  const json* field = find_field(obj, key);
  if (field && field->is_string()) return field->get<std::string>();
  return std::nullopt;
}

inline std::string get_string_or(const json& obj, const char* key, const std::string& fallback) {
  return get_string(obj, key).value_or(fallback);
}

inline bool get_bool_or(const json& obj, const char* key, bool fallback) {
  const json* field = find_field(obj, key);
  if (field && field->is_boolean()) return field->get<bool>();
  return fallback;
}

}  // namespace acp
