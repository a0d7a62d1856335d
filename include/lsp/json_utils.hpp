#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lsp {

// Optional members are omitted when empty and read as empty when missing or
// null. Conversion goes through nlohmann's serializer, which reaches the
// to_json/from_json overloads of lsp types by ADL.

template <typename T>
void from_json_optional(
    const nlohmann::json& j, const std::string& key, std::optional<T>& value) {
  if (j.contains(key) && !j.at(key).is_null()) {
    value = j.at(key).get<T>();
  } else {
    value = std::nullopt;
  }
}

template <typename T>
void to_json_optional(
    nlohmann::json& j, const std::string& key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

template <typename T>
void from_json_required(
    const nlohmann::json& j, const std::string& key, T& value) {
  j.at(key).get_to(value);
}

template <typename T>
void to_json_required(
    nlohmann::json& j, const std::string& key, const T& value) {
  j[key] = value;
}

}  // namespace lsp
