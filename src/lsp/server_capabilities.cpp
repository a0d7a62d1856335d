#include "lsp/server_capabilities.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const DefinitionOptions& o) {
  to_json(j, static_cast<const WorkDoneProgressOptions&>(o));
}

void from_json(const nlohmann::json& j, DefinitionOptions& o) {
  from_json(j, static_cast<WorkDoneProgressOptions&>(o));
}

void to_json(nlohmann::json& j, const ReferenceOptions& o) {
  to_json(j, static_cast<const WorkDoneProgressOptions&>(o));
}

void from_json(const nlohmann::json& j, ReferenceOptions& o) {
  from_json(j, static_cast<WorkDoneProgressOptions&>(o));
}

void to_json(
    nlohmann::json& j, const ServerCapabilities::DefinitionProvider& o) {
  std::visit([&j](const auto& arg) { j = arg; }, o);
}

void from_json(
    const nlohmann::json& j, ServerCapabilities::DefinitionProvider& o) {
  if (j.is_boolean()) {
    o = j.get<bool>();
  } else {
    o = j.get<DefinitionOptions>();
  }
}

void to_json(
    nlohmann::json& j, const ServerCapabilities::ReferencesProvider& o) {
  std::visit([&j](const auto& arg) { j = arg; }, o);
}

void from_json(
    const nlohmann::json& j, ServerCapabilities::ReferencesProvider& o) {
  if (j.is_boolean()) {
    o = j.get<bool>();
  } else {
    o = j.get<ReferenceOptions>();
  }
}

void to_json(nlohmann::json& j, const ServerCapabilities& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "positionEncoding", o.positionEncoding);
  to_json_optional(j, "definitionProvider", o.definitionProvider);
  to_json_optional(j, "referencesProvider", o.referencesProvider);
}

void from_json(const nlohmann::json& j, ServerCapabilities& o) {
  from_json_optional(j, "positionEncoding", o.positionEncoding);
  from_json_optional(j, "definitionProvider", o.definitionProvider);
  from_json_optional(j, "referencesProvider", o.referencesProvider);
}

}  // namespace lsp
