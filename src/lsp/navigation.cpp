#include "lsp/navigation.hpp"

#include <nlohmann/json.hpp>

#include "lsp/json_utils.hpp"

namespace lsp {

// Goto Definition Request
void to_json(nlohmann::json& j, const DefinitionParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
  to_json_required(j, "position", p.position);
  to_json_optional(j, "workDoneToken", p.workDoneToken);
  to_json_optional(j, "partialResultToken", p.partialResultToken);
}

void from_json(const nlohmann::json& j, DefinitionParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "position", p.position);
  from_json_optional(j, "workDoneToken", p.workDoneToken);
  from_json_optional(j, "partialResultToken", p.partialResultToken);
}

void to_json(nlohmann::json& j, const DefinitionResult& r) {
  if (!r) {
    j = nullptr;
    return;
  }
  if (std::holds_alternative<Location>(*r)) {
    j = std::get<Location>(*r);
  } else {
    j = std::get<std::vector<Location>>(*r);
  }
}

void from_json(const nlohmann::json& j, DefinitionResult& r) {
  if (j.is_null()) {
    r = std::nullopt;
  } else if (j.is_array()) {
    r = j.get<std::vector<Location>>();
  } else {
    r = j.get<Location>();
  }
}

// Find References Request
void to_json(nlohmann::json& j, const ReferenceContext& c) {
  to_json_required(j, "includeDeclaration", c.includeDeclaration);
}

void from_json(const nlohmann::json& j, ReferenceContext& c) {
  from_json_required(j, "includeDeclaration", c.includeDeclaration);
}

void to_json(nlohmann::json& j, const ReferenceParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
  to_json_required(j, "position", p.position);
  to_json_optional(j, "workDoneToken", p.workDoneToken);
  to_json_optional(j, "partialResultToken", p.partialResultToken);
  to_json_required(j, "context", p.context);
}

void from_json(const nlohmann::json& j, ReferenceParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "position", p.position);
  from_json_optional(j, "workDoneToken", p.workDoneToken);
  from_json_optional(j, "partialResultToken", p.partialResultToken);
  from_json_required(j, "context", p.context);
}

void to_json(nlohmann::json& j, const ReferenceResult& r) {
  if (!r) {
    j = nullptr;
    return;
  }
  j = *r;
}

void from_json(const nlohmann::json& j, ReferenceResult& r) {
  if (j.is_null()) {
    r = std::nullopt;
  } else {
    r = j.get<std::vector<Location>>();
  }
}

}  // namespace lsp
