#include "lsp/client_capabilities.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const GeneralClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "positionEncodings", c.positionEncodings);
}

void from_json(const nlohmann::json& j, GeneralClientCapabilities& c) {
  from_json_optional(j, "positionEncodings", c.positionEncodings);
}

void to_json(nlohmann::json& j, const ClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "workspace", c.workspace);
  to_json_optional(j, "textDocument", c.textDocument);
  to_json_optional(j, "window", c.window);
  to_json_optional(j, "general", c.general);
  to_json_optional(j, "experimental", c.experimental);
}

void from_json(const nlohmann::json& j, ClientCapabilities& c) {
  from_json_optional(j, "workspace", c.workspace);
  from_json_optional(j, "textDocument", c.textDocument);
  from_json_optional(j, "window", c.window);
  from_json_optional(j, "general", c.general);
  from_json_optional(j, "experimental", c.experimental);
}

}  // namespace lsp
