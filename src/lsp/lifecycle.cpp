#include "lsp/lifecycle.hpp"

#include <nlohmann/json.hpp>

#include "lsp/json_utils.hpp"

namespace lsp {

// Initialize Request
void to_json(nlohmann::json& j, const InitializeParams::ClientInfo& p) {
  j = nlohmann::json{{"name", p.name}};
  to_json_optional(j, "version", p.version);
}

void from_json(const nlohmann::json& j, InitializeParams::ClientInfo& p) {
  j.at("name").get_to(p.name);
  from_json_optional(j, "version", p.version);
}

void to_json(nlohmann::json& j, const InitializeParams& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "workDoneToken", p.workDoneToken);
  // processId is required but nullable
  j["processId"] = p.processId ? nlohmann::json(*p.processId) : nullptr;
  to_json_optional(j, "clientInfo", p.clientInfo);
  to_json_optional(j, "locale", p.locale);
  to_json_optional(j, "rootPath", p.rootPath);
  to_json_optional(j, "rootUri", p.rootUri);
  to_json_optional(j, "initializationOptions", p.initializationOptions);
  to_json_optional(j, "capabilities", p.capabilities);
  to_json_optional(j, "workspaceFolders", p.workspaceFolders);
}

void from_json(const nlohmann::json& j, InitializeParams& p) {
  from_json_optional(j, "workDoneToken", p.workDoneToken);
  from_json_optional(j, "processId", p.processId);
  from_json_optional(j, "clientInfo", p.clientInfo);
  from_json_optional(j, "locale", p.locale);
  from_json_optional(j, "rootPath", p.rootPath);
  from_json_optional(j, "rootUri", p.rootUri);
  from_json_optional(j, "initializationOptions", p.initializationOptions);
  from_json_optional(j, "capabilities", p.capabilities);
  from_json_optional(j, "workspaceFolders", p.workspaceFolders);
}

void to_json(nlohmann::json& j, const InitializeResult::ServerInfo& p) {
  j = nlohmann::json{{"name", p.name}};
  to_json_optional(j, "version", p.version);
}

void from_json(const nlohmann::json& j, InitializeResult::ServerInfo& p) {
  j.at("name").get_to(p.name);
  from_json_optional(j, "version", p.version);
}

void to_json(nlohmann::json& j, const InitializeResult& p) {
  j = nlohmann::json{{"capabilities", p.capabilities}};
  to_json_optional(j, "serverInfo", p.serverInfo);
}

void from_json(const nlohmann::json& j, InitializeResult& p) {
  j.at("capabilities").get_to(p.capabilities);
  from_json_optional(j, "serverInfo", p.serverInfo);
}

// Initialized Notification
void to_json(nlohmann::json&, const InitializedParams&) {}
void from_json(const nlohmann::json&, InitializedParams&) {}

// Shutdown Request
void to_json(nlohmann::json&, const ShutdownParams&) {}
void from_json(const nlohmann::json&, ShutdownParams&) {}

void to_json(nlohmann::json&, const ShutdownResult&) {}
void from_json(const nlohmann::json&, ShutdownResult&) {}

// Exit Notification
void to_json(nlohmann::json&, const ExitParams&) {}
void from_json(const nlohmann::json&, ExitParams&) {}

}  // namespace lsp
