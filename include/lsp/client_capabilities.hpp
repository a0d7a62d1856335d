#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lsp {

// Only the capabilities the server reads are modelled; the rest of the
// client's capability object is kept as raw JSON.

struct GeneralClientCapabilities {
  // Kept as strings so encodings unknown to the server do not fail the
  // whole initialize request
  std::optional<std::vector<std::string>> positionEncodings;
};

void to_json(nlohmann::json& j, const GeneralClientCapabilities& c);
void from_json(const nlohmann::json& j, GeneralClientCapabilities& c);

struct ClientCapabilities {
  std::optional<nlohmann::json> workspace;
  std::optional<nlohmann::json> textDocument;
  std::optional<nlohmann::json> window;
  std::optional<GeneralClientCapabilities> general;
  std::optional<nlohmann::json> experimental;
};

void to_json(nlohmann::json& j, const ClientCapabilities& c);
void from_json(const nlohmann::json& j, ClientCapabilities& c);

}  // namespace lsp
