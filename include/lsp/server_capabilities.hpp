#pragma once

#include <optional>
#include <variant>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

struct DefinitionOptions : WorkDoneProgressOptions {};

void to_json(nlohmann::json& j, const DefinitionOptions& o);
void from_json(const nlohmann::json& j, DefinitionOptions& o);

struct ReferenceOptions : WorkDoneProgressOptions {};

void to_json(nlohmann::json& j, const ReferenceOptions& o);
void from_json(const nlohmann::json& j, ReferenceOptions& o);

struct ServerCapabilities {
  std::optional<PositionEncodingKind> positionEncoding =
      PositionEncodingKind::kUtf16;

  using DefinitionProvider = std::variant<bool, DefinitionOptions>;
  std::optional<DefinitionProvider> definitionProvider = std::nullopt;

  using ReferencesProvider = std::variant<bool, ReferenceOptions>;
  std::optional<ReferencesProvider> referencesProvider = std::nullopt;
};

void to_json(nlohmann::json& j, const ServerCapabilities::DefinitionProvider& o);
void from_json(
    const nlohmann::json& j, ServerCapabilities::DefinitionProvider& o);

void to_json(nlohmann::json& j, const ServerCapabilities::ReferencesProvider& o);
void from_json(
    const nlohmann::json& j, ServerCapabilities::ReferencesProvider& o);

void to_json(nlohmann::json& j, const ServerCapabilities& o);
void from_json(const nlohmann::json& j, ServerCapabilities& o);

}  // namespace lsp
