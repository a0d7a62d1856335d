#pragma once

#include <optional>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Goto Definition Request
struct DefinitionParams : TextDocumentPositionParams,
                          WorkDoneProgressParams,
                          PartialResultParams {};

void to_json(nlohmann::json& j, const DefinitionParams& p);
void from_json(const nlohmann::json& j, DefinitionParams& p);

// Serialized as null, a single Location or an array of Locations
using DefinitionResult =
    std::optional<std::variant<Location, std::vector<Location>>>;

void to_json(nlohmann::json& j, const DefinitionResult& r);
void from_json(const nlohmann::json& j, DefinitionResult& r);

// Find References Request
struct ReferenceContext {
  bool includeDeclaration = false;
};

void to_json(nlohmann::json& j, const ReferenceContext& c);
void from_json(const nlohmann::json& j, ReferenceContext& c);

struct ReferenceParams : TextDocumentPositionParams,
                         WorkDoneProgressParams,
                         PartialResultParams {
  ReferenceContext context{};
};

void to_json(nlohmann::json& j, const ReferenceParams& p);
void from_json(const nlohmann::json& j, ReferenceParams& p);

// Serialized as null or an array of Locations
using ReferenceResult = std::optional<std::vector<Location>>;

void to_json(nlohmann::json& j, const ReferenceResult& r);
void from_json(const nlohmann::json& j, ReferenceResult& r);

}  // namespace lsp
