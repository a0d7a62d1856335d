#include "xdrls/semantic/query_engine.hpp"

#include <algorithm>
#include <functional>
#include <iterator>
#include <utility>

namespace xdrls::semantic {

auto FindTokenAt(const std::vector<Token>& tokens, int column)
    -> const Token* {
  // First token starting after the column; its predecessor is the candidate
  auto it = std::ranges::upper_bound(
      tokens, column, std::less<>{}, [](const Token& t) { return t.start; });
  if (it == tokens.begin()) {
    return nullptr;
  }
  const Token& token = *std::prev(it);
  if (token.start <= column && column <= token.end) {
    return &token;
  }
  return nullptr;
}

QueryEngine::QueryEngine(std::shared_ptr<const IndexStore> store)
    : store_(std::move(store)) {
}

auto QueryEngine::IdentifierAt(
    const CanonicalPath& file, lsp::Position position) const
    -> std::optional<std::string> {
  auto tokens = store_->FindLineTokens(file, position.line);
  const auto* token = FindTokenAt(tokens, position.character);
  if (token == nullptr) {
    return std::nullopt;
  }
  return token->name;
}

auto QueryEngine::DefinitionOf(const std::string& name) const
    -> std::optional<lsp::Location> {
  return store_->FindDefinition(name);
}

auto QueryEngine::ReferencesOf(
    const std::string& name, bool include_declaration) const
    -> std::optional<std::vector<lsp::Location>> {
  auto references = store_->FindReferences(name);
  if (!references) {
    return std::nullopt;
  }
  if (include_declaration) {
    if (auto definition = store_->FindDefinition(name)) {
      references->push_back(std::move(*definition));
    }
  }
  return references;
}

}  // namespace xdrls::semantic
