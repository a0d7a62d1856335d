#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <lsp/basic.hpp>

#include "xdrls/semantic/file_index.hpp"
#include "xdrls/semantic/index_store.hpp"
#include "xdrls/utils/canonical_path.hpp"

namespace xdrls::semantic {

// Token of `tokens` (sorted by start) covering `column`, both ends inclusive
[[nodiscard]] auto FindTokenAt(const std::vector<Token>& tokens, int column)
    -> const Token*;

// Point queries over an IndexStore. A miss is std::nullopt, never an error.
class QueryEngine {
 public:
  explicit QueryEngine(std::shared_ptr<const IndexStore> store);

  [[nodiscard]] auto IdentifierAt(
      const CanonicalPath& file, lsp::Position position) const
      -> std::optional<std::string>;

  [[nodiscard]] auto DefinitionOf(const std::string& name) const
      -> std::optional<lsp::Location>;

  // std::nullopt when `name` is unknown to the reference table. An empty
  // vector means the name is known but has no uses.
  [[nodiscard]] auto ReferencesOf(
      const std::string& name, bool include_declaration) const
      -> std::optional<std::vector<lsp::Location>>;

 private:
  std::shared_ptr<const IndexStore> store_;
};

}  // namespace xdrls::semantic
