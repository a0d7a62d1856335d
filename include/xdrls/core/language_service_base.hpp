#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <lsp/basic.hpp>
#include <lsp/error.hpp>

#include "xdrls/semantic/line_map.hpp"

namespace xdrls {

using lsp::error::LspError;

// Domain operations behind the LSP handlers. The server layer only converts
// protocol types; everything that touches the index goes through here.
class LanguageServiceBase {
 public:
  LanguageServiceBase() = default;
  LanguageServiceBase(const LanguageServiceBase&) = default;
  LanguageServiceBase(LanguageServiceBase&&) = delete;
  auto operator=(const LanguageServiceBase&) -> LanguageServiceBase& = default;
  auto operator=(LanguageServiceBase&&) -> LanguageServiceBase& = delete;
  virtual ~LanguageServiceBase() = default;

  // Unit of the columns in query positions and returned ranges. Must be set
  // before InitializeWorkspace.
  virtual auto SetPositionEncoding(semantic::PositionEncoding encoding)
      -> void = 0;

  // Discovers and indexes the workspace. Queries issued before this
  // completes wait for it.
  virtual auto InitializeWorkspace(std::string workspace_uri)
      -> asio::awaitable<std::expected<void, LspError>> = 0;

  // std::nullopt when no identifier is at the position or the name has no
  // definition
  virtual auto GetDefinitionForPosition(std::string uri, lsp::Position position)
      -> asio::awaitable<
          std::expected<std::optional<lsp::Location>, LspError>> = 0;

  // std::nullopt when no identifier is at the position or the name is never
  // referenced
  virtual auto GetReferencesForPosition(
      std::string uri, lsp::Position position, bool include_declaration)
      -> asio::awaitable<std::expected<
          std::optional<std::vector<lsp::Location>>, LspError>> = 0;
};

}  // namespace xdrls
