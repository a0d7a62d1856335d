#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "xdrls/core/language_service_base.hpp"
#include "xdrls/semantic/index_store.hpp"
#include "xdrls/semantic/query_engine.hpp"
#include "xdrls/utils/broadcast_event.hpp"
#include "xdrls/utils/canonical_path.hpp"

namespace xdrls::services {

// Serves navigation queries from one workspace-wide IndexStore.
//
// The index is built once, on a background pool, by InitializeWorkspace.
// Queries await workspace_ready_ first, so they never see a partial index.
class LanguageService : public LanguageServiceBase {
 public:
  explicit LanguageService(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto SetPositionEncoding(semantic::PositionEncoding encoding)
      -> void override {
    encoding_ = encoding;
  }

  auto InitializeWorkspace(std::string workspace_uri)
      -> asio::awaitable<std::expected<void, LspError>> override;

  auto GetDefinitionForPosition(std::string uri, lsp::Position position)
      -> asio::awaitable<
          std::expected<std::optional<lsp::Location>, LspError>> override;

  auto GetReferencesForPosition(
      std::string uri, lsp::Position position, bool include_declaration)
      -> asio::awaitable<std::expected<
          std::optional<std::vector<lsp::Location>>, LspError>> override;

  // Read-only view of the index, for tests
  [[nodiscard]] auto Store() const
      -> std::shared_ptr<const semantic::IndexStore> {
    return store_;
  }

 private:
  // Waits for the index and resolves the identifier under the cursor
  auto IdentifierAt(const std::string& uri, lsp::Position position)
      -> asio::awaitable<std::expected<std::optional<std::string>, LspError>>;

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;

  std::shared_ptr<semantic::IndexStore> store_;
  semantic::QueryEngine query_engine_;
  semantic::PositionEncoding encoding_ = semantic::PositionEncoding::kUtf16;

  CanonicalPath workspace_root_;

  // Set once indexing finished or failed; initialization_error_ tells which
  utils::BroadcastEvent workspace_ready_;
  std::optional<std::string> initialization_error_;

  // Indexing reads and parses every schema file; keep it off the I/O thread
  std::unique_ptr<asio::thread_pool> index_pool_;
};

}  // namespace xdrls::services
