#include "xdrls/services/language_service.hpp"

#include <utility>

#include "xdrls/core/workspace_indexer.hpp"
#include "xdrls/utils/path_utils.hpp"
#include "xdrls/utils/scoped_timer.hpp"

namespace xdrls::services {

using lsp::error::LspErrorCode;

LanguageService::LanguageService(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      store_(std::make_shared<semantic::IndexStore>(logger_)),
      query_engine_(store_),
      workspace_ready_(executor),
      index_pool_(std::make_unique<asio::thread_pool>(1)) {
}

auto LanguageService::InitializeWorkspace(std::string workspace_uri)
    -> asio::awaitable<std::expected<void, LspError>> {
  utils::ScopedTimer timer("Workspace initialization", logger_);
  logger_->debug("LanguageService initializing workspace: {}", workspace_uri);

  auto fail = [this](std::string message) {
    logger_->error("LanguageService initialization failed: {}", message);
    initialization_error_ = message;
    workspace_ready_.Set();
    return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidParams, std::move(message));
  };

  auto root = ResolveWorkspaceRoot(workspace_uri);
  if (!root) {
    co_return fail(root.error());
  }
  workspace_root_ = *root;

  auto indexed = co_await asio::co_spawn(
      index_pool_->get_executor(),
      [this]() -> asio::awaitable<std::expected<std::size_t, std::string>> {
        co_return DiscoverAndIndex(
            workspace_root_, *store_, encoding_, logger_);
      },
      asio::use_awaitable);
  if (!indexed) {
    co_return fail(indexed.error());
  }

  // Wakes every query parked on the event
  workspace_ready_.Set();

  logger_->info(
      "LanguageService workspace initialized: {} ({} files, {})",
      workspace_uri, *indexed,
      utils::ScopedTimer::FormatDuration(timer.GetElapsed()));
  co_return lsp::error::Ok();
}

auto LanguageService::IdentifierAt(
    const std::string& uri, lsp::Position position)
    -> asio::awaitable<std::expected<std::optional<std::string>, LspError>> {
  co_await workspace_ready_.AsyncWait(asio::use_awaitable);

  if (initialization_error_) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kServerNotInitialized, *initialization_error_);
  }

  if (!IsFileUri(uri)) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kRequestFailed, "Could not open file");
  }

  auto name =
      query_engine_.IdentifierAt(CanonicalPath::FromUri(uri), position);
  if (!name) {
    logger_->debug(
        "No identifier at position {}:{} in {}", position.line,
        position.character, uri);
  }
  co_return name;
}

auto LanguageService::GetDefinitionForPosition(
    std::string uri, lsp::Position position)
    -> asio::awaitable<std::expected<std::optional<lsp::Location>, LspError>> {
  utils::ScopedTimer timer("GetDefinitionForPosition", logger_);

  auto name = co_await IdentifierAt(uri, position);
  if (!name) {
    co_return std::unexpected(name.error());
  }
  if (!*name) {
    co_return std::optional<lsp::Location>{};
  }

  auto definition = query_engine_.DefinitionOf(**name);
  if (!definition) {
    logger_->debug("No definition for '{}'", **name);
  }
  co_return definition;
}

auto LanguageService::GetReferencesForPosition(
    std::string uri, lsp::Position position, bool include_declaration)
    -> asio::awaitable<
        std::expected<std::optional<std::vector<lsp::Location>>, LspError>> {
  utils::ScopedTimer timer("GetReferencesForPosition", logger_);

  auto name = co_await IdentifierAt(uri, position);
  if (!name) {
    co_return std::unexpected(name.error());
  }
  if (!*name) {
    co_return std::optional<std::vector<lsp::Location>>{};
  }

  auto references = query_engine_.ReferencesOf(**name, include_declaration);
  if (references) {
    logger_->debug("Found {} references to '{}'", references->size(), **name);
  }
  co_return references;
}

}  // namespace xdrls::services
