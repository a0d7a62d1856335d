#include "xdrls/core/xdrls_lsp_server.hpp"

#include <algorithm>
#include <string_view>

#include <spdlog/spdlog.h>

#include "xdrls/core/workspace_indexer.hpp"

namespace xdrls {

using lsp::LspError;
using lsp::LspErrorCode;
using lsp::Ok;

namespace {

constexpr std::string_view kServerVersion = "0.1.0";

auto ToSemanticEncoding(lsp::PositionEncodingKind kind)
    -> semantic::PositionEncoding {
  return kind == lsp::PositionEncodingKind::kUtf8
             ? semantic::PositionEncoding::kUtf8
             : semantic::PositionEncoding::kUtf16;
}

auto NotInitializedError() -> std::unexpected<LspError> {
  return LspError::UnexpectedFromCode(
      LspErrorCode::kServerNotInitialized, "Server is not initialized");
}

}  // namespace

auto NegotiatePositionEncoding(const lsp::InitializeParams& params)
    -> lsp::PositionEncodingKind {
  if (params.capabilities && params.capabilities->general &&
      params.capabilities->general->positionEncodings) {
    const auto& offered = *params.capabilities->general->positionEncodings;
    if (std::ranges::find(offered, "utf-8") != offered.end()) {
      return lsp::PositionEncodingKind::kUtf8;
    }
  }
  return lsp::PositionEncodingKind::kUtf16;
}

XdrlsLspServer::XdrlsLspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<LanguageServiceBase> language_service,
    std::shared_ptr<spdlog::logger> logger)
    : lsp::LspServer(executor, std::move(endpoint), logger),
      logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      language_service_(std::move(language_service)) {
}

auto XdrlsLspServer::OnInitialize(lsp::InitializeParams params)
    -> asio::awaitable<std::expected<lsp::InitializeResult, lsp::LspError>> {
  // Validate the root here so a bad workspace fails the handshake; the
  // indexing itself starts on initialized
  std::optional<lsp::DocumentUri> root_uri = params.rootUri;
  if (!root_uri) {
    if (const auto& workspace_folders_opt = params.workspaceFolders) {
      if (workspace_folders_opt->size() != 1) {
        co_return LspError::UnexpectedFromCode(
            LspErrorCode::kInvalidRequest, "Only one workspace is supported");
      }
      root_uri = workspace_folders_opt->front().uri;
    }
  }

  if (!root_uri) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidParams,
        "This language server requires rootUri to be set");
  }

  if (auto root = ResolveWorkspaceRoot(*root_uri); !root) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidParams, root.error());
  }
  root_uri_ = root_uri;

  auto encoding = NegotiatePositionEncoding(params);
  language_service_->SetPositionEncoding(ToSemanticEncoding(encoding));

  lsp::ServerCapabilities capabilities{
      .positionEncoding = encoding,
      .definitionProvider = true,
      .referencesProvider = true,
  };

  co_return lsp::InitializeResult{
      .capabilities = capabilities,
      .serverInfo = lsp::InitializeResult::ServerInfo{
          .name = "xdrls", .version = std::string(kServerVersion)}};
}

auto XdrlsLspServer::OnInitialized(lsp::InitializedParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  initialized_ = true;

  auto logged = co_await LogMessage(
      {.type = lsp::MessageType::Info, .message = "xdrls initialized"});
  if (!logged) {
    Logger()->warn(
        "Could not notify the client: {}", logged.error().Message());
  }

  // Without a root the service still runs initialization, which fails and
  // releases queries waiting on the workspace
  if (!root_uri_) {
    Logger()->warn("initialized received without a workspace root");
  }

  // Queries wait for the index inside the language service
  asio::co_spawn(
      executor_,
      [this, uri = root_uri_.value_or("")]() -> asio::awaitable<void> {
        auto result = co_await language_service_->InitializeWorkspace(uri);
        if (!result) {
          Logger()->error(
              "Workspace initialization failed: {}", result.error().Message());
        }
      },
      asio::detached);

  co_return Ok();
}

auto XdrlsLspServer::OnShutdown(lsp::ShutdownParams /*unused*/)
    -> asio::awaitable<std::expected<lsp::ShutdownResult, lsp::LspError>> {
  shutdown_requested_ = true;
  co_return lsp::ShutdownResult{};
}

auto XdrlsLspServer::OnExit(lsp::ExitParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  if (!shutdown_requested_) {
    Logger()->warn("exit received before shutdown");
  }
  co_await lsp::LspServer::Shutdown();
  co_return Ok();
}

auto XdrlsLspServer::OnGotoDefinition(lsp::DefinitionParams params)
    -> asio::awaitable<std::expected<lsp::DefinitionResult, lsp::LspError>> {
  Logger()->debug("OnGotoDefinition received: {}", params.textDocument.uri);
  if (!initialized_) {
    co_return NotInitializedError();
  }
  auto location = co_await language_service_->GetDefinitionForPosition(
      params.textDocument.uri, params.position);
  if (!location) {
    co_return std::unexpected(location.error());
  }
  if (!*location) {
    co_return lsp::DefinitionResult{};
  }
  co_return lsp::DefinitionResult{**location};
}

auto XdrlsLspServer::OnFindReferences(lsp::ReferenceParams params)
    -> asio::awaitable<std::expected<lsp::ReferenceResult, lsp::LspError>> {
  Logger()->debug("OnFindReferences received: {}", params.textDocument.uri);
  if (!initialized_) {
    co_return NotInitializedError();
  }
  co_return co_await language_service_->GetReferencesForPosition(
      params.textDocument.uri, params.position,
      params.context.includeDeclaration);
}

}  // namespace xdrls
