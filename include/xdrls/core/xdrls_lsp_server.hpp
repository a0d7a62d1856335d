#pragma once

#include <memory>
#include <optional>
#include <string>

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>

#include "lsp/lifecycle.hpp"
#include "lsp/lsp_server.hpp"
#include "xdrls/core/language_service_base.hpp"

namespace xdrls {

// Picks the position encoding for the session: UTF-8 when the client offers
// it, UTF-16 (the protocol default) otherwise
[[nodiscard]] auto NegotiatePositionEncoding(
    const lsp::InitializeParams& params) -> lsp::PositionEncodingKind;

class XdrlsLspServer : public lsp::LspServer {
 public:
  XdrlsLspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<LanguageServiceBase> language_service,
      std::shared_ptr<spdlog::logger> logger = nullptr);

 private:
  // Server state
  bool initialized_ = false;
  bool shutdown_requested_ = false;

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;

  std::shared_ptr<LanguageServiceBase> language_service_{nullptr};

  // Workspace root from the initialize request, indexed on initialized
  std::optional<lsp::DocumentUri> root_uri_;

 protected:
  // Initialize Request
  auto OnInitialize(lsp::InitializeParams params) -> asio::awaitable<
      std::expected<lsp::InitializeResult, lsp::LspError>> override;

  // Initialized Notification
  auto OnInitialized(lsp::InitializedParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Shutdown Request
  auto OnShutdown(lsp::ShutdownParams params) -> asio::awaitable<
      std::expected<lsp::ShutdownResult, lsp::LspError>> override;

  // Exit Notification
  auto OnExit(lsp::ExitParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Goto Definition Request
  auto OnGotoDefinition(lsp::DefinitionParams params) -> asio::awaitable<
      std::expected<lsp::DefinitionResult, lsp::LspError>> override;

  // Find References Request
  auto OnFindReferences(lsp::ReferenceParams params) -> asio::awaitable<
      std::expected<lsp::ReferenceResult, lsp::LspError>> override;
};

}  // namespace xdrls
