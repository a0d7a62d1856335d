#pragma once

#include <expected>
#include <memory>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/error/error.hpp>
#include <spdlog/spdlog.h>

#include "lsp/error.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/navigation.hpp"
#include "lsp/window.hpp"

namespace lsp {

using lsp::error::LspError;
using lsp::error::LspErrorCode;
using lsp::error::Ok;

// Binds the LSP methods a navigation server answers to virtual handlers.
// Subclasses override the handlers they support; the rest reply with
// "method not implemented".
class LspServer {
 public:
  LspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  LspServer(const LspServer&) = delete;
  LspServer(LspServer&&) = delete;
  auto operator=(const LspServer&) -> LspServer& = delete;
  auto operator=(LspServer&&) -> LspServer& = delete;

  virtual ~LspServer() = default;

  // Registers the handlers and serves until the endpoint shuts down
  auto Start() -> asio::awaitable<std::expected<void, LspError>>;
  auto Shutdown() -> asio::awaitable<std::expected<void, LspError>>;
  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

  // LogMessage Notification. A server without an endpoint only logs locally.
  auto LogMessage(LogMessageParams params)
      -> asio::awaitable<std::expected<void, LspError>>;

 protected:
  void RegisterHandlers();

 private:
  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint_;
  asio::any_io_executor executor_;
  asio::executor_work_guard<asio::any_io_executor> work_guard_;

  void RegisterLifecycleHandlers();
  void RegisterLanguageFeatureHandlers();

 protected:
  // Initialize Request
  virtual auto OnInitialize(InitializeParams /*unused*/)
      -> asio::awaitable<std::expected<InitializeResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnInitialize is not implemented");
  }

  // Initialized Notification
  virtual auto OnInitialized(InitializedParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnInitialized is not implemented");
  }

  // Shutdown Request
  virtual auto OnShutdown(ShutdownParams /*unused*/)
      -> asio::awaitable<std::expected<ShutdownResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnShutdown is not implemented");
  }

  // Exit Notification
  virtual auto OnExit(ExitParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnExit is not implemented");
  }

  // Goto Definition Request
  virtual auto OnGotoDefinition(DefinitionParams /*unused*/)
      -> asio::awaitable<std::expected<DefinitionResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnGotoDefinition is not implemented");
  }

  // Find References Request
  virtual auto OnFindReferences(ReferenceParams /*unused*/)
      -> asio::awaitable<std::expected<ReferenceResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnFindReferences is not implemented");
  }
};

}  // namespace lsp
