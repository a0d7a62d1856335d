#include "lsp/lsp_server.hpp"

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lsp {

using lsp::error::LspError;
using lsp::error::Ok;

LspServer::LspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      endpoint_(std::move(endpoint)),
      executor_(executor),
      work_guard_(asio::make_work_guard(executor)) {
}

auto LspServer::Start() -> asio::awaitable<std::expected<void, LspError>> {
  RegisterHandlers();

  auto result = co_await endpoint_->Start();
  if (!result) {
    Logger()->error("LspServer endpoint error: {}", result.error().Message());
    co_return LspError::UnexpectedFromRpcError(result.error());
  }
  Logger()->debug("LspServer endpoint started");

  auto shutdown_result = co_await endpoint_->WaitForShutdown();
  if (!shutdown_result) {
    Logger()->error(
        "LspServer endpoint wait for shutdown error: {}",
        shutdown_result.error().Message());
    co_return LspError::UnexpectedFromRpcError(shutdown_result.error());
  }
  Logger()->debug("LspServer endpoint wait for shutdown completed");

  co_return Ok();
}

auto LspServer::LogMessage(LogMessageParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  if (!endpoint_) {
    Logger()->info("{}", params.message);
    co_return Ok();
  }

  auto result = co_await endpoint_->SendNotification<LogMessageParams>(
      "window/logMessage", params);
  if (!result) {
    Logger()->error(
        "LspServer failed to send log message: {}", result.error().Message());
    co_return LspError::UnexpectedFromRpcError(result.error());
  }
  co_return Ok();
}

auto LspServer::Shutdown() -> asio::awaitable<std::expected<void, LspError>> {
  Logger()->debug("Server shutting down");

  if (endpoint_) {
    auto result = co_await endpoint_->Shutdown();
    if (!result) {
      Logger()->error(
          "LspServer endpoint shutdown error: {}", result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    Logger()->debug("LspServer endpoint shutdown");
  }

  // Let io_context.run() return once outstanding work drains
  work_guard_.reset();

  co_return Ok();
}

void LspServer::RegisterHandlers() {
  RegisterLifecycleHandlers();
  RegisterLanguageFeatureHandlers();
}

void LspServer::RegisterLifecycleHandlers() {
  // Initialize Request
  endpoint_->RegisterMethodCall<InitializeParams, InitializeResult, LspError>(
      "initialize",
      [this](const InitializeParams& params) { return OnInitialize(params); });

  // Initialized Notification
  endpoint_->RegisterNotification<InitializedParams, LspError>(
      "initialized", [this](const InitializedParams& params) {
        return OnInitialized(params);
      });

  // Shutdown Request
  endpoint_->RegisterMethodCall<ShutdownParams, ShutdownResult, LspError>(
      "shutdown",
      [this](const ShutdownParams& params) { return OnShutdown(params); });

  // Exit Notification
  endpoint_->RegisterNotification<ExitParams, LspError>(
      "exit", [this](const ExitParams& params) { return OnExit(params); });
}

void LspServer::RegisterLanguageFeatureHandlers() {
  // Goto Definition Request
  endpoint_->RegisterMethodCall<DefinitionParams, DefinitionResult, LspError>(
      "textDocument/definition", [this](const DefinitionParams& params) {
        return OnGotoDefinition(params);
      });

  // Find References Request
  endpoint_->RegisterMethodCall<ReferenceParams, ReferenceResult, LspError>(
      "textDocument/references", [this](const ReferenceParams& params) {
        return OnFindReferences(params);
      });
}

}  // namespace lsp
