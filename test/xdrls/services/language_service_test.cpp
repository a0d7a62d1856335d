#include "xdrls/services/language_service.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/xdrls/common/async_fixture.hpp"
#include "test/xdrls/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using lsp::error::LspErrorCode;
using xdrls::semantic::PositionEncoding;
using xdrls::services::LanguageService;
using xdrls::test::FileTestFixture;
using xdrls::test::RunAsyncTest;

namespace {

constexpr std::string_view kTypes =
    "const MAX = 16;\n"
    "typedef string label<MAX>;\n"
    "enum kind { PLAIN = 0, FANCY = 1 };\n";

constexpr std::string_view kRecords =
    "struct record {\n"
    "  label title;\n"
    "  kind flavor;\n"
    "  label tags<MAX>;\n"
    "};\n";

auto At(int line, int character) -> lsp::Position {
  return lsp::Position{.line = line, .character = character};
}

}  // namespace

TEST_CASE("LanguageService answers queries after indexing",
          "[language_service]") {
  FileTestFixture fixture("xdrls_language_service_test");
  auto types = fixture.CreateFile("types.x", kTypes);
  auto records = fixture.CreateFile("records.x", kRecords);
  const auto root_uri = fixture.GetTempDir().ToUri();

  RunAsyncTest([&](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto service = std::make_shared<LanguageService>(executor);
    service->SetPositionEncoding(PositionEncoding::kUtf8);

    auto init = co_await service->InitializeWorkspace(root_uri);
    REQUIRE(init.has_value());
    CHECK(service->Store()->FileCount() == 2);

    auto definition =
        co_await service->GetDefinitionForPosition(records.ToUri(), At(1, 3));
    REQUIRE(definition.has_value());
    REQUIRE(definition->has_value());
    CHECK((*definition)->uri == types.ToUri());
    CHECK((*definition)->range.start == At(1, 15));

    auto references = co_await service->GetReferencesForPosition(
        types.ToUri(), At(0, 7), true);
    REQUIRE(references.has_value());
    REQUIRE(references->has_value());
    CHECK((*references)->size() == 3);
    CHECK((*references)->back().uri == types.ToUri());

    auto miss =
        co_await service->GetDefinitionForPosition(records.ToUri(), At(0, 6));
    REQUIRE(miss.has_value());
    CHECK_FALSE(miss->has_value());
  });
}

TEST_CASE("LanguageService queries wait for the workspace",
          "[language_service]") {
  FileTestFixture fixture("xdrls_language_service_wait_test");
  auto types = fixture.CreateFile("types.x", kTypes);
  const auto root_uri = fixture.GetTempDir().ToUri();

  RunAsyncTest([&](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto service = std::make_shared<LanguageService>(executor);

    std::optional<bool> found;
    asio::co_spawn(
        executor,
        [service, &found, uri = types.ToUri()]() -> asio::awaitable<void> {
          auto result =
              co_await service->GetDefinitionForPosition(uri, At(1, 23));
          found = result.has_value() && result->has_value();
        },
        asio::detached);

    // The query is parked until indexing completes
    asio::steady_timer timer(executor);
    timer.expires_after(std::chrono::milliseconds(20));
    co_await timer.async_wait(asio::use_awaitable);
    CHECK_FALSE(found.has_value());

    auto init = co_await service->InitializeWorkspace(root_uri);
    REQUIRE(init.has_value());

    timer.expires_after(std::chrono::milliseconds(20));
    co_await timer.async_wait(asio::use_awaitable);
    REQUIRE(found.has_value());
    CHECK(*found);
  });
}

TEST_CASE("LanguageService reports an invalid root", "[language_service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto service = std::make_shared<LanguageService>(executor);

    auto init = co_await service->InitializeWorkspace(
        "file:///nonexistent/xdrls/workspace");
    REQUIRE_FALSE(init.has_value());
    CHECK(init.error().Code() == LspErrorCode::kInvalidParams);

    auto query = co_await service->GetDefinitionForPosition(
        "file:///nonexistent/xdrls/workspace/a.x", At(0, 0));
    REQUIRE_FALSE(query.has_value());
    CHECK(query.error().Code() == LspErrorCode::kServerNotInitialized);
  });
}

TEST_CASE("LanguageService releases parked queries without a root",
          "[language_service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto service = std::make_shared<LanguageService>(executor);

    std::optional<LspErrorCode> code;
    asio::co_spawn(
        executor,
        [service, &code]() -> asio::awaitable<void> {
          auto result = co_await service->GetReferencesForPosition(
              "file:///ws/a.x", At(0, 0), true);
          if (!result) {
            code = result.error().Code();
          }
        },
        asio::detached);

    auto init = co_await service->InitializeWorkspace("");
    REQUIRE_FALSE(init.has_value());

    asio::steady_timer timer(executor);
    timer.expires_after(std::chrono::milliseconds(20));
    co_await timer.async_wait(asio::use_awaitable);
    CHECK(code == LspErrorCode::kServerNotInitialized);
  });
}

TEST_CASE("LanguageService rejects non-file document URIs",
          "[language_service]") {
  FileTestFixture fixture("xdrls_language_service_uri_test");
  fixture.CreateFile("types.x", kTypes);
  const auto root_uri = fixture.GetTempDir().ToUri();

  RunAsyncTest([&](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto service = std::make_shared<LanguageService>(executor);
    auto init = co_await service->InitializeWorkspace(root_uri);
    REQUIRE(init.has_value());

    auto result = co_await service->GetReferencesForPosition(
        "untitled:Untitled-1", At(0, 7), false);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().Code() == LspErrorCode::kRequestFailed);
    CHECK(result.error().Message() == "Could not open file");
  });
}

TEST_CASE("LanguageService UTF-16 positions", "[language_service]") {
  FileTestFixture fixture("xdrls_language_service_utf16_test");
  auto file = fixture.CreateFile(
      "notes.x", "/* \xE2\x82\xAC\xE2\x82\xAC */ const EURO = 2;\n");
  const auto root_uri = fixture.GetTempDir().ToUri();

  RunAsyncTest([&](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto service = std::make_shared<LanguageService>(executor);
    service->SetPositionEncoding(PositionEncoding::kUtf16);
    auto init = co_await service->InitializeWorkspace(root_uri);
    REQUIRE(init.has_value());

    // Each euro sign is 3 bytes but one UTF-16 unit
    auto definition =
        co_await service->GetDefinitionForPosition(file.ToUri(), At(0, 16));
    REQUIRE(definition.has_value());
    REQUIRE(definition->has_value());
    CHECK((*definition)->range.start == At(0, 15));
    CHECK((*definition)->range.end == At(0, 19));
  });
}
