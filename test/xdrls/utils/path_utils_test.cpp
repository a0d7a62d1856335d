#include "xdrls/utils/path_utils.hpp"

#include <string>
#include <unordered_set>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/xdrls/common/file_fixture.hpp"
#include "xdrls/utils/canonical_path.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using xdrls::CanonicalPath;

TEST_CASE("IsSchemaFile matches configured extensions", "[path_utils]") {
  const std::vector<std::string> extensions = {".x", ".xdr"};
  CHECK(xdrls::IsSchemaFile("proto/a.x", extensions));
  CHECK(xdrls::IsSchemaFile("proto/a.XDR", extensions));
  CHECK_FALSE(xdrls::IsSchemaFile("proto/a.h", extensions));
  CHECK_FALSE(xdrls::IsSchemaFile("proto/x", extensions));
  CHECK_FALSE(xdrls::IsSchemaFile(".xdrls", extensions));
}

TEST_CASE("UriToPath decodes file URIs", "[path_utils]") {
  CHECK(xdrls::IsFileUri("file:///ws/a.x"));
  CHECK_FALSE(xdrls::IsFileUri("untitled:Untitled-1"));

  CHECK(xdrls::UriToPath("file:///ws/a.x") == "/ws/a.x");
  CHECK(xdrls::UriToPath("file:///ws/my%20proto/a.x") == "/ws/my proto/a.x");
  CHECK(xdrls::UriToPath("file://localhost/ws/a.x") == "/ws/a.x");
  CHECK(xdrls::UriToPath("file:///ws/sub/../a.x") == "/ws/a.x");
  // Malformed escapes are kept as written
  CHECK(xdrls::UriToPath("file:///ws/100%.x") == "/ws/100%.x");
}

TEST_CASE("PathToUri escapes reserved characters", "[path_utils]") {
  CHECK(xdrls::PathToUri("/ws/a.x") == "file:///ws/a.x");
  CHECK(xdrls::PathToUri("/ws/my proto/#1.x") == "file:///ws/my%20proto/%231.x");
  CHECK(xdrls::PathToUri("/ws/\xC3\xA9.x") == "file:///ws/%C3%A9.x");
}

TEST_CASE("CanonicalPath identifies files", "[canonical_path]") {
  xdrls::test::FileTestFixture fixture("xdrls_canonical_path_test");
  auto file = fixture.CreateFile("dir/a.x", "");

  SECTION("URI round trip") {
    auto from_uri = CanonicalPath::FromUri(file.ToUri());
    CHECK(from_uri == file);
  }

  SECTION("different spellings compare equal") {
    auto spelled = fixture.GetTempDir() / "dir/../dir/./a.x";
    CHECK(spelled == file);

    std::unordered_set<CanonicalPath> set{file};
    CHECK(set.contains(spelled));
  }

  SECTION("non-file URIs give an empty path") {
    CHECK(CanonicalPath::FromUri("untitled:Untitled-1").Empty());
    CHECK(CanonicalPath().Empty());
  }

  SECTION("formats as its path string") {
    CHECK(fmt::format("{}", file) == file.String());
  }
}
