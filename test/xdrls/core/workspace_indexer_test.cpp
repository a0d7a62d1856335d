#include "xdrls/core/workspace_indexer.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/xdrls/common/file_fixture.hpp"
#include "xdrls/core/discovery_provider.hpp"
#include "xdrls/semantic/query_engine.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using xdrls::CanonicalPath;
using xdrls::DiscoverAndIndex;
using xdrls::ResolveWorkspaceRoot;
using xdrls::WorkspaceDiscoveryProvider;
using xdrls::XdrlsConfigFile;
using xdrls::semantic::IndexStore;
using xdrls::test::FileTestFixture;

TEST_CASE("WorkspaceDiscoveryProvider finds schema files in order",
          "[discovery]") {
  FileTestFixture fixture("xdrls_discovery_test");
  auto b = fixture.CreateFile("b.x", "");
  auto a = fixture.CreateFile("sub/dir/a.x", "");
  auto upper = fixture.CreateFile("c.X", "");
  fixture.CreateFile("notes.txt", "");
  fixture.CreateFile("x", "");

  WorkspaceDiscoveryProvider discovery;
  auto files = discovery.DiscoverFiles(fixture.GetTempDir(), XdrlsConfigFile{});

  REQUIRE(files.size() == 3);
  CHECK(files[0] == b);
  CHECK(files[1] == upper);
  CHECK(files[2] == a);
}

TEST_CASE("WorkspaceDiscoveryProvider applies the configuration",
          "[discovery]") {
  FileTestFixture fixture("xdrls_discovery_config_test");
  auto keep = fixture.CreateFile("proto/keep.xdr", "");
  fixture.CreateFile("proto/gen/skip.xdr", "");
  fixture.CreateFile("proto/plain.x", "");
  auto config_path = fixture.CreateFile(
      ".xdrls", "Extensions: [xdr]\nIf:\n  PathExclude: .*/gen/.*\n");

  auto config = XdrlsConfigFile::LoadFromFile(config_path);
  REQUIRE(config.has_value());

  WorkspaceDiscoveryProvider discovery;
  auto files = discovery.DiscoverFiles(fixture.GetTempDir(), *config);
  REQUIRE(files.size() == 1);
  CHECK(files[0] == keep);
}

TEST_CASE("WorkspaceDiscoveryProvider follows directory symlinks",
          "[discovery]") {
  FileTestFixture fixture("xdrls_discovery_symlink_test");
  auto shared = fixture.CreateFile("vendor/shared.x", "");
  auto local = fixture.CreateFile("proto/local.x", "");
  const auto root = fixture.GetTempDir().Path();

  SECTION("linked directory outside the tree") {
    FileTestFixture outside("xdrls_discovery_symlink_target_test");
    auto linked = outside.CreateFile("linked.x", "");
    std::filesystem::create_directory_symlink(
        outside.GetTempDir().Path(), root / "proto/external");

    WorkspaceDiscoveryProvider discovery;
    auto files = discovery.DiscoverFiles(fixture.GetTempDir(), XdrlsConfigFile{});
    // Files are identified by their resolved path
    REQUIRE(files.size() == 3);
    CHECK(std::ranges::find(files, linked) != files.end());
    CHECK(std::ranges::find(files, local) != files.end());
    CHECK(std::ranges::find(files, shared) != files.end());
  }

  SECTION("link cycles end") {
    std::filesystem::create_directory_symlink(root, root / "proto/loop");
    std::filesystem::create_directory_symlink(
        root / "vendor", root / "proto/vendor_again");

    WorkspaceDiscoveryProvider discovery;
    auto files = discovery.DiscoverFiles(fixture.GetTempDir(), XdrlsConfigFile{});
    REQUIRE(files.size() == 2);
    CHECK(files[0] == local);
    CHECK(files[1] == shared);
  }
}

TEST_CASE("WorkspaceDiscoveryProvider skips an unreadable directory only",
          "[discovery]") {
  FileTestFixture fixture("xdrls_discovery_unreadable_test");
  fixture.CreateFile("locked/hidden.x", "");
  auto before = fixture.CreateFile("a/before.x", "");
  auto after = fixture.CreateFile("z/after.x", "");
  const auto locked = fixture.GetTempDir().Path() / "locked";

  std::filesystem::permissions(locked, std::filesystem::perms::none);

  WorkspaceDiscoveryProvider discovery;
  auto files = discovery.DiscoverFiles(fixture.GetTempDir(), XdrlsConfigFile{});

  std::filesystem::permissions(locked, std::filesystem::perms::owner_all);

  // A privileged user can still read the locked directory
  CHECK(std::ranges::find(files, before) != files.end());
  CHECK(std::ranges::find(files, after) != files.end());
  CHECK((files.size() == 2 || files.size() == 3));
}

TEST_CASE("ResolveWorkspaceRoot validates the root URI", "[workspace]") {
  FileTestFixture fixture("xdrls_resolve_root_test");
  auto file = fixture.CreateFile("a.x", "");

  auto root = ResolveWorkspaceRoot(fixture.GetTempDir().ToUri());
  REQUIRE(root.has_value());
  CHECK(*root == fixture.GetTempDir());

  auto not_file = ResolveWorkspaceRoot("https://example.com/schemas");
  REQUIRE_FALSE(not_file.has_value());
  CHECK_THAT(
      not_file.error(),
      Catch::Matchers::ContainsSubstring("valid file path"));

  auto not_directory = ResolveWorkspaceRoot(file.ToUri());
  REQUIRE_FALSE(not_directory.has_value());
  CHECK_THAT(
      not_directory.error(),
      Catch::Matchers::ContainsSubstring("doesn't name a directory"));
}

TEST_CASE("DiscoverAndIndex builds the index of a workspace", "[workspace]") {
  FileTestFixture fixture("xdrls_discover_and_index_test");
  auto types = fixture.CreateFile(
      "types.x",
      "const MAX = 8;\n"
      "typedef string name<MAX>;\n");
  auto user = fixture.CreateFile(
      "rpc/user.x", "struct user { name first; name last; };\n");
  fixture.CreateFile("rpc/broken.x", "struct {");

  auto store = std::make_shared<IndexStore>();
  auto indexed = DiscoverAndIndex(fixture.GetTempDir(), *store);
  REQUIRE(indexed.has_value());
  CHECK(*indexed == 2);

  xdrls::semantic::QueryEngine engine(store);

  auto name = engine.IdentifierAt(user, {.line = 0, .character = 15});
  REQUIRE(name == "name");
  auto definition = engine.DefinitionOf(*name);
  REQUIRE(definition.has_value());
  CHECK(definition->uri == types.ToUri());

  auto references = engine.ReferencesOf("MAX", true);
  REQUIRE(references.has_value());
  CHECK(references->size() == 2);
}

TEST_CASE("DiscoverAndIndex rejects a missing root", "[workspace]") {
  IndexStore store;
  auto result =
      DiscoverAndIndex(CanonicalPath("/nonexistent/xdrls/workspace"), store);
  REQUIRE_FALSE(result.has_value());
  CHECK(store.FileCount() == 0);
}
