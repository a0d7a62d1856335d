#include "xdrls/semantic/index_store.hpp"

#include <string_view>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/xdrls/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using xdrls::CanonicalPath;
using xdrls::semantic::BuildFileIndex;
using xdrls::semantic::IndexStore;
using xdrls::test::FileTestFixture;

namespace {

auto AddText(IndexStore& store, const CanonicalPath& file, std::string_view text)
    -> void {
  auto index = BuildFileIndex(file, text);
  REQUIRE(index.has_value());
  store.Add(std::move(*index));
}

}  // namespace

TEST_CASE("IndexStore keeps the last definition merged", "[index_store]") {
  IndexStore store;
  const CanonicalPath first("/ws/a.x");
  const CanonicalPath second("/ws/b.x");

  AddText(store, first, "const LIMIT = 1;");
  AddText(store, second, "\nconst LIMIT = 2;");

  auto definition = store.FindDefinition("LIMIT");
  REQUIRE(definition.has_value());
  CHECK(definition->uri == second.ToUri());
  CHECK(definition->range.start.line == 1);
}

TEST_CASE("IndexStore accumulates references across files", "[index_store]") {
  IndexStore store;
  AddText(store, CanonicalPath("/ws/a.x"), "typedef id key;");
  AddText(store, CanonicalPath("/ws/b.x"), "struct s { id owner; };");

  auto references = store.FindReferences("id");
  REQUIRE(references.has_value());
  REQUIRE(references->size() == 2);
  CHECK((*references)[0].uri == CanonicalPath("/ws/a.x").ToUri());
  CHECK((*references)[1].uri == CanonicalPath("/ws/b.x").ToUri());

  CHECK_FALSE(store.FindReferences("nothing").has_value());
  CHECK_FALSE(store.FindDefinition("id").has_value());
  CHECK(store.FileCount() == 2);
}

TEST_CASE("IndexStore tokens are looked up per file and line",
          "[index_store]") {
  IndexStore store;
  const CanonicalPath file("/ws/a.x");
  AddText(store, file, "const A = 1;\nconst B = 2;");

  auto line = store.FindLineTokens(file, 1);
  REQUIRE(line.size() == 1);
  CHECK(line[0].name == "B");

  CHECK(store.FindLineTokens(file, 7).empty());
  CHECK(store.FindLineTokens(CanonicalPath("/ws/other.x"), 0).empty());
}

TEST_CASE("IndexStore merging the same file twice is idempotent",
          "[index_store]") {
  IndexStore store;
  const CanonicalPath file("/ws/a.x");
  AddText(store, file, "struct s { T field; };");
  AddText(store, file, "struct s { T field; };");

  auto references = store.FindReferences("T");
  REQUIRE(references.has_value());
  CHECK(references->size() == 1);
  CHECK(store.FileCount() == 1);
}

TEST_CASE("IndexStore IndexFiles replaces the index", "[index_store]") {
  FileTestFixture fixture("xdrls_index_store_test");
  auto a = fixture.CreateFile("a.x", "const A = 1;");
  auto b = fixture.CreateFile("b.x", "const B = ;");  // does not parse
  auto c = fixture.CreateFile("c.x", "typedef int C;");

  IndexStore store;
  AddText(store, CanonicalPath("/elsewhere/old.x"), "const OLD = 1;");

  CHECK(store.IndexFiles({a, b, c}) == 2);
  CHECK(store.FileCount() == 2);
  CHECK(store.FindDefinition("A").has_value());
  CHECK(store.FindDefinition("C").has_value());
  CHECK_FALSE(store.FindDefinition("B").has_value());
  CHECK_FALSE(store.FindDefinition("OLD").has_value());

  SECTION("building twice yields the same tables") {
    CHECK(store.IndexFiles({a, b, c}) == 2);
    auto definition = store.FindDefinition("A");
    REQUIRE(definition.has_value());
    CHECK(definition->uri == a.ToUri());
    CHECK(store.FileCount() == 2);
  }
}

TEST_CASE("IndexStore Reindex replaces one file's contribution",
          "[index_store]") {
  IndexStore store;
  const CanonicalPath a("/ws/a.x");
  const CanonicalPath b("/ws/b.x");
  AddText(store, a, "const SHARED = 1;\ntypedef old_type value;");
  AddText(store, b, "struct s { old_type x; };");

  SECTION("new text replaces definitions, references and tokens") {
    auto result = store.Reindex(a, "typedef new_type value;", 1);
    REQUIRE(result.has_value());
    CHECK(*result);

    CHECK_FALSE(store.FindDefinition("SHARED").has_value());
    auto old_refs = store.FindReferences("old_type");
    REQUIRE(old_refs.has_value());
    REQUIRE(old_refs->size() == 1);
    CHECK((*old_refs)[0].uri == b.ToUri());

    CHECK(store.FindReferences("new_type").has_value());
    CHECK(store.FindLineTokens(a, 1).empty());
  }

  SECTION("discovery order still decides duplicate definitions") {
    AddText(store, CanonicalPath("/ws/c.x"), "const SHARED = 3;");
    REQUIRE(store.Reindex(a, "const SHARED = 10;", 2).has_value());

    auto definition = store.FindDefinition("SHARED");
    REQUIRE(definition.has_value());
    CHECK(definition->uri == CanonicalPath("/ws/c.x").ToUri());
  }

  SECTION("unchanged version is a no-op") {
    REQUIRE(store.Reindex(a, "const OTHER = 1;", 5).value());
    auto result = store.Reindex(a, "const THIRD = 1;", 5);
    REQUIRE(result.has_value());
    CHECK_FALSE(*result);
    CHECK(store.FindDefinition("OTHER").has_value());
    CHECK_FALSE(store.FindDefinition("THIRD").has_value());
  }

  SECTION("parse failure keeps the previous contribution") {
    auto result = store.Reindex(a, "const BROKEN", 3);
    REQUIRE_FALSE(result.has_value());
    CHECK(store.FindDefinition("SHARED").has_value());
    CHECK_FALSE(store.FindDefinition("BROKEN").has_value());
  }

  SECTION("unknown file is appended") {
    const CanonicalPath d("/ws/d.x");
    REQUIRE(store.Reindex(d, "const SHARED = 4;", 1).value());
    CHECK(store.FileCount() == 3);
    auto definition = store.FindDefinition("SHARED");
    REQUIRE(definition.has_value());
    CHECK(definition->uri == d.ToUri());
  }
}
