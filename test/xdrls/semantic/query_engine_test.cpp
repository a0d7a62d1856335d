#include "xdrls/semantic/query_engine.hpp"

#include <memory>
#include <string_view>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using xdrls::CanonicalPath;
using xdrls::semantic::BuildFileIndex;
using xdrls::semantic::FindTokenAt;
using xdrls::semantic::IndexStore;
using xdrls::semantic::QueryEngine;
using xdrls::semantic::Token;

namespace {

const CanonicalPath kFile("/ws/schema.x");

// Store holding one file with the given text
auto MakeEngine(std::string_view text) -> QueryEngine {
  auto store = std::make_shared<IndexStore>();
  auto index = BuildFileIndex(kFile, text);
  REQUIRE(index.has_value());
  store->Add(std::move(*index));
  return QueryEngine(store);
}

auto At(int line, int character) -> lsp::Position {
  return lsp::Position{.line = line, .character = character};
}

}  // namespace

TEST_CASE("FindTokenAt matches inclusive token bounds", "[query]") {
  const std::vector<Token> tokens = {
      {.start = 2, .end = 5, .name = "abc"},
      {.start = 8, .end = 9, .name = "d"},
  };

  CHECK(FindTokenAt(tokens, 0) == nullptr);
  CHECK(FindTokenAt(tokens, 2)->name == "abc");
  CHECK(FindTokenAt(tokens, 4)->name == "abc");
  CHECK(FindTokenAt(tokens, 5)->name == "abc");
  CHECK(FindTokenAt(tokens, 6) == nullptr);
  CHECK(FindTokenAt(tokens, 8)->name == "d");
  CHECK(FindTokenAt(tokens, 10) == nullptr);
  CHECK(FindTokenAt({}, 0) == nullptr);
}

TEST_CASE("QueryEngine constant definition", "[query]") {
  auto engine = MakeEngine("const MAX = 10;");

  auto definition = engine.DefinitionOf("MAX");
  REQUIRE(definition.has_value());
  CHECK(definition->uri == kFile.ToUri());
  CHECK(
      definition->range ==
      lsp::Range{.start = At(0, 6), .end = At(0, 9)});

  CHECK_FALSE(engine.ReferencesOf("MAX", false).has_value());
  CHECK_FALSE(engine.ReferencesOf("MAX", true).has_value());
}

TEST_CASE("QueryEngine struct fields are references only", "[query]") {
  auto engine = MakeEngine("struct Foo { int x; };");

  auto foo = engine.DefinitionOf("Foo");
  REQUIRE(foo.has_value());
  CHECK(foo->range.start.line == 0);

  auto references = engine.ReferencesOf("x", false);
  REQUIRE(references.has_value());
  REQUIRE(references->size() == 1);
  CHECK(
      (*references)[0].range ==
      lsp::Range{.start = At(0, 17), .end = At(0, 18)});

  CHECK_FALSE(engine.DefinitionOf("x").has_value());
}

TEST_CASE("QueryEngine misses between adjacent tokens", "[query]") {
  auto engine = MakeEngine("typedef a  b;");

  CHECK(engine.IdentifierAt(kFile, At(0, 8)) == "a");
  CHECK(engine.IdentifierAt(kFile, At(0, 9)) == "a");
  CHECK_FALSE(engine.IdentifierAt(kFile, At(0, 10)).has_value());
  CHECK(engine.IdentifierAt(kFile, At(0, 11)) == "b");
}

TEST_CASE("QueryEngine resolves identifiers by position", "[query]") {
  auto engine = MakeEngine(
      "const SIZE = 4;\n"
      "typedef opaque block[SIZE];\n"
      "struct chain { block head; block tail; };\n");

  SECTION("definition of a use") {
    auto name = engine.IdentifierAt(kFile, At(1, 23));
    REQUIRE(name == "SIZE");
    auto definition = engine.DefinitionOf(*name);
    REQUIRE(definition.has_value());
    CHECK(definition->range.start == At(0, 6));
  }

  SECTION("references with and without the declaration") {
    auto name = engine.IdentifierAt(kFile, At(1, 16));
    REQUIRE(name == "block");

    auto uses = engine.ReferencesOf(*name, false);
    REQUIRE(uses.has_value());
    REQUIRE(uses->size() == 2);
    CHECK((*uses)[0].range.start == At(2, 15));
    CHECK((*uses)[1].range.start == At(2, 27));

    auto with_declaration = engine.ReferencesOf(*name, true);
    REQUIRE(with_declaration.has_value());
    REQUIRE(with_declaration->size() == 3);
    CHECK(with_declaration->back().range.start == At(1, 15));
  }

  SECTION("positions outside any token") {
    CHECK_FALSE(engine.IdentifierAt(kFile, At(0, 0)).has_value());
    CHECK_FALSE(engine.IdentifierAt(kFile, At(3, 0)).has_value());
    CHECK_FALSE(engine.IdentifierAt(kFile, At(-1, 0)).has_value());
    CHECK_FALSE(
        engine.IdentifierAt(CanonicalPath("/ws/other.x"), At(0, 6))
            .has_value());
  }
}
