#include "xdrls/semantic/file_index.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <fmt/format.h>

#include "xdrls/semantic/occurrence_visitor.hpp"
#include "xdrls/syntax/parser.hpp"

namespace xdrls::semantic {

auto BuildFileIndex(
    const CanonicalPath& file, std::string_view text, PositionEncoding encoding,
    int version) -> std::expected<FileIndex, std::string> {
  LineMap line_map(text, encoding);

  auto spec = syntax::Parse(text);
  if (!spec) {
    auto position = line_map.PositionOf(spec.error().offset);
    return std::unexpected(fmt::format(
        "{}:{}:{}: {}", file, position.line + 1, position.character + 1,
        spec.error().message));
  }

  FileIndex index{.file = file, .version = version};
  const std::string uri = file.ToUri();

  for (auto& occurrence : OccurrenceVisitor::Collect(*spec)) {
    auto range = line_map.RangeOf(occurrence.span);

    index.tokens[range.start.line].push_back(
        Token{
            .start = range.start.character,
            .end = range.end.character,
            .name = occurrence.name});

    auto& target =
        occurrence.is_definition ? index.definitions : index.references;
    target.push_back(
        NamedLocation{
            .name = std::move(occurrence.name),
            .location = lsp::Location{.uri = uri, .range = range}});
  }

  for (auto& [line, tokens] : index.tokens) {
    std::ranges::stable_sort(
        tokens, [](const Token& lhs, const Token& rhs) {
          return lhs.start < rhs.start;
        });
  }

  return index;
}

auto LoadFileIndex(const CanonicalPath& file, PositionEncoding encoding)
    -> std::expected<FileIndex, std::string> {
  std::ifstream stream(file.Path(), std::ios::binary);
  if (!stream) {
    return std::unexpected(fmt::format("{}: cannot open file", file));
  }

  std::stringstream buffer;
  buffer << stream.rdbuf();
  if (stream.bad()) {
    return std::unexpected(fmt::format("{}: read error", file));
  }

  return BuildFileIndex(file, buffer.str(), encoding);
}

}  // namespace xdrls::semantic
