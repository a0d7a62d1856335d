#pragma once

#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <lsp/basic.hpp>

#include "xdrls/semantic/line_map.hpp"
#include "xdrls/utils/canonical_path.hpp"

namespace xdrls::semantic {

// Identifier occurrence on one line: [start, end] columns and its name
struct Token {
  int start = 0;
  int end = 0;
  std::string name;
};

// Tokens of one file keyed by line, each line sorted by start column
using LineTokens = std::map<int, std::vector<Token>>;

struct NamedLocation {
  std::string name;
  lsp::Location location;
};

// Everything one file adds to the index. Definitions and references keep
// source order so merging files in discovery order is deterministic.
struct FileIndex {
  CanonicalPath file;
  int version = 0;
  LineTokens tokens;
  std::vector<NamedLocation> definitions;
  std::vector<NamedLocation> references;
};

// Parses `text`, walks it and maps every occurrence to a location in `file`.
// Returns a message naming the file and the failure position when the text
// does not parse.
[[nodiscard]] auto BuildFileIndex(
    const CanonicalPath& file, std::string_view text,
    PositionEncoding encoding = PositionEncoding::kUtf8, int version = 0)
    -> std::expected<FileIndex, std::string>;

// Reads `file` from disk, then BuildFileIndex
[[nodiscard]] auto LoadFileIndex(
    const CanonicalPath& file,
    PositionEncoding encoding = PositionEncoding::kUtf8)
    -> std::expected<FileIndex, std::string>;

}  // namespace xdrls::semantic
