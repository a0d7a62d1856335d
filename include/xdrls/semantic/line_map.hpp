#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include <lsp/basic.hpp>

#include "xdrls/syntax/ast.hpp"

namespace xdrls::semantic {

// Unit of a column in a (line, column) position
enum class PositionEncoding {
  // Bytes of the line prefix
  kUtf8,
  // UTF-16 code units of the line prefix
  kUtf16,
};

// Maps byte offsets of one file to zero-based (line, column) positions.
//
// Line starts are offset 0 plus one past every '\n'. An offset belongs to the
// greatest line start not exceeding it. The text is borrowed and must outlive
// the map.
class LineMap {
 public:
  explicit LineMap(
      std::string_view text,
      PositionEncoding encoding = PositionEncoding::kUtf8);

  [[nodiscard]] auto LineOf(std::size_t offset) const -> int;

  // Column of `offset` measured from the start of `line`
  [[nodiscard]] auto ColumnOf(int line, std::size_t offset) const -> int;

  [[nodiscard]] auto PositionOf(std::size_t offset) const -> lsp::Position;

  // Both endpoints are measured against the line of span.start, so an
  // identifier always yields a single-line range
  [[nodiscard]] auto RangeOf(syntax::ByteSpan span) const -> lsp::Range;

  [[nodiscard]] auto LineCount() const -> std::size_t {
    return line_starts_.size();
  }

 private:
  std::string_view text_;
  PositionEncoding encoding_;
  std::vector<std::size_t> line_starts_;
};

// Number of UTF-16 code units needed to encode `text`. Bytes that do not
// start a well-formed UTF-8 sequence count as one unit each.
[[nodiscard]] auto Utf16Length(std::string_view text) -> std::size_t;

}  // namespace xdrls::semantic
