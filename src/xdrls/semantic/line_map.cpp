#include "xdrls/semantic/line_map.hpp"

#include <algorithm>
#include <iterator>

namespace xdrls::semantic {

namespace {

auto IsContinuation(unsigned char byte) -> bool {
  return (byte & 0xC0) == 0x80;
}

// Length in bytes of the sequence starting at text[pos], or 0 when it is not
// a complete well-formed sequence
auto SequenceLength(std::string_view text, std::size_t pos) -> std::size_t {
  auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 0;
  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
  } else {
    return 0;
  }

  if (pos + length > text.size()) {
    return 0;
  }
  for (std::size_t i = 1; i < length; ++i) {
    if (!IsContinuation(static_cast<unsigned char>(text[pos + i]))) {
      return 0;
    }
  }
  return length;
}

}  // namespace

auto Utf16Length(std::string_view text) -> std::size_t {
  std::size_t units = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto length = SequenceLength(text, pos);
    if (length == 0) {
      ++units;
      ++pos;
      continue;
    }
    // Code points above the BMP need a surrogate pair
    units += length == 4 ? 2 : 1;
    pos += length;
  }
  return units;
}

LineMap::LineMap(std::string_view text, PositionEncoding encoding)
    : text_(text), encoding_(encoding) {
  line_starts_.push_back(0);
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      line_starts_.push_back(i + 1);
    }
  }
}

auto LineMap::LineOf(std::size_t offset) const -> int {
  auto it = std::ranges::upper_bound(line_starts_, offset);
  return static_cast<int>(std::distance(line_starts_.begin(), it)) - 1;
}

auto LineMap::ColumnOf(int line, std::size_t offset) const -> int {
  const std::size_t line_start = line_starts_[static_cast<std::size_t>(line)];
  const std::size_t end = std::min(offset, text_.size());
  if (end <= line_start) {
    return 0;
  }

  switch (encoding_) {
    case PositionEncoding::kUtf8:
      return static_cast<int>(end - line_start);
    case PositionEncoding::kUtf16:
      return static_cast<int>(
          Utf16Length(text_.substr(line_start, end - line_start)));
  }
  return static_cast<int>(end - line_start);
}

auto LineMap::PositionOf(std::size_t offset) const -> lsp::Position {
  int line = LineOf(offset);
  return lsp::Position{.line = line, .character = ColumnOf(line, offset)};
}

auto LineMap::RangeOf(syntax::ByteSpan span) const -> lsp::Range {
  int line = LineOf(span.start);
  return lsp::Range{
      .start = {.line = line, .character = ColumnOf(line, span.start)},
      .end = {.line = line, .character = ColumnOf(line, span.end)},
  };
}

}  // namespace xdrls::semantic
