#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "xdrls/syntax/ast.hpp"

namespace xdrls::syntax {

enum class TokenKind {
  kIdentifier,
  kConstant,

  // Keywords
  kBool,
  kCase,
  kConst,
  kDefault,
  kDouble,
  kQuadruple,
  kEnum,
  kFloat,
  kHyper,
  kInt,
  kOpaque,
  kString,
  kStruct,
  kSwitch,
  kTypedef,
  kUnion,
  kUnsigned,
  kVoid,

  // Punctuation
  kLeftBrace,
  kRightBrace,
  kLeftBracket,
  kRightBracket,
  kLeftAngle,
  kRightAngle,
  kLeftParen,
  kRightParen,
  kSemicolon,
  kColon,
  kComma,
  kEquals,
  kStar,

  kEndOfFile,
};

auto ToString(TokenKind kind) -> std::string_view;

struct SyntaxToken {
  TokenKind kind;
  std::string_view text;
  ByteSpan span;
};

// First error found while lexing or parsing a file
struct ParseError {
  std::string message;
  std::size_t offset = 0;
};

// Splits XDR source text into tokens. Whitespace, /* */ and // comments and
// rpcgen pass-through lines (a '%' in the first column) are skipped. The
// returned tokens view into `text`, which must outlive them.
class Lexer {
 public:
  explicit Lexer(std::string_view text) : text_(text) {
  }

  [[nodiscard]] auto Tokenize()
      -> std::expected<std::vector<SyntaxToken>, ParseError>;

 private:
  auto SkipTrivia() -> std::expected<void, ParseError>;
  auto LexWord() -> SyntaxToken;
  auto LexNumber() -> std::expected<SyntaxToken, ParseError>;
  auto LexPunctuation() -> std::expected<SyntaxToken, ParseError>;

  [[nodiscard]] auto AtLineStart() const -> bool;
  [[nodiscard]] auto PeekChar(std::size_t ahead = 0) const -> char;
  auto MakeToken(TokenKind kind, std::size_t start) const -> SyntaxToken;

  std::string_view text_;
  std::size_t pos_ = 0;
};

}  // namespace xdrls::syntax
