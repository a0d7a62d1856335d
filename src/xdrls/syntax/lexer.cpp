#include "xdrls/syntax/lexer.hpp"

#include <cctype>
#include <unordered_map>

#include <fmt/format.h>

namespace xdrls::syntax {

namespace {

auto IsIdentifierStart(char c) -> bool {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto IsIdentifierChar(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto IsDigit(char c) -> bool {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto IsHexDigit(char c) -> bool {
  return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

auto LookupKeyword(std::string_view word) -> TokenKind {
  static const std::unordered_map<std::string_view, TokenKind> kKeywords = {
      {"bool", TokenKind::kBool},         {"case", TokenKind::kCase},
      {"const", TokenKind::kConst},       {"default", TokenKind::kDefault},
      {"double", TokenKind::kDouble},     {"quadruple", TokenKind::kQuadruple},
      {"enum", TokenKind::kEnum},         {"float", TokenKind::kFloat},
      {"hyper", TokenKind::kHyper},       {"int", TokenKind::kInt},
      {"opaque", TokenKind::kOpaque},     {"string", TokenKind::kString},
      {"struct", TokenKind::kStruct},     {"switch", TokenKind::kSwitch},
      {"typedef", TokenKind::kTypedef},   {"union", TokenKind::kUnion},
      {"unsigned", TokenKind::kUnsigned}, {"void", TokenKind::kVoid},
  };

  if (auto it = kKeywords.find(word); it != kKeywords.end()) {
    return it->second;
  }
  return TokenKind::kIdentifier;
}

}  // namespace

auto ToString(TokenKind kind) -> std::string_view {
  switch (kind) {
    case TokenKind::kIdentifier:
      return "identifier";
    case TokenKind::kConstant:
      return "constant";
    case TokenKind::kBool:
      return "'bool'";
    case TokenKind::kCase:
      return "'case'";
    case TokenKind::kConst:
      return "'const'";
    case TokenKind::kDefault:
      return "'default'";
    case TokenKind::kDouble:
      return "'double'";
    case TokenKind::kQuadruple:
      return "'quadruple'";
    case TokenKind::kEnum:
      return "'enum'";
    case TokenKind::kFloat:
      return "'float'";
    case TokenKind::kHyper:
      return "'hyper'";
    case TokenKind::kInt:
      return "'int'";
    case TokenKind::kOpaque:
      return "'opaque'";
    case TokenKind::kString:
      return "'string'";
    case TokenKind::kStruct:
      return "'struct'";
    case TokenKind::kSwitch:
      return "'switch'";
    case TokenKind::kTypedef:
      return "'typedef'";
    case TokenKind::kUnion:
      return "'union'";
    case TokenKind::kUnsigned:
      return "'unsigned'";
    case TokenKind::kVoid:
      return "'void'";
    case TokenKind::kLeftBrace:
      return "'{'";
    case TokenKind::kRightBrace:
      return "'}'";
    case TokenKind::kLeftBracket:
      return "'['";
    case TokenKind::kRightBracket:
      return "']'";
    case TokenKind::kLeftAngle:
      return "'<'";
    case TokenKind::kRightAngle:
      return "'>'";
    case TokenKind::kLeftParen:
      return "'('";
    case TokenKind::kRightParen:
      return "')'";
    case TokenKind::kSemicolon:
      return "';'";
    case TokenKind::kColon:
      return "':'";
    case TokenKind::kComma:
      return "','";
    case TokenKind::kEquals:
      return "'='";
    case TokenKind::kStar:
      return "'*'";
    case TokenKind::kEndOfFile:
      return "end of file";
  }
  return "unknown token";
}

auto Lexer::Tokenize() -> std::expected<std::vector<SyntaxToken>, ParseError> {
  std::vector<SyntaxToken> tokens;

  while (true) {
    if (auto trivia = SkipTrivia(); !trivia) {
      return std::unexpected(trivia.error());
    }

    if (pos_ >= text_.size()) {
      tokens.push_back(MakeToken(TokenKind::kEndOfFile, pos_));
      return tokens;
    }

    const char c = PeekChar();
    if (IsIdentifierStart(c)) {
      tokens.push_back(LexWord());
    } else if (IsDigit(c) || c == '-') {
      auto number = LexNumber();
      if (!number) {
        return std::unexpected(number.error());
      }
      tokens.push_back(*number);
    } else {
      auto punct = LexPunctuation();
      if (!punct) {
        return std::unexpected(punct.error());
      }
      tokens.push_back(*punct);
    }
  }
}

auto Lexer::SkipTrivia() -> std::expected<void, ParseError> {
  while (pos_ < text_.size()) {
    const char c = PeekChar();

    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      ++pos_;
      continue;
    }

    // rpcgen pass-through line
    if (c == '%' && AtLineStart()) {
      while (pos_ < text_.size() && PeekChar() != '\n') {
        ++pos_;
      }
      continue;
    }

    if (c == '/' && PeekChar(1) == '/') {
      while (pos_ < text_.size() && PeekChar() != '\n') {
        ++pos_;
      }
      continue;
    }

    if (c == '/' && PeekChar(1) == '*') {
      const std::size_t start = pos_;
      auto close = text_.find("*/", pos_ + 2);
      if (close == std::string_view::npos) {
        return std::unexpected(
            ParseError{.message = "unterminated comment", .offset = start});
      }
      pos_ = close + 2;
      continue;
    }

    break;
  }
  return {};
}

auto Lexer::LexWord() -> SyntaxToken {
  const std::size_t start = pos_;
  while (pos_ < text_.size() && IsIdentifierChar(PeekChar())) {
    ++pos_;
  }
  return MakeToken(LookupKeyword(text_.substr(start, pos_ - start)), start);
}

auto Lexer::LexNumber() -> std::expected<SyntaxToken, ParseError> {
  const std::size_t start = pos_;

  if (PeekChar() == '-') {
    ++pos_;
    if (!IsDigit(PeekChar())) {
      return std::unexpected(ParseError{
          .message = "expected digits after '-'", .offset = start});
    }
  }

  if (PeekChar() == '0' && (PeekChar(1) == 'x' || PeekChar(1) == 'X')) {
    pos_ += 2;
    if (!IsHexDigit(PeekChar())) {
      return std::unexpected(ParseError{
          .message = "expected hexadecimal digits", .offset = start});
    }
    while (IsHexDigit(PeekChar())) {
      ++pos_;
    }
  } else if (PeekChar() == '0') {
    ++pos_;
    while (PeekChar() >= '0' && PeekChar() <= '7') {
      ++pos_;
    }
  } else {
    while (IsDigit(PeekChar())) {
      ++pos_;
    }
  }

  if (IsIdentifierChar(PeekChar())) {
    return std::unexpected(ParseError{
        .message = fmt::format(
            "invalid character '{}' in constant", PeekChar()),
        .offset = pos_});
  }

  return MakeToken(TokenKind::kConstant, start);
}

auto Lexer::LexPunctuation() -> std::expected<SyntaxToken, ParseError> {
  const std::size_t start = pos_;
  TokenKind kind{};

  switch (PeekChar()) {
    case '{':
      kind = TokenKind::kLeftBrace;
      break;
    case '}':
      kind = TokenKind::kRightBrace;
      break;
    case '[':
      kind = TokenKind::kLeftBracket;
      break;
    case ']':
      kind = TokenKind::kRightBracket;
      break;
    case '<':
      kind = TokenKind::kLeftAngle;
      break;
    case '>':
      kind = TokenKind::kRightAngle;
      break;
    case '(':
      kind = TokenKind::kLeftParen;
      break;
    case ')':
      kind = TokenKind::kRightParen;
      break;
    case ';':
      kind = TokenKind::kSemicolon;
      break;
    case ':':
      kind = TokenKind::kColon;
      break;
    case ',':
      kind = TokenKind::kComma;
      break;
    case '=':
      kind = TokenKind::kEquals;
      break;
    case '*':
      kind = TokenKind::kStar;
      break;
    default:
      return std::unexpected(ParseError{
          .message = fmt::format("unexpected character '{}'", PeekChar()),
          .offset = start});
  }

  ++pos_;
  return MakeToken(kind, start);
}

auto Lexer::AtLineStart() const -> bool {
  return pos_ == 0 || text_[pos_ - 1] == '\n';
}

auto Lexer::PeekChar(std::size_t ahead) const -> char {
  if (pos_ + ahead >= text_.size()) {
    return '\0';
  }
  return text_[pos_ + ahead];
}

auto Lexer::MakeToken(TokenKind kind, std::size_t start) const -> SyntaxToken {
  return SyntaxToken{
      .kind = kind,
      .text = text_.substr(start, pos_ - start),
      .span = ByteSpan{.start = start, .end = pos_},
  };
}

}  // namespace xdrls::syntax
