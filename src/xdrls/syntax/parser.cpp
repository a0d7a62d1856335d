#include "xdrls/syntax/parser.hpp"

#include <memory>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace xdrls::syntax {

auto Parse(std::string_view text) -> std::expected<Specification, ParseError> {
  Lexer lexer(text);
  auto tokens = lexer.Tokenize();
  if (!tokens) {
    return std::unexpected(tokens.error());
  }

  Parser parser(std::move(*tokens));
  return parser.ParseSpecification();
}

Parser::Parser(std::vector<SyntaxToken> tokens) : tokens_(std::move(tokens)) {
  // Tokenize always terminates the stream; keep Peek() total for hand-built
  // token lists as well
  if (tokens_.empty() || tokens_.back().kind != TokenKind::kEndOfFile) {
    std::size_t end = tokens_.empty() ? 0 : tokens_.back().span.end;
    tokens_.push_back(
        SyntaxToken{
            .kind = TokenKind::kEndOfFile,
            .text = {},
            .span = ByteSpan{.start = end, .end = end}});
  }
}

auto Parser::ParseSpecification() -> std::expected<Specification, ParseError> {
  Specification spec;
  while (!Check(TokenKind::kEndOfFile)) {
    auto definition = ParseDefinition();
    if (!definition) {
      return std::unexpected(definition.error());
    }
    spec.definitions.push_back(std::move(*definition));
  }
  return spec;
}

auto Parser::ParseDefinition() -> std::expected<Definition, ParseError> {
  switch (Peek().kind) {
    case TokenKind::kConst:
      return ParseConstantDefinition();

    case TokenKind::kTypedef: {
      Advance();
      auto declaration = ParseDeclaration();
      if (!declaration) {
        return std::unexpected(declaration.error());
      }
      if (auto semi = Expect(TokenKind::kSemicolon); !semi) {
        return std::unexpected(semi.error());
      }
      return TypedefDefinition{.declaration = std::move(*declaration)};
    }

    case TokenKind::kEnum: {
      Advance();
      auto id = ParseIdentifier();
      if (!id) {
        return std::unexpected(id.error());
      }
      auto body = ParseEnumBody();
      if (!body) {
        return std::unexpected(body.error());
      }
      if (auto semi = Expect(TokenKind::kSemicolon); !semi) {
        return std::unexpected(semi.error());
      }
      return EnumDefinition{.id = std::move(*id), .body = std::move(*body)};
    }

    case TokenKind::kStruct: {
      Advance();
      auto id = ParseIdentifier();
      if (!id) {
        return std::unexpected(id.error());
      }
      auto body = ParseStructBody();
      if (!body) {
        return std::unexpected(body.error());
      }
      if (auto semi = Expect(TokenKind::kSemicolon); !semi) {
        return std::unexpected(semi.error());
      }
      return StructDefinition{.id = std::move(*id), .body = std::move(*body)};
    }

    case TokenKind::kUnion: {
      Advance();
      auto id = ParseIdentifier();
      if (!id) {
        return std::unexpected(id.error());
      }
      auto body = ParseUnionBody();
      if (!body) {
        return std::unexpected(body.error());
      }
      if (auto semi = Expect(TokenKind::kSemicolon); !semi) {
        return std::unexpected(semi.error());
      }
      return UnionDefinition{.id = std::move(*id), .body = std::move(*body)};
    }

    default:
      return std::unexpected(ErrorAtCurrent("a definition"));
  }
}

auto Parser::ParseConstantDefinition()
    -> std::expected<Definition, ParseError> {
  if (auto kw = Expect(TokenKind::kConst); !kw) {
    return std::unexpected(kw.error());
  }
  auto id = ParseIdentifier();
  if (!id) {
    return std::unexpected(id.error());
  }
  if (auto eq = Expect(TokenKind::kEquals); !eq) {
    return std::unexpected(eq.error());
  }
  auto value = Expect(TokenKind::kConstant);
  if (!value) {
    return std::unexpected(value.error());
  }
  if (auto semi = Expect(TokenKind::kSemicolon); !semi) {
    return std::unexpected(semi.error());
  }
  return ConstantDefinition{
      .id = std::move(*id), .value = Constant{std::string(value->text)}};
}

auto Parser::ParseDeclaration() -> std::expected<Declaration, ParseError> {
  if (Match(TokenKind::kVoid)) {
    return Declaration{VoidDeclaration{}};
  }

  if (Match(TokenKind::kOpaque)) {
    auto id = ParseIdentifier();
    if (!id) {
      return std::unexpected(id.error());
    }
    if (Check(TokenKind::kLeftBracket)) {
      auto size = ParseFixedBound();
      if (!size) {
        return std::unexpected(size.error());
      }
      return Declaration{FixedOpaqueDeclaration{
          .id = std::move(*id), .size = std::move(*size)}};
    }
    auto max_size = ParseOptionalBound();
    if (!max_size) {
      return std::unexpected(max_size.error());
    }
    return Declaration{VariableOpaqueDeclaration{
        .id = std::move(*id), .max_size = std::move(*max_size)}};
  }

  if (Match(TokenKind::kString)) {
    auto id = ParseIdentifier();
    if (!id) {
      return std::unexpected(id.error());
    }
    auto max_size = ParseOptionalBound();
    if (!max_size) {
      return std::unexpected(max_size.error());
    }
    return Declaration{StringDeclaration{
        .id = std::move(*id), .max_size = std::move(*max_size)}};
  }

  auto type = ParseTypeSpecifier();
  if (!type) {
    return std::unexpected(type.error());
  }

  if (Match(TokenKind::kStar)) {
    auto id = ParseIdentifier();
    if (!id) {
      return std::unexpected(id.error());
    }
    return Declaration{OptionalDeclaration{
        .type = std::move(*type), .id = std::move(*id)}};
  }

  auto id = ParseIdentifier();
  if (!id) {
    return std::unexpected(id.error());
  }

  if (Check(TokenKind::kLeftBracket)) {
    auto size = ParseFixedBound();
    if (!size) {
      return std::unexpected(size.error());
    }
    return Declaration{FixedArrayDeclaration{
        .type = std::move(*type),
        .id = std::move(*id),
        .size = std::move(*size)}};
  }

  if (Check(TokenKind::kLeftAngle)) {
    auto max_size = ParseOptionalBound();
    if (!max_size) {
      return std::unexpected(max_size.error());
    }
    return Declaration{VariableArrayDeclaration{
        .type = std::move(*type),
        .id = std::move(*id),
        .max_size = std::move(*max_size)}};
  }

  return Declaration{
      PlainDeclaration{.type = std::move(*type), .id = std::move(*id)}};
}

auto Parser::ParseTypeSpecifier() -> std::expected<TypeSpecifier, ParseError> {
  switch (Peek().kind) {
    case TokenKind::kUnsigned: {
      Advance();
      if (Match(TokenKind::kInt)) {
        return BuiltinType{"unsigned int"};
      }
      if (Match(TokenKind::kHyper)) {
        return BuiltinType{"unsigned hyper"};
      }
      return BuiltinType{"unsigned"};
    }

    case TokenKind::kInt:
    case TokenKind::kHyper:
    case TokenKind::kFloat:
    case TokenKind::kDouble:
    case TokenKind::kQuadruple:
    case TokenKind::kBool:
      return BuiltinType{std::string(Advance().text)};

    case TokenKind::kEnum:
    case TokenKind::kStruct:
    case TokenKind::kUnion: {
      if (depth_ >= kMaxNestingDepth) {
        return std::unexpected(ParseError{
            .message = "nesting too deep", .offset = Peek().span.start});
      }
      ++depth_;
      auto type = ParseInlineBody();
      --depth_;
      return type;
    }

    case TokenKind::kIdentifier: {
      auto id = ParseIdentifier();
      if (!id) {
        return std::unexpected(id.error());
      }
      return std::move(*id);
    }

    default:
      return std::unexpected(ErrorAtCurrent("a type specifier"));
  }
}

auto Parser::ParseInlineBody() -> std::expected<TypeSpecifier, ParseError> {
  switch (Advance().kind) {
    case TokenKind::kEnum: {
      auto body = ParseEnumBody();
      if (!body) {
        return std::unexpected(body.error());
      }
      return std::move(*body);
    }
    case TokenKind::kStruct: {
      auto body = ParseStructBody();
      if (!body) {
        return std::unexpected(body.error());
      }
      return std::move(*body);
    }
    default: {
      auto body = ParseUnionBody();
      if (!body) {
        return std::unexpected(body.error());
      }
      return std::move(*body);
    }
  }
}

auto Parser::ParseEnumBody() -> std::expected<EnumBody, ParseError> {
  if (auto open = Expect(TokenKind::kLeftBrace); !open) {
    return std::unexpected(open.error());
  }

  EnumBody body;
  do {
    auto id = ParseIdentifier();
    if (!id) {
      return std::unexpected(id.error());
    }
    if (auto eq = Expect(TokenKind::kEquals); !eq) {
      return std::unexpected(eq.error());
    }
    auto value = ParseValue();
    if (!value) {
      return std::unexpected(value.error());
    }
    body.members.push_back(
        EnumMember{.id = std::move(*id), .value = std::move(*value)});
  } while (Match(TokenKind::kComma));

  if (auto close = Expect(TokenKind::kRightBrace); !close) {
    return std::unexpected(close.error());
  }
  return body;
}

auto Parser::ParseStructBody() -> std::expected<StructBody, ParseError> {
  if (auto open = Expect(TokenKind::kLeftBrace); !open) {
    return std::unexpected(open.error());
  }

  StructBody body;
  do {
    auto declaration = ParseDeclaration();
    if (!declaration) {
      return std::unexpected(declaration.error());
    }
    if (auto semi = Expect(TokenKind::kSemicolon); !semi) {
      return std::unexpected(semi.error());
    }
    body.members.push_back(std::move(*declaration));
  } while (!Check(TokenKind::kRightBrace));

  Advance();
  return body;
}

auto Parser::ParseUnionBody() -> std::expected<UnionBody, ParseError> {
  if (auto kw = Expect(TokenKind::kSwitch); !kw) {
    return std::unexpected(kw.error());
  }
  if (auto open = Expect(TokenKind::kLeftParen); !open) {
    return std::unexpected(open.error());
  }
  auto discriminant = ParseDeclaration();
  if (!discriminant) {
    return std::unexpected(discriminant.error());
  }
  if (auto close = Expect(TokenKind::kRightParen); !close) {
    return std::unexpected(close.error());
  }
  if (auto open = Expect(TokenKind::kLeftBrace); !open) {
    return std::unexpected(open.error());
  }

  UnionBody body;
  body.discriminant = std::make_unique<Declaration>(std::move(*discriminant));

  // At least one case arm is required
  do {
    auto arm = ParseCaseSpec();
    if (!arm) {
      return std::unexpected(arm.error());
    }
    body.cases.push_back(std::move(*arm));
  } while (Check(TokenKind::kCase));

  if (Match(TokenKind::kDefault)) {
    if (auto colon = Expect(TokenKind::kColon); !colon) {
      return std::unexpected(colon.error());
    }
    auto declaration = ParseDeclaration();
    if (!declaration) {
      return std::unexpected(declaration.error());
    }
    if (auto semi = Expect(TokenKind::kSemicolon); !semi) {
      return std::unexpected(semi.error());
    }
    body.default_case =
        std::make_unique<Declaration>(std::move(*declaration));
  }

  if (auto close = Expect(TokenKind::kRightBrace); !close) {
    return std::unexpected(close.error());
  }
  return body;
}

auto Parser::ParseCaseSpec() -> std::expected<CaseSpec, ParseError> {
  CaseSpec arm;
  do {
    if (auto kw = Expect(TokenKind::kCase); !kw) {
      return std::unexpected(kw.error());
    }
    auto value = ParseValue();
    if (!value) {
      return std::unexpected(value.error());
    }
    if (auto colon = Expect(TokenKind::kColon); !colon) {
      return std::unexpected(colon.error());
    }
    arm.values.push_back(std::move(*value));
  } while (Check(TokenKind::kCase));

  auto declaration = ParseDeclaration();
  if (!declaration) {
    return std::unexpected(declaration.error());
  }
  if (auto semi = Expect(TokenKind::kSemicolon); !semi) {
    return std::unexpected(semi.error());
  }
  arm.declaration = std::move(*declaration);
  return arm;
}

auto Parser::ParseValue() -> std::expected<Value, ParseError> {
  if (Check(TokenKind::kConstant)) {
    return Constant{std::string(Advance().text)};
  }
  if (Check(TokenKind::kIdentifier)) {
    auto id = ParseIdentifier();
    if (!id) {
      return std::unexpected(id.error());
    }
    return std::move(*id);
  }
  return std::unexpected(ErrorAtCurrent("a constant or identifier"));
}

auto Parser::ParseIdentifier() -> std::expected<Identifier, ParseError> {
  auto token = Expect(TokenKind::kIdentifier);
  if (!token) {
    return std::unexpected(token.error());
  }
  return Identifier{.name = std::string(token->text), .span = token->span};
}

auto Parser::ParseOptionalBound()
    -> std::expected<std::unique_ptr<Value>, ParseError> {
  if (auto open = Expect(TokenKind::kLeftAngle); !open) {
    return std::unexpected(open.error());
  }
  if (Match(TokenKind::kRightAngle)) {
    return nullptr;
  }
  auto value = ParseValue();
  if (!value) {
    return std::unexpected(value.error());
  }
  if (auto close = Expect(TokenKind::kRightAngle); !close) {
    return std::unexpected(close.error());
  }
  return std::make_unique<Value>(std::move(*value));
}

auto Parser::ParseFixedBound() -> std::expected<Value, ParseError> {
  if (auto open = Expect(TokenKind::kLeftBracket); !open) {
    return std::unexpected(open.error());
  }
  auto value = ParseValue();
  if (!value) {
    return std::unexpected(value.error());
  }
  if (auto close = Expect(TokenKind::kRightBracket); !close) {
    return std::unexpected(close.error());
  }
  return value;
}

auto Parser::Expect(TokenKind kind) -> std::expected<SyntaxToken, ParseError> {
  if (!Check(kind)) {
    return std::unexpected(ErrorAtCurrent(ToString(kind)));
  }
  return Advance();
}

auto Parser::Advance() -> const SyntaxToken& {
  const SyntaxToken& token = tokens_[pos_];
  if (token.kind != TokenKind::kEndOfFile) {
    ++pos_;
  }
  return token;
}

auto Parser::Peek(std::size_t ahead) const -> const SyntaxToken& {
  std::size_t index = pos_ + ahead;
  if (index >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[index];
}

auto Parser::Check(TokenKind kind) const -> bool {
  return Peek().kind == kind;
}

auto Parser::Match(TokenKind kind) -> bool {
  if (!Check(kind)) {
    return false;
  }
  Advance();
  return true;
}

auto Parser::ErrorAtCurrent(std::string_view expected) const -> ParseError {
  const auto& token = Peek();
  std::string found = token.kind == TokenKind::kEndOfFile
                          ? std::string("end of file")
                          : fmt::format("'{}'", token.text);
  return ParseError{
      .message = fmt::format("expected {}, found {}", expected, found),
      .offset = token.span.start};
}

}  // namespace xdrls::syntax
