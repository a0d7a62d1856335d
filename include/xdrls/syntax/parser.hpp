#pragma once

#include <cstddef>
#include <expected>
#include <string_view>
#include <vector>

#include "xdrls/syntax/ast.hpp"
#include "xdrls/syntax/lexer.hpp"

namespace xdrls::syntax {

// Parse one XDR schema file (RFC 4506 section 6.3). On failure nothing but
// the first error is returned.
[[nodiscard]] auto Parse(std::string_view text)
    -> std::expected<Specification, ParseError>;

// Recursive-descent parser over the output of Lexer
class Parser {
 public:
  explicit Parser(std::vector<SyntaxToken> tokens);

  [[nodiscard]] auto ParseSpecification()
      -> std::expected<Specification, ParseError>;

 private:
  auto ParseDefinition() -> std::expected<Definition, ParseError>;
  auto ParseConstantDefinition() -> std::expected<Definition, ParseError>;
  auto ParseDeclaration() -> std::expected<Declaration, ParseError>;
  auto ParseTypeSpecifier() -> std::expected<TypeSpecifier, ParseError>;
  // Anonymous enum, struct or union body inside a declaration
  auto ParseInlineBody() -> std::expected<TypeSpecifier, ParseError>;
  auto ParseEnumBody() -> std::expected<EnumBody, ParseError>;
  auto ParseStructBody() -> std::expected<StructBody, ParseError>;
  auto ParseUnionBody() -> std::expected<UnionBody, ParseError>;
  auto ParseCaseSpec() -> std::expected<CaseSpec, ParseError>;
  auto ParseValue() -> std::expected<Value, ParseError>;
  auto ParseIdentifier() -> std::expected<Identifier, ParseError>;

  // Parses "<" [ value ] ">" after the identifier of a variable-length
  // declaration
  auto ParseOptionalBound()
      -> std::expected<std::unique_ptr<Value>, ParseError>;
  // Parses "[" value "]"
  auto ParseFixedBound() -> std::expected<Value, ParseError>;

  auto Expect(TokenKind kind) -> std::expected<SyntaxToken, ParseError>;
  auto Advance() -> const SyntaxToken&;
  [[nodiscard]] auto Peek(std::size_t ahead = 0) const -> const SyntaxToken&;
  [[nodiscard]] auto Check(TokenKind kind) const -> bool;
  auto Match(TokenKind kind) -> bool;
  [[nodiscard]] auto ErrorAtCurrent(std::string_view expected) const
      -> ParseError;

  // Bodies nested deeper than this are rejected so recursion stays bounded
  static constexpr int kMaxNestingDepth = 256;

  std::vector<SyntaxToken> tokens_;
  std::size_t pos_ = 0;
  int depth_ = 0;
};

}  // namespace xdrls::syntax
