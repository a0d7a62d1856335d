#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace xdrls::syntax {

// Half-open byte range [start, end) into the source text of one file
struct ByteSpan {
  std::size_t start = 0;
  std::size_t end = 0;
};

struct Identifier {
  std::string name;
  ByteSpan span;
};

// Literal constant token, kept as written (decimal, 0x.., 0.., optional '-')
struct Constant {
  std::string text;
};

using Value = std::variant<Constant, Identifier>;

// Built-in type keyword(s), e.g. "unsigned hyper"
struct BuiltinType {
  std::string name;
};

struct EnumMember {
  Identifier id;
  Value value;
};

struct EnumBody {
  std::vector<EnumMember> members;
};

// Bodies nest through declarations. Each body owns its children; the
// recursion goes through std::vector and std::unique_ptr so Declaration may
// be incomplete here.
struct Declaration;
struct CaseSpec;

struct StructBody {
  std::vector<Declaration> members;
};

struct UnionBody {
  std::unique_ptr<Declaration> discriminant;
  std::vector<CaseSpec> cases;
  std::unique_ptr<Declaration> default_case;
};

using TypeSpecifier =
    std::variant<BuiltinType, EnumBody, StructBody, UnionBody, Identifier>;

// type-specifier identifier
struct PlainDeclaration {
  TypeSpecifier type;
  Identifier id;
};

// type-specifier identifier "[" value "]"
struct FixedArrayDeclaration {
  TypeSpecifier type;
  Identifier id;
  Value size;
};

// type-specifier identifier "<" [ value ] ">"
struct VariableArrayDeclaration {
  TypeSpecifier type;
  Identifier id;
  std::unique_ptr<Value> max_size;
};

// "opaque" identifier "[" value "]"
struct FixedOpaqueDeclaration {
  Identifier id;
  Value size;
};

// "opaque" identifier "<" [ value ] ">"
struct VariableOpaqueDeclaration {
  Identifier id;
  std::unique_ptr<Value> max_size;
};

// "string" identifier "<" [ value ] ">"
struct StringDeclaration {
  Identifier id;
  std::unique_ptr<Value> max_size;
};

// type-specifier "*" identifier
struct OptionalDeclaration {
  TypeSpecifier type;
  Identifier id;
};

struct VoidDeclaration {};

struct Declaration {
  using Node = std::variant<
      PlainDeclaration, FixedArrayDeclaration, VariableArrayDeclaration,
      FixedOpaqueDeclaration, VariableOpaqueDeclaration, StringDeclaration,
      OptionalDeclaration, VoidDeclaration>;

  Node node;
};

struct CaseSpec {
  std::vector<Value> values;
  Declaration declaration;
};

struct ConstantDefinition {
  Identifier id;
  Constant value;
};

struct TypedefDefinition {
  Declaration declaration;
};

struct EnumDefinition {
  Identifier id;
  EnumBody body;
};

struct StructDefinition {
  Identifier id;
  StructBody body;
};

struct UnionDefinition {
  Identifier id;
  UnionBody body;
};

using Definition = std::variant<
    ConstantDefinition, TypedefDefinition, EnumDefinition, StructDefinition,
    UnionDefinition>;

// One parsed schema file
struct Specification {
  std::vector<Definition> definitions;
};

}  // namespace xdrls::syntax
