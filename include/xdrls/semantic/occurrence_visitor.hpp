#pragma once

#include <string>
#include <vector>

#include "xdrls/syntax/ast.hpp"

namespace xdrls::semantic {

// One identifier token of a parsed file, classified as the site that names a
// definition or as a use of a name
struct Occurrence {
  std::string name;
  syntax::ByteSpan span;
  bool is_definition = false;
};

// Depth-first walk of a Specification that yields every identifier in source
// order.
//
// Definition sites:
// - constant names and top-level enum/struct/union names
// - the declared name of a top-level typedef
// - every enum member name, including enums nested in other bodies
//
// Everything else is a use: field names inside struct and union bodies (the
// discriminant, case arms and default arm included), named types, and names
// used as values (array bounds, case labels, enum member values).
//
// The result owns copies of the names, so the Specification may be dropped
// once Collect() returns.
class OccurrenceVisitor {
 public:
  [[nodiscard]] static auto Collect(const syntax::Specification& spec)
      -> std::vector<Occurrence>;

 private:
  OccurrenceVisitor() = default;

  auto VisitDefinition(const syntax::Definition& definition) -> void;
  auto VisitDeclaration(
      const syntax::Declaration& declaration, bool in_definition) -> void;
  auto VisitTypeSpecifier(const syntax::TypeSpecifier& type) -> void;
  auto VisitEnumBody(const syntax::EnumBody& body) -> void;
  auto VisitStructBody(const syntax::StructBody& body) -> void;
  auto VisitUnionBody(const syntax::UnionBody& body) -> void;
  auto VisitValue(const syntax::Value& value) -> void;

  auto Record(const syntax::Identifier& id, bool is_definition) -> void;

  std::vector<Occurrence> occurrences_;
};

}  // namespace xdrls::semantic
