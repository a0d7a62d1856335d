#include "xdrls/semantic/occurrence_visitor.hpp"

#include <type_traits>
#include <variant>

namespace xdrls::semantic {

auto OccurrenceVisitor::Collect(const syntax::Specification& spec)
    -> std::vector<Occurrence> {
  OccurrenceVisitor visitor;
  for (const auto& definition : spec.definitions) {
    visitor.VisitDefinition(definition);
  }
  return std::move(visitor.occurrences_);
}

auto OccurrenceVisitor::VisitDefinition(const syntax::Definition& definition)
    -> void {
  std::visit(
      [this](const auto& def) {
        using T = std::decay_t<decltype(def)>;
        if constexpr (std::is_same_v<T, syntax::ConstantDefinition>) {
          Record(def.id, true);
        } else if constexpr (std::is_same_v<T, syntax::TypedefDefinition>) {
          VisitDeclaration(def.declaration, true);
        } else if constexpr (std::is_same_v<T, syntax::EnumDefinition>) {
          Record(def.id, true);
          VisitEnumBody(def.body);
        } else if constexpr (std::is_same_v<T, syntax::StructDefinition>) {
          Record(def.id, true);
          VisitStructBody(def.body);
        } else if constexpr (std::is_same_v<T, syntax::UnionDefinition>) {
          Record(def.id, true);
          VisitUnionBody(def.body);
        }
      },
      definition);
}

auto OccurrenceVisitor::VisitDeclaration(
    const syntax::Declaration& declaration, bool in_definition) -> void {
  std::visit(
      [this, in_definition](const auto& decl) {
        using T = std::decay_t<decltype(decl)>;
        if constexpr (
            std::is_same_v<T, syntax::PlainDeclaration> ||
            std::is_same_v<T, syntax::OptionalDeclaration>) {
          VisitTypeSpecifier(decl.type);
          Record(decl.id, in_definition);
        } else if constexpr (std::is_same_v<T, syntax::FixedArrayDeclaration>) {
          VisitTypeSpecifier(decl.type);
          Record(decl.id, in_definition);
          VisitValue(decl.size);
        } else if constexpr (std::is_same_v<
                                 T, syntax::VariableArrayDeclaration>) {
          VisitTypeSpecifier(decl.type);
          Record(decl.id, in_definition);
          if (decl.max_size) {
            VisitValue(*decl.max_size);
          }
        } else if constexpr (std::is_same_v<
                                 T, syntax::FixedOpaqueDeclaration>) {
          Record(decl.id, in_definition);
          VisitValue(decl.size);
        } else if constexpr (
            std::is_same_v<T, syntax::VariableOpaqueDeclaration> ||
            std::is_same_v<T, syntax::StringDeclaration>) {
          Record(decl.id, in_definition);
          if (decl.max_size) {
            VisitValue(*decl.max_size);
          }
        }
        // void declares nothing
      },
      declaration.node);
}

auto OccurrenceVisitor::VisitTypeSpecifier(const syntax::TypeSpecifier& type)
    -> void {
  std::visit(
      [this](const auto& spec) {
        using T = std::decay_t<decltype(spec)>;
        if constexpr (std::is_same_v<T, syntax::EnumBody>) {
          VisitEnumBody(spec);
        } else if constexpr (std::is_same_v<T, syntax::StructBody>) {
          VisitStructBody(spec);
        } else if constexpr (std::is_same_v<T, syntax::UnionBody>) {
          VisitUnionBody(spec);
        } else if constexpr (std::is_same_v<T, syntax::Identifier>) {
          Record(spec, false);
        }
      },
      type);
}

auto OccurrenceVisitor::VisitEnumBody(const syntax::EnumBody& body) -> void {
  for (const auto& member : body.members) {
    Record(member.id, true);
    VisitValue(member.value);
  }
}

auto OccurrenceVisitor::VisitStructBody(const syntax::StructBody& body)
    -> void {
  for (const auto& member : body.members) {
    VisitDeclaration(member, false);
  }
}

auto OccurrenceVisitor::VisitUnionBody(const syntax::UnionBody& body) -> void {
  if (body.discriminant) {
    VisitDeclaration(*body.discriminant, false);
  }
  for (const auto& arm : body.cases) {
    for (const auto& value : arm.values) {
      VisitValue(value);
    }
    VisitDeclaration(arm.declaration, false);
  }
  if (body.default_case) {
    VisitDeclaration(*body.default_case, false);
  }
}

auto OccurrenceVisitor::VisitValue(const syntax::Value& value) -> void {
  if (const auto* id = std::get_if<syntax::Identifier>(&value)) {
    Record(*id, false);
  }
}

auto OccurrenceVisitor::Record(const syntax::Identifier& id, bool is_definition)
    -> void {
  occurrences_.push_back(
      Occurrence{
          .name = id.name, .span = id.span, .is_definition = is_definition});
}

}  // namespace xdrls::semantic
