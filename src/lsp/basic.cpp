#include "lsp/basic.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "lsp/json_utils.hpp"

namespace lsp {

// Position
void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"line", p.line}, {"character", p.character}};
}

void from_json(const nlohmann::json& j, Position& p) {
  j.at("line").get_to(p.line);
  j.at("character").get_to(p.character);
}

void to_json(nlohmann::json& j, const PositionEncodingKind& p) {
  switch (p) {
    case PositionEncodingKind::kUtf8:
      j = "utf-8";
      break;
    case PositionEncodingKind::kUtf16:
      j = "utf-16";
      break;
    case PositionEncodingKind::kUtf32:
      j = "utf-32";
      break;
  }
}

void from_json(const nlohmann::json& j, PositionEncodingKind& p) {
  auto s = j.get<std::string>();
  if (s == "utf-8") {
    p = PositionEncodingKind::kUtf8;
  } else if (s == "utf-16") {
    p = PositionEncodingKind::kUtf16;
  } else if (s == "utf-32") {
    p = PositionEncodingKind::kUtf32;
  } else {
    throw std::invalid_argument("Invalid position encoding kind: " + s);
  }
}

// Range
void to_json(nlohmann::json& j, const Range& r) {
  j = nlohmann::json{{"start", r.start}, {"end", r.end}};
}

void from_json(const nlohmann::json& j, Range& r) {
  j.at("start").get_to(r.start);
  j.at("end").get_to(r.end);
}

// Location
void to_json(nlohmann::json& j, const Location& l) {
  j = nlohmann::json{{"uri", l.uri}, {"range", l.range}};
}

void from_json(const nlohmann::json& j, Location& l) {
  j.at("uri").get_to(l.uri);
  j.at("range").get_to(l.range);
}

// Text Document Identifier
void to_json(nlohmann::json& j, const TextDocumentIdentifier& t) {
  j = nlohmann::json{{"uri", t.uri}};
}

void from_json(const nlohmann::json& j, TextDocumentIdentifier& t) {
  j.at("uri").get_to(t.uri);
}

// Text Document Position Params
void to_json(nlohmann::json& j, const TextDocumentPositionParams& t) {
  j = nlohmann::json{
      {"textDocument", t.textDocument}, {"position", t.position}};
}

void from_json(const nlohmann::json& j, TextDocumentPositionParams& t) {
  j.at("textDocument").get_to(t.textDocument);
  j.at("position").get_to(t.position);
}

// Work Done Progress
void to_json(nlohmann::json& j, const WorkDoneProgressParams& p) {
  to_json_optional(j, "workDoneToken", p.workDoneToken);
}

void from_json(const nlohmann::json& j, WorkDoneProgressParams& p) {
  from_json_optional(j, "workDoneToken", p.workDoneToken);
}

void to_json(nlohmann::json& j, const WorkDoneProgressOptions& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "workDoneProgress", p.workDoneProgress);
}

void from_json(const nlohmann::json& j, WorkDoneProgressOptions& p) {
  from_json_optional(j, "workDoneProgress", p.workDoneProgress);
}

// Partial Result Progress
void to_json(nlohmann::json& j, const PartialResultParams& p) {
  to_json_optional(j, "partialResultToken", p.partialResultToken);
}

void from_json(const nlohmann::json& j, PartialResultParams& p) {
  from_json_optional(j, "partialResultToken", p.partialResultToken);
}

// Workspace Folder
void to_json(nlohmann::json& j, const WorkspaceFolder& w) {
  j = nlohmann::json{{"uri", w.uri}, {"name", w.name}};
}

void from_json(const nlohmann::json& j, WorkspaceFolder& w) {
  j.at("uri").get_to(w.uri);
  j.at("name").get_to(w.name);
}

}  // namespace lsp
