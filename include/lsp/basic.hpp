#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lsp {

// URI
using Uri = std::string;
using DocumentUri = std::string;

// Progress tokens are integer or string; kept as raw JSON
using ProgressToken = nlohmann::json;

// Position
struct Position {
  int line = 0;
  int character = 0;

  friend auto operator==(const Position&, const Position&) -> bool = default;
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

enum class PositionEncodingKind {
  kUtf8,
  kUtf16,
  kUtf32,
};

void to_json(nlohmann::json& j, const PositionEncodingKind& p);
void from_json(const nlohmann::json& j, PositionEncodingKind& p);

// Range
struct Range {
  Position start;
  Position end;

  friend auto operator==(const Range&, const Range&) -> bool = default;
};

void to_json(nlohmann::json& j, const Range& r);
void from_json(const nlohmann::json& j, Range& r);

// Location
struct Location {
  DocumentUri uri;
  Range range;

  friend auto operator==(const Location&, const Location&) -> bool = default;
};

void to_json(nlohmann::json& j, const Location& l);
void from_json(const nlohmann::json& j, Location& l);

// Text Document Identifier
struct TextDocumentIdentifier {
  DocumentUri uri;
};

void to_json(nlohmann::json& j, const TextDocumentIdentifier& t);
void from_json(const nlohmann::json& j, TextDocumentIdentifier& t);

// Text Document Position Params
struct TextDocumentPositionParams {
  TextDocumentIdentifier textDocument;
  Position position;
};

void to_json(nlohmann::json& j, const TextDocumentPositionParams& t);
void from_json(const nlohmann::json& j, TextDocumentPositionParams& t);

// Work Done Progress
struct WorkDoneProgressParams {
  std::optional<ProgressToken> workDoneToken;
};

void to_json(nlohmann::json& j, const WorkDoneProgressParams& p);
void from_json(const nlohmann::json& j, WorkDoneProgressParams& p);

struct WorkDoneProgressOptions {
  std::optional<bool> workDoneProgress;
};

void to_json(nlohmann::json& j, const WorkDoneProgressOptions& p);
void from_json(const nlohmann::json& j, WorkDoneProgressOptions& p);

// Partial Result Progress
struct PartialResultParams {
  std::optional<ProgressToken> partialResultToken;
};

void to_json(nlohmann::json& j, const PartialResultParams& p);
void from_json(const nlohmann::json& j, PartialResultParams& p);

// Workspace Folder
struct WorkspaceFolder {
  DocumentUri uri;
  std::string name;
};

void to_json(nlohmann::json& j, const WorkspaceFolder& w);
void from_json(const nlohmann::json& j, WorkspaceFolder& w);

}  // namespace lsp
