#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <lsp/basic.hpp>
#include <spdlog/spdlog.h>

#include "xdrls/semantic/file_index.hpp"
#include "xdrls/semantic/line_map.hpp"
#include "xdrls/utils/canonical_path.hpp"

namespace xdrls::semantic {

// Workspace-wide tables answering the position queries:
//   tokens:      file -> line -> identifier tokens sorted by start column
//   definitions: name -> location of the last definition merged
//   references:  name -> every use of the name, in merge order
//
// Each table has its own mutex. Building and re-indexing hold all three for
// the whole update; lookups take one table lock at a time and return copies,
// so a lookup that spans two tables is not atomic.
class IndexStore {
 public:
  explicit IndexStore(std::shared_ptr<spdlog::logger> logger = nullptr);

  IndexStore(const IndexStore&) = delete;
  IndexStore(IndexStore&&) = delete;
  auto operator=(const IndexStore&) -> IndexStore& = delete;
  auto operator=(IndexStore&&) -> IndexStore& = delete;
  ~IndexStore() = default;

  // Replaces the whole index with `files`, read and parsed in the given
  // order. Files that cannot be read or parsed are skipped. Returns the number
  // of files indexed.
  auto IndexFiles(
      const std::vector<CanonicalPath>& files,
      PositionEncoding encoding = PositionEncoding::kUtf8) -> std::size_t;

  // Merges an already built file index after everything indexed so far
  auto Add(FileIndex file_index) -> void;

  // Replaces the contribution of `file` with one built from `text` and
  // rebuilds the name tables in discovery order. A file not indexed before
  // is appended to that order.
  //
  // Returns false when `version` equals the indexed version (nothing done),
  // true when the contribution was replaced, and the parse error when `text`
  // is rejected; the previous contribution stays in place in that case.
  auto Reindex(
      const CanonicalPath& file, std::string_view text, int version,
      PositionEncoding encoding = PositionEncoding::kUtf8)
      -> std::expected<bool, std::string>;

  [[nodiscard]] auto FindLineTokens(const CanonicalPath& file, int line) const
      -> std::vector<Token>;

  [[nodiscard]] auto FindDefinition(const std::string& name) const
      -> std::optional<lsp::Location>;

  // std::nullopt when the name was never used anywhere
  [[nodiscard]] auto FindReferences(const std::string& name) const
      -> std::optional<std::vector<lsp::Location>>;

  [[nodiscard]] auto FileCount() const -> std::size_t;

 private:
  struct Contribution {
    int version = 0;
    std::vector<NamedLocation> definitions;
    std::vector<NamedLocation> references;
  };

  // Callers hold all three table locks
  auto MergeLocked(FileIndex file_index) -> void;
  auto RebuildNameTablesLocked() -> void;
  auto ClearLocked() -> void;

  mutable std::mutex tokens_mutex_;
  std::unordered_map<CanonicalPath, LineTokens> tokens_;

  mutable std::mutex definitions_mutex_;
  std::unordered_map<std::string, lsp::Location> definitions_;

  mutable std::mutex references_mutex_;
  std::unordered_map<std::string, std::vector<lsp::Location>> references_;

  // Guarded by all three locks together
  std::vector<CanonicalPath> discovery_order_;
  std::unordered_map<CanonicalPath, Contribution> contributions_;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace xdrls::semantic
