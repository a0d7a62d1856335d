#include "xdrls/semantic/index_store.hpp"

#include <utility>

namespace xdrls::semantic {

IndexStore::IndexStore(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto IndexStore::IndexFiles(
    const std::vector<CanonicalPath>& files, PositionEncoding encoding)
    -> std::size_t {
  std::scoped_lock lock(tokens_mutex_, definitions_mutex_, references_mutex_);
  ClearLocked();

  std::size_t indexed = 0;
  for (const auto& file : files) {
    auto file_index = LoadFileIndex(file, encoding);
    if (!file_index) {
      logger_->debug("Skipping {}", file_index.error());
      continue;
    }
    MergeLocked(std::move(*file_index));
    ++indexed;
  }

  logger_->debug(
      "IndexStore indexed {}/{} files: {} definitions, {} referenced names",
      indexed, files.size(), definitions_.size(), references_.size());
  return indexed;
}

auto IndexStore::Add(FileIndex file_index) -> void {
  std::scoped_lock lock(tokens_mutex_, definitions_mutex_, references_mutex_);
  if (contributions_.contains(file_index.file)) {
    // Same file merged twice: keep the tables a function of the file set
    auto file = file_index.file;
    contributions_[file] = Contribution{
        .version = file_index.version,
        .definitions = std::move(file_index.definitions),
        .references = std::move(file_index.references)};
    tokens_[file] = std::move(file_index.tokens);
    RebuildNameTablesLocked();
    return;
  }
  MergeLocked(std::move(file_index));
}

auto IndexStore::Reindex(
    const CanonicalPath& file, std::string_view text, int version,
    PositionEncoding encoding) -> std::expected<bool, std::string> {
  {
    std::scoped_lock lock(
        tokens_mutex_, definitions_mutex_, references_mutex_);
    auto it = contributions_.find(file);
    if (it != contributions_.end() && it->second.version == version) {
      logger_->debug("Reindex of {} skipped: version {} unchanged", file,
                     version);
      return false;
    }
  }

  // Parse without holding the tables
  auto file_index = BuildFileIndex(file, text, encoding, version);
  if (!file_index) {
    logger_->debug("Reindex of {} kept previous contents: {}", file,
                   file_index.error());
    return std::unexpected(file_index.error());
  }

  std::scoped_lock lock(tokens_mutex_, definitions_mutex_, references_mutex_);
  if (!contributions_.contains(file)) {
    discovery_order_.push_back(file);
  }
  contributions_[file] = Contribution{
      .version = file_index->version,
      .definitions = std::move(file_index->definitions),
      .references = std::move(file_index->references)};
  tokens_[file] = std::move(file_index->tokens);
  RebuildNameTablesLocked();

  logger_->debug("Reindexed {} at version {}", file, version);
  return true;
}

auto IndexStore::FindLineTokens(const CanonicalPath& file, int line) const
    -> std::vector<Token> {
  std::lock_guard<std::mutex> lock(tokens_mutex_);
  auto file_it = tokens_.find(file);
  if (file_it == tokens_.end()) {
    return {};
  }
  auto line_it = file_it->second.find(line);
  if (line_it == file_it->second.end()) {
    return {};
  }
  return line_it->second;
}

auto IndexStore::FindDefinition(const std::string& name) const
    -> std::optional<lsp::Location> {
  std::lock_guard<std::mutex> lock(definitions_mutex_);
  auto it = definitions_.find(name);
  if (it == definitions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto IndexStore::FindReferences(const std::string& name) const
    -> std::optional<std::vector<lsp::Location>> {
  std::lock_guard<std::mutex> lock(references_mutex_);
  auto it = references_.find(name);
  if (it == references_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto IndexStore::FileCount() const -> std::size_t {
  std::lock_guard<std::mutex> lock(tokens_mutex_);
  return tokens_.size();
}

auto IndexStore::MergeLocked(FileIndex file_index) -> void {
  for (const auto& def : file_index.definitions) {
    definitions_.insert_or_assign(def.name, def.location);
  }
  for (const auto& ref : file_index.references) {
    references_[ref.name].push_back(ref.location);
  }

  const auto file = file_index.file;
  discovery_order_.push_back(file);
  contributions_[file] = Contribution{
      .version = file_index.version,
      .definitions = std::move(file_index.definitions),
      .references = std::move(file_index.references)};
  tokens_[file] = std::move(file_index.tokens);
}

auto IndexStore::RebuildNameTablesLocked() -> void {
  definitions_.clear();
  references_.clear();
  for (const auto& file : discovery_order_) {
    const auto& contribution = contributions_.at(file);
    for (const auto& def : contribution.definitions) {
      definitions_.insert_or_assign(def.name, def.location);
    }
    for (const auto& ref : contribution.references) {
      references_[ref.name].push_back(ref.location);
    }
  }
}

auto IndexStore::ClearLocked() -> void {
  tokens_.clear();
  definitions_.clear();
  references_.clear();
  discovery_order_.clear();
  contributions_.clear();
}

}  // namespace xdrls::semantic
