#include "xdrls/core/workspace_indexer.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/format.h>

#include "xdrls/core/discovery_provider.hpp"
#include "xdrls/core/xdrls_config_file.hpp"
#include "xdrls/utils/path_utils.hpp"
#include "xdrls/utils/scoped_timer.hpp"

namespace xdrls {

namespace {

auto IsDirectory(const CanonicalPath& path) -> bool {
  std::error_code ec;
  return std::filesystem::is_directory(path.Path(), ec);
}

}  // namespace

auto ResolveWorkspaceRoot(std::string_view root_uri)
    -> std::expected<CanonicalPath, std::string> {
  if (!IsFileUri(root_uri)) {
    return std::unexpected(fmt::format(
        "Workspace root '{}' doesn't seem to be a valid file path", root_uri));
  }

  auto root = CanonicalPath::FromUri(root_uri);
  if (root.Empty() || !IsDirectory(root)) {
    return std::unexpected(
        fmt::format("Workspace root '{}' doesn't name a directory", root_uri));
  }
  return root;
}

auto DiscoverAndIndex(
    const CanonicalPath& root, semantic::IndexStore& store,
    semantic::PositionEncoding encoding,
    std::shared_ptr<spdlog::logger> logger)
    -> std::expected<std::size_t, std::string> {
  if (!logger) {
    logger = spdlog::default_logger();
  }
  if (!IsDirectory(root)) {
    return std::unexpected(
        fmt::format("Workspace root {} doesn't name a directory", root));
  }

  utils::ScopedTimer timer(fmt::format("Indexing {}", root), logger);

  auto config = XdrlsConfigFile::LoadFromFile(root / ".xdrls", logger)
                    .value_or(XdrlsConfigFile(logger));

  WorkspaceDiscoveryProvider discovery(logger);
  auto files = discovery.DiscoverFiles(root, config);

  auto indexed = store.IndexFiles(files, encoding);
  logger->info(
      "Indexed {} of {} schema files under {}", indexed, files.size(), root);
  return indexed;
}

}  // namespace xdrls
