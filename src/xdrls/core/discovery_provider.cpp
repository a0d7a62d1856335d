#include "xdrls/core/discovery_provider.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <unordered_set>

#include "xdrls/utils/path_utils.hpp"

namespace xdrls {

WorkspaceDiscoveryProvider::WorkspaceDiscoveryProvider(
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto WorkspaceDiscoveryProvider::DiscoverFiles(
    const CanonicalPath& workspace_root, const XdrlsConfigFile& config) const
    -> std::vector<CanonicalPath> {
  std::vector<CanonicalPath> files;

  logger_->debug(
      "WorkspaceDiscoveryProvider discovering files in workspace: {}",
      workspace_root);

  // Directory symlinks are followed; each directory is read once by its
  // canonical path so link cycles end
  std::vector<std::filesystem::path> pending{workspace_root.Path()};
  std::unordered_set<std::string> visited;

  while (!pending.empty()) {
    auto dir = std::move(pending.back());
    pending.pop_back();
    if (!visited.insert(CanonicalPath(dir).String()).second) {
      continue;
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);
    const std::filesystem::directory_iterator end;

    for (; !ec && it != end; it.increment(ec)) {
      const auto& entry = *it;
      std::error_code status_ec;
      if (entry.is_directory(status_ec)) {
        pending.push_back(entry.path());
        continue;
      }
      if (!entry.is_regular_file(status_ec) ||
          !IsSchemaFile(entry.path(), config.GetExtensions())) {
        continue;
      }

      auto relative = entry.path()
                          .lexically_relative(workspace_root.Path())
                          .generic_string();
      if (!config.ShouldIncludeFile(relative)) {
        logger_->debug("WorkspaceDiscoveryProvider excluded {}", relative);
        continue;
      }

      files.emplace_back(entry.path());
    }

    // Only this directory is cut short; the walk goes on with the others
    if (ec) {
      logger_->warn(
          "WorkspaceDiscoveryProvider skipping unreadable directory {}: {}",
          dir.string(), ec.message());
    }
  }

  std::sort(files.begin(), files.end());
  // Symlinks may resolve two entries to the same file
  files.erase(std::unique(files.begin(), files.end()), files.end());

  logger_->debug(
      "WorkspaceDiscoveryProvider discovered {} files", files.size());
  return files;
}

}  // namespace xdrls
