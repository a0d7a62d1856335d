#pragma once

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "xdrls/core/xdrls_config_file.hpp"
#include "xdrls/utils/canonical_path.hpp"

namespace xdrls {

// Finds schema files under the workspace root: regular files whose extension
// is one of the configured ones and whose relative path passes the config's
// path conditions. The result is sorted by path so that the merge order, and
// with it which duplicate definition wins, does not depend on the file
// system's directory order.
class WorkspaceDiscoveryProvider {
 public:
  explicit WorkspaceDiscoveryProvider(
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto DiscoverFiles(
      const CanonicalPath& workspace_root,
      const XdrlsConfigFile& config) const -> std::vector<CanonicalPath>;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace xdrls
