#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "xdrls/utils/canonical_path.hpp"

namespace xdrls {

// Contents of the optional .xdrls file at the workspace root:
//
//   Extensions: [.x, .xdr]
//   If:
//     PathMatch: proto/.*
//     PathExclude: [.*/build/.*, .*/gen/.*]
class XdrlsConfigFile {
 public:
  // Path filtering conditions (If block). Patterns are ECMAScript regexes
  // matched against the whole workspace-relative path.
  struct PathCondition {
    // Include only paths matching at least one pattern
    std::vector<std::string> path_match;
    // Exclude paths matching any pattern
    std::vector<std::string> path_exclude;
  };

  explicit XdrlsConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Returns std::nullopt when the file is missing or not valid YAML
  static auto LoadFromFile(
      const CanonicalPath& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<XdrlsConfigFile>;

  [[nodiscard]] auto GetExtensions() const -> const std::vector<std::string>& {
    return extensions_;
  }

  [[nodiscard]] auto GetPathCondition() const -> const PathCondition& {
    return path_condition_;
  }

  // `relative_path` is relative to the workspace root, with forward slashes
  [[nodiscard]] auto ShouldIncludeFile(std::string_view relative_path) const
      -> bool;

 private:
  std::shared_ptr<spdlog::logger> logger_;

  // With leading dot, ".x" unless configured
  std::vector<std::string> extensions_{".x"};

  PathCondition path_condition_;
};

}  // namespace xdrls
