#include "xdrls/core/xdrls_config_file.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>

#include <fmt/ranges.h>
#include <yaml-cpp/yaml.h>

namespace xdrls {

namespace {

// Accepts either a scalar or a sequence of scalars
auto ReadStringList(const YAML::Node& node) -> std::vector<std::string> {
  std::vector<std::string> values;
  if (node.IsScalar()) {
    values.push_back(node.as<std::string>());
  } else if (node.IsSequence()) {
    for (const auto& item : node) {
      values.push_back(item.as<std::string>());
    }
  }
  return values;
}

auto MatchesAny(
    const std::string& path, const std::vector<std::string>& patterns)
    -> bool {
  return std::ranges::any_of(patterns, [&](const std::string& pattern) {
    return std::regex_match(path, std::regex(pattern));
  });
}

}  // namespace

XdrlsConfigFile::XdrlsConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto XdrlsConfigFile::LoadFromFile(
    const CanonicalPath& config_path, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<XdrlsConfigFile> {
  XdrlsConfigFile config(logger);

  if (!std::filesystem::exists(config_path.Path())) {
    config.logger_->debug(
        "No .xdrls configuration file found at {}", config_path);
    return std::nullopt;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(config_path.String());

    if (yaml["Extensions"]) {
      auto extensions = ReadStringList(yaml["Extensions"]);
      for (auto& ext : extensions) {
        if (!ext.empty() && ext.front() != '.') {
          ext.insert(ext.begin(), '.');
        }
      }
      std::erase_if(extensions, [](const std::string& ext) {
        return ext.size() < 2;
      });
      if (!extensions.empty()) {
        config.extensions_ = std::move(extensions);
      }
      config.logger_->debug(
          "Loaded Extensions: {}", fmt::join(config.extensions_, ", "));
    }

    if (yaml["If"]) {
      if (yaml["If"]["PathMatch"]) {
        config.path_condition_.path_match =
            ReadStringList(yaml["If"]["PathMatch"]);
        config.logger_->debug(
            "Loaded PathMatch with {} patterns",
            config.path_condition_.path_match.size());
      }
      if (yaml["If"]["PathExclude"]) {
        config.path_condition_.path_exclude =
            ReadStringList(yaml["If"]["PathExclude"]);
        config.logger_->debug(
            "Loaded PathExclude with {} patterns",
            config.path_condition_.path_exclude.size());
      }
    }

    config.logger_->debug("Loaded .xdrls configuration from {}", config_path);
    return config;

  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing .xdrls configuration file: {}", e.what());
    return std::nullopt;
  }
}

auto XdrlsConfigFile::ShouldIncludeFile(std::string_view relative_path) const
    -> bool {
  if (path_condition_.path_match.empty() &&
      path_condition_.path_exclude.empty()) {
    return true;
  }

  std::string path(relative_path);
  try {
    if (!path_condition_.path_match.empty() &&
        !MatchesAny(path, path_condition_.path_match)) {
      return false;
    }
    return !MatchesAny(path, path_condition_.path_exclude);
  } catch (const std::regex_error& e) {
    logger_->warn(
        "Invalid regex in path condition ({}), including file by default: {}",
        e.what(), relative_path);
    return true;
  }
}

}  // namespace xdrls
