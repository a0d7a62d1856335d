#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace app {

/// Name of the framed pipe to serve on, taken from the first "--pipe=<name>"
/// argument after the program name. nullopt when absent or empty.
auto ParsePipeName(const std::vector<std::string>& args)
    -> std::optional<std::string>;

/// Log level named by `level`; unknown names fall back to debug
auto ParseLogLevel(std::string_view level) -> spdlog::level::level_enum;

/// Creates the "transport", "jsonrpc" and "xdrls" loggers. Only the xdrls
/// logger follows SPDLOG_LEVEL; the protocol loggers stay at info.
auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
