#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace xdrls {

// Extension match is case-insensitive; `extensions` carry the leading dot
[[nodiscard]] auto IsSchemaFile(
    const std::filesystem::path& path,
    const std::vector<std::string>& extensions) -> bool;

// URI operations
[[nodiscard]] auto IsFileUri(std::string_view uri) -> bool;
[[nodiscard]] auto UriToPath(std::string_view uri) -> std::filesystem::path;
[[nodiscard]] auto PathToUri(const std::filesystem::path& path)
    -> std::string;
[[nodiscard]] auto NormalizePath(std::filesystem::path path)
    -> std::filesystem::path;

}  // namespace xdrls
