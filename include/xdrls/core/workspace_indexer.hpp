#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "xdrls/semantic/index_store.hpp"
#include "xdrls/semantic/line_map.hpp"
#include "xdrls/utils/canonical_path.hpp"

namespace xdrls {

// Resolves a workspace root URI to a directory. Fails when the URI is not a
// file URI or does not name an existing directory.
[[nodiscard]] auto ResolveWorkspaceRoot(std::string_view root_uri)
    -> std::expected<CanonicalPath, std::string>;

// Loads <root>/.xdrls if present, discovers the schema files under `root`
// and rebuilds `store` from them. Files that cannot be read or parsed are
// skipped. Returns the number of files indexed, or an error when `root` is
// not a directory (the store is left untouched then).
auto DiscoverAndIndex(
    const CanonicalPath& root, semantic::IndexStore& store,
    semantic::PositionEncoding encoding = semantic::PositionEncoding::kUtf8,
    std::shared_ptr<spdlog::logger> logger = nullptr)
    -> std::expected<std::size_t, std::string>;

}  // namespace xdrls
