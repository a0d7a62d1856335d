#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace xdrls {

// Absolute, symlink-resolved path of a schema file or workspace directory.
// Serves as the file identity of the index, so two spellings of the same file
// compare equal once they exist on disk.
class CanonicalPath {
 public:
  CanonicalPath() = default;

  explicit CanonicalPath(std::filesystem::path path);

  // Returns an empty path when `uri` does not use the file scheme
  static auto FromUri(std::string_view uri) -> CanonicalPath;

  auto ToUri() const -> std::string;

  auto Path() const -> const std::filesystem::path&;
  auto String() const -> const std::string&;

  auto Empty() const -> bool;

  explicit operator std::string() const {
    return String();
  }

  friend auto operator==(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() == rhs.String();
  }

  friend auto operator<(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() < rhs.String();
  }

  auto operator/(const std::filesystem::path& rhs) const -> CanonicalPath;

 private:
  std::filesystem::path path_;
  std::string string_;
};

}  // namespace xdrls

template <>
struct fmt::formatter<xdrls::CanonicalPath> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const xdrls::CanonicalPath& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(p.String(), ctx);
  }
};

template <>
struct std::hash<xdrls::CanonicalPath> {
  auto operator()(const xdrls::CanonicalPath& path) const noexcept
      -> std::size_t {
    return std::hash<std::string>{}(path.String());
  }
};
