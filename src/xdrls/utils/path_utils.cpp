#include "xdrls/utils/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <fmt/format.h>

namespace xdrls {

namespace {

constexpr std::string_view kFileScheme = "file://";

auto HexValue(char c) -> int {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

auto ToLower(std::string text) -> std::string {
  std::ranges::transform(text, text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

}  // namespace

auto IsSchemaFile(
    const std::filesystem::path& path,
    const std::vector<std::string>& extensions) -> bool {
  std::string ext = path.extension().string();
  if (ext.empty()) {
    return false;
  }
  ext = ToLower(std::move(ext));
  return std::ranges::any_of(extensions, [&](const std::string& candidate) {
    return ToLower(candidate) == ext;
  });
}

auto IsFileUri(std::string_view uri) -> bool {
  return uri.starts_with(kFileScheme);
}

auto UriToPath(std::string_view uri) -> std::filesystem::path {
  if (!IsFileUri(uri)) {
    return {uri};
  }

  std::string_view encoded = uri.substr(kFileScheme.size());

  // Drop an authority component ("file://localhost/...")
  if (!encoded.starts_with('/')) {
    auto slash = encoded.find('/');
    encoded = slash == std::string_view::npos ? std::string_view{}
                                              : encoded.substr(slash);
  }

  // file:///C:/path -> C:/path
  if (encoded.size() >= 3 && encoded[0] == '/' && encoded[2] == ':') {
    encoded.remove_prefix(1);
  }

  std::string decoded;
  decoded.reserve(encoded.size());
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    if (encoded[i] == '%' && i + 2 < encoded.size() &&
        HexValue(encoded[i + 1]) >= 0 && HexValue(encoded[i + 2]) >= 0) {
      decoded += static_cast<char>(
          (HexValue(encoded[i + 1]) << 4) | HexValue(encoded[i + 2]));
      i += 2;
    } else {
      decoded += encoded[i];
    }
  }

  return NormalizePath(decoded);
}

auto PathToUri(const std::filesystem::path& path) -> std::string {
  std::string result(kFileScheme);
  const std::string text = path.generic_string();

  if (text.size() >= 2 && text[1] == ':') {
    result += '/';
  }

  for (char c : text) {
    auto byte = static_cast<unsigned char>(c);
    if (c == ' ' || c == '%' || c == '#' || c == '?' || byte > 127 ||
        byte < 32) {
      result += fmt::format("%{:02X}", byte);
    } else {
      result += c;
    }
  }

  return result;
}

auto NormalizePath(std::filesystem::path path) -> std::filesystem::path {
  // Paths that do not exist (yet) are kept lexically normalized
  std::error_code ec;
  auto canonical = std::filesystem::canonical(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  return canonical;
}

}  // namespace xdrls
