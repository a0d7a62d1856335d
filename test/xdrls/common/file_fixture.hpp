#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string_view>

#include "xdrls/utils/canonical_path.hpp"

namespace xdrls::test {

// Temporary workspace directory, removed with everything in it when the
// fixture goes away. Each test binary passes its own prefix so binaries run
// in parallel do not share a directory.
class FileTestFixture {
 public:
  FileTestFixture() : FileTestFixture("xdrls_test") {
  }

  explicit FileTestFixture(std::string_view prefix) {
    std::filesystem::path base_temp;
    if (const char* test_tmpdir = std::getenv("TEST_TMPDIR")) {
      base_temp = test_tmpdir;
    } else {
      base_temp = std::filesystem::temp_directory_path();
    }

    temp_dir_ = base_temp / prefix;
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
    std::filesystem::create_directories(temp_dir_);
  }

  ~FileTestFixture() {
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
  }

  FileTestFixture(const FileTestFixture&) = delete;
  auto operator=(const FileTestFixture&) -> FileTestFixture& = delete;

  FileTestFixture(FileTestFixture&&) = delete;
  auto operator=(FileTestFixture&&) -> FileTestFixture& = delete;

  [[nodiscard]] auto GetTempDir() const -> xdrls::CanonicalPath {
    return xdrls::CanonicalPath(temp_dir_);
  }

  // `filename` may contain directories; they are created as needed
  auto CreateFile(std::string_view filename, std::string_view content)
      -> xdrls::CanonicalPath {
    auto file_path = temp_dir_ / filename;
    std::filesystem::create_directories(file_path.parent_path());
    std::ofstream file(file_path, std::ios::binary);
    file << content;
    file.close();
    return xdrls::CanonicalPath(file_path);
  }

 private:
  std::filesystem::path temp_dir_;
};

}  // namespace xdrls::test
