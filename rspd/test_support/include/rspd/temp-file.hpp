#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace rspd::test {

// Creates a unique temporary directory under the system temp directory and removes it, with its content,
// on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "rspd-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// Writes 'content' to 'relativePath' under 'dir' (creating intermediate directories). Returns the full path.
// Throws std::runtime_error on failure.
std::filesystem::path WriteFile(const ScopedTempDir& dir, std::string_view relativePath, std::string_view content);

// Whole content of a file, or empty string if it cannot be read.
std::string ReadFile(const std::filesystem::path& path);

}  // namespace rspd::test
