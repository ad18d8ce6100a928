#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "rspd/base-fd.hpp"

namespace rspd {

// Read-only file opened by path.
class File {
 public:
  // Default-constructed File is closed.
  File() noexcept = default;

  // Opens the file. A missing file gives a closed File (logged at debug level), other failures are logged as errors.
  explicit File(std::string_view path);

  explicit File(const char* path);

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Current size in bytes. Throws std::system_error if the file cannot be stat'ed.
  [[nodiscard]] std::size_t size() const;

  // Last modification time in nanoseconds since epoch. Throws std::system_error if the file cannot be stat'ed.
  [[nodiscard]] int64_t modificationTimeNs() const;

  // Reads the whole file from the start. Throws std::system_error on read error.
  [[nodiscard]] std::string loadAllContent() const;

 private:
  BaseFd _fd;
};

}  // namespace rspd
