#include "rspd/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

#include "rspd/errno-throw.hpp"
#include "rspd/log.hpp"

namespace rspd {

namespace {

int OpenReadOnly(const char* path) {
  const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno == ENOENT || errno == ENOTDIR) {
      log::debug("File '{}' does not exist", path);
    } else {
      log::error("Unable to open file '{}' (errno {}: {})", path, errno, std::strerror(errno));
    }
    return BaseFd::kClosedFd;
  }
  return fd;
}

struct stat Stat(int fd) {
  struct stat st{};
  if (::fstat(fd, &st) != 0) {
    throw_errno("fstat failed for fd # {}", fd);
  }
  return st;
}

}  // namespace

File::File(std::string_view path) : _fd(OpenReadOnly(std::string(path).c_str())) {}

File::File(const char* path) : _fd(OpenReadOnly(path)) {}

std::size_t File::size() const { return static_cast<std::size_t>(Stat(_fd.fd()).st_size); }

int64_t File::modificationTimeNs() const {
  const struct stat st = Stat(_fd.fd());
  static constexpr int64_t kNanosPerSec = 1000000000;
  return (static_cast<int64_t>(st.st_mtim.tv_sec) * kNanosPerSec) + static_cast<int64_t>(st.st_mtim.tv_nsec);
}

std::string File::loadAllContent() const {
  std::string content;
  content.reserve(size());

  static constexpr std::size_t kBufSize = 8192;
  for (;;) {
    const std::size_t oldSize = content.size();

    // We capture lastRead to inspect the result after the non-throwing lambda.
    ssize_t lastRead = 0;
    content.resize_and_overwrite(oldSize + kBufSize, [this, oldSize, &lastRead](char* data, std::size_t) {
      lastRead = ::pread(_fd.fd(), data + oldSize, kBufSize, static_cast<off_t>(oldSize));
      if (lastRead > 0) {
        return oldSize + static_cast<std::size_t>(lastRead);
      }
      return oldSize;
    });

    if (lastRead > 0) {
      continue;
    }
    if (lastRead == 0) {
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    throw_errno("Unable to read file fd # {}", _fd.fd());
  }

  return content;
}

}  // namespace rspd
