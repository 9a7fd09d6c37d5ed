#include "filefetch/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "filefetch/log.hpp"

namespace filefetch {

namespace {

constexpr int kOpenFlags = O_RDONLY | O_CLOEXEC;

// Failures are logged, the negative result is adopted by BaseFd as a closed descriptor.
int OpenReadOnly(const char* path) {
  const int fd = ::open(path, kOpenFlags);
  if (fd < 0) {
    log::error("Unable to open file '{}' (errno {}: {})", path, errno, std::strerror(errno));
  }
  return fd;
}

}  // namespace

File::File(std::string_view path) : _fd(OpenReadOnly(std::string(path).c_str())) {}

File::File(const char* path) : _fd(OpenReadOnly(path)) {}

std::size_t File::size() const {
  struct stat st{};
  if (_fd && ::fstat(_fd.fd(), &st) == 0) {
    return static_cast<std::size_t>(st.st_size);
  }
  throw std::runtime_error("File::size failed");
}

std::size_t File::readAt(std::span<std::byte> dst, std::size_t offset) const {
  while (true) {
    const auto nbRead = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead >= 0) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno == EINTR) {
      continue;
    }
    log::error("Unable to read file (fd {}) at offset {}: errno {}: {}", _fd.fd(), offset, errno,
               std::strerror(errno));
    return kError;
  }
}

std::string File::loadContent(std::size_t nbBytes) const {
  if (!_fd) {
    throw std::runtime_error("File is not opened");
  }

  std::string content;
  std::size_t pos = 0;
  content.resize_and_overwrite(nbBytes, [this, &pos](char* data, std::size_t capacity) {
    while (pos < capacity) {
      const auto nbRead = readAt(std::as_writable_bytes(std::span<char>(data + pos, capacity - pos)), pos);
      if (nbRead == kError || nbRead == 0) {
        break;
      }
      pos += nbRead;
    }
    return pos;
  });

  if (pos != nbBytes) {
    log::error("Read {} bytes from fd {} while {} were expected", pos, _fd.fd(), nbBytes);
    throw std::runtime_error("File::loadContent unexpected read size");
  }
  return content;
}

}  // namespace filefetch
