#include "filefetch/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "filefetch/log.hpp"

namespace filefetch {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  BaseFd tmp(std::move(other));
  std::swap(_fd, tmp._fd);
  return *this;
}

int BaseFd::release() noexcept {
  const int fd = _fd;
  _fd = kClosedFd;
  return fd;
}

void BaseFd::close() noexcept {
  const int fd = release();
  if (fd == kClosedFd) {
    return;
  }
  // On Linux the descriptor is released even when close() fails (EINTR included), it must not be closed again.
  if (::close(fd) != 0) {
    log::warn("Closing descriptor {} reported errno {}: {}", fd, errno, std::strerror(errno));
  }
}

}  // namespace filefetch
