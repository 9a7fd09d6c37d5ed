#pragma once

namespace filefetch {

// Sole owner of a POSIX file descriptor, closed at destruction.
// Any negative value is normalized to kClosedFd, so that the result of a failed open() can be adopted directly.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  BaseFd() noexcept = default;

  explicit BaseFd(int fd) noexcept : _fd(fd < 0 ? kClosedFd : fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd& operator=(const BaseFd&) = delete;

  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Gives up ownership: the returned descriptor is left open and this object becomes closed.
  [[nodiscard]] int release() noexcept;

  // Closes the descriptor now. No-op if already closed.
  void close() noexcept;

 private:
  int _fd{kClosedFd};
};

}  // namespace filefetch
