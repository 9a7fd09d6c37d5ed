#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <string_view>

#include "filefetch/base-fd.hpp"

namespace filefetch {

class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path, read only.
  // On success, the returned File owns the underlying descriptor and will close it on destruction.
  // On failure, the error is logged and operator bool() returns false.
  explicit File(const std::string& path) : File(path.c_str()) {}

  explicit File(std::string_view path);

  // Same as above, 'path' must be null-terminated.
  explicit File(const char* path);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Return the current file size in bytes, as seen from the opened descriptor.
  // Throws std::runtime_error if the file is not opened or cannot be inspected.
  [[nodiscard]] std::size_t size() const;

  // Read up to dst.size() bytes starting at the given absolute offset.
  // Uses pread() so it does not modify the file's current offset.
  // Returns the number of bytes read (0 on EOF). Returns kError on error.
  [[nodiscard]] std::size_t readAt(std::span<std::byte> dst, std::size_t offset) const;

  // Load exactly 'nbBytes' bytes from the start of the file.
  // Throws std::runtime_error on read error, or if the file holds less than 'nbBytes' bytes.
  [[nodiscard]] std::string loadContent(std::size_t nbBytes) const;

 private:
  BaseFd _fd;
};

}  // namespace filefetch
