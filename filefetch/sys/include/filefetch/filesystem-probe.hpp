#pragma once

#include <filesystem>
#include <system_error>

namespace filefetch {

// Filesystem capabilities whose outcome depends on the host (permissions, symlinks, case sensitivity).
// The default implementation queries the local filesystem; tests may substitute a fake one.
class FileSystemProbe {
 public:
  FileSystemProbe() noexcept = default;

  FileSystemProbe(const FileSystemProbe&) = delete;
  FileSystemProbe(FileSystemProbe&&) = delete;
  FileSystemProbe& operator=(const FileSystemProbe&) = delete;
  FileSystemProbe& operator=(FileSystemProbe&&) = delete;

  virtual ~FileSystemProbe() = default;

  // Tells whether the current process is allowed to read the existing entry at 'path'.
  [[nodiscard]] virtual bool isReadable(const std::filesystem::path& path) const = 0;

  // Returns the canonical form of 'path': absolute, with symlinks and '.' / '..' segments resolved.
  // On failure, sets 'ec' and returns an empty path.
  [[nodiscard]] virtual std::filesystem::path canonical(const std::filesystem::path& path,
                                                        std::error_code& ec) const = 0;
};

class LocalFileSystemProbe final : public FileSystemProbe {
 public:
  [[nodiscard]] bool isReadable(const std::filesystem::path& path) const override;

  [[nodiscard]] std::filesystem::path canonical(const std::filesystem::path& path,
                                                std::error_code& ec) const override;
};

// Shared stateless probe of the local filesystem.
[[nodiscard]] const FileSystemProbe& LocalFileSystem() noexcept;

}  // namespace filefetch
