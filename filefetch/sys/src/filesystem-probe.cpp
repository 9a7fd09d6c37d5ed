#include "filefetch/filesystem-probe.hpp"

#include <unistd.h>

#include <filesystem>
#include <system_error>

namespace filefetch {

bool LocalFileSystemProbe::isReadable(const std::filesystem::path& path) const {
  return ::access(path.c_str(), R_OK) == 0;
}

std::filesystem::path LocalFileSystemProbe::canonical(const std::filesystem::path& path, std::error_code& ec) const {
  return std::filesystem::canonical(path, ec);
}

const FileSystemProbe& LocalFileSystem() noexcept {
  static const LocalFileSystemProbe kLocalFileSystem{};
  return kLocalFileSystem;
}

}  // namespace filefetch
