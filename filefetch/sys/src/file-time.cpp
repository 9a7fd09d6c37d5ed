#include "filefetch/file-time.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

#include "filefetch/timedef.hpp"

namespace filefetch {

SysTimePoint LastModifiedTime(const std::filesystem::path& path, std::error_code& ec) noexcept {
  const auto writeTime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return SysTimePoint{};
  }
  return std::chrono::time_point_cast<SysDuration>(std::chrono::file_clock::to_sys(writeTime));
}

SysTimePoint LastModifiedTimeOrEpoch(const std::filesystem::path& path) noexcept {
  std::error_code ec;
  return LastModifiedTime(path, ec);
}

}  // namespace filefetch
