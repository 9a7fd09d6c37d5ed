#pragma once

#include <filesystem>
#include <system_error>

#include "filefetch/timedef.hpp"

namespace filefetch {

// Last modification time of 'path' (symlinks followed) as a system time point.
// On failure, sets 'ec' and returns the Unix epoch.
[[nodiscard]] SysTimePoint LastModifiedTime(const std::filesystem::path& path, std::error_code& ec) noexcept;

// Last modification time of 'path', or the Unix epoch if it cannot be determined.
[[nodiscard]] SysTimePoint LastModifiedTimeOrEpoch(const std::filesystem::path& path) noexcept;

}  // namespace filefetch
