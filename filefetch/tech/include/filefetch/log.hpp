#pragma once

// Logging facade. All components log through filefetch::log, which is spdlog.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace filefetch {

namespace log = spdlog;

}  // namespace filefetch
