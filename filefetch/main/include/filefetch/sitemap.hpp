#pragma once

#include <filesystem>
#include <string>

namespace filefetch {

// Renders the immediate children of 'directory' as a sitemap XML document (UTF-8).
// The first <url> entry references the directory itself, followed by one entry per child in enumeration order,
// and by an entry for the parent directory if 'includeParent' is true and 'directory' is not a root.
// Locations are written as 'file:\' followed by the absolute path, directories (self and parent) ending with '\'.
// Last modification dates use the RFC 7231 format. An entry whose date cannot be read is dated at the epoch.
// 'directory' is expected to be absolute.
// Throws std::filesystem::filesystem_error if the directory cannot be enumerated.
[[nodiscard]] std::string GenerateDirectorySitemap(const std::filesystem::path& directory, bool includeParent);

}  // namespace filefetch
