#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "filefetch/file-protocol-config.hpp"
#include "filefetch/filesystem-probe.hpp"
#include "filefetch/http-status-code.hpp"
#include "filefetch/metadata.hpp"
#include "filefetch/protocol-response.hpp"

namespace filefetch {

// Resolves a 'file:' locator against the filesystem into an HTTP shaped outcome.
// All the work happens in the constructor. Outcomes are reported through the status code:
//   - 404 if the entry does not exist
//   - 401 if it exists but cannot be read by the current process
//   - 300 with a 'Location' metadata if the path is not in canonical form
//   - 200 with a sitemap XML payload for a directory
//   - 200 with the file bytes for a regular file (400 if it is too large, 420 if it cannot be read)
//   - 500 for any other kind of entry, or on unexpected filesystem failures
// 'metadata' is borrowed for the lifetime of the object and updated in place.
class FileResponse {
 public:
  // Throws std::invalid_argument if 'locator' is malformed, or if its path cannot be decoded with
  // the configured character encoding.
  FileResponse(std::string_view locator, Metadata& metadata, const FileProtocolConfig& config,
               const FileSystemProbe& probe);

  FileResponse(std::string_view locator, Metadata& metadata, const FileProtocolConfig& config)
      : FileResponse(locator, metadata, config, LocalFileSystem()) {}

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  [[nodiscard]] std::string_view content() const noexcept { return _content; }

  [[nodiscard]] const Metadata& metadata() const noexcept { return _metadata; }

  // Snapshot of the current outcome.
  [[nodiscard]] ProtocolResponse toProtocolResponse() const;

 private:
  void resolve(const std::filesystem::path& path, const FileProtocolConfig& config, const FileSystemProbe& probe);

  void loadFile(const std::filesystem::path& path);

  void listDirectory(const std::filesystem::path& path, bool crawlParent);

  std::string _content;
  Metadata& _metadata;
  http::StatusCode _statusCode{http::StatusCodeInternalServerError};
};

}  // namespace filefetch
