#pragma once

#include <memory>
#include <string_view>

#include "filefetch/file-protocol-config.hpp"
#include "filefetch/filesystem-probe.hpp"
#include "filefetch/metadata.hpp"
#include "filefetch/protocol-response.hpp"

namespace filefetch {

// Entry point of the file protocol: turns 'file:' locators into protocol responses.
// Holds no mutable state, so concurrent calls to getProtocolOutput are safe as long as each one uses
// its own Metadata.
class FileProtocol {
 public:
  // Throws std::invalid_argument if 'config' is invalid.
  // If 'probe' is null, the local filesystem is used.
  explicit FileProtocol(FileProtocolConfig config = {}, std::shared_ptr<const FileSystemProbe> probe = nullptr);

  // Resolves 'locator', updating 'metadata' in place, and returns the outcome.
  // Throws std::invalid_argument if 'locator' is malformed or its path cannot be decoded.
  [[nodiscard]] ProtocolResponse getProtocolOutput(std::string_view locator, Metadata& metadata) const;

  [[nodiscard]] const FileProtocolConfig& config() const noexcept { return _config; }

 private:
  [[nodiscard]] const FileSystemProbe& probe() const noexcept { return _probe ? *_probe : LocalFileSystem(); }

  FileProtocolConfig _config;
  std::shared_ptr<const FileSystemProbe> _probe;
};

}  // namespace filefetch
