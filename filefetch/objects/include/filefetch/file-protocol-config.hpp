#pragma once

#include <string>
#include <string_view>

#include "filefetch/charset.hpp"

namespace filefetch {

/// Configuration knobs for the file protocol.
class FileProtocolConfig {
 public:
  static constexpr std::string_view kDefaultCharacterEncoding = "UTF-8";

  /// Throws std::invalid_argument if the configuration cannot be used.
  void validate() const;

  /// Name of the character encoding used to decode percent-encoded locator paths.
  [[nodiscard]] std::string_view characterEncoding() const noexcept { return _characterEncoding; }

  /// Charset matching characterEncoding(). Throws std::invalid_argument if it is not supported.
  [[nodiscard]] Charset charset() const;

  FileProtocolConfig &withCharacterEncoding(std::string_view characterEncoding) {
    _characterEncoding.assign(characterEncoding);
    return *this;
  }

  FileProtocolConfig &withCrawlParent(bool enable = true) {
    crawlParent = enable;
    return *this;
  }

  // Whether directory listings end with an entry for the parent directory.
  bool crawlParent{true};

 private:
  std::string _characterEncoding{kDefaultCharacterEncoding};
};

}  // namespace filefetch
