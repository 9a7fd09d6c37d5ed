#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "filefetch/charset.hpp"

namespace filefetch {

// A URL-shaped resource locator: scheme:[//authority]path[?query][#fragment]
// Only the syntactic split is performed, no component is decoded.
class Locator {
 public:
  // Parse 'locator'. Throws std::invalid_argument if it does not start with a valid scheme followed by ':'.
  explicit Locator(std::string_view locator);

  [[nodiscard]] std::string_view str() const noexcept { return _str; }

  [[nodiscard]] std::string_view scheme() const noexcept { return component(_scheme); }

  // Authority part after '//', empty if absent.
  [[nodiscard]] std::string_view authority() const noexcept { return component(_authority); }

  // Path component, possibly empty.
  [[nodiscard]] std::string_view path() const noexcept { return component(_path); }

  // Query component without the leading '?', empty if absent.
  [[nodiscard]] std::string_view query() const noexcept { return component(_query); }

  // Fragment without the leading '#', empty if absent.
  [[nodiscard]] std::string_view fragment() const noexcept { return component(_fragment); }

  // Path followed by '?query' when a query is present.
  [[nodiscard]] std::string_view file() const noexcept;

  [[nodiscard]] bool hasQuery() const noexcept { return _hasQuery; }

  bool operator==(const Locator&) const noexcept = default;

 private:
  struct Range {
    bool operator==(const Range&) const noexcept = default;

    uint32_t pos{};
    uint32_t len{};
  };

  [[nodiscard]] std::string_view component(Range range) const noexcept {
    return std::string_view(_str).substr(range.pos, range.len);
  }

  std::string _str;
  Range _scheme;
  Range _authority;
  Range _path;
  Range _query;
  Range _fragment;
  bool _hasQuery{false};
};

// Renders an absolute filesystem path as a file locator ('file:' followed by the percent-encoded path).
// The result decodes back to 'absolutePath' through DecodePath with UTF-8 (for UTF-8 paths).
// A '/' is appended for directories so that relative references resolve inside them.
[[nodiscard]] std::string MakeFileLocator(const std::filesystem::path& absolutePath, bool isDirectory);

// Percent-decodes a locator path ('+' meaning a space) and transcodes the decoded bytes from 'charset' to UTF-8.
// Throws std::invalid_argument on a malformed escape sequence, or on bytes that are invalid in 'charset'.
[[nodiscard]] std::string DecodePath(std::string_view encodedPath, Charset charset);

}  // namespace filefetch
