#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "filefetch/http-status-code.hpp"
#include "filefetch/metadata.hpp"

namespace filefetch {

// Outcome of a protocol fetch: status code, payload bytes and response metadata.
// Immutable once built.
class ProtocolResponse {
 public:
  ProtocolResponse(std::string content, http::StatusCode statusCode, Metadata metadata)
      : _content(std::move(content)), _metadata(std::move(metadata)), _statusCode(statusCode) {}

  [[nodiscard]] std::string_view content() const noexcept { return _content; }

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  [[nodiscard]] const Metadata& metadata() const noexcept { return _metadata; }

  bool operator==(const ProtocolResponse&) const noexcept = default;

 private:
  std::string _content;
  Metadata _metadata;
  http::StatusCode _statusCode;
};

}  // namespace filefetch
