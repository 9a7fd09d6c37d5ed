#pragma once

#include <string_view>

namespace filefetch::http {

// Metadata keys produced by the file protocol. They reuse HTTP header names so that downstream
// consumers of HTTP responses can read them without special-casing file responses.
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view LastModified = "Last-Modified";
inline constexpr std::string_view Location = "Location";

// Marker flag distinguishing synthetic directory listings from real XML sitemaps.
inline constexpr std::string_view IsSitemap = "isSitemap";

inline constexpr std::string_view ContentTypeApplicationXml = "application/xml";

inline constexpr std::string_view FileScheme = "file";

}  // namespace filefetch::http
