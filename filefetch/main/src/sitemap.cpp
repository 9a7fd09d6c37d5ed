#include "filefetch/sitemap.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include "filefetch/file-time.hpp"
#include "filefetch/log.hpp"
#include "filefetch/timedef.hpp"
#include "filefetch/timestring.hpp"

namespace filefetch {

namespace {

constexpr std::string_view kSitemapHeader =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<urlset xmlns=\"http://www.sitemaps.org/schemas/sitemap/0.9\">\n";
constexpr std::string_view kSitemapFooter = "</urlset>";

// Consumers of these listings expect the backslash separators.
constexpr std::string_view kLocPrefix = "file:\\";
constexpr char kDirectorySuffix = '\\';

void appendXmlEscaped(std::string_view text, std::string& out) {
  for (char ch : text) {
    switch (ch) {
      case '&':
        out.append("&amp;");
        break;
      case '<':
        out.append("&lt;");
        break;
      case '>':
        out.append("&gt;");
        break;
      case '"':
        out.append("&quot;");
        break;
      case '\'':
        out.append("&#39;");
        break;
      default:
        out.push_back(ch);
        break;
    }
  }
}

void appendUrl(const std::filesystem::path& path, bool isDirectoryRef, std::string& out) {
  out.append("<url>\n  <loc>");
  out.append(kLocPrefix);
  appendXmlEscaped(path.native(), out);
  if (isDirectoryRef) {
    out.push_back(kDirectorySuffix);
  }
  out.append("</loc>\n  <lastmod>");

  std::error_code ec;
  const SysTimePoint lastModified = LastModifiedTime(path, ec);
  if (ec) {
    log::debug("Unable to read last modification time of '{}': {}", path.c_str(), ec.message());
  }
  const auto oldSize = out.size();
  out.resize(oldSize + kRFC7231DateStrLen);
  TimeToStringRFC7231(lastModified, out.data() + oldSize);

  out.append("</lastmod>\n</url>\n");
}

}  // namespace

std::string GenerateDirectorySitemap(const std::filesystem::path& directory, bool includeParent) {
  std::error_code ec;
  std::filesystem::directory_iterator iter(directory, ec);
  if (ec) {
    throw std::filesystem::filesystem_error("Unable to list directory", directory, ec);
  }

  std::string out(kSitemapHeader);
  appendUrl(directory, true, out);

  const std::filesystem::directory_iterator end;
  while (iter != end) {
    appendUrl(iter->path(), false, out);
    iter.increment(ec);
    if (ec) {
      throw std::filesystem::filesystem_error("Unable to advance directory iterator", directory, ec);
    }
  }

  if (includeParent) {
    if (directory.has_relative_path()) {
      appendUrl(directory.parent_path(), true, out);
    } else {
      log::debug("'{}' has no parent directory, omitting it from the listing", directory.c_str());
    }
  }

  out.append(kSitemapFooter);
  return out;
}

}  // namespace filefetch
