#include "filefetch/file-response.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "filefetch/file-protocol-config.hpp"
#include "filefetch/file-time.hpp"
#include "filefetch/file.hpp"
#include "filefetch/filesystem-probe.hpp"
#include "filefetch/http-constants.hpp"
#include "filefetch/http-status-code.hpp"
#include "filefetch/locator.hpp"
#include "filefetch/log.hpp"
#include "filefetch/metadata.hpp"
#include "filefetch/protocol-response.hpp"
#include "filefetch/sitemap.hpp"
#include "filefetch/timestring.hpp"

namespace filefetch {

namespace {

constexpr std::size_t kMaxFileSize = static_cast<std::size_t>(std::numeric_limits<int32_t>::max());

// Collapses repeated '/' and drops a trailing '/' (except for the root).
std::string NormalizeSeparators(std::string_view path) {
  std::string ret;
  ret.reserve(path.size());
  for (char ch : path) {
    if (ch == '/' && !ret.empty() && ret.back() == '/') {
      continue;
    }
    ret.push_back(ch);
  }
  if (ret.size() > 1U && ret.back() == '/') {
    ret.pop_back();
  }
  return ret;
}

}  // namespace

FileResponse::FileResponse(std::string_view locator, Metadata& metadata, const FileProtocolConfig& config,
                           const FileSystemProbe& probe)
    : _metadata(metadata) {
  const Locator parsedLocator(locator);
  if (parsedLocator.path() != parsedLocator.file()) {
    log::warn("Query string of locator '{}' is ignored", locator);
  }

  std::string_view encodedPath = parsedLocator.path();
  if (encodedPath.empty()) {
    encodedPath = "/";
  }

  const std::string decodedPath = DecodePath(encodedPath, config.charset());
  if (decodedPath.find('\0') != std::string::npos) {
    log::debug("Path of locator '{}' contains a null character", locator);
    _statusCode = http::StatusCodeNotFound;
    return;
  }

  resolve(std::filesystem::path(NormalizeSeparators(decodedPath)), config, probe);
}

ProtocolResponse FileResponse::toProtocolResponse() const { return {_content, _statusCode, _metadata}; }

void FileResponse::resolve(const std::filesystem::path& path, const FileProtocolConfig& config,
                           const FileSystemProbe& probe) {
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    log::debug("'{}' does not exist", path.c_str());
    _statusCode = http::StatusCodeNotFound;
    return;
  }

  if (!probe.isReadable(path)) {
    log::info("'{}' is not readable", path.c_str());
    _statusCode = http::StatusCodeUnauthorized;
    return;
  }

  const std::filesystem::path canonicalPath = probe.canonical(path, ec);
  if (ec) {
    log::error("Unable to compute canonical path of '{}': {}", path.c_str(), ec.message());
    _statusCode = http::StatusCodeInternalServerError;
    return;
  }

  const bool isDirectory = std::filesystem::is_directory(status);

  if (canonicalPath.native() != path.native()) {
    log::debug("'{}' redirects to its canonical path '{}'", path.c_str(), canonicalPath.c_str());
    _metadata.setValue(http::Location, MakeFileLocator(canonicalPath, isDirectory));
    _statusCode = http::StatusCodeMultipleChoices;
    return;
  }

  if (isDirectory) {
    listDirectory(path, config.crawlParent);
  } else if (std::filesystem::is_regular_file(status)) {
    loadFile(path);
  } else {
    log::warn("'{}' is neither a directory nor a regular file", path.c_str());
    _statusCode = http::StatusCodeInternalServerError;
  }
}

void FileResponse::loadFile(const std::filesystem::path& path) {
  const File file(path.c_str());
  if (!file) {
    _statusCode = http::StatusCodeMethodFailure;
    return;
  }

  try {
    const std::size_t size = file.size();
    if (size > kMaxFileSize) {
      log::warn("'{}' is too large to be loaded ({} bytes)", path.c_str(), size);
      _statusCode = http::StatusCodeBadRequest;
      return;
    }
    _content = file.loadContent(size);
    _metadata.setValue(http::ContentLength, std::to_string(size));
  } catch (const std::runtime_error& ex) {
    log::error("Exception while fetching file response '{}': {}", path.c_str(), ex.what());
    _content.clear();
    _statusCode = http::StatusCodeMethodFailure;
    return;
  }

  _metadata.setValue(http::LastModified, FormatHttpDate(LastModifiedTimeOrEpoch(path)));
  _statusCode = http::StatusCodeOK;
}

void FileResponse::listDirectory(const std::filesystem::path& path, bool crawlParent) {
  try {
    _content = GenerateDirectorySitemap(path, crawlParent);
  } catch (const std::filesystem::filesystem_error& ex) {
    log::error("Unable to list directory '{}': {}", path.c_str(), ex.what());
    _statusCode = http::StatusCodeInternalServerError;
    return;
  }

  _metadata.setValue(http::ContentType, http::ContentTypeApplicationXml);
  _metadata.setValue(http::IsSitemap, "true");
  _statusCode = http::StatusCodeOK;
}

}  // namespace filefetch
