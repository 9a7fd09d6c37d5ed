#include "filefetch/locator.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

#include "filefetch/cctype.hpp"
#include "filefetch/char-hexadecimal-converter.hpp"
#include "filefetch/charset.hpp"
#include "filefetch/http-constants.hpp"
#include "filefetch/log.hpp"
#include "filefetch/url-decode.hpp"

namespace filefetch {

namespace {

constexpr bool IsSchemeChar(char ch) { return isalpha(ch) || isdigit(ch) || ch == '+' || ch == '-' || ch == '.'; }

// RFC 3986 pchar (unreserved, sub-delims, ':' and '@') plus the '/' separator.
// '+' is excluded as DecodePath reads it as a space.
constexpr bool IsFileLocatorPathChar(char ch) {
  if (isalpha(ch) || isdigit(ch)) {
    return true;
  }
  static constexpr std::string_view kAllowed = "-._~!$&'()*,;=:@/";
  return kAllowed.find(ch) != std::string_view::npos;
}

// Appends 'path' to 'out', each byte outside the file locator path set written as %XX.
void AppendEncodedPath(std::string_view path, std::string& out) {
  std::size_t nbEscaped = 0;
  for (char ch : path) {
    if (!IsFileLocatorPathChar(ch)) {
      ++nbEscaped;
    }
  }
  const auto oldSize = out.size();
  out.resize(oldSize + path.size() + (2U * nbEscaped));

  char* buf = out.data() + oldSize;
  for (char ch : path) {
    if (IsFileLocatorPathChar(ch)) {
      *buf++ = ch;
    } else {
      *buf++ = '%';
      buf = to_upper_hex(ch, buf);
    }
  }
}

}  // namespace

Locator::Locator(std::string_view locator) : _str(locator) {
  if (_str.size() > std::numeric_limits<uint32_t>::max()) {
    throw std::invalid_argument("Locator is too long");
  }
  const std::string_view str(_str);
  const auto colonPos = str.find(':');
  if (colonPos == std::string_view::npos || colonPos == 0 || !isalpha(str.front())) {
    throw std::invalid_argument("Locator has no scheme");
  }
  for (char ch : str.substr(0, colonPos)) {
    if (!IsSchemeChar(ch)) {
      throw std::invalid_argument("Locator has an invalid scheme");
    }
  }
  _scheme = Range{0, static_cast<uint32_t>(colonPos)};

  std::size_t pos = colonPos + 1;
  std::size_t end = str.size();

  const auto hashPos = str.find('#', pos);
  if (hashPos != std::string_view::npos) {
    _fragment = Range{static_cast<uint32_t>(hashPos + 1), static_cast<uint32_t>(end - hashPos - 1)};
    end = hashPos;
  }

  const std::string_view rest = str.substr(0, end);
  if (rest.substr(pos).starts_with("//")) {
    auto authorityEnd = rest.find_first_of("/?", pos + 2);
    if (authorityEnd == std::string_view::npos) {
      authorityEnd = end;
    }
    _authority = Range{static_cast<uint32_t>(pos + 2), static_cast<uint32_t>(authorityEnd - pos - 2)};
    pos = authorityEnd;
  }

  auto pathEnd = rest.find('?', pos);
  if (pathEnd == std::string_view::npos) {
    pathEnd = end;
  } else {
    _hasQuery = true;
    _query = Range{static_cast<uint32_t>(pathEnd + 1), static_cast<uint32_t>(end - pathEnd - 1)};
  }
  _path = Range{static_cast<uint32_t>(pos), static_cast<uint32_t>(pathEnd - pos)};
}

std::string_view Locator::file() const noexcept {
  const auto fileEnd = _hasQuery ? _query.pos + _query.len : _path.pos + _path.len;
  return std::string_view(_str).substr(_path.pos, fileEnd - _path.pos);
}

std::string MakeFileLocator(const std::filesystem::path& absolutePath, bool isDirectory) {
  const std::string_view pathStr = absolutePath.native();

  std::string ret;
  ret.reserve(http::FileScheme.size() + 1U + pathStr.size() + 1U);
  ret.append(http::FileScheme);
  ret.push_back(':');
  AppendEncodedPath(pathStr, ret);

  if (isDirectory && !ret.ends_with('/')) {
    ret.push_back('/');
  }
  return ret;
}

std::string DecodePath(std::string_view encodedPath, Charset charset) {
  std::string bytes(encodedPath);
  const char* end = url::DecodeInPlace(bytes.data(), bytes.data() + bytes.size());
  if (end == nullptr) {
    log::error("Invalid percent-encoding in path '{}'", encodedPath);
    throw std::invalid_argument("Invalid percent-encoding in locator path");
  }
  bytes.resize(static_cast<std::size_t>(end - bytes.data()));

  std::string decoded;
  AppendAsUTF8(bytes, charset, decoded);
  return decoded;
}

}  // namespace filefetch
