#include "filefetch/file-protocol-config.hpp"

#include <stdexcept>
#include <string>

#include "filefetch/charset.hpp"

namespace filefetch {

namespace {

[[noreturn]] void ThrowUnsupportedEncoding(const std::string& characterEncoding) {
  throw std::invalid_argument("FileProtocolConfig.characterEncoding '" + characterEncoding + "' is not supported");
}

}  // namespace

void FileProtocolConfig::validate() const {
  if (!CharsetFromName(_characterEncoding)) {
    ThrowUnsupportedEncoding(_characterEncoding);
  }
}

Charset FileProtocolConfig::charset() const {
  const auto found = CharsetFromName(_characterEncoding);
  if (!found) {
    ThrowUnsupportedEncoding(_characterEncoding);
  }
  return *found;
}

}  // namespace filefetch
