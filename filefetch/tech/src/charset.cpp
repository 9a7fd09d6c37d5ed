#include "filefetch/charset.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "filefetch/log.hpp"
#include "filefetch/string-equal-ignore-case.hpp"

namespace filefetch {

namespace {

constexpr std::array<std::pair<std::string_view, Charset>, 11> kCharsetAliases{{
    {"UTF-8", Charset::UTF8},
    {"UTF8", Charset::UTF8},
    {"ISO-8859-1", Charset::ISO_8859_1},
    {"ISO8859-1", Charset::ISO_8859_1},
    {"ISO8859_1", Charset::ISO_8859_1},
    {"ISO_8859_1", Charset::ISO_8859_1},
    {"latin1", Charset::ISO_8859_1},
    {"Latin-1", Charset::ISO_8859_1},
    {"US-ASCII", Charset::US_ASCII},
    {"ASCII", Charset::US_ASCII},
    {"ISO646-US", Charset::US_ASCII},
}};

// Length of the UTF-8 sequence starting at 'pos', or 0 if it is not a valid sequence.
// Overlong forms, surrogates and code points above U+10FFFF are rejected.
std::size_t ValidUTF8SequenceLength(std::string_view bytes, std::size_t pos) {
  const auto byteAt = [bytes](std::size_t idx) { return static_cast<unsigned char>(bytes[idx]); };
  const unsigned char lead = byteAt(pos);
  if (lead < 0x80U) {
    return 1;
  }
  std::size_t len;
  unsigned char minSecond = 0x80U;
  unsigned char maxSecond = 0xBFU;
  if (lead >= 0xC2U && lead <= 0xDFU) {
    len = 2;
  } else if (lead >= 0xE0U && lead <= 0xEFU) {
    len = 3;
    if (lead == 0xE0U) {
      minSecond = 0xA0U;
    } else if (lead == 0xEDU) {
      maxSecond = 0x9FU;
    }
  } else if (lead >= 0xF0U && lead <= 0xF4U) {
    len = 4;
    if (lead == 0xF0U) {
      minSecond = 0x90U;
    } else if (lead == 0xF4U) {
      maxSecond = 0x8FU;
    }
  } else {
    return 0;
  }
  if (pos + len > bytes.size()) {
    return 0;
  }
  const unsigned char second = byteAt(pos + 1);
  if (second < minSecond || second > maxSecond) {
    return 0;
  }
  for (std::size_t idx = pos + 2; idx < pos + len; ++idx) {
    if ((byteAt(idx) & 0xC0U) != 0x80U) {
      return 0;
    }
  }
  return len;
}

}  // namespace

std::optional<Charset> CharsetFromName(std::string_view name) noexcept {
  for (const auto& [alias, charset] : kCharsetAliases) {
    if (CaseInsensitiveEqual(alias, name)) {
      return charset;
    }
  }
  return std::nullopt;
}

std::string_view CharsetName(Charset charset) noexcept {
  switch (charset) {
    case Charset::UTF8:
      return "UTF-8";
    case Charset::ISO_8859_1:
      return "ISO-8859-1";
    case Charset::US_ASCII:
      return "US-ASCII";
    default:
      std::unreachable();
  }
}

void AppendAsUTF8(std::string_view bytes, Charset charset, std::string& out) {
  switch (charset) {
    case Charset::UTF8:
      for (std::size_t pos = 0; pos < bytes.size();) {
        const auto len = ValidUTF8SequenceLength(bytes, pos);
        if (len == 0) {
          log::error("Invalid UTF-8 sequence at byte {} of '{}'", pos, bytes);
          throw std::invalid_argument("Invalid UTF-8 byte sequence");
        }
        pos += len;
      }
      out.append(bytes);
      break;
    case Charset::ISO_8859_1:
      out.reserve(out.size() + bytes.size());
      for (char ch : bytes) {
        const auto code = static_cast<unsigned char>(ch);
        if (code < 0x80U) {
          out.push_back(ch);
        } else {
          // Latin-1 maps 1:1 to U+0080..U+00FF, encoded on 2 bytes in UTF-8
          out.push_back(static_cast<char>(0xC0U | (code >> 6U)));
          out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
        }
      }
      break;
    case Charset::US_ASCII:
      for (char ch : bytes) {
        if (static_cast<unsigned char>(ch) >= 0x80U) {
          log::error("Non ASCII byte {:#x} in '{}'", static_cast<unsigned char>(ch), bytes);
          throw std::invalid_argument("Invalid US-ASCII byte");
        }
      }
      out.append(bytes);
      break;
    default:
      std::unreachable();
  }
}

}  // namespace filefetch
