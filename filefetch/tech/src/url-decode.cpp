#include "filefetch/url-decode.hpp"

#include "filefetch/char-hexadecimal-converter.hpp"

namespace filefetch::url {

char* DecodeInPlace(char* first, const char* last) {
  char* out = first;
  while (first != last) {
    const char ch = *first++;
    if (ch == '+') {
      *out++ = ' ';
    } else if (ch != '%') {
      *out++ = ch;
    } else {
      if (last - first < 2) {
        return nullptr;
      }
      const int high = from_hex_digit(first[0]);
      const int low = from_hex_digit(first[1]);
      if (high < 0 || low < 0) {
        return nullptr;
      }
      *out++ = static_cast<char>((high << 4) | low);
      first += 2;
    }
  }
  return out;
}

}  // namespace filefetch::url
