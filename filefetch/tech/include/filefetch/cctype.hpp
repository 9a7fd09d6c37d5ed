#pragma once

namespace filefetch {

constexpr bool isdigit(char ch) { return ch >= '0' && ch <= '9'; }

constexpr bool isalpha(char ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); }

constexpr bool isspace(char ch) { return ch == ' ' || (ch >= '\t' && ch <= '\r'); }

constexpr unsigned char tolower(unsigned char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    ch |= 0x20;
  }
  return ch;
}

constexpr char tolower(char ch) { return static_cast<char>(tolower(static_cast<unsigned char>(ch))); }

}  // namespace filefetch
