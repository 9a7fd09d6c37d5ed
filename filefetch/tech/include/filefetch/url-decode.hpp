#pragma once

namespace filefetch::url {

// Percent-decodes [first, last) in place, with '+' decoded as a space.
// Returns a pointer past the last decoded char, or nullptr if a '%' is not followed by two hexadecimal digits
// (the buffer content is then unspecified).
char* DecodeInPlace(char* first, const char* last);

}  // namespace filefetch::url
