#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace filefetch {

// Character encodings accepted for decoding locator paths.
enum class Charset : std::uint8_t { UTF8, ISO_8859_1, US_ASCII };

// Returns the Charset matching given name (case-insensitive, common aliases accepted such as 'utf8',
// 'latin1' or 'ascii'), or std::nullopt if it is not supported.
[[nodiscard]] std::optional<Charset> CharsetFromName(std::string_view name) noexcept;

// Canonical name of the charset (e.g. "UTF-8").
[[nodiscard]] std::string_view CharsetName(Charset charset) noexcept;

// Appends to 'out' the UTF-8 representation of 'bytes' interpreted in given charset.
// Throws std::invalid_argument if 'bytes' is not a valid sequence in this charset.
void AppendAsUTF8(std::string_view bytes, Charset charset, std::string& out);

}  // namespace filefetch
