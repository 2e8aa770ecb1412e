#pragma once

#include <cstddef>

namespace stackquery {

inline constexpr char32_t kMaxCodePoint = 0x10FFFF;

/// Returns the number of bytes of the UTF-8 encoding of given code point (between 1 and 4),
/// or 0 if it cannot be encoded (UTF-16 surrogates and values above U+10FFFF).
/// Examples:
///  U+0041 'A' -> 1
///  U+00E9 'é' -> 2
///  U+20AC '€' -> 3
///  U+1F600    -> 4
///  U+D800     -> 0
constexpr std::size_t Utf8EncodedLength(char32_t codePoint) noexcept {
  if (codePoint < 0x80) {
    return 1;
  }
  if (codePoint < 0x800) {
    return 2;
  }
  if (codePoint < 0x10000) {
    return codePoint >= 0xD800 && codePoint <= 0xDFFF ? 0 : 3;
  }
  return codePoint <= kMaxCodePoint ? 4 : 0;
}

/// Writes to 'buf' the UTF-8 encoding of given code point.
/// Given buffer should have space for at least Utf8EncodedLength(codePoint) chars, which must not be 0.
/// Return a pointer to the char immediately positioned after the last written byte.
constexpr char *Utf8Encode(char32_t codePoint, char *buf) noexcept {
  switch (Utf8EncodedLength(codePoint)) {
    case 1:
      *buf++ = static_cast<char>(codePoint);
      break;
    case 2:
      *buf++ = static_cast<char>(0xC0 | (codePoint >> 6));
      *buf++ = static_cast<char>(0x80 | (codePoint & 0x3F));
      break;
    case 3:
      *buf++ = static_cast<char>(0xE0 | (codePoint >> 12));
      *buf++ = static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
      *buf++ = static_cast<char>(0x80 | (codePoint & 0x3F));
      break;
    case 4:
      *buf++ = static_cast<char>(0xF0 | (codePoint >> 18));
      *buf++ = static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
      *buf++ = static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
      *buf++ = static_cast<char>(0x80 | (codePoint & 0x3F));
      break;
    default:
      break;
  }
  return buf;
}

}  // namespace stackquery
