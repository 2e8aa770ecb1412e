#pragma once

#include <cstddef>
#include <string_view>

#include "stackquery/utf8.hpp"

namespace stackquery::test {

/// Tells whether 'str' is a well-formed UTF-8 sequence of complete characters
/// (no overlong forms, no surrogates, nothing above U+10FFFF).
constexpr bool IsValidUtf8(std::string_view str) noexcept {
  const char *first = str.data();
  const char *last = first + str.size();
  while (first < last) {
    const auto lead = static_cast<unsigned char>(*first);
    std::size_t nbBytes;
    char32_t codePoint;
    if (lead < 0x80) {
      ++first;
      continue;
    }
    if ((lead & 0xE0) == 0xC0) {
      nbBytes = 2;
      codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      nbBytes = 3;
      codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      nbBytes = 4;
      codePoint = lead & 0x07;
    } else {
      return false;
    }
    if (static_cast<std::size_t>(last - first) < nbBytes) {
      return false;
    }
    for (std::size_t pos = 1; pos < nbBytes; ++pos) {
      const auto cont = static_cast<unsigned char>(first[pos]);
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      codePoint = (codePoint << 6) | (cont & 0x3F);
    }
    // reject overlong encodings and non encodable code points
    if (Utf8EncodedLength(codePoint) != nbBytes) {
      return false;
    }
    first += nbBytes;
  }
  return true;
}

}  // namespace stackquery::test
