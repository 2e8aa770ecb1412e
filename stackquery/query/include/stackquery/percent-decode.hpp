#pragma once

#include <cstddef>
#include <string_view>

#include "stackquery/bounded-text.hpp"
#include "stackquery/char-hexadecimal-converter.hpp"

namespace stackquery::url {

// Decodes the character starting at 'first' ('first' < 'last') with application/x-www-form-urlencoded rules:
//  - '%' followed by two hexadecimal digits (case-insensitive) gives the byte they encode,
//  - '%' not followed by two hexadecimal digits stays a literal '%' (the chars after it are not consumed),
//  - '+' gives a space,
//  - any other byte is taken as is.
// Returns the decoded byte and advances 'first' past the consumed input.
constexpr unsigned char DecodeNextByte(const char *&first, const char *last) noexcept {
  const char ch = *first;
  if (ch == '%' && last - first > 2) {
    const int hi = from_hex_digit(first[1]);
    const int lo = from_hex_digit(first[2]);
    if (hi >= 0 && lo >= 0) {
      first += 3;
      return static_cast<unsigned char>((hi << 4) | lo);
    }
  }
  ++first;
  return ch == '+' ? static_cast<unsigned char>(' ') : static_cast<unsigned char>(ch);
}

struct PercentDecodeResult {
  // Number of consumed input chars, smaller than the input size only if decoding stopped because the output was full.
  std::size_t nbConsumed;
  // Whether some decoded characters are missing from the output.
  bool truncated;
};

// Percent decodes 'input' and appends the result to 'out', stopping as soon as 'out' is full.
// Each decoded byte is appended as the code point of same value (U+0000 to U+00FF), so the stored text is valid
// UTF-8 whatever the input bytes. A decoded character that does not fit in the remaining room is dropped and
// decoding goes on, as a shorter one may still fit.
template <std::size_t Capacity>
constexpr PercentDecodeResult PercentDecodeInto(std::string_view input, BoundedText<Capacity> &out) noexcept {
  const char *first = input.data();
  const char *last = first + input.size();
  bool dropped = false;
  while (first < last && !out.full()) {
    if (!out.append(static_cast<char32_t>(DecodeNextByte(first, last)))) {
      dropped = true;
    }
  }
  return {static_cast<std::size_t>(first - input.data()), dropped || first != last};
}

// Returns a new BoundedText holding the percent decoded 'input', truncated to Capacity bytes.
// Examples:
//  PercentDecode<32>("hello%20world") -> "hello world"
//  PercentDecode<32>("hello+world")   -> "hello world"
//  PercentDecode<32>("50%25")         -> "50%"
//  PercentDecode<32>("100%")          -> "100%"
//  PercentDecode<4>("abcdef")         -> "abcd"
template <std::size_t Capacity>
constexpr BoundedText<Capacity> PercentDecode(std::string_view input) noexcept {
  BoundedText<Capacity> ret;
  PercentDecodeInto(input, ret);
  return ret;
}

}  // namespace stackquery::url
