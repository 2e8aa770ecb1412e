#pragma once

namespace stackquery {

/// Decode a single hexadecimal digit, case-insensitive. Returns -1 if invalid.
/// Examples:
///  '7' -> 7
///  'b' -> 11
///  'F' -> 15
///  'g' -> -1
constexpr int from_hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

}  // namespace stackquery
