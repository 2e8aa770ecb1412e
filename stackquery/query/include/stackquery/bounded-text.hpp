#pragma once

#include <array>
#include <cstddef>
#include <string_view>

#include "stackquery/config.hpp"
#include "stackquery/utf8.hpp"

namespace stackquery {

// BoundedText is a fixed capacity UTF-8 text buffer living entirely in its own storage (no heap allocation).
// Its content is always a sequence of complete UTF-8 characters: a character whose encoding does not fit in the
// remaining room is dropped as a whole, the previous content being kept intact.
// Appending is saturating, not failing: append() tells whether the character has been kept.
template <std::size_t Capacity>
class BoundedText {
  static_assert(Capacity > 0U, "BoundedText requires a positive capacity");

 public:
  using size_type = std::size_t;

  static constexpr size_type kCapacity = Capacity;

  constexpr BoundedText() noexcept = default;

  // Appends the UTF-8 encoding of given code point if it entirely fits, otherwise does nothing.
  // Code points without UTF-8 encoding (surrogates, above U+10FFFF) are dropped as well.
  // Returns true if the code point has been appended, false if it has been dropped.
  constexpr bool append(char32_t codePoint) noexcept {
    const auto nbBytes = Utf8EncodedLength(codePoint);
    if (nbBytes == 0 || nbBytes > kCapacity - _len) {
      return false;
    }
    Utf8Encode(codePoint, _buf.data() + _len);
    _len += nbBytes;
    return true;
  }

  constexpr void clear() noexcept { _len = 0; }

  [[nodiscard]] constexpr size_type size() const noexcept { return _len; }
  [[nodiscard]] constexpr size_type length() const noexcept { return _len; }

  [[nodiscard]] static constexpr size_type capacity() noexcept { return kCapacity; }

  [[nodiscard]] constexpr bool empty() const noexcept { return _len == 0; }

  // Tells whether no more byte can be appended.
  [[nodiscard]] constexpr bool full() const noexcept { return _len == kCapacity; }

  // Returns a view on the stored text, valid until next modification or destruction of this object.
  [[nodiscard]] constexpr std::string_view view() const noexcept {
    if (STACKQUERY_UNLIKELY(_len > kCapacity)) {
      return {};
    }
    return {_buf.data(), _len};
  }

  constexpr operator std::string_view() const noexcept { return view(); }

  [[nodiscard]] constexpr const char *data() const noexcept { return _buf.data(); }

  constexpr bool operator==(std::string_view str) const noexcept { return view() == str; }

  template <std::size_t OtherCapacity>
  constexpr bool operator==(const BoundedText<OtherCapacity> &other) const noexcept {
    return view() == other.view();
  }

 private:
  std::array<char, kCapacity> _buf{};
  size_type _len{};
};

}  // namespace stackquery
