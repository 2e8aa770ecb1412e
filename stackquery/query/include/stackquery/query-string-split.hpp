#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>

namespace stackquery::url {

inline constexpr char kQueryStart = '?';
inline constexpr char kPairSep = '&';
inline constexpr char kKeyValueSep = '=';

// Returns the query string of given URL, that is everything after its first '?' (possibly empty),
// or std::nullopt if there is no '?' at all.
// No URI validation is made: a '#fragment' is kept as part of the query string.
// Examples:
//  "https://example.com/path?a=1&b=2" -> "a=1&b=2"
//  "?flag"                            -> "flag"
//  "/path?"                           -> ""
//  "/path"                            -> std::nullopt
[[nodiscard]] std::optional<std::string_view> FindQueryString(std::string_view urlOrQuery) noexcept;

// Raw (not yet decoded) key and value of a query pair.
struct RawQueryPair {
  std::string_view key;
  std::string_view value;
};

// Splits a raw 'key=value' pair on its first '='. A pair without '=' is a key with an empty value.
// Examples:
//  "a=1"   -> {"a", "1"}
//  "a=1=2" -> {"a", "1=2"}
//  "=1"    -> {"", "1"}
//  "flag"  -> {"flag", ""}
[[nodiscard]] RawQueryPair SplitQueryPair(std::string_view pair) noexcept;

// Non-allocating forward range over the raw pairs of a query string, split on '&'.
// Empty pairs (coming from '&&', leading or trailing '&') are skipped.
// The order of pairs and duplicates are preserved.
// Example:
//    for (std::string_view rawPair : QueryPairRange("a=1&&b&c=")) {
//       // "a=1", "b", "c="
//    }
class QueryPairRange {
 public:
  class iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::string_view;
    using difference_type = std::ptrdiff_t;
    using reference = std::string_view;

    iterator() noexcept = default;

    iterator(const char *first, const char *last) noexcept : _first(first), _pairEnd(first), _last(last) {
      skipSeparators();
    }

    std::string_view operator*() const noexcept { return {_first, _pairEnd}; }

    iterator &operator++() noexcept {
      _first = _pairEnd;
      skipSeparators();
      return *this;
    }

    iterator operator++(int) noexcept {
      iterator ret = *this;
      ++*this;
      return ret;
    }

    bool operator==(const iterator &other) const noexcept { return _first == other._first; }

   private:
    void skipSeparators() noexcept;

    const char *_first{};
    const char *_pairEnd{};
    const char *_last{};
  };

  QueryPairRange() noexcept = default;

  explicit QueryPairRange(std::string_view query) noexcept : _query(query) {}

  [[nodiscard]] iterator begin() const noexcept { return {_query.data(), _query.data() + _query.size()}; }

  [[nodiscard]] iterator end() const noexcept {
    return {_query.data() + _query.size(), _query.data() + _query.size()};
  }

  // Returns the remaining raw query text starting at given pair position (useful for diagnostics).
  [[nodiscard]] std::string_view remainingFrom(iterator it) const noexcept {
    const std::string_view pair = *it;
    return {pair.data(), _query.data() + _query.size()};
  }

 private:
  std::string_view _query;
};

}  // namespace stackquery::url
