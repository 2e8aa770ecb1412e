#pragma once

#include <array>
#include <cassert>
#include <cstddef>
#include <iterator>
#include <optional>
#include <span>
#include <string_view>

#include "stackquery/percent-decode.hpp"
#include "stackquery/query-param.hpp"
#include "stackquery/query-params-diagnostics.hpp"
#include "stackquery/query-params-limits.hpp"
#include "stackquery/query-string-split.hpp"

namespace stackquery {

// QueryParams extracts the decoded key / value pairs of a URL query string into a fixed array of slots,
// without any heap allocation. Its footprint is fixed at compile time by its three capacities:
//  - MaxNbParams: maximum number of stored parameters,
//  - KeyCapacity: maximum size in bytes of a decoded key,
//  - ValueCapacity: maximum size in bytes of a decoded value.
// Parsing never fails: it degrades predictably when a limit is hit or when the input is malformed.
//  - extra parameters above MaxNbParams are dropped,
//  - keys and values are truncated to their capacity, on a UTF-8 character boundary,
//  - malformed percent escapes are kept literally,
//  - pairs with an empty key ('=value') and empty pairs ('&&') are skipped.
// All returned views point into the table storage: they are valid until the next parse(), clear() or destruction.
// Example:
//    stackquery::QueryParams<> params;
//    params.parse("https://example.com/path?name=John+Doe&city=New%20York");
//    params.get("city");  // "New York"
//    for (const auto &[key, value] : params) {
//       // do something with key and value
//    }
template <std::size_t MaxNbParams = kDefaultMaxQueryParams, std::size_t KeyCapacity = kDefaultMaxKeyLen,
          std::size_t ValueCapacity = kDefaultMaxValueLen>
class QueryParams {
  static_assert(MaxNbParams > 0U, "QueryParams requires a positive maximum number of parameters");

 public:
  using size_type = std::size_t;
  using param_type = QueryParam<KeyCapacity, ValueCapacity>;

  static constexpr size_type kMaxNbParams = MaxNbParams;
  static constexpr size_type kKeyCapacity = KeyCapacity;
  static constexpr size_type kValueCapacity = ValueCapacity;

  class iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = QueryParamView;
    using difference_type = std::ptrdiff_t;
    using reference = QueryParamView;

    iterator() noexcept = default;

    QueryParamView operator*() const noexcept { return _param->view(); }

    iterator &operator++() noexcept {
      ++_param;
      return *this;
    }

    iterator operator++(int) noexcept {
      iterator ret = *this;
      ++_param;
      return ret;
    }

    bool operator==(const iterator &) const noexcept = default;

   private:
    friend class QueryParams;

    explicit iterator(const param_type *param) noexcept : _param(param) {}

    const param_type *_param{};
  };

  QueryParams() noexcept = default;

  // Parses the query string of given URL (everything after its first '?') and appends its decoded parameters after
  // the already stored ones, in order of appearance.
  // If there is no '?' in 'urlOrQuery', nothing is done.
  // Stops as soon as the table is full.
  void parse(std::string_view urlOrQuery) noexcept {
    const auto query = url::FindQueryString(urlOrQuery);
    if (!query) {
      return;
    }
    const url::QueryPairRange rawPairs(*query);
    for (auto it = rawPairs.begin(); it != rawPairs.end(); ++it) {
      if (_nbParams == kMaxNbParams) {
        detail::LogQueryParamsLimitReached(kMaxNbParams, rawPairs.remainingFrom(it));
        break;
      }
      const std::string_view rawPair = *it;
      const url::RawQueryPair raw = url::SplitQueryPair(rawPair);
      if (raw.key.empty()) {
        detail::LogQueryPairWithEmptyKeySkipped(rawPair);
        continue;
      }

      param_type &param = _params[_nbParams];
      param._key.clear();
      param._value.clear();
      if (url::PercentDecodeInto(raw.key, param._key).truncated) {
        detail::LogQueryParamTruncated("key", raw.key, kKeyCapacity);
      }
      if (url::PercentDecodeInto(raw.value, param._value).truncated) {
        detail::LogQueryParamTruncated("value", raw.value, kValueCapacity);
      }
      ++_nbParams;
    }
  }

  // Returns the value of the first parameter whose key is exactly 'key' (case-sensitive),
  // or std::nullopt if there is none.
  // A parameter without value gives an engaged empty value.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const noexcept {
    for (const param_type &param : params()) {
      if (param.key() == key) {
        return param.value();
      }
    }
    return std::nullopt;
  }

  // Like get() but does not distinguish an absent key from an empty value.
  [[nodiscard]] std::string_view valueOrEmpty(std::string_view key) const noexcept {
    const auto value = get(key);
    return value ? *value : std::string_view{};
  }

  [[nodiscard]] bool contains(std::string_view key) const noexcept { return get(key).has_value(); }

  // Returns the parameter at given index, which must be smaller than size().
  [[nodiscard]] const param_type &operator[](size_type idx) const noexcept {
    assert(idx < _nbParams);
    return _params[idx];
  }

  // Get a view on the stored parameters, in order of appearance.
  [[nodiscard]] std::span<const param_type> params() const noexcept { return {_params.data(), _nbParams}; }

  [[nodiscard]] iterator begin() const noexcept { return iterator(_params.data()); }
  [[nodiscard]] iterator end() const noexcept { return iterator(_params.data() + _nbParams); }

  [[nodiscard]] size_type size() const noexcept { return _nbParams; }
  [[nodiscard]] size_type length() const noexcept { return _nbParams; }

  [[nodiscard]] static constexpr size_type capacity() noexcept { return kMaxNbParams; }

  [[nodiscard]] bool empty() const noexcept { return _nbParams == 0; }

  [[nodiscard]] bool full() const noexcept { return _nbParams == kMaxNbParams; }

  // Forgets all stored parameters. Their slots are reused by the next parse().
  void clear() noexcept { _nbParams = 0; }

 private:
  std::array<param_type, kMaxNbParams> _params{};
  size_type _nbParams{};
};

// QueryParams with the default capacities: 16 parameters, keys of 32 bytes and values of 128 bytes.
using DefaultQueryParams = QueryParams<>;

}  // namespace stackquery
