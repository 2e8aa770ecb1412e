#pragma once

#include <cstddef>
#include <string_view>

#include "stackquery/bounded-text.hpp"

namespace stackquery {

// Decoded key / value views of a query parameter.
// They point into the storage of the owning QueryParams table.
struct QueryParamView {
  std::string_view key;
  std::string_view value;

  bool operator==(const QueryParamView &) const noexcept = default;
};

template <std::size_t MaxNbParams, std::size_t KeyCapacity, std::size_t ValueCapacity>
class QueryParams;

// A query parameter slot of a QueryParams table: a decoded key and a decoded value, each with its own fixed capacity.
// A parameter without value (like 'flag' in '?flag&a=1') has an empty value.
template <std::size_t KeyCapacity, std::size_t ValueCapacity>
class QueryParam {
 public:
  using key_type = BoundedText<KeyCapacity>;
  using value_type = BoundedText<ValueCapacity>;

  constexpr QueryParam() noexcept = default;

  [[nodiscard]] constexpr std::string_view key() const noexcept { return _key.view(); }

  [[nodiscard]] constexpr std::string_view value() const noexcept { return _value.view(); }

  [[nodiscard]] constexpr QueryParamView view() const noexcept { return {key(), value()}; }

 private:
  template <std::size_t, std::size_t, std::size_t>
  friend class QueryParams;

  key_type _key;
  value_type _value;
};

}  // namespace stackquery
