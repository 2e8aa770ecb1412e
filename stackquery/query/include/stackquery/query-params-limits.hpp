#pragma once

#include <cstddef>

namespace stackquery {

// Default maximum number of query parameters stored by a QueryParams table.
inline constexpr std::size_t kDefaultMaxQueryParams = 16;

// Default capacity of a decoded parameter key, in bytes.
inline constexpr std::size_t kDefaultMaxKeyLen = 32;

// Default capacity of a decoded parameter value, in bytes.
inline constexpr std::size_t kDefaultMaxValueLen = 128;

}  // namespace stackquery
