#include "stackquery/query-string-split.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

namespace stackquery::url {

std::optional<std::string_view> FindQueryString(std::string_view urlOrQuery) noexcept {
  const auto questionMarkPos = urlOrQuery.find(kQueryStart);
  if (questionMarkPos == std::string_view::npos) {
    return std::nullopt;
  }
  return urlOrQuery.substr(questionMarkPos + 1U);
}

RawQueryPair SplitQueryPair(std::string_view pair) noexcept {
  const auto equalPos = pair.find(kKeyValueSep);
  if (equalPos == std::string_view::npos) {
    return {pair, {}};
  }
  return {pair.substr(0, equalPos), pair.substr(equalPos + 1U)};
}

void QueryPairRange::iterator::skipSeparators() noexcept {
  _first = std::find_if(_first, _last, [](char ch) { return ch != kPairSep; });
  _pairEnd = std::find(_first, _last, kPairSep);
}

}  // namespace stackquery::url
