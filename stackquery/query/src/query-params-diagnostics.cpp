#include "stackquery/query-params-diagnostics.hpp"

#include <cstddef>
#include <string_view>

#include "stackquery/log.hpp"

namespace stackquery::detail {

void LogQueryParamsLimitReached(std::size_t maxNbParams, std::string_view droppedQuery) noexcept {
  log::debug("Query parameters limit of {} reached, dropping '{}'", maxNbParams, droppedQuery);
}

void LogQueryParamTruncated(std::string_view what, std::string_view rawText, std::size_t capacity) noexcept {
  log::debug("Query parameter {} '{}' of {} raw bytes truncated to a capacity of {} bytes", what, rawText,
             rawText.size(), capacity);
}

void LogQueryPairWithEmptyKeySkipped(std::string_view rawPair) noexcept {
  log::trace("Skipping query pair '{}' with an empty key", rawPair);
}

}  // namespace stackquery::detail
