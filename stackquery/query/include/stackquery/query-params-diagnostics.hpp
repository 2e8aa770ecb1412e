#pragma once

#include <cstddef>
#include <string_view>

// Reporting of the degraded (but never failing) outcomes of query string parsing.
// They are compiled out of line so that public headers do not depend on the logging backend.
// Messages are emitted at debug / trace levels only, so they are silent with the default logging level.
namespace stackquery::detail {

void LogQueryParamsLimitReached(std::size_t maxNbParams, std::string_view droppedQuery) noexcept;

void LogQueryParamTruncated(std::string_view what, std::string_view rawText, std::size_t capacity) noexcept;

void LogQueryPairWithEmptyKeySkipped(std::string_view rawPair) noexcept;

}  // namespace stackquery::detail
