#pragma once

// Umbrella header of the public API.

#include "stackquery/bounded-text.hpp"         // IWYU pragma: export
#include "stackquery/features.hpp"             // IWYU pragma: export
#include "stackquery/percent-decode.hpp"       // IWYU pragma: export
#include "stackquery/query-param.hpp"          // IWYU pragma: export
#include "stackquery/query-params-limits.hpp"  // IWYU pragma: export
#include "stackquery/query-params.hpp"         // IWYU pragma: export
#include "stackquery/query-string-split.hpp"   // IWYU pragma: export
#include "stackquery/version.hpp"              // IWYU pragma: export
