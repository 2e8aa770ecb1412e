#pragma once

namespace stackquery {

#ifdef STACKQUERY_ENABLE_SPDLOG
constexpr bool spdLogEnabled() { return true; }
#else
constexpr bool spdLogEnabled() { return false; }
#endif

}  // namespace stackquery
