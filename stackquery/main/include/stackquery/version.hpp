#pragma once

#include <string_view>

#include "stackquery/config.hpp"

#ifdef STACKQUERY_ENABLE_SPDLOG
#include <spdlog/version.h>
#endif

#ifndef STACKQUERY_VERSION_STR
#error "STACKQUERY_VERSION_STR must be defined via build system"
#endif

#ifdef STACKQUERY_ENABLE_SPDLOG
#define STACKQUERY_LOGGING_SECTION \
  "logging: spdlog " STACKQUERY_VER_STRING(SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH)
#else
#define STACKQUERY_LOGGING_SECTION "logging: disabled"
#endif

namespace stackquery {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return STACKQUERY_VERSION_STR; }

// Full version string, available at compile time as a single static storage string.
//
// Layout (multiline):
//   stackquery <version>\n
//     compiler: <...>\n
//     logging: <...>
//
// Each section is determined at compile time via feature macros.
constexpr std::string_view fullVersionStringView() {
  return "stackquery " STACKQUERY_VERSION_STR "\n  compiler: " STACKQUERY_COMPILER_VERSION
         "\n  " STACKQUERY_LOGGING_SECTION;
}

}  // namespace stackquery
