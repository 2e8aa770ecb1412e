#pragma once

// Logging abstraction: spdlog when available; otherwise a minimal stdout fallback.
#ifdef STACKQUERY_ENABLE_SPDLOG
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export
#else
#include <chrono>
#include <format>
#include <iostream>
#include <string_view>
#include <utility>
#endif

namespace stackquery {
#ifdef STACKQUERY_ENABLE_SPDLOG
namespace log = spdlog;
#else
namespace log {

// Only the levels used by stackquery, with the spdlog ordering.
struct level {
  using level_enum = int;
  static constexpr int trace = 0;
  static constexpr int debug = 1;
  static constexpr int info = 2;
};

inline level::level_enum &current_level() {
  static level::level_enum lvl = level::info;
  return lvl;
}

inline void set_level(level::level_enum lvl) { current_level() = lvl; }
inline level::level_enum get_level() { return current_level(); }
inline bool should_log(level::level_enum lvl) { return get_level() <= lvl; }

namespace detail {
template <typename... Args>
void emit(std::string_view lvlTag, std::format_string<Args...> fmt, Args &&...args) {
  const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
  std::cout << '[' << std::format("{:%FT%T}Z", now) << "] [" << lvlTag << "] "
            << std::format(fmt, std::forward<Args>(args)...) << '\n';
}
}  // namespace detail

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args &&...args) {
  if (should_log(level::trace)) {
    detail::emit("trace", fmt, std::forward<Args>(args)...);
  }
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args &&...args) {
  if (should_log(level::debug)) {
    detail::emit("debug", fmt, std::forward<Args>(args)...);
  }
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args &&...args) {
  if (should_log(level::info)) {
    detail::emit("info", fmt, std::forward<Args>(args)...);
  }
}

}  // namespace log
#endif

}  // namespace stackquery
