#pragma once

#if defined(__clang__) && defined(__clang_minor__)
#define STACKQUERY_CLANG (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#elif defined(__GNUC__) && defined(__GNUC_MINOR__) && defined(__GNUC_PATCHLEVEL__)
#define STACKQUERY_GCC (__GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__)
#elif defined(_MSC_FULL_VER)
#define STACKQUERY_MSVC _MSC_FULL_VER
#endif

#if defined(__GNUC__)
#define STACKQUERY_LIKELY(x) (__builtin_expect(!!(x), 1))
#define STACKQUERY_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define STACKQUERY_LIKELY(x) (!!(x))
#define STACKQUERY_UNLIKELY(x) (!!(x))
#endif

#define STACKQUERY_STRINGIFY(x) #x
#define STACKQUERY_VER_STRING(major, minor, patch) \
  STACKQUERY_STRINGIFY(major) "." STACKQUERY_STRINGIFY(minor) "." STACKQUERY_STRINGIFY(patch)

#ifdef STACKQUERY_CLANG
#define STACKQUERY_COMPILER_NAME "clang"
#define STACKQUERY_COMPILER_VERSION \
  STACKQUERY_COMPILER_NAME " " STACKQUERY_VER_STRING(__clang_major__, __clang_minor__, __clang_patchlevel__)
#elifdef __GNUC__
#define STACKQUERY_COMPILER_NAME "g++"
#define STACKQUERY_COMPILER_VERSION \
  STACKQUERY_COMPILER_NAME " " STACKQUERY_VER_STRING(__GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__)
#elif defined(_MSC_VER)
#define STACKQUERY_COMPILER_NAME "MSVC"
#define STACKQUERY_COMPILER_VERSION STACKQUERY_COMPILER_NAME " " STACKQUERY_STRINGIFY(_MSC_FULL_VER)
#else
#error "Unknown compiler. Only clang, gcc and MSVC are supported."
#endif
