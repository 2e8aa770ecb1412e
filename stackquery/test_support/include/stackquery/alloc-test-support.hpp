#pragma once

#include <dlfcn.h>

#include <cerrno>
#include <cstddef>
#include <cstdlib>

#ifdef __GLIBC__
extern "C" void* __libc_malloc(size_t) noexcept;          // NOLINT(bugprone-reserved-identifier)
extern "C" void* __libc_realloc(void*, size_t) noexcept;  // NOLINT(bugprone-reserved-identifier)
#endif

namespace stackquery::test {

// Allocation tracking utilities used by tests checking that parsing never touches the heap.
// Including this header in a test executable overrides `malloc` / `realloc` (operator new relies on them) so that:
//  - every call is counted, see `MallocCallCount()`,
//  - `FailNextMalloc()` causes the next N allocations to return ENOMEM.
// It must be included by a single translation unit of the test executable.
// Do NOT override `free` from here, that can break the dynamic loader and sanitizer internals.

// Use simple inline counters and atomic builtins to avoid C++ runtime
// initialization that can be unsafe when allocator hooks run during
// dynamic loader/sanitizer initialization.
inline unsigned long g_malloc_call_counter = 0;
inline int g_malloc_failure_counter = 0;

__attribute__((no_sanitize("address"))) inline void FailNextMalloc(int count = 1) {
  __atomic_store_n(&g_malloc_failure_counter, count, __ATOMIC_RELAXED);
}

// Returns the number of remaining allocations that will fail.
[[nodiscard]] __attribute__((no_sanitize("address"))) inline int PendingMallocFailures() {
  return __atomic_load_n(&g_malloc_failure_counter, __ATOMIC_RELAXED);
}

// Returns the total number of malloc / realloc calls made so far by the process.
[[nodiscard]] __attribute__((no_sanitize("address"))) inline unsigned long MallocCallCount() {
  return __atomic_load_n(&g_malloc_call_counter, __ATOMIC_RELAXED);
}

__attribute__((no_sanitize("address"))) inline void CountMallocCall() {
  __atomic_add_fetch(&g_malloc_call_counter, 1UL, __ATOMIC_RELAXED);
}

[[nodiscard]] inline __attribute__((no_sanitize("address"))) bool ShouldFailMalloc() {
  int remaining = __atomic_load_n(&g_malloc_failure_counter, __ATOMIC_RELAXED);
  while (remaining > 0) {
    int desired = remaining - 1;
    if (__atomic_compare_exchange_n(&g_malloc_failure_counter, &remaining, desired, /*weak=*/true, __ATOMIC_RELAXED,
                                    __ATOMIC_RELAXED)) {
      return true;
    }
  }
  return false;
}

// Portable resolver for RTLD_NEXT symbols. It aborts if symbol resolution fails.
template <typename Fn>
Fn ResolveNext(const char* name) {
  void* sym = dlsym(RTLD_NEXT, name);
  if (sym == nullptr) {
    std::abort();
  }
  return reinterpret_cast<Fn>(sym);
}

}  // namespace stackquery::test

// Disable overriding malloc/realloc for:
// 1. Clang builds instrumented with AddressSanitizer - Clang's ASAN runtime
//    may call allocation functions very early during initialization.
// 2. Non-glibc systems (like musl/Alpine) - without __libc_malloc fallback,
//    dlsym resolution can deadlock or recurse during early initialization.
#if defined(__clang__) && defined(__has_feature)
#if __has_feature(address_sanitizer)
#define STACKQUERY_WANT_MALLOC_OVERRIDES 0
#endif
#endif

#ifndef STACKQUERY_WANT_MALLOC_OVERRIDES
#ifdef __GLIBC__
#define STACKQUERY_WANT_MALLOC_OVERRIDES 1
#else
#define STACKQUERY_WANT_MALLOC_OVERRIDES 0
#endif
#endif

#if STACKQUERY_WANT_MALLOC_OVERRIDES
void* CallRealMalloc(size_t size) {
  using MallocFn = void* (*)(size_t);
  static MallocFn fn = nullptr;
  static volatile int resolving = 0;
  if (fn != nullptr) {
    return fn(size);
  }
  // Try to become the resolver using an atomic CAS builtin (no libc calls)
  if (!__sync_bool_compare_and_swap(&resolving, 0, 1)) {
    // Another resolver in progress; fall back to direct libc symbol to avoid
    // calling dlsym while it's being resolved.
    return __libc_malloc(size);
  }

  // We are the resolver. Resolve the next-in-chain allocator via RTLD_NEXT.
  fn = stackquery::test::ResolveNext<MallocFn>("malloc");
  __sync_synchronize();
  resolving = 0;
  return fn(size);
}

void* CallRealRealloc(void* ptr, size_t size) {
  using ReallocFn = void* (*)(void*, size_t);
  static ReallocFn fn = nullptr;
  static volatile int resolving = 0;
  if (fn != nullptr) {
    return fn(ptr, size);
  }
  if (!__sync_bool_compare_and_swap(&resolving, 0, 1)) {
    return __libc_realloc(ptr, size);
  }

  fn = stackquery::test::ResolveNext<ReallocFn>("realloc");
  __sync_synchronize();
  resolving = 0;
  return fn(ptr, size);
}

extern "C" void* malloc(size_t size) {
  stackquery::test::CountMallocCall();
  if (stackquery::test::ShouldFailMalloc()) {
    errno = ENOMEM;
    return nullptr;
  }
  return CallRealMalloc(size);
}

extern "C" void* realloc(void* ptr, size_t size) {
  stackquery::test::CountMallocCall();
  return CallRealRealloc(ptr, size);
}

// free is intentionally left un-overridden.
#endif  // STACKQUERY_WANT_MALLOC_OVERRIDES
