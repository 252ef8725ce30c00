/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 */

#ifndef SCON_PLATFORM_HPP_
#define SCON_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace scon {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define SCON_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define SCON_PLATFORM_MACOS 1
#endif

#if defined(SCON_PLATFORM_LINUX) || defined(SCON_PLATFORM_MACOS)
#define SCON_PLATFORM_POSIX 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define SCON_LIKELY(x) __builtin_expect(!!(x), 1)
#define SCON_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define SCON_PRINTF_FMT(fmt_idx, args_idx) \
  __attribute__((format(printf, fmt_idx, args_idx)))
#else
#define SCON_LIKELY(x) (x)
#define SCON_UNLIKELY(x) (x)
#define SCON_PRINTF_FMT(fmt_idx, args_idx)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "SCON_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define SCON_ASSERT(cond) ((void)0)
#else
#define SCON_ASSERT(cond) \
  ((cond) ? ((void)0) : ::scon::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace scon

#endif  // SCON_PLATFORM_HPP_
