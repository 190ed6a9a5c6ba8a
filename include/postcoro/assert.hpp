#pragma once

#include <source_location>

#if defined(__GNUC__) || defined(__clang__)
#define POSTCORO_LIKELY(x) __builtin_expect(!!(x), 1)
#else
#define POSTCORO_LIKELY(x) (x)
#endif

namespace postcoro::detail {

/// Print a `[postcoro] <kind> failure` report pointing at `where`, then abort.
[[noreturn]] void contract_failure(
  char const* kind, char const* expr, char const* msg,
  std::source_location where = std::source_location::current()) noexcept;

}  // namespace postcoro::detail

// Public contract checks: always on.
#define POSTCORO_ENSURE(expr, msg) \
  (POSTCORO_LIKELY(expr) ? (void)0 : ::postcoro::detail::contract_failure("ENSURE", #expr, msg))

// Internal invariants: debug builds only.
#if !defined(NDEBUG)
#define POSTCORO_ASSERT(expr, msg) \
  (POSTCORO_LIKELY(expr) ? (void)0 : ::postcoro::detail::contract_failure("ASSERT", #expr, msg))
#else
#define POSTCORO_ASSERT(expr, msg) ((void)0)
#endif
