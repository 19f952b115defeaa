#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define RAILWAY_LIKELY(x) __builtin_expect(!!(x), 1)
#else
#define RAILWAY_LIKELY(x) (x)
#endif

namespace railway::detail {

/// Print a diagnostic block to stderr and abort.
///
/// `kind` is "ASSERT" or "ENSURE"; `msg` may be null.
[[noreturn]] void fail(char const* kind, char const* expr, char const* msg, char const* file,
                       int line, char const* func) noexcept;

}  // namespace railway::detail

#define RAILWAY_CHECK_SELECTOR(_1, _2, NAME, ...) NAME

// -------------------- ASSERT --------------------
// Debug-only invariant. Compiled out under NDEBUG.
#if !defined(NDEBUG)

#define RAILWAY_ASSERT_1(expr)                                                          \
  (RAILWAY_LIKELY(expr) ? (void)0                                                       \
                        : ::railway::detail::fail("ASSERT", #expr, nullptr, __FILE__, \
                                                  __LINE__, __func__))

#define RAILWAY_ASSERT_2(expr, msg)                                                   \
  (RAILWAY_LIKELY(expr)                                                               \
     ? (void)0                                                                        \
     : ::railway::detail::fail("ASSERT", #expr, msg, __FILE__, __LINE__, __func__))

#define RAILWAY_ASSERT(...) \
  RAILWAY_CHECK_SELECTOR(__VA_ARGS__, RAILWAY_ASSERT_2, RAILWAY_ASSERT_1)(__VA_ARGS__)

#else
#define RAILWAY_ASSERT(...) ((void)0)
#endif

// -------------------- ENSURE --------------------
// Always-on invariant.

#define RAILWAY_ENSURE_1(expr)                                                          \
  (RAILWAY_LIKELY(expr) ? (void)0                                                       \
                        : ::railway::detail::fail("ENSURE", #expr, nullptr, __FILE__, \
                                                  __LINE__, __func__))

#define RAILWAY_ENSURE_2(expr, msg)                                                   \
  (RAILWAY_LIKELY(expr)                                                               \
     ? (void)0                                                                        \
     : ::railway::detail::fail("ENSURE", #expr, msg, __FILE__, __LINE__, __func__))

#define RAILWAY_ENSURE(...) \
  RAILWAY_CHECK_SELECTOR(__VA_ARGS__, RAILWAY_ENSURE_2, RAILWAY_ENSURE_1)(__VA_ARGS__)
