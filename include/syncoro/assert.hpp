#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define SYNCORO_LIKELY(x) __builtin_expect(!!(x), 1)
#else
#define SYNCORO_LIKELY(x) (x)
#endif

namespace syncoro::detail {

enum class check_kind {
  assertion,    // SYNCORO_ASSERT: debug builds only
  ensure,       // SYNCORO_ENSURE: always on
  unreachable,  // SYNCORO_UNREACHABLE
};

/// Print the failed check to stderr and abort.
[[noreturn]] void check_failed(check_kind kind, char const* expr, char const* msg,
                               char const* file, int line, char const* func) noexcept;

// Optional second macro argument.
constexpr auto check_message() noexcept -> char const* { return nullptr; }
constexpr auto check_message(char const* msg) noexcept -> char const* { return msg; }

}  // namespace syncoro::detail

#define SYNCORO_CHECK_IMPL(kind, expr, ...)                                                  \
  (SYNCORO_LIKELY(expr) ? (void)0                                                            \
                        : ::syncoro::detail::check_failed(                                   \
                            ::syncoro::detail::check_kind::kind, #expr,                      \
                            ::syncoro::detail::check_message(__VA_ARGS__), __FILE__, __LINE__, \
                            __func__))

// Lifecycle and threading invariants (e.g. resource() off the worker thread).
#if !defined(NDEBUG)
#define SYNCORO_ASSERT(expr, ...) SYNCORO_CHECK_IMPL(assertion, expr __VA_OPT__(, ) __VA_ARGS__)
#else
#define SYNCORO_ASSERT(expr, ...) ((void)0)
#endif

// Misuse that cannot be reported any other way (e.g. a connection without a connector).
#define SYNCORO_ENSURE(expr, ...) SYNCORO_CHECK_IMPL(ensure, expr __VA_OPT__(, ) __VA_ARGS__)

#define SYNCORO_UNREACHABLE()                                                             \
  ::syncoro::detail::check_failed(::syncoro::detail::check_kind::unreachable, nullptr,    \
                                  nullptr, __FILE__, __LINE__, __func__)
