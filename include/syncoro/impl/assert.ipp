#include <syncoro/assert.hpp>

#include <cstdio>
#include <cstdlib>

namespace syncoro::detail {

namespace {

constexpr auto check_label(check_kind kind) noexcept -> char const* {
  switch (kind) {
    case check_kind::assertion:
      return "ASSERT";
    case check_kind::ensure:
      return "ENSURE";
    case check_kind::unreachable:
      return "UNREACHABLE";
  }
  return "CHECK";
}

}  // namespace

void check_failed(check_kind kind, char const* expr, char const* msg, char const* file, int line,
                  char const* func) noexcept {
  std::fprintf(stderr, "[syncoro] %s failure\n", check_label(kind));
  if (expr != nullptr) {
    std::fprintf(stderr, "  expression: %s\n", expr);
  }
  if (msg != nullptr) {
    std::fprintf(stderr, "  message   : %s\n", msg);
  }
  std::fprintf(stderr, "  location  : %s:%d\n  function  : %s\n", file, line, func);
  std::fflush(stderr);
  std::abort();
}

}  // namespace syncoro::detail
