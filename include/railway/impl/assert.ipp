#include <railway/assert.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>

namespace railway::detail {

void fail(char const* kind, char const* expr, char const* msg, char const* file, int line,
          char const* func) noexcept {
  fmt::print(stderr, "[railway] {} failure\n", kind);
  fmt::print(stderr, "  expression: {}\n", expr);
  if (msg) {
    fmt::print(stderr, "  message   : {}\n", msg);
  }
  fmt::print(stderr, "  location  : {}:{}\n", file, line);
  fmt::print(stderr, "  function  : {}\n", func);
  std::fflush(stderr);
  std::abort();
}

}  // namespace railway::detail
