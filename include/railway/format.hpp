#pragma once

#include <railway/outcome.hpp>

#include <fmt/format.h>

// {fmt} support: `fmt::format("{}", o)` renders `success(<value>)` or `failure(<error>)`.
// Both payload types must themselves be formattable.

template <>
struct fmt::formatter<railway::unit> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <class FormatContext>
  auto format(railway::unit, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "()");
  }
};

template <class T, class E>
struct fmt::formatter<railway::outcome<T, E>> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <class FormatContext>
  auto format(railway::outcome<T, E> const& o, FormatContext& ctx) const {
    if (o.is_success()) {
      return fmt::format_to(ctx.out(), "success({})", o.value());
    }
    return fmt::format_to(ctx.out(), "failure({})", o.error());
  }
};
