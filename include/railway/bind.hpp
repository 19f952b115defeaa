#pragma once

#include <railway/detail/bridge.hpp>
#include <railway/outcome.hpp>
#include <railway/pipe.hpp>
#include <railway/traits/outcome_traits.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace railway {

namespace detail {

template <class F>
struct bind_adaptor {
  using outcome_adaptor_tag = void;

  F f;

  template <class T, class E>
  auto apply(outcome<T, E>&& o) && {
    using raw = std::invoke_result_t<F&, T&&>;
    using result_type = traits::settled_t<raw>;
    static_assert(traits::is_outcome_v<result_type>,
                  "bind: the continuation must return an outcome (or a pending one)");
    static_assert(std::is_same_v<typename result_type::error_type, E>,
                  "bind: the continuation must keep the error type; use map_error first");
    constexpr bool pending = traits::is_pending_v<raw>;

    if (o.is_failure()) {
      return lift<pending>(result_type::failure(std::move(o).error()));
    }
    return lift<pending>(call(std::move(f), std::move(o).value()));
  }
};

}  // namespace detail

/// Dependent chaining ("flatMap"): `success(v) | bind(f)` is `f(v)`; a failure short-circuits
/// and `f` is not invoked.
///
/// Satisfies the monad laws with `outcome::success` as unit:
/// - `success(v) | bind(f) == f(v)`
/// - `r | bind(outcome::success) == r`
/// - `r | bind(f) | bind(g) == r | bind([](auto x) { return f(x) | bind(g); })`
template <class F>
auto bind(F f) -> detail::bind_adaptor<F> {
  return {std::move(f)};
}

}  // namespace railway
