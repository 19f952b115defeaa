#pragma once

#include <railway/awaitable.hpp>
#include <railway/detail/bridge.hpp>
#include <railway/outcome.hpp>
#include <railway/pipe.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace railway {

namespace detail {

template <class P, class C, class T, class E>
auto bind_if_pending(P predicate, C continuation, outcome<T, E> o) -> awaitable<outcome<T, E>> {
  if (co_await std::invoke(predicate, std::as_const(o).value())) {
    co_return std::move(o);
  }
  if constexpr (traits::is_pending_v<std::invoke_result_t<C&, T&&>>) {
    co_return co_await std::invoke(continuation, std::move(o).value());
  } else {
    co_return std::invoke(continuation, std::move(o).value());
  }
}

template <class P, class C>
struct bind_if_adaptor {
  using outcome_adaptor_tag = void;

  P predicate;
  C continuation;

  template <class T, class E>
  auto apply(outcome<T, E>&& o) && {
    using predicate_raw = std::invoke_result_t<P&, T const&>;
    using continuation_raw = std::invoke_result_t<C&, T&&>;
    static_assert(std::is_same_v<traits::settled_t<continuation_raw>, outcome<T, E>>,
                  "bind_if: the continuation must return the same outcome type");
    constexpr bool pending =
      traits::is_pending_v<predicate_raw> || traits::is_pending_v<continuation_raw>;

    if (o.is_failure()) {
      return lift<pending>(std::move(o));
    }
    if constexpr (traits::is_pending_v<predicate_raw>) {
      return bind_if_pending(std::move(predicate), std::move(continuation), std::move(o));
    } else {
      // NOTE: true means "already satisfied": keep the value and skip the continuation.
      if (std::invoke(predicate, std::as_const(o).value())) {
        return lift<pending>(std::move(o));
      }
      return lift<pending>(call(std::move(continuation), std::move(o).value()));
    }
  }
};

}  // namespace detail

/// Predicate-gated continuation.
///
/// IMPORTANT: the polarity is "skip when true". On `success(v)`:
/// - `predicate(v) == true`: `success(v)` is returned unchanged, `continuation` is not invoked;
/// - `predicate(v) == false`: the result is `continuation(v)`.
/// A failure propagates and neither function is invoked.
///
/// Either function may be asynchronous (return an awaitable).
template <class P, class C>
auto bind_if(P predicate, C continuation) -> detail::bind_if_adaptor<P, C> {
  return {std::move(predicate), std::move(continuation)};
}

}  // namespace railway
