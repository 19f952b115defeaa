#pragma once

#include <railway/awaitable.hpp>
#include <railway/outcome.hpp>
#include <railway/pipe.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace railway {

namespace detail {

// The outcome lives in this frame while the action runs, so the action may hold on to the
// reference it is given until it completes.
template <class A, class T, class E>
auto tap_pending(A action, outcome<T, E> o) -> awaitable<outcome<T, E>> {
  if (o.is_success()) {
    co_await std::invoke(action, std::as_const(o).value());
  }
  co_return std::move(o);
}

template <class A, class T, class E>
auto tap_error_pending(A action, outcome<T, E> o) -> awaitable<outcome<T, E>> {
  if (o.is_failure()) {
    co_await std::invoke(action, std::as_const(o).error());
  }
  co_return std::move(o);
}

template <class A>
struct tap_adaptor {
  using outcome_adaptor_tag = void;

  A action;

  template <class T, class E>
  auto apply(outcome<T, E>&& o) && {
    if constexpr (traits::is_pending_v<std::invoke_result_t<A&, T const&>>) {
      return tap_pending(std::move(action), std::move(o));
    } else {
      if (o.is_success()) {
        std::invoke(action, std::as_const(o).value());
      }
      return std::move(o);
    }
  }
};

template <class A>
struct tap_error_adaptor {
  using outcome_adaptor_tag = void;

  A action;

  template <class T, class E>
  auto apply(outcome<T, E>&& o) && {
    if constexpr (traits::is_pending_v<std::invoke_result_t<A&, E const&>>) {
      return tap_error_pending(std::move(action), std::move(o));
    } else {
      if (o.is_failure()) {
        std::invoke(action, std::as_const(o).error());
      }
      return std::move(o);
    }
  }
};

}  // namespace detail

/// Observe a success value without altering the outcome.
///
/// `action(v)` runs for its side effect only (it sees a const reference); the input outcome is
/// returned as is. On a failure `action` is not invoked.
template <class A>
auto tap(A action) -> detail::tap_adaptor<A> {
  return {std::move(action)};
}

/// Mirror of `tap` on the failure channel.
template <class A>
auto tap_error(A action) -> detail::tap_error_adaptor<A> {
  return {std::move(action)};
}

}  // namespace railway
