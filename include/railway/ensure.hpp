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

template <class P, class G, class T, class E>
auto ensure_pending(P predicate, G error_value, outcome<T, E> o) -> awaitable<outcome<T, E>> {
  if (co_await std::invoke(predicate, std::as_const(o).value())) {
    co_return std::move(o);
  }
  co_return outcome<T, E>::failure(E(std::move(error_value)));
}

template <class P, class G>
struct ensure_adaptor {
  using outcome_adaptor_tag = void;

  P predicate;
  G error_value;

  template <class T, class E>
  auto apply(outcome<T, E>&& o) && {
    static_assert(std::is_constructible_v<E, G&&>, "ensure: the error must convert to E");
    using predicate_raw = std::invoke_result_t<P&, T const&>;
    constexpr bool pending = traits::is_pending_v<predicate_raw>;

    if (o.is_failure()) {
      return lift<pending>(std::move(o));
    }
    if constexpr (pending) {
      return ensure_pending(std::move(predicate), std::move(error_value), std::move(o));
    } else {
      if (std::invoke(predicate, std::as_const(o).value())) {
        return std::move(o);
      }
      return outcome<T, E>::failure(E(std::move(error_value)));
    }
  }
};

}  // namespace detail

/// Keep a success only if `predicate(v)` holds; otherwise replace it with `failure(error_value)`.
///
/// A failure propagates unchanged and the predicate is not invoked.
template <class P, class G>
auto ensure(P predicate, G error_value) -> detail::ensure_adaptor<P, G> {
  return {std::move(predicate), std::move(error_value)};
}

}  // namespace railway
