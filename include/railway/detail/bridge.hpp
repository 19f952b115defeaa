#pragma once

#include <railway/awaitable.hpp>
#include <railway/traits/awaitable_value.hpp>

#include <functional>
#include <type_traits>
#include <utility>

// Sync/async bridge shared by every combinator.
//
// A combinator is written once against three helpers:
// - `call(f, args...)`: invoke a continuation. A plain result is returned as is; a pending one
//   is wrapped in a coroutine that owns both `f` and `args`, so lambda captures and arguments
//   outlive the lazy coroutine `f` returns.
// - `then(x, k)`: apply `k` to `x` now, or after awaiting `x` if it is pending.
// - `lift<Pending>(x)`: bring a result into the shape the combinator returns (`awaitable<R>`
//   when any input or continuation is pending, `R` otherwise).
//
// The only suspension points are the `co_await`s in this file.

namespace railway::detail {

template <bool Pending, class R>
using maybe_pending_t = std::conditional_t<Pending, awaitable<R>, R>;

template <class R>
auto make_ready(R r) -> awaitable<R> {
  co_return std::move(r);
}

template <bool Pending, class X>
auto lift(X&& x) {
  using value_type = std::remove_cvref_t<X>;
  if constexpr (Pending && !traits::is_pending_v<X>) {
    return make_ready<value_type>(std::forward<X>(x));
  } else {
    return value_type(std::forward<X>(x));
  }
}

template <class F, class... Args>
auto call_pending(F f, Args... args)
  -> awaitable<traits::settled_t<std::invoke_result_t<F&, Args&&...>>> {
  using value_type = traits::settled_t<std::invoke_result_t<F&, Args&&...>>;
  if constexpr (std::is_void_v<value_type>) {
    co_await std::invoke(f, std::move(args)...);
  } else {
    co_return co_await std::invoke(f, std::move(args)...);
  }
}

template <class F, class... Args>
auto call(F&& f, Args&&... args) {
  using raw = std::invoke_result_t<std::decay_t<F>&, std::decay_t<Args>&&...>;
  if constexpr (traits::is_pending_v<raw>) {
    return call_pending<std::decay_t<F>, std::decay_t<Args>...>(std::forward<F>(f),
                                                                 std::forward<Args>(args)...);
  } else {
    return std::invoke(f, std::forward<Args>(args)...);
  }
}

template <class V, class K>
auto then_pending(awaitable<V> x, K k)
  -> awaitable<traits::settled_t<std::invoke_result_t<K&, V>>> {
  using raw = std::invoke_result_t<K&, V>;
  if constexpr (traits::is_pending_v<raw>) {
    co_return co_await std::invoke(k, co_await std::move(x));
  } else {
    co_return std::invoke(k, co_await std::move(x));
  }
}

template <class X, class K>
auto then(X&& x, K k) {
  if constexpr (traits::is_pending_v<X>) {
    static_assert(!std::is_lvalue_reference_v<X>,
                  "railway: a pending outcome must be moved into a combinator");
    using value_type = traits::awaitable_value_t<X>;
    static_assert(!std::is_void_v<value_type>, "railway: cannot chain on awaitable<void>");
    return then_pending<value_type, K>(std::move(x), std::move(k));
  } else {
    return std::invoke(k, std::forward<X>(x));
  }
}

}  // namespace railway::detail
