#pragma once

#include <railway/detail/bridge.hpp>
#include <railway/outcome.hpp>
#include <railway/pipe.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace railway {

namespace detail {

template <class F>
struct map_adaptor {
  using outcome_adaptor_tag = void;

  F f;

  template <class T, class E>
  auto apply(outcome<T, E>&& o) && {
    using raw = std::invoke_result_t<F&, T&&>;
    using value_type = traits::settled_t<raw>;
    static_assert(!std::is_void_v<value_type>, "map: the transform must return a value");
    using result_type = outcome<value_type, E>;
    constexpr bool pending = traits::is_pending_v<raw>;

    if (o.is_failure()) {
      return lift<pending>(result_type::failure(std::move(o).error()));
    }
    return then(call(std::move(f), std::move(o).value()),
                [](value_type v) { return result_type::success(std::move(v)); });
  }
};

template <class G>
struct map_error_adaptor {
  using outcome_adaptor_tag = void;

  G g;

  template <class T, class E>
  auto apply(outcome<T, E>&& o) && {
    using raw = std::invoke_result_t<G&, E&&>;
    using error_type = traits::settled_t<raw>;
    static_assert(!std::is_void_v<error_type>, "map_error: the transform must return an error");
    using result_type = outcome<T, error_type>;
    constexpr bool pending = traits::is_pending_v<raw>;

    if (o.is_success()) {
      return lift<pending>(result_type::success(std::move(o).value()));
    }
    return then(call(std::move(g), std::move(o).error()),
                [](error_type e) { return result_type::failure(std::move(e)); });
  }
};

}  // namespace detail

/// `success(v) | map(f)` is `success(f(v))`; a failure passes through and `f` is not invoked.
///
/// `f` may return `awaitable<T2>`, in which case the result is pending.
template <class F>
auto map(F f) -> detail::map_adaptor<F> {
  return {std::move(f)};
}

/// Dual of `map` on the failure channel: `failure(e) | map_error(g)` is `failure(g(e))`.
template <class G>
auto map_error(G g) -> detail::map_error_adaptor<G> {
  return {std::move(g)};
}

}  // namespace railway
