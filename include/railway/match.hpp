#pragma once

#include <railway/detail/bridge.hpp>
#include <railway/outcome.hpp>
#include <railway/pipe.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace railway {

namespace detail {

template <class S, class F>
struct match_adaptor {
  using outcome_adaptor_tag = void;

  S on_success;
  F on_failure;

  template <class T, class E>
  auto apply(outcome<T, E>&& o) && {
    using success_raw = std::invoke_result_t<S&, T&&>;
    using failure_raw = std::invoke_result_t<F&, E&&>;
    using result_type =
      std::common_type_t<traits::settled_t<success_raw>, traits::settled_t<failure_raw>>;
    static_assert(!std::is_void_v<result_type>, "match: both handlers must return a value");
    constexpr bool pending = traits::is_pending_v<success_raw> || traits::is_pending_v<failure_raw>;

    auto to_result = [](auto&& r) { return result_type(std::forward<decltype(r)>(r)); };
    if (o.is_success()) {
      return lift<pending>(then(call(std::move(on_success), std::move(o).value()), to_result));
    }
    return lift<pending>(then(call(std::move(on_failure), std::move(o).error()), to_result));
  }
};

}  // namespace detail

/// Reduce an outcome to a single value by invoking exactly one of two handlers.
///
/// The result is the common type of both handlers' results; it is pending if the input or
/// either handler is.
template <class S, class F>
auto match(S on_success, F on_failure) -> detail::match_adaptor<S, F> {
  return {std::move(on_success), std::move(on_failure)};
}

}  // namespace railway
