#pragma once

#include <railway/detail/bridge.hpp>
#include <railway/outcome.hpp>
#include <railway/traits/outcome_traits.hpp>

#include <type_traits>
#include <utility>

namespace railway {

namespace detail {

/// A one-shot combinator: `std::move(adaptor).apply(outcome<T, E>&&)` implements its branching
/// for an outcome that is available now.
template <class A>
concept outcome_adaptor = requires { typename std::remove_cvref_t<A>::outcome_adaptor_tag; };

}  // namespace detail

/// Apply a combinator to an outcome, or to a pending outcome.
///
/// `outcome | adaptor` yields the adaptor's result directly; `awaitable<outcome> | adaptor`
/// yields an awaitable that first awaits the input, then applies the adaptor. Chains read left
/// to right and each step starts only after the previous one (and everything it awaited)
/// completed.
template <class Input, class Adaptor>
  requires traits::is_outcome_source_v<Input> && detail::outcome_adaptor<Adaptor>
auto operator|(Input&& in, Adaptor&& adaptor) {
  return detail::then(
    std::forward<Input>(in),
    [a = std::remove_cvref_t<Adaptor>(std::forward<Adaptor>(adaptor))]<class T, class E>(
      outcome<T, E> o) mutable { return std::move(a).apply(std::move(o)); });
}

}  // namespace railway
