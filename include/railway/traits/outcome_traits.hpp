#pragma once

#include <railway/traits/awaitable_value.hpp>

#include <type_traits>

namespace railway {

template <class T, class E>
class outcome;

namespace traits {

template <typename O>
struct is_outcome : std::false_type {};

template <class T, class E>
struct is_outcome<outcome<T, E>> : std::true_type {};

template <typename O>
inline constexpr bool is_outcome_v = is_outcome<std::remove_cvref_t<O>>::value;

/// True for an outcome that is available now or one that is still pending.
template <typename X>
inline constexpr bool is_outcome_source_v = is_outcome_v<settled_t<X>>;

}  // namespace traits
}  // namespace railway
