#pragma once

#include <type_traits>

namespace railway {

// Forward declaration
template <typename T>
class awaitable;

namespace traits {

/// Type trait to extract the value type from an awaitable type.
///
/// Primary template is undefined; specializations must define a `type` member.
template <typename A>
struct awaitable_value;

template <typename T>
struct awaitable_value<awaitable<T>> {
  using type = T;
};

template <typename A>
using awaitable_value_t = typename awaitable_value<std::remove_cvref_t<A>>::type;

/// True if `A` is a value that is not available yet (a `railway::awaitable<T>`).
template <typename A>
struct is_pending : std::false_type {};

template <typename T>
struct is_pending<awaitable<T>> : std::true_type {};

template <typename A>
inline constexpr bool is_pending_v = is_pending<std::remove_cvref_t<A>>::value;

/// The type a value settles to: `T` for `awaitable<T>`, the decayed type otherwise.
template <typename A>
struct settled {
  using type = A;
};

template <typename T>
struct settled<awaitable<T>> {
  using type = T;
};

template <typename A>
using settled_t = typename settled<std::remove_cvref_t<A>>::type;

}  // namespace traits
}  // namespace railway
