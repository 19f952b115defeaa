#pragma once

#include <railway/awaitable.hpp>
#include <railway/outcome.hpp>
#include <railway/traits/awaitable_value.hpp>

#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace railway {

/// Cleanup clause for `try_invoke`: a zero-argument action that runs exactly once after the
/// operation, on success and on failure alike. It may return `awaitable<void>`.
template <class C>
struct finally_t {
  C cleanup;
};

template <class C>
auto finally(C cleanup) -> finally_t<C> {
  return {std::move(cleanup)};
}

namespace detail {

template <class T>
struct is_finally : std::false_type {};

template <class C>
struct is_finally<finally_t<C>> : std::true_type {};

struct no_cleanup {
  void operator()() const noexcept {}
};

struct keep_exception {
  auto operator()(std::exception_ptr ep) const noexcept -> std::exception_ptr { return ep; }
};

template <class Op>
using try_value_t = std::conditional_t<std::is_void_v<traits::settled_t<std::invoke_result_t<Op&>>>,
                                       unit, traits::settled_t<std::invoke_result_t<Op&>>>;

template <class Op, class Factory>
using try_outcome_t =
  outcome<try_value_t<Op>, std::decay_t<std::invoke_result_t<Factory&, std::exception_ptr>>>;

/// Run `op`, returning its value or the exception it raised.
template <class Op>
auto capture(Op& op, std::exception_ptr& raised) -> std::optional<try_value_t<Op>> {
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Op&>>) {
      std::invoke(op);
      return unit{};
    } else {
      return std::invoke(op);
    }
  } catch (...) {
    raised = std::current_exception();
    return std::nullopt;
  }
}

/// Build the outcome. A throwing factory is recorded in `escaped` rather than propagated, so
/// the cleanup clause still runs before it is rethrown.
template <class Result, class T, class Factory>
auto settle(std::optional<T>& value, std::exception_ptr raised, Factory& factory,
            std::exception_ptr& escaped) -> std::optional<Result> {
  if (!raised) {
    return Result::success(std::move(*value));
  }
  try {
    return Result::failure(std::invoke(factory, std::move(raised)));
  } catch (...) {
    escaped = std::current_exception();
    return std::nullopt;
  }
}

template <class Result, class Op, class Factory, class Cleanup>
auto try_pending(Op op, Factory factory, Cleanup cleanup) -> awaitable<Result> {
  using value_type = typename Result::value_type;

  std::exception_ptr raised{};
  std::optional<value_type> value{};
  if constexpr (traits::is_pending_v<std::invoke_result_t<Op&>>) {
    try {
      if constexpr (std::is_void_v<traits::settled_t<std::invoke_result_t<Op&>>>) {
        co_await std::invoke(op);
        value.emplace();
      } else {
        value.emplace(co_await std::invoke(op));
      }
    } catch (...) {
      raised = std::current_exception();
    }
  } else {
    value = capture(op, raised);
  }

  std::exception_ptr escaped{};
  auto result = settle<Result>(value, std::move(raised), factory, escaped);

  if constexpr (traits::is_pending_v<std::invoke_result_t<Cleanup&>>) {
    co_await std::invoke(cleanup);
  } else {
    std::invoke(cleanup);
  }

  if (escaped) {
    std::rethrow_exception(escaped);
  }
  co_return std::move(*result);
}

template <class Op, class Factory, class Cleanup>
auto try_impl(Op op, Factory factory, Cleanup cleanup) {
  using result_type = try_outcome_t<Op, Factory>;
  constexpr bool pending = traits::is_pending_v<std::invoke_result_t<Op&>> ||
                           traits::is_pending_v<std::invoke_result_t<Cleanup&>>;

  if constexpr (pending) {
    return try_pending<result_type>(std::move(op), std::move(factory), std::move(cleanup));
  } else {
    std::exception_ptr raised{};
    auto value = capture(op, raised);

    std::exception_ptr escaped{};
    auto result = settle<result_type>(value, std::move(raised), factory, escaped);

    std::invoke(cleanup);

    if (escaped) {
      std::rethrow_exception(escaped);
    }
    return std::move(*result);
  }
}

}  // namespace detail

/// Run `op` and capture any exception it raises as a failure built by `factory`.
///
/// `op` returns `T` (or `void`, giving `unit`); `factory` maps the captured
/// `std::exception_ptr` to the error type. If `op` returns `awaitable<T>` the result is
/// `awaitable<outcome<T, E>>`, and exceptions raised while it runs (including cancellation)
/// are captured the same way. Exceptions thrown by `factory` propagate.
template <class Op, class Factory>
  requires(!detail::is_finally<Factory>::value)
auto try_invoke(Op op, Factory factory) {
  return detail::try_impl(std::move(op), std::move(factory), detail::no_cleanup{});
}

/// `try_invoke(op, factory)` followed by a cleanup clause.
///
/// Order: `op`, then (on an exception) `factory`, then `cleanup` exactly once, then return.
/// The cleanup runs even if `factory` throws; an exception thrown by `cleanup` propagates.
template <class Op, class Factory, class C>
auto try_invoke(Op op, Factory factory, finally_t<C> clause) {
  return detail::try_impl(std::move(op), std::move(factory), std::move(clause.cleanup));
}

/// Exception-first capture: the error is the `std::exception_ptr` of the very exception `op`
/// raised.
///
/// Lets a later `tap_error` inspect the concrete exception before a `map_error` narrows it to
/// a domain error.
template <class Op>
auto try_invoke(Op op) {
  return detail::try_impl(std::move(op), detail::keep_exception{}, detail::no_cleanup{});
}

/// Exception-first capture followed by a cleanup clause.
template <class Op, class C>
auto try_invoke(Op op, finally_t<C> clause) {
  return detail::try_impl(std::move(op), detail::keep_exception{}, std::move(clause.cleanup));
}

}  // namespace railway
