#pragma once

#include <railway/awaitable.hpp>
#include <railway/detail/bridge.hpp>
#include <railway/disposable.hpp>
#include <railway/outcome.hpp>
#include <railway/pipe.hpp>
#include <railway/traits/outcome_traits.hpp>

#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace railway {

namespace detail {

// The resource lives in this frame: the body may keep using it across suspensions, and it is
// released exactly once before the awaitable completes.
template <class Result, class B, class R>
auto with_resource_pending(B body, R resource) -> awaitable<Result> {
  std::exception_ptr ep{};
  std::optional<Result> result{};
  try {
    if constexpr (traits::is_pending_v<std::invoke_result_t<B&, R&>>) {
      result.emplace(co_await std::invoke(body, resource));
    } else {
      result.emplace(std::invoke(body, resource));
    }
  } catch (...) {
    ep = std::current_exception();
  }

  if constexpr (resource_traits<R>::is_async) {
    co_await resource_traits<R>::release_async(resource);
  } else {
    resource_traits<R>::release(resource);
  }

  if (ep) {
    std::rethrow_exception(ep);
  }
  co_return std::move(*result);
}

template <class B>
struct with_resource_adaptor {
  using outcome_adaptor_tag = void;

  B body;

  template <class R, class E>
  auto apply(outcome<R, E>&& o) && {
    using raw = std::invoke_result_t<B&, R&>;
    using result_type = traits::settled_t<raw>;
    static_assert(traits::is_outcome_v<result_type>,
                  "with_resource: the body must return an outcome (or a pending one)");
    static_assert(std::is_same_v<typename result_type::error_type, E>,
                  "with_resource: the body must keep the error type");
    constexpr bool pending = traits::is_pending_v<raw> || resource_traits<R>::is_async;

    // No resource was ever handed out, so there is nothing to release.
    if (o.is_failure()) {
      return lift<pending>(result_type::failure(std::move(o).error()));
    }

    R resource = std::move(o).value();
    resource_traits<R>::check(resource);

    if constexpr (pending) {
      return with_resource_pending<result_type>(std::move(body), std::move(resource));
    } else {
      std::optional<result_type> result{};
      try {
        result.emplace(std::invoke(body, resource));
      } catch (...) {
        resource_traits<R>::release(resource);
        throw;
      }
      resource_traits<R>::release(resource);
      return std::move(*result);
    }
  }
};

}  // namespace detail

/// Scoped use of a resource carried by a successful outcome.
///
/// On `success(r)`, `body(r)` runs and `r` is released exactly once afterwards, whether the
/// body returned a success, a failure, or threw (the exception propagates after the release;
/// it is not converted into a failure). On a failure the body is not invoked and nothing is
/// released.
///
/// Nested `with_resource` calls release innermost first. An exception thrown by the release
/// itself propagates.
template <class B>
auto with_resource(B body) -> detail::with_resource_adaptor<B> {
  return {std::move(body)};
}

}  // namespace railway
