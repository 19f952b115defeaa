#pragma once

#include <railway/completion_token.hpp>
#include <railway/detail/spawn.hpp>
#include <railway/executor.hpp>

#include <type_traits>
#include <utility>

namespace railway {

/// Start an awaitable on the given executor (detached / fire-and-forget).
///
/// Ownership of the coroutine frame is detached from the passed awaitable: the frame is
/// destroyed at final_suspend. An exception escaping it is reported to stderr.
template <typename T>
void co_spawn(executor ex, awaitable<T> a, detached_t) {
  detail::spawn_detached_impl(ex, std::move(a));
}

/// Start an awaitable on the given executor and invoke `completion` with its outcome:
/// `success(value)` (`unit` for `awaitable<void>`) or `failure(std::exception_ptr)`.
template <typename T, typename F>
  requires detail::completion_callback_for<std::decay_t<F>, T>
void co_spawn(executor ex, awaitable<T> a, F&& completion) {
  using callback_type = std::decay_t<F>;
  detail::spawn_detached_impl(ex, detail::spawn_entry_point_with_completion<T, callback_type>(
                                    std::move(a), std::forward<F>(completion)));
}

}  // namespace railway
