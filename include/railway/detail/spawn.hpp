#pragma once

#include <railway/assert.hpp>
#include <railway/awaitable.hpp>
#include <railway/completion_token.hpp>
#include <railway/executor.hpp>
#include <railway/outcome.hpp>

#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace railway::detail {

/// What a spawned `awaitable<T>` completes with: its value (or `unit` for `void`), or the
/// exception that escaped it.
template <typename T>
using spawn_outcome = outcome<std::conditional_t<std::is_void_v<T>, unit, T>, std::exception_ptr>;

template <typename F, typename T>
concept completion_callback_for =
  std::invocable<F&, spawn_outcome<T>> && (!std::same_as<std::remove_cvref_t<F>, detached_t>);

/// Coroutine entry point for co_spawn with a completion callback.
///
/// The callback runs exactly once. An exception thrown by the callback itself escapes the
/// detached frame and is reported by the promise.
template <typename T, typename F>
auto spawn_entry_point_with_completion(awaitable<T> a, F completion) -> awaitable<void> {
  using result_type = spawn_outcome<T>;

  std::exception_ptr ep{};
  std::optional<typename result_type::value_type> value{};
  try {
    if constexpr (std::is_void_v<T>) {
      co_await std::move(a);
      value.emplace();
    } else {
      value.emplace(co_await std::move(a));
    }
  } catch (...) {
    ep = std::current_exception();
  }

  if (ep) {
    completion(result_type::failure(std::move(ep)));
  } else {
    completion(result_type::success(std::move(*value)));
  }
}

/// Start `a` detached and return its frame.
///
/// The frame destroys itself at final_suspend, so the handle is only usable while the
/// coroutine is known to be suspended short of completion.
template <typename T>
auto spawn_detached_frame(executor ex, awaitable<T> a)
  -> std::coroutine_handle<awaitable_promise<T>> {
  RAILWAY_ENSURE(ex, "co_spawn: empty executor");
  auto h = a.release();
  RAILWAY_ENSURE(h, "co_spawn: empty awaitable");

  h.promise().set_executor(ex);
  h.promise().detach();

  // Exceptions never leave `resume()`: the promise captures them and reports them at
  // final_suspend.
  ex.post([h]() mutable { h.resume(); });
  return h;
}

template <typename T>
void spawn_detached_impl(executor ex, awaitable<T> a) {
  (void)spawn_detached_frame(ex, std::move(a));
}

}  // namespace railway::detail
