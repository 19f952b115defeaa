#pragma once

#include <railway/detail/awaitable_promise.hpp>

#include <coroutine>
#include <exception>
#include <stop_token>
#include <utility>

namespace railway {

/// Lazy coroutine producing a `T`: the library's pending value.
///
/// An awaitable does nothing until it is awaited (or started by `co_spawn`), and it can be
/// awaited exactly once. Awaiting resumes the coroutine by symmetric transfer and rethrows any
/// exception that escaped it.
template <typename T>
class awaitable {
 public:
  using promise_type = detail::awaitable_promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  /// IMPORTANT: This type owns the coroutine frame. If it still owns a handle on destruction,
  /// it will `destroy()` the coroutine.
  explicit awaitable(handle_type h) noexcept : coro_(h) {}
  ~awaitable() noexcept {
    if (coro_) {
      coro_.destroy();
    }
  }

  awaitable(awaitable const&) = delete;
  auto operator=(awaitable const&) -> awaitable& = delete;

  awaitable(awaitable&& other) noexcept : coro_(std::exchange(other.coro_, {})) {}
  auto operator=(awaitable&& other) noexcept -> awaitable& {
    if (this != &other) {
      if (coro_) {
        coro_.destroy();
      }
      coro_ = std::exchange(other.coro_, {});
    }
    return *this;
  }

  /// Release ownership of the coroutine handle without destroying it.
  ///
  /// SAFETY: After `release()`, the caller becomes responsible for eventually destroying the
  /// handle (or transferring ownership elsewhere).
  [[nodiscard]] auto release() noexcept -> handle_type { return std::exchange(coro_, {}); }

  [[nodiscard]] auto valid() const noexcept -> bool { return static_cast<bool>(coro_); }

  bool await_ready() const noexcept { return false; }

  template <class Promise>
  auto await_suspend(std::coroutine_handle<Promise> h) -> std::coroutine_handle<> {
    RAILWAY_ENSURE(coro_, "awaitable: awaiting an empty or already-consumed awaitable");
    coro_.promise().set_continuation(h);
    if constexpr (requires { h.promise().get_executor(); }) {
      coro_.promise().inherit_executor(h.promise().get_executor());
    }
    if constexpr (requires { h.promise().get_stop_token(); }) {
      coro_.promise().inherit_stop_token(h.promise().get_stop_token());
    }
    return coro_;
  }

  auto await_resume() -> T {
    coro_.promise().rethrow_if_exception();
    return coro_.promise().take_value();
  }

 private:
  handle_type coro_;
};

/// Attach a stop token to a not-yet-started awaitable.
///
/// Every coroutine it awaits inherits the token; `this_coro::yield` turns a requested stop into
/// `error::operation_aborted`.
template <typename T>
auto bind_stop_token(std::stop_token token, awaitable<T> a) -> awaitable<T> {
  auto h = a.release();
  RAILWAY_ENSURE(h, "bind_stop_token: empty awaitable");
  h.promise().set_stop_token(std::move(token));
  return awaitable<T>{h};
}

}  // namespace railway

namespace railway::detail {

template <typename T>
auto awaitable_promise<T>::get_return_object() -> awaitable<T> {
  using promise_t = awaitable_promise<T>;
  return awaitable<T>{std::coroutine_handle<promise_t>::from_promise(*this)};
}

inline auto awaitable_promise<void>::get_return_object() -> awaitable<void> {
  using promise_t = awaitable_promise<void>;
  return awaitable<void>{std::coroutine_handle<promise_t>::from_promise(*this)};
}

}  // namespace railway::detail
