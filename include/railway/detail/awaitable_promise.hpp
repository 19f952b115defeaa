#pragma once

#include <railway/assert.hpp>
#include <railway/detail/diagnostics.hpp>
#include <railway/error.hpp>
#include <railway/executor.hpp>
#include <railway/this_coro.hpp>

#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <stop_token>
#include <system_error>
#include <utility>

namespace railway {
template <typename T>
class awaitable;
}  // namespace railway

namespace railway::detail {

struct awaitable_promise_base {
  executor ex_{};
  std::coroutine_handle<> continuation_{};
  std::exception_ptr exception_{};
  bool detached_{false};
  std::stop_token stop_token_{};

  awaitable_promise_base() noexcept = default;

  std::suspend_always initial_suspend() noexcept { return {}; }

  auto final_suspend() noexcept {
    struct final_awaiter {
      awaitable_promise_base* self;

      bool await_ready() noexcept { return false; }

      auto await_suspend(std::coroutine_handle<> h) noexcept -> std::coroutine_handle<> {
        // Detached coroutines own their frame and have nobody to hand an exception to.
        if (self->detached_) {
          if (self->exception_) {
            report_detached_exception(self->exception_);
          }
          h.destroy();
          return std::noop_coroutine();
        }

        auto cont = std::exchange(self->continuation_, std::coroutine_handle<>{});
        if (!cont) {
          return std::noop_coroutine();
        }
        return cont;
      }

      void await_resume() noexcept {}
    };

    return final_awaiter{this};
  }

  auto get_executor() const noexcept -> executor { return ex_; }
  void set_executor(executor ex) noexcept { ex_ = ex; }

  void inherit_executor(executor parent_ex) noexcept {
    if (!ex_) {
      ex_ = parent_ex;
    }
  }

  auto get_stop_token() const noexcept -> std::stop_token { return stop_token_; }
  void set_stop_token(std::stop_token token) noexcept { stop_token_ = std::move(token); }

  void inherit_stop_token(std::stop_token parent) noexcept {
    if (!stop_token_.stop_possible()) {
      stop_token_ = std::move(parent);
    }
  }

  void detach() noexcept {
    RAILWAY_ENSURE(ex_, "awaitable_promise: detach() requires executor");
    detached_ = true;
  }

  void set_continuation(std::coroutine_handle<> h) noexcept { continuation_ = h; }

  void unhandled_exception() noexcept { exception_ = std::current_exception(); }

  void rethrow_if_exception() {
    if (exception_) {
      std::rethrow_exception(std::exchange(exception_, nullptr));
    }
  }

  template <typename Awaitable>
  decltype(auto) await_transform(Awaitable&& a) noexcept {
    return std::forward<Awaitable>(a);
  }

  auto await_transform(this_coro::executor_t) noexcept {
    struct awaiter {
      executor ex;
      bool await_ready() noexcept { return true; }
      auto await_resume() noexcept -> executor { return ex; }
      void await_suspend(std::coroutine_handle<>) noexcept {}
    };
    return awaiter{ex_};
  }

  auto await_transform(this_coro::stop_token_t) noexcept {
    struct awaiter {
      std::stop_token token;
      bool await_ready() noexcept { return true; }
      auto await_resume() noexcept -> std::stop_token { return token; }
      void await_suspend(std::coroutine_handle<>) noexcept {}
    };
    return awaiter{stop_token_};
  }

  auto await_transform(this_coro::yield_t) noexcept {
    struct awaiter {
      awaitable_promise_base* self;

      // A stop that is already requested skips the round trip through the loop.
      bool await_ready() noexcept { return self->stop_token_.stop_requested(); }

      void await_suspend(std::coroutine_handle<> h) {
        RAILWAY_ENSURE(self->ex_, "this_coro::yield: coroutine has no executor");
        self->ex_.post([h]() mutable { h.resume(); });
      }

      void await_resume() {
        if (self->stop_token_.stop_requested()) {
          throw std::system_error(make_error_code(error::operation_aborted));
        }
      }
    };

    return awaiter{this};
  }
};

template <typename T>
struct awaitable_promise final : awaitable_promise_base {
  std::optional<T> value_{};

  awaitable_promise() noexcept = default;

  auto get_return_object() -> awaitable<T>;

  template <typename U>
    requires std::convertible_to<U, T>
  void return_value(U&& v) {
    value_.emplace(std::forward<U>(v));
  }

  auto take_value() -> T {
    RAILWAY_ASSERT(value_.has_value(), "awaitable: value taken twice or never set");
    auto v = std::move(*value_);
    value_.reset();
    return v;
  }
};

template <>
struct awaitable_promise<void> final : awaitable_promise_base {
  awaitable_promise() noexcept = default;

  auto get_return_object() -> awaitable<void>;
  void return_void() noexcept {}

  void take_value() noexcept {}
};

}  // namespace railway::detail
