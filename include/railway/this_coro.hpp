#pragma once

namespace railway::this_coro {

/// `co_await this_coro::executor` yields the executor the current coroutine runs on.
struct executor_t {};
inline constexpr executor_t executor{};

/// `co_await this_coro::stop_token` yields the stop token inherited by the current coroutine.
struct stop_token_t {};
inline constexpr stop_token_t stop_token{};

/// `co_await this_coro::yield` suspends and re-posts the coroutine to its executor.
///
/// If a stop was requested (before suspending or while queued), resumption throws
/// `std::system_error` with `railway::error::operation_aborted`.
struct yield_t {};
inline constexpr yield_t yield{};

}  // namespace railway::this_coro
