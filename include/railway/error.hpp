#pragma once

#include <system_error>
#include <type_traits>

namespace railway {

/// Status codes raised by the coroutine host runtime (never by the outcome algebra itself).
enum class error {
  /// The awaiting coroutine observed a stop request.
  operation_aborted = 1,

  /// `sync_wait` ran out of queued work before the awaitable completed.
  loop_exhausted,

  /// `sync_wait` found the run_loop stopped before the awaitable completed.
  loop_stopped,
};

auto make_error_code(error e) -> std::error_code;

}  // namespace railway

namespace std {

template <>
struct is_error_code_enum<railway::error> : std::true_type {};

}  // namespace std
