#pragma once

#include <railway/awaitable.hpp>
#include <railway/detail/spawn.hpp>
#include <railway/error.hpp>
#include <railway/outcome.hpp>
#include <railway/run_loop.hpp>

#include <exception>
#include <memory>
#include <optional>
#include <system_error>
#include <type_traits>
#include <utility>

namespace railway {

/// Drive `loop` until the awaitable completes; return its value or rethrow its exception.
///
/// This is the boundary where a pending outcome becomes a plain one:
/// `sync_wait(loop, pending_outcome)` yields the `outcome<T, E>` itself.
///
/// Throws `std::system_error` with `error::loop_exhausted` if the loop runs dry first, or with
/// `error::loop_stopped` if the loop is stopped first. On either error the chain is abandoned:
/// - if work is still queued (a stop between suspension and resumption), the chain stays
///   detached on the loop and finishes quietly if the loop is restarted and run again;
/// - if nothing is queued, nothing on the loop can resume it, and its frames are destroyed
///   without running the rest of the chain.
template <typename T>
auto sync_wait(run_loop& loop, awaitable<T> a) -> T {
  using result_type = detail::spawn_outcome<T>;

  loop.restart();

  // Owned by the completion callback as well: an abandoned chain may still complete after
  // this call has thrown.
  auto result = std::make_shared<std::optional<result_type>>();
  auto on_complete = [result](result_type r) { result->emplace(std::move(r)); };
  auto frame = detail::spawn_detached_frame(
    loop.get_executor(),
    detail::spawn_entry_point_with_completion<T>(std::move(a), std::move(on_complete)));

  // `frame` is valid while `*result` is empty: the callback runs before final_suspend.
  while (!*result) {
    if (loop.stopped()) {
      if (!loop.has_pending_tasks()) {
        frame.destroy();
      }
      throw std::system_error(make_error_code(error::loop_stopped));
    }
    if (loop.run_one() == 0) {
      frame.destroy();
      throw std::system_error(make_error_code(error::loop_exhausted));
    }
  }

  // Drain follow-up work queued by the completed chain.
  (void)loop.run();

  auto& settled = **result;
  if (settled.is_failure()) {
    std::rethrow_exception(std::move(settled).error());
  }
  if constexpr (std::is_void_v<T>) {
    return;
  } else {
    return std::move(settled).value();
  }
}

}  // namespace railway
