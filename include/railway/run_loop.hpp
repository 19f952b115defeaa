#pragma once

#include <railway/executor.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>

namespace railway {

/// Single-threaded event loop hosting pending outcomes.
///
/// Semantics:
/// - `run*()` executes posted tasks in FIFO order on the calling thread.
/// - At most one thread may drive `run()` / `run_one()` at a time.
/// - `post()` (through the executor) and `stop()` are safe to call from any thread.
///
/// The loop creates no threads and performs no I/O; it only resumes coroutines that suspended
/// through `this_coro::yield` or were started with `co_spawn`.
class run_loop {
 public:
  run_loop() = default;
  ~run_loop() = default;

  run_loop(run_loop const&) = delete;
  auto operator=(run_loop const&) -> run_loop& = delete;
  run_loop(run_loop&&) = delete;
  auto operator=(run_loop&&) -> run_loop& = delete;

  /// Run until `stop()` is requested or the queue is empty.
  /// Returns the number of tasks executed.
  auto run() -> std::size_t;

  /// Run at most one task. Returns 0 if nothing was queued (or the loop is stopped).
  auto run_one() -> std::size_t;

  /// Request the loop to stop (idempotent). Queued tasks are kept for `restart()`.
  void stop() noexcept;

  /// Clear the stopped state so the loop can run again.
  void restart() noexcept;

  auto stopped() const noexcept -> bool { return stopped_.load(std::memory_order_acquire); }

  /// True if at least one task is queued.
  auto has_pending_tasks() const -> bool;

  auto get_executor() noexcept -> executor { return executor{*this}; }

 private:
  friend class executor;

  void post(std::function<void()> f);

  mutable std::mutex mtx_{};
  std::queue<std::function<void()>> queue_{};
  std::atomic<bool> stopped_{false};
};

}  // namespace railway
