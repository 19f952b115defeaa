#pragma once

#include <functional>

// A minimal handle for "where does a suspended coroutine continue".
//
// The only execution context in this library is `run_loop`; the executor is a non-owning
// reference to one. Combinators never post on their own: only `this_coro::yield` and
// `co_spawn` schedule through an executor.

namespace railway {

class run_loop;

class executor {
 public:
  executor() noexcept = default;
  explicit executor(run_loop& loop) noexcept : loop_(&loop) {}

  /// Enqueue `f` on the bound loop. Never runs `f` inline.
  void post(std::function<void()> f) const;

  /// True if the bound loop has been stopped (or this executor is empty).
  auto stopped() const noexcept -> bool;

  explicit operator bool() const noexcept { return loop_ != nullptr; }

  friend auto operator==(executor const& a, executor const& b) noexcept -> bool {
    return a.loop_ == b.loop_;
  }

 private:
  auto ensure_loop() const -> run_loop&;

  run_loop* loop_{nullptr};
};

}  // namespace railway
