#include <railway/assert.hpp>
#include <railway/executor.hpp>
#include <railway/run_loop.hpp>

#include <utility>

namespace railway {

void executor::post(std::function<void()> f) const { ensure_loop().post(std::move(f)); }

auto executor::stopped() const noexcept -> bool { return loop_ == nullptr || loop_->stopped(); }

auto executor::ensure_loop() const -> run_loop& {
  RAILWAY_ENSURE(loop_, "executor: empty loop_");
  return *loop_;
}

void run_loop::post(std::function<void()> f) {
  RAILWAY_ENSURE(f, "run_loop::post: empty task");
  std::scoped_lock lk{mtx_};
  queue_.push(std::move(f));
}

auto run_loop::run_one() -> std::size_t {
  if (stopped()) {
    return 0;
  }

  std::function<void()> task;
  {
    std::scoped_lock lk{mtx_};
    if (queue_.empty()) {
      return 0;
    }
    task = std::move(queue_.front());
    queue_.pop();
  }

  // Run outside the lock: the task may post follow-up work.
  task();
  return 1;
}

auto run_loop::run() -> std::size_t {
  std::size_t n = 0;
  while (run_one() != 0) {
    ++n;
  }
  return n;
}

void run_loop::stop() noexcept { stopped_.store(true, std::memory_order_release); }

void run_loop::restart() noexcept { stopped_.store(false, std::memory_order_release); }

auto run_loop::has_pending_tasks() const -> bool {
  std::scoped_lock lk{mtx_};
  return !queue_.empty();
}

}  // namespace railway
